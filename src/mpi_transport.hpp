#pragma once

#include "client.hpp"
#include "log.hpp"
#include "protocol_wire.hpp"

#include <mpi.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace replicaflow
{
    enum class MpiFrameKind : std::uint8_t
    {
        Hello = 1,
        HelloAck = 2,
        Command = 3,
        Response = 4,
    };

    struct MpiFrame
    {
        MpiFrameKind kind = MpiFrameKind::Hello;
        // Chosen by the connecting client; frames of other sessions are ignored.
        std::uint64_t session = 0;
        int srcRank = -1;
        ByteBuffer bytes;
    };

    // Point-to-point framing over nonblocking MPI sends. Send buffers are kept
    // alive until MPI reports completion.
    class MpiFrameChannel
    {
    public:
        explicit MpiFrameChannel(MPI_Comm comm = MPI_COMM_WORLD, int tag = 0)
            : m_comm(comm), m_tag(tag)
        {
            if (m_comm == MPI_COMM_NULL)
            {
                throw std::runtime_error("MpiFrameChannel: null communicator");
            }
        }

        MpiFrameChannel(const MpiFrameChannel &) = delete;
        MpiFrameChannel &operator=(const MpiFrameChannel &) = delete;

        ~MpiFrameChannel()
        {
            for (auto &p : m_pendingSends)
            {
                if (MPI_Wait(&p.req, MPI_STATUS_IGNORE) != MPI_SUCCESS)
                {
                    Logger::instance().logf(LogLevel::Error, "mpi", "MPI_Wait failed on a pending send");
                }
            }
        }

        MPI_Comm comm() const noexcept { return m_comm; }

        void send(int dst, MpiFrameKind kind, std::uint64_t session, std::span<const std::byte> payload)
        {
            drain_completed_sends_();

            WireWriter w;
            w.write_u8(static_cast<std::uint8_t>(kind));
            w.write_u64(session);
            w.write_bytes(payload);

            PendingSend pending;
            pending.buf = w.take();
            pending.req = MPI_REQUEST_NULL;

            const int rc = MPI_Isend(pending.buf.data(), static_cast<int>(pending.buf.size()), MPI_BYTE, dst, m_tag, m_comm, &pending.req);
            if (rc != MPI_SUCCESS)
            {
                throw ReplicaError("MpiFrameChannel: MPI_Isend failed");
            }
            m_pendingSends.push_back(std::move(pending));
        }

        // Receives one frame from `source` (or MPI_ANY_SOURCE), if one is waiting.
        std::optional<MpiFrame> poll(int source)
        {
            drain_completed_sends_();

            MPI_Status status;
            int flag = 0;
            int rc = MPI_Iprobe(source, m_tag, m_comm, &flag, &status);
            if (rc != MPI_SUCCESS)
            {
                throw ReplicaError("MpiFrameChannel: MPI_Iprobe failed");
            }
            if (!flag)
            {
                return std::nullopt;
            }

            int count = 0;
            rc = MPI_Get_count(&status, MPI_BYTE, &count);
            if (rc != MPI_SUCCESS || count <= 0)
            {
                throw ReplicaError("MpiFrameChannel: MPI_Get_count failed");
            }

            ByteBuffer buf(static_cast<std::size_t>(count));
            rc = MPI_Recv(buf.data(), count, MPI_BYTE, status.MPI_SOURCE, status.MPI_TAG, m_comm, MPI_STATUS_IGNORE);
            if (rc != MPI_SUCCESS)
            {
                throw ReplicaError("MpiFrameChannel: MPI_Recv failed");
            }

            WireReader r(std::span<const std::byte>(buf.data(), buf.size()));

            MpiFrame out;
            const auto kind = r.read_u8();
            if (kind < static_cast<std::uint8_t>(MpiFrameKind::Hello) || kind > static_cast<std::uint8_t>(MpiFrameKind::Response))
            {
                throw ReplicaError("MpiFrameChannel: unknown frame kind " + std::to_string(kind));
            }
            out.kind = static_cast<MpiFrameKind>(kind);
            out.session = r.read_u64();
            out.srcRank = status.MPI_SOURCE;
            out.bytes = r.read_bytes();
            return out;
        }

    private:
        struct PendingSend
        {
            ByteBuffer buf;
            MPI_Request req = MPI_REQUEST_NULL;
        };

        void drain_completed_sends_()
        {
            for (std::size_t i = 0; i < m_pendingSends.size();)
            {
                int done = 0;
                const int rc = MPI_Test(&m_pendingSends[i].req, &done, MPI_STATUS_IGNORE);
                if (rc != MPI_SUCCESS)
                {
                    throw ReplicaError("MpiFrameChannel: MPI_Test failed");
                }
                if (done)
                {
                    m_pendingSends[i] = std::move(m_pendingSends.back());
                    m_pendingSends.pop_back();
                    continue;
                }
                ++i;
            }
        }

        MPI_Comm m_comm;
        int m_tag = 0;
        std::vector<PendingSend> m_pendingSends;
    };

    // Parses a replica address of the form `mpi:<rank>`.
    inline std::optional<int> parse_mpi_address(std::string_view addr)
    {
        constexpr std::string_view prefix = "mpi:";
        if (addr.substr(0, prefix.size()) != prefix)
        {
            return std::nullopt;
        }
        addr.remove_prefix(prefix.size());
        int rank = -1;
        auto [ptr, ec] = std::from_chars(addr.data(), addr.data() + addr.size(), rank);
        if (ec != std::errc{} || ptr != addr.data() + addr.size() || rank < 0)
        {
            return std::nullopt;
        }
        return rank;
    }

    // Client side of one connection to a replica process on another rank.
    class MpiComputeClient final : public IComputeClient<Timestamp>
    {
    public:
        // Performs the handshake: sends hello with `version` and waits for the
        // replica to accept it. Throws ReplicaError if the replica refuses or
        // does not answer in time; stopping `st` abandons the wait the same way.
        MpiComputeClient(MPI_Comm comm, int tag, int peerRank, std::uint64_t session, std::string_view version,
                         std::chrono::milliseconds handshakeTimeout, std::stop_token st = {})
            : m_channel(comm, tag), m_peer(peerRank), m_session(session)
        {
            if (st.stop_requested())
            {
                throw ReplicaError("handshake with mpi:" + std::to_string(m_peer) + " canceled");
            }
            const ByteBuffer hello = bytes_from_string(std::string(version));
            m_channel.send(m_peer, MpiFrameKind::Hello, m_session, hello);

            const auto deadline = std::chrono::steady_clock::now() + handshakeTimeout;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (st.stop_requested())
                {
                    throw ReplicaError("handshake with mpi:" + std::to_string(m_peer) + " canceled");
                }
                auto frame = m_channel.poll(m_peer);
                if (!frame)
                {
                    std::this_thread::sleep_for(std::chrono::microseconds(100));
                    continue;
                }
                if (frame->kind != MpiFrameKind::HelloAck || frame->session != m_session)
                {
                    // Left over from an earlier session.
                    continue;
                }

                bool accepted = false;
                std::string serverVersion;
                try
                {
                    WireReader r(std::span<const std::byte>(frame->bytes.data(), frame->bytes.size()));
                    accepted = r.read_bool();
                    serverVersion = r.read_string();
                }
                catch (const std::runtime_error &e)
                {
                    throw ReplicaError(std::string("malformed handshake reply from replica: ") + e.what());
                }
                if (!accepted)
                {
                    throw ReplicaError("replica at mpi:" + std::to_string(m_peer) + " rejected version " + std::string(version) +
                                       " (replica runs " + serverVersion + ")");
                }
                return;
            }
            throw ReplicaError("handshake with mpi:" + std::to_string(m_peer) + " timed out");
        }

        void send(ComputeCommand<Timestamp> cmd) override
        {
            const ByteBuffer bytes = encode_command(cmd);
            m_channel.send(m_peer, MpiFrameKind::Command, m_session, bytes);
        }

        std::optional<ComputeResponse<Timestamp>> poll() override
        {
            while (auto frame = m_channel.poll(m_peer))
            {
                if (frame->kind != MpiFrameKind::Response || frame->session != m_session)
                {
                    continue;
                }
                try
                {
                    return decode_response(std::span<const std::byte>(frame->bytes.data(), frame->bytes.size()));
                }
                catch (const std::runtime_error &e)
                {
                    throw ReplicaError(std::string("malformed response from replica: ") + e.what());
                }
            }
            return std::nullopt;
        }

    private:
        MpiFrameChannel m_channel;
        int m_peer = -1;
        std::uint64_t m_session = 0;
    };

    // Connects to replica processes named `mpi:<rank>`, one address per
    // connection. Compose with PartitionedConnector for multi-process replicas.
    class MpiConnector final : public IClientConnector<Timestamp>
    {
    public:
        explicit MpiConnector(MPI_Comm comm = MPI_COMM_WORLD, int tag = 0,
                              std::chrono::milliseconds handshakeTimeout = std::chrono::milliseconds(2000))
            : m_comm(comm), m_tag(tag), m_handshakeTimeout(handshakeTimeout)
        {
            if (m_comm == MPI_COMM_NULL)
            {
                throw std::runtime_error("MpiConnector: null communicator");
            }
            MPI_Comm_rank(m_comm, &m_rank);
            MPI_Comm_size(m_comm, &m_size);
        }

        std::unique_ptr<IComputeClient<Timestamp>> connect(const std::vector<std::string> &addrs, std::string_view version, std::stop_token st = {}) override
        {
            if (addrs.size() != 1)
            {
                throw ReplicaError("MpiConnector: expected exactly one address, got " + std::to_string(addrs.size()));
            }
            const auto rank = parse_mpi_address(addrs.front());
            if (!rank || *rank >= m_size || *rank == m_rank)
            {
                throw ReplicaError("MpiConnector: invalid replica address " + addrs.front());
            }
            // Sessions are unique per controller rank and connection attempt.
            const std::uint64_t session = (static_cast<std::uint64_t>(m_rank) << 40) | ++m_sessions;
            return std::make_unique<MpiComputeClient>(m_comm, m_tag, *rank, session, version, m_handshakeTimeout, st);
        }

    private:
        MPI_Comm m_comm;
        int m_tag = 0;
        std::chrono::milliseconds m_handshakeTimeout;
        int m_rank = 0;
        int m_size = 0;
        // Replica tasks connect concurrently.
        std::atomic<std::uint64_t> m_sessions{0};
    };

    // Replica side: accepts one controller session at a time. A hello starts
    // a fresh session, after which the caller must rebuild its state from the
    // commands that follow.
    class MpiReplicaServer
    {
    public:
        MpiReplicaServer(MPI_Comm comm, int tag, std::string buildVersion)
            : m_channel(comm, tag), m_buildVersion(std::move(buildVersion))
        {
        }

        bool connected() const noexcept { return m_client >= 0; }
        std::uint64_t session() const noexcept { return m_session; }
        std::uint64_t sessions_accepted() const noexcept { return m_accepted; }

        // Returns the next command of the current session, if any. Handshakes
        // and frames of stale sessions are handled internally. `newSession`,
        // when given, is set if a new session started during this call.
        std::optional<ComputeCommand<Timestamp>> poll_command(bool *newSession = nullptr)
        {
            while (auto frame = m_channel.poll(MPI_ANY_SOURCE))
            {
                if (frame->kind == MpiFrameKind::Hello)
                {
                    const std::string version = string_from_bytes(frame->bytes);
                    const bool accepted = version == m_buildVersion;

                    WireWriter w;
                    w.write_bool(accepted);
                    w.write_string(m_buildVersion);
                    const ByteBuffer ack = w.take();
                    m_channel.send(frame->srcRank, MpiFrameKind::HelloAck, frame->session, ack);

                    if (!accepted)
                    {
                        Logger::instance().logf(LogLevel::Warn, "replica-server", "rejected controller version %s", version.c_str());
                        continue;
                    }
                    m_client = frame->srcRank;
                    m_session = frame->session;
                    ++m_accepted;
                    if (newSession)
                    {
                        *newSession = true;
                    }
                    Logger::instance().logf(LogLevel::Info, "replica-server", "accepted session %llu from rank %d",
                                            static_cast<unsigned long long>(m_session), m_client);
                    continue;
                }
                if (frame->kind != MpiFrameKind::Command || frame->session != m_session || frame->srcRank != m_client)
                {
                    continue;
                }
                return decode_command(std::span<const std::byte>(frame->bytes.data(), frame->bytes.size()));
            }
            return std::nullopt;
        }

        // Sends a response to the current session. Throws if there is none.
        void send_response(const ComputeResponse<Timestamp> &resp)
        {
            if (!connected())
            {
                throw std::runtime_error("MpiReplicaServer: no controller session");
            }
            const ByteBuffer bytes = encode_response(resp);
            m_channel.send(m_client, MpiFrameKind::Response, m_session, bytes);
        }

    private:
        MpiFrameChannel m_channel;
        std::string m_buildVersion;
        int m_client = -1;
        std::uint64_t m_session = 0;
        std::uint64_t m_accepted = 0;
    };
}
