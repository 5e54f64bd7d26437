#include "active_replication.hpp"
#include "mpi_transport.hpp"

#include <mpi.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// Rank 0 runs the controller; every other rank is a single-process replica.
//
// Replicas only speak when spoken to: each peek at time t is answered with the
// collection uppers at t+1 followed by the rows. That keeps the controller and
// the replicas in lockstep, so the run ends cleanly once every replica has
// answered the final peek.

namespace
{
    using T = replicaflow::Timestamp;

    constexpr int kTag = 11;
    constexpr replicaflow::Uuid kShutdownPeek{0xFFFF'FFFF'FFFF'FFFFull, 0};
    const char *const kVersion = "mpi-demo";

    struct Params
    {
        std::uint32_t steps = 20;
        std::uint64_t timeoutMs = 10'000;
        replicaflow::LogLevel logLevel = replicaflow::LogLevel::Warn;
    };

    bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    [[noreturn]] void usage_and_exit(int rank)
    {
        if (rank == 0)
        {
            std::cerr << "MPI replicated compute (rank 0 controls, ranks 1.. are replicas)\n"
                      << "  --steps N         number of peeks to issue (default 20)\n"
                      << "  --timeout-ms N    per-step wait for all replicas (default 10000)\n"
                      << "  --log LEVEL       error|warn|info|debug|trace|off (default warn, or REPLICAFLOW_LOG)\n";
        }
        MPI_Abort(MPI_COMM_WORLD, 2);
        std::exit(2);
    }

    Params parse_args(int argc, char **argv, int rank)
    {
        Params p;
        p.logLevel = replicaflow::log_level_from_env(p.logLevel);
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit(rank);
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--steps")
            {
                if (!parse_u32(need(), p.steps))
                    usage_and_exit(rank);
            }
            else if (a == "--timeout-ms")
            {
                if (!parse_u64(need(), p.timeoutMs))
                    usage_and_exit(rank);
            }
            else if (a == "--log")
            {
                auto lvl = replicaflow::parse_log_level(need());
                if (!lvl)
                    usage_and_exit(rank);
                p.logLevel = *lvl;
            }
            else
            {
                usage_and_exit(rank);
            }
        }
        return p;
    }

    // Replica rank: serves controller sessions until the shutdown peek arrives.
    void serve(int rank)
    {
        replicaflow::MpiReplicaServer server(MPI_COMM_WORLD, kTag, kVersion);
        std::set<replicaflow::GlobalId> exports;

        for (;;)
        {
            bool fresh = false;
            auto cmd = server.poll_command(&fresh);
            if (fresh)
            {
                exports.clear();
            }
            if (!cmd)
            {
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                continue;
            }

            if (const auto *create = cmd->get_if<replicaflow::CreateDataflows<T>>())
            {
                for (const auto &d : create->dataflows)
                {
                    for (const auto &id : d.export_ids())
                    {
                        exports.insert(id);
                    }
                }
            }
            else if (const auto *ac = cmd->get_if<replicaflow::AllowCompaction<T>>())
            {
                for (const auto &[id, f] : ac->frontiers)
                {
                    if (f.empty())
                    {
                        exports.erase(id);
                    }
                }
            }
            else if (const auto *peek = cmd->get_if<replicaflow::Peek<T>>())
            {
                replicaflow::FrontierUppers<T> uppers;
                for (const auto &id : exports)
                {
                    uppers.uppers.emplace_back(id, replicaflow::Antichain<T>{peek->timestamp + 1});
                }
                server.send_response(std::move(uppers));

                replicaflow::PeekResponse r;
                r.uuid = peek->uuid;
                r.result = replicaflow::PeekRows{{{"rank " + std::to_string(rank), 1}}};
                server.send_response(r);

                if (peek->uuid == kShutdownPeek)
                {
                    return;
                }
            }
        }
    }

    int control(const Params &p, int size)
    {
        replicaflow::ActiveReplicationConfig cfg;
        cfg.buildVersion = kVersion;
        cfg.logLevel = p.logLevel;

        replicaflow::ActiveReplication<T> ar(cfg, std::make_shared<replicaflow::MpiConnector>(MPI_COMM_WORLD, kTag));
        for (int r = 1; r < size; ++r)
        {
            ar.add_replica(static_cast<replicaflow::ReplicaId>(r), {"mpi:" + std::to_string(r)});
        }

        const replicaflow::GlobalId index = replicaflow::GlobalId::user(1);
        replicaflow::DataflowDescription<T> d;
        d.objectsToBuild.push_back(replicaflow::BuildDesc{replicaflow::GlobalId::transient(1), "Get(u0)"});
        d.indexExports.push_back(replicaflow::IndexExport{index, replicaflow::GlobalId::transient(1), {0}});
        d.asOf = replicaflow::Antichain<T>{0};
        d.debugName = "mpi_index";

        ar.send(replicaflow::CreateTimely{});
        ar.send(replicaflow::CreateInstance{});
        ar.send(replicaflow::CreateDataflows<T>{{d}});
        ar.send(replicaflow::InitializationComplete{});

        std::map<replicaflow::ReplicaId, std::uint64_t> heard;
        std::uint64_t answered = 0;
        replicaflow::Antichain<T> upper = replicaflow::Antichain<T>::minimum();

        // Each replica answers a peek with two responses.
        const auto await_step = [&](std::uint64_t expectedPerReplica) -> bool
        {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(p.timeoutMs);
            for (;;)
            {
                bool done = true;
                for (int r = 1; r < size; ++r)
                {
                    done = done && heard[static_cast<replicaflow::ReplicaId>(r)] >= expectedPerReplica;
                }
                if (done)
                {
                    return true;
                }
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                {
                    return false;
                }
                auto resp = ar.recv_for(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
                if (!resp)
                {
                    continue;
                }
                if (const auto *hb = resp->heartbeat())
                {
                    ++heard[hb->replica];
                }
                else if (const auto *c = resp->compute())
                {
                    if (c->is<replicaflow::PeekResponse>())
                    {
                        ++answered;
                    }
                    else if (const auto *u = c->get_if<replicaflow::FrontierUppers<T>>())
                    {
                        for (const auto &[id, f] : u->uppers)
                        {
                            if (id == index)
                            {
                                upper = f;
                            }
                        }
                    }
                }
            }
        };

        for (std::uint32_t step = 0; step <= p.steps; ++step)
        {
            replicaflow::Peek<T> peek;
            peek.id = index;
            peek.uuid = step == p.steps ? kShutdownPeek : replicaflow::Uuid{0, step + 1};
            peek.timestamp = step;
            ar.send(peek);

            if (!await_step(2ull * (step + 1)))
            {
                std::cerr << "mpi_replicated_compute: replicas did not answer step " << step << "\n";
                return 2;
            }
        }

        const auto &stats = ar.stats();
        std::cout << "mpi_replicated_compute"
                  << " replicas=" << (size - 1)
                  << " peeks=" << (p.steps + 1)
                  << " answered=" << answered
                  << " upper=" << replicaflow::to_string(upper)
                  << " suppressed=" << stats.responsesSuppressed << "\n";

        if (answered != p.steps + 1ull)
        {
            std::cerr << "mpi_replicated_compute: expected one answer per peek\n";
            return 2;
        }
        return 0;
    }
}

int main(int argc, char **argv)
{
    // Replica tasks on rank 0 call MPI from their own threads.
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_MULTIPLE, &provided);
    int rank = 0;
    int size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    if (provided < MPI_THREAD_MULTIPLE)
    {
        if (rank == 0)
        {
            std::cerr << "mpi_replicated_compute: MPI_THREAD_MULTIPLE is not supported\n";
        }
        MPI_Finalize();
        return 2;
    }
    if (size < 2)
    {
        if (rank == 0)
        {
            std::cerr << "mpi_replicated_compute: needs at least 2 ranks\n";
        }
        MPI_Finalize();
        return 2;
    }

    const Params p = parse_args(argc, argv, rank);
    replicaflow::Logger::instance().set_level(p.logLevel);

    int exitCode = 0;
    if (rank == 0)
    {
        exitCode = control(p, size);
        if (exitCode != 0)
        {
            MPI_Abort(MPI_COMM_WORLD, exitCode);
        }
    }
    else
    {
        serve(rank);
    }

    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return exitCode;
}
