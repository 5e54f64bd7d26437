/*
Purpose: Compute protocol over MPI between a controller rank and a replica rank.

What this tests: malformed addresses are rejected, a stopped connection
attempt fails without waiting for the handshake, a version mismatch fails
the handshake with ReplicaError, an accepted session carries commands to the
replica and responses back, and a second connection starts a new session on
the server whose frames do not mix with the first.
*/

#include "mpi_transport.hpp"

#include <mpi.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stop_token>

namespace
{
    using T = replicaflow::Timestamp;
    using replicaflow::Antichain;
    using replicaflow::GlobalId;

    constexpr int kTag = 7;
    const replicaflow::Uuid kDone{0, 0xD0};

    [[noreturn]] void fail(const char *msg)
    {
        std::fprintf(stderr, "%s\n", msg);
        MPI_Abort(MPI_COMM_WORLD, 1);
        std::abort();
    }

    void check(bool ok, const char *msg)
    {
        if (!ok)
        {
            fail(msg);
        }
    }

    replicaflow::CreateDataflows<T> create_index(GlobalId id)
    {
        replicaflow::DataflowDescription<T> d;
        d.indexExports.push_back(replicaflow::IndexExport{id, GlobalId::transient(id.value), {}});
        d.asOf = Antichain<T>{0};
        return replicaflow::CreateDataflows<T>{{d}};
    }

    replicaflow::Peek<T> make_peek(replicaflow::Uuid uuid)
    {
        replicaflow::Peek<T> p;
        p.id = GlobalId::user(1);
        p.uuid = uuid;
        p.timestamp = 4;
        return p;
    }

    // Replica rank: answers dataflow creation with a frontier and peeks with
    // the number of the session they arrived on. Stops at the `kDone` peek.
    void serve()
    {
        replicaflow::MpiReplicaServer server(MPI_COMM_WORLD, kTag, "v1");
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (std::chrono::steady_clock::now() < deadline)
        {
            bool newSession = false;
            auto cmd = server.poll_command(&newSession);
            if (!cmd)
            {
                continue;
            }
            if (const auto *create = cmd->get_if<replicaflow::CreateDataflows<T>>())
            {
                replicaflow::FrontierUppers<T> uppers;
                for (const auto &id : create->dataflows.front().export_ids())
                {
                    uppers.uppers.emplace_back(id, Antichain<T>{5});
                }
                server.send_response(uppers);
            }
            else if (const auto *peek = cmd->get_if<replicaflow::Peek<T>>())
            {
                replicaflow::PeekResponse r;
                r.uuid = peek->uuid;
                r.result = replicaflow::PeekRows{{{"session-" + std::to_string(server.sessions_accepted()), 1}}};
                server.send_response(r);
                if (peek->uuid == kDone)
                {
                    return;
                }
            }
        }
        fail("replica rank timed out");
    }

    std::optional<replicaflow::ComputeResponse<T>> await(replicaflow::IComputeClient<T> &client)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (auto r = client.poll())
            {
                return r;
            }
        }
        return std::nullopt;
    }

    std::string peek_row(const std::optional<replicaflow::ComputeResponse<T>> &r)
    {
        check(r.has_value(), "no peek response");
        const auto *peek = r->get_if<replicaflow::PeekResponse>();
        check(peek != nullptr, "expected a peek response");
        return std::get<replicaflow::PeekRows>(peek->result).rows.front().first;
    }

    void control()
    {
        replicaflow::MpiConnector connector(MPI_COMM_WORLD, kTag, std::chrono::milliseconds(5000));

        for (const char *bad : {"tcp:1", "mpi:", "mpi:0", "mpi:99", "mpi:1x"})
        {
            bool threw = false;
            try
            {
                (void)connector.connect({bad}, "v1");
            }
            catch (const replicaflow::ReplicaError &)
            {
                threw = true;
            }
            check(threw, "malformed address accepted");
        }

        // A stopped connection attempt gives up without waiting out the handshake.
        {
            std::stop_source stopped;
            stopped.request_stop();
            const auto start = std::chrono::steady_clock::now();
            bool threw = false;
            try
            {
                (void)connector.connect({"mpi:1"}, "v1", stopped.get_token());
            }
            catch (const replicaflow::ReplicaError &)
            {
                threw = true;
            }
            check(threw, "stopped connect succeeded");
            check(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1000), "stopped connect waited for the handshake");
        }

        {
            bool threw = false;
            try
            {
                (void)connector.connect({"mpi:1"}, "v0");
            }
            catch (const replicaflow::ReplicaError &)
            {
                threw = true;
            }
            check(threw, "version mismatch accepted");
        }

        {
            auto client = connector.connect({"mpi:1"}, "v1");
            client->send(create_index(GlobalId::user(1)));
            const auto uppers = await(*client);
            check(uppers.has_value(), "no frontier response");
            const auto *u = uppers->get_if<replicaflow::FrontierUppers<T>>();
            check(u != nullptr && u->uppers.size() == 1, "expected one upper");
            check(u->uppers[0].first == GlobalId::user(1), "wrong collection");
            check(u->uppers[0].second == Antichain<T>{5}, "wrong frontier");

            client->send(make_peek(replicaflow::Uuid{0, 1}));
            check(peek_row(await(*client)) == "session-1", "peek answered on wrong session");
        }

        // Reconnecting replaces the session.
        auto client = connector.connect({"mpi:1"}, "v1");
        client->send(make_peek(kDone));
        check(peek_row(await(*client)) == "session-2", "reconnect did not start a new session");
    }
}

int main(int argc, char **argv)
{
    int rc = MPI_Init(&argc, &argv);
    if (rc != MPI_SUCCESS)
    {
        return 2;
    }

    int rank = -1;
    int size = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    check(size == 2, "MPI compute client test requires exactly 2 ranks");

    if (rank == 0)
    {
        control();
    }
    else
    {
        serve();
    }

    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return 0;
}
