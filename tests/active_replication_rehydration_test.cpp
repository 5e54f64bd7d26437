/*
Purpose: Replica failures are repaired without the caller noticing.

What this tests: a replica whose connection breaks (or is closed by the
replica) is reconnected and replayed the history; responses it repeats after
the replay are suppressed; frontier and peek answers stay deduplicated across
the failure; a replica found dead during send is rehydrated immediately and
the end-of-stream marker of its old task is discarded as stale; the uppers
of a rehydrated replica's introspection collections do not move backwards.
*/

#include "active_replication.hpp"
#include "local_replica.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace
{
    using T = replicaflow::Timestamp;
    using replicaflow::Antichain;
    using replicaflow::GlobalId;
    using Endpoint = replicaflow::LocalReplicaEndpoint<T>;
    using namespace std::chrono_literals;

    const GlobalId kIndex = GlobalId::user(1);

    replicaflow::ActiveReplicationConfig fast_config()
    {
        replicaflow::ActiveReplicationConfig cfg;
        cfg.connectRetry.initialBackoff = std::chrono::milliseconds(5);
        cfg.connectRetry.maxBackoff = std::chrono::milliseconds(20);
        return cfg;
    }

    replicaflow::CreateDataflows<T> create_index(GlobalId id)
    {
        replicaflow::DataflowDescription<T> d;
        d.indexExports.push_back(replicaflow::IndexExport{id, GlobalId::transient(id.value), {}});
        d.asOf = Antichain<T>{0};
        return replicaflow::CreateDataflows<T>{{d}};
    }

    replicaflow::ComputeResponse<T> upper(T t)
    {
        return replicaflow::FrontierUppers<T>{{{kIndex, Antichain<T>{t}}}};
    }

    // Receives compute responses (skipping heartbeats) until `quiet` passes
    // without one.
    std::vector<replicaflow::ComputeResponse<T>> collect(replicaflow::ActiveReplication<T> &ar, std::chrono::milliseconds quiet)
    {
        std::vector<replicaflow::ComputeResponse<T>> out;
        while (auto r = ar.recv_for(quiet))
        {
            if (const auto *c = r->compute())
            {
                out.push_back(*c);
            }
        }
        return out;
    }

    // Pumps the controller until `ep` has a live session number `n` that
    // received at least `commands` commands.
    bool pump_until_rehydrated(replicaflow::ActiveReplication<T> &ar, Endpoint &ep, std::size_t n, std::size_t commands,
                               std::vector<replicaflow::ComputeResponse<T>> &seen)
    {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (auto r = ar.recv_for(5ms))
            {
                if (const auto *c = r->compute())
                {
                    seen.push_back(*c);
                }
            }
            if (ep.wait_for_sessions(n, 0ms) && ep.commands(n - 1).size() >= commands)
            {
                return true;
            }
        }
        return false;
    }
}

int main()
{
    auto connector = std::make_shared<replicaflow::LocalConnector<T>>();
    auto r1 = connector->add_endpoint("r1");
    auto r2 = connector->add_endpoint("r2");

    replicaflow::ActiveReplication<T> ar(fast_config(), connector);
    ar.add_replica(1, {"r1"});
    ar.add_replica(2, {"r2"});

    ar.send(replicaflow::CreateTimely{});
    ar.send(create_index(kIndex));
    assert(r1->wait_for_commands(0, 2, 5s));
    assert(r2->wait_for_commands(0, 2, 5s));

    // Both replicas report the same progress: delivered once.
    r1->push_response(upper(5));
    r2->push_response(upper(5));
    {
        const auto got = collect(ar, 200ms);
        assert(got.size() == 1);
        assert((got[0] == upper(5)));
    }

    // r1 breaks and comes back with the replayed history.
    r1->fail();
    {
        std::vector<replicaflow::ComputeResponse<T>> seen;
        assert(pump_until_rehydrated(ar, *r1, 2, 2, seen));
        assert(seen.empty());

        const auto replay = r1->commands(1);
        assert(replay.size() == 2);
        assert(replay[0].is<replicaflow::CreateTimely>());
        assert(replay[1].is<replicaflow::CreateDataflows<T>>());
    }
    assert(ar.stats().rehydrations == 1);

    // The rehydrated replica re-reports old progress: suppressed. New
    // progress from either replica is delivered once.
    r1->push_response(upper(5));
    assert(collect(ar, 200ms).empty());
    r1->push_response(upper(9));
    r2->push_response(upper(9));
    {
        const auto got = collect(ar, 200ms);
        assert(got.size() == 1);
        assert((got[0] == upper(9)));
    }

    // A peek answered by both replicas is delivered once.
    replicaflow::Peek<T> peek;
    peek.id = kIndex;
    peek.uuid = replicaflow::Uuid{7, 7};
    peek.timestamp = 8;
    ar.send(peek);
    assert(r1->wait_for_commands(1, 3, 5s));
    assert(r2->wait_for_commands(0, 3, 5s));
    {
        replicaflow::PeekResponse answer;
        answer.uuid = peek.uuid;
        answer.result = replicaflow::PeekRows{{{"row", 1}}};
        r2->push_response(answer);
        r1->push_response(answer);

        const auto got = collect(ar, 200ms);
        assert(got.size() == 1);
        assert(got[0].is<replicaflow::PeekResponse>());
    }

    // r2 hangs up in an orderly way, which is still a failure.
    r2->close_gracefully();
    {
        std::vector<replicaflow::ComputeResponse<T>> seen;
        assert(pump_until_rehydrated(ar, *r2, 2, 2, seen));
        assert(seen.empty());

        // The answered peek is not replayed.
        for (const auto &cmd : r2->commands(1))
        {
            assert(!cmd.is<replicaflow::Peek<T>>());
        }
    }
    assert(ar.stats().rehydrations == 2);

    // r1 dies while the controller is not receiving. The next send finds
    // its task gone and rehydrates it on the spot.
    r1->fail();
    std::this_thread::sleep_for(200ms);
    replicaflow::AllowCompaction<T> compaction;
    compaction.frontiers.emplace_back(kIndex, Antichain<T>{3});
    ar.send(compaction);
    assert(ar.stats().rehydrations == 3);
    assert(r1->wait_for_sessions(3, 5s));
    assert(r1->wait_for_commands(2, 2, 5s));
    {
        // The compaction is folded into the replayed dataflow.
        const auto replay = r1->commands(2);
        assert(replay.size() == 2);
        const auto *create = replay[1].get_if<replicaflow::CreateDataflows<T>>();
        assert(create && (*create->dataflows[0].asOf == Antichain<T>{3}));
    }
    assert(r2->wait_for_commands(1, 3, 5s));

    // The dead task's end-of-stream marker arrives later and is ignored.
    assert(collect(ar, 200ms).empty());
    assert(ar.stats().rehydrations == 3);
    assert(ar.stats().staleMessages >= 1);

    const auto ids = ar.get_replica_ids();
    assert((ids == std::vector<replicaflow::ReplicaId>{1, 2}));

    // Introspection collections of a rehydrated replica never report an
    // earlier upper than the one already delivered.
    {
        auto logsConnector = std::make_shared<replicaflow::LocalConnector<T>>();
        auto r3 = logsConnector->add_endpoint("r3");
        replicaflow::ActiveReplication<T> logsAr(fast_config(), logsConnector);

        const GlobalId peekLog = GlobalId::system(42);
        replicaflow::PersistedLogs logs;
        logs[replicaflow::LogVariant::ComputePeekCurrent] = {peekLog, replicaflow::CollectionMetadata{}};
        logsAr.add_replica(3, {"r3"}, logs);
        logsAr.send(replicaflow::CreateTimely{});
        assert(r3->wait_for_commands(0, 1, 5s));

        r3->push_response(replicaflow::FrontierUppers<T>{{{peekLog, Antichain<T>{5}}}});
        const auto before = collect(logsAr, 100ms);
        assert(before.size() == 1);

        r3->fail();
        assert(collect(logsAr, 100ms).empty());
        assert(logsAr.stats().rehydrations == 1);
        assert(r3->wait_for_sessions(2, 5s));
        assert(logsAr.state().upper(peekLog) != nullptr);
        assert(*logsAr.state().upper(peekLog) == Antichain<T>{5});

        r3->push_response(replicaflow::FrontierUppers<T>{{{peekLog, Antichain<T>{3}}}});
        r3->push_response(replicaflow::FrontierUppers<T>{{{peekLog, Antichain<T>{7}}}});
        const auto after = collect(logsAr, 200ms);
        assert(after.size() == 1);
        const auto *u = after[0].get_if<replicaflow::FrontierUppers<T>>();
        assert(u && u->uppers.size() == 1);
        assert(u->uppers[0].first == peekLog);
        assert(u->uppers[0].second == Antichain<T>{7});
    }

    return 0;
}
