/*
Purpose: Frontier deduplication across replicas.

What this tests: identical reports from two replicas produce one emission,
regressive or equal reports never produce one, incomparable (partially
ordered) reports do not count as progress, untracked collections are ignored,
and every response queues a heartbeat for the reporting replica.
*/

#include "replication_state.hpp"

#include <cassert>
#include <cstdint>

namespace
{
    using T = replicaflow::Timestamp;
    using P = replicaflow::Product<std::uint64_t, std::uint64_t>;
    using replicaflow::Antichain;
    using replicaflow::GlobalId;

    template <class Time>
    replicaflow::CreateDataflows<Time> create_index(GlobalId id)
    {
        replicaflow::DataflowDescription<Time> d;
        d.indexExports.push_back(replicaflow::IndexExport{id, GlobalId::transient(id.value), {}});
        d.asOf = Antichain<Time>::minimum();
        return replicaflow::CreateDataflows<Time>{{d}};
    }

    template <class Time>
    replicaflow::ComputeResponse<Time> uppers(std::vector<std::pair<GlobalId, Antichain<Time>>> u)
    {
        return replicaflow::FrontierUppers<Time>{std::move(u)};
    }

    template <class Time>
    const replicaflow::FrontierUppers<Time> &as_uppers(const std::optional<replicaflow::ActiveReplicationResponse<Time>> &r)
    {
        assert(r.has_value());
        const auto *compute = r->compute();
        assert(compute);
        const auto *out = compute->template get_if<replicaflow::FrontierUppers<Time>>();
        assert(out);
        return *out;
    }

    template <class Time>
    std::size_t drain_heartbeats(replicaflow::ActiveReplicationState<Time> &s)
    {
        std::size_t n = 0;
        while (auto r = s.pop_pending())
        {
            assert(r->is_heartbeat());
            ++n;
        }
        return n;
    }
}

int main()
{
    const GlobalId c1 = GlobalId::user(1);

    // Two replicas report the same advance: emitted once.
    {
        replicaflow::ActiveReplicationState<T> s;
        s.handle_command(create_index<T>(c1));
        assert(s.tracked_collections() == 1);
        assert((*s.upper(c1) == Antichain<T>{0}));

        const auto first = s.handle_response(uppers<T>({{c1, Antichain<T>{5}}}), 1);
        const auto &u = as_uppers(first);
        assert(u.uppers.size() == 1);
        assert((u.uppers[0].first == c1));
        assert((u.uppers[0].second == Antichain<T>{5}));

        assert(!s.handle_response(uppers<T>({{c1, Antichain<T>{5}}}), 2).has_value());

        // Heartbeats: one per response, in arrival order.
        auto hb1 = s.pop_pending();
        assert(hb1 && hb1->is_heartbeat() && hb1->heartbeat()->replica == 1);
        auto hb2 = s.pop_pending();
        assert(hb2 && hb2->is_heartbeat() && hb2->heartbeat()->replica == 2);
        assert(!s.has_pending());

        // Regression and repetition are dropped; further progress is not.
        assert(!s.handle_response(uppers<T>({{c1, Antichain<T>{3}}}), 2).has_value());
        assert(!s.handle_response(uppers<T>({{c1, Antichain<T>{5}}}), 1).has_value());
        const auto next = s.handle_response(uppers<T>({{c1, Antichain<T>{7}}}), 2);
        assert((as_uppers(next).uppers[0].second == Antichain<T>{7}));
        assert((*s.upper(c1) == Antichain<T>{7}));

        // Untracked ids are skipped; the rest of the batch still counts.
        const auto mixed = s.handle_response(uppers<T>({{GlobalId::user(99), Antichain<T>{9}}, {c1, Antichain<T>{8}}}), 1);
        assert(as_uppers(mixed).uppers.size() == 1);
        assert((as_uppers(mixed).uppers[0].first == c1));

        // Completion (empty frontier) is progress too.
        const auto done = s.handle_response(uppers<T>({{c1, Antichain<T>{}}}), 1);
        assert(as_uppers(done).uppers[0].second.empty());
        assert(!s.handle_response(uppers<T>({{c1, Antichain<T>{}}}), 2).has_value());

        assert(drain_heartbeats(s) == 6);

        // Retired: later reports are ignored.
        replicaflow::AllowCompaction<T> retire;
        retire.frontiers.emplace_back(c1, Antichain<T>{});
        s.handle_command(retire);
        assert(s.upper(c1) == nullptr);
        assert(!s.handle_response(uppers<T>({{c1, Antichain<T>{}}}), 1).has_value());
    }

    // Partially ordered times: an incomparable report is not progress.
    {
        replicaflow::ActiveReplicationState<P> s;
        s.handle_command(create_index<P>(c1));

        const auto a = s.handle_response(uppers<P>({{c1, Antichain<P>{P{1, 2}}}}), 1);
        assert((as_uppers(a).uppers[0].second == Antichain<P>{P{1, 2}}));

        assert(!s.handle_response(uppers<P>({{c1, Antichain<P>{P{2, 1}}}}), 2).has_value());
        assert((*s.upper(c1) == Antichain<P>{P{1, 2}}));

        const auto b = s.handle_response(uppers<P>({{c1, Antichain<P>{P{2, 2}}}}), 2);
        assert((as_uppers(b).uppers[0].second == Antichain<P>{P{2, 2}}));

        assert(drain_heartbeats(s) == 3);
    }

    return 0;
}
