/*
Purpose: History reduction produces an equivalent, shorter replay.

What this tests: reduce keeps the last CreateTimely/CreateInstance, merges
configuration updates, folds allowed compaction into dataflow as-of frontiers,
drops dataflows whose outputs were all retired, keeps live peeks, orders
InitializationComplete last, and is idempotent.
*/

#include "command_history.hpp"

#include <cassert>
#include <vector>

namespace
{
    using T = replicaflow::Timestamp;
    using replicaflow::Antichain;
    using replicaflow::GlobalId;

    replicaflow::DataflowDescription<T> index_dataflow(std::uint64_t id)
    {
        replicaflow::DataflowDescription<T> d;
        d.objectsToBuild.push_back(replicaflow::BuildDesc{GlobalId::transient(id), "plan"});
        d.indexExports.push_back(replicaflow::IndexExport{GlobalId::user(id), GlobalId::transient(id), {0}});
        d.asOf = Antichain<T>{0};
        d.debugName = "index_" + std::to_string(id);
        return d;
    }

    replicaflow::AllowCompaction<T> compact(GlobalId id, Antichain<T> f)
    {
        replicaflow::AllowCompaction<T> c;
        c.frontiers.emplace_back(id, std::move(f));
        return c;
    }
}

int main()
{
    replicaflow::ComputeCommandHistory<T> h;

    replicaflow::CreateTimely first;
    first.config.workers = 2;
    replicaflow::CreateTimely second;
    second.config.workers = 4;
    h.push(first);
    h.push(second);
    h.push(replicaflow::CreateInstance{});

    using replicaflow::ComputeParameter;
    using replicaflow::ComputeParameterKind;
    h.push(replicaflow::UpdateConfiguration{{ComputeParameter{ComputeParameterKind::MaxResultSize, 10}}});
    h.push(replicaflow::UpdateConfiguration{{ComputeParameter{ComputeParameterKind::MaxResultSize, 20},
                                             ComputeParameter{ComputeParameterKind::DataflowMaxInflightBytes, 5}}});

    // df1 exports u1; df2 exports the index u3 and the sink u2.
    auto df1 = index_dataflow(1);
    auto df2 = index_dataflow(3);
    df2.sinkExports.push_back(replicaflow::SinkExport{GlobalId::user(2), GlobalId::user(3), "kafka"});
    h.push(replicaflow::CreateDataflows<T>{{df1, df2}});

    h.push(compact(GlobalId::user(1), Antichain<T>{5}));
    h.push(compact(GlobalId::user(2), Antichain<T>{7}));
    h.push(compact(GlobalId::user(3), Antichain<T>{4}));
    h.push(compact(GlobalId::user(1), Antichain<T>{8}));
    // Retires df1 entirely.
    h.push(compact(GlobalId::user(1), Antichain<T>{}));

    replicaflow::Peek<T> peek;
    peek.id = GlobalId::user(3);
    peek.uuid = replicaflow::Uuid{0, 42};
    peek.timestamp = 6;
    h.push(peek);
    h.push(replicaflow::InitializationComplete{});

    assert(h.size() == 13);
    h.reduce();

    const auto &cmds = h.commands();
    assert(cmds.size() == 7);

    const auto *ct = cmds[0].get_if<replicaflow::CreateTimely>();
    assert(ct && ct->config.workers == 4);

    assert(cmds[1].is<replicaflow::CreateInstance>());

    const auto *update = cmds[2].get_if<replicaflow::UpdateConfiguration>();
    assert(update);
    assert(update->params.size() == 2);
    assert(update->params.count(ComputeParameter{ComputeParameterKind::MaxResultSize, 20}) == 1);
    assert(update->params.count(ComputeParameter{ComputeParameterKind::DataflowMaxInflightBytes, 5}) == 1);

    // df1 is gone; df2 starts at the meet of its exports' compaction.
    const auto *create = cmds[3].get_if<replicaflow::CreateDataflows<T>>();
    assert(create);
    assert(create->dataflows.size() == 1);
    assert(create->dataflows[0].debugName == "index_3");
    assert(create->dataflows[0].asOf.has_value());
    assert((*create->dataflows[0].asOf == Antichain<T>{4}));

    // u1 went with its dataflow and u3 is implied by as-of; u2 still lags ahead.
    const auto *compaction = cmds[4].get_if<replicaflow::AllowCompaction<T>>();
    assert(compaction);
    assert(compaction->frontiers.size() == 1);
    assert((compaction->frontiers[0].first == GlobalId::user(2)));
    assert((compaction->frontiers[0].second == Antichain<T>{7}));

    const auto *keptPeek = cmds[5].get_if<replicaflow::Peek<T>>();
    assert(keptPeek && (keptPeek->uuid == replicaflow::Uuid{0, 42}));

    assert(cmds[6].is<replicaflow::InitializationComplete>());

    // Idempotent.
    const std::vector<replicaflow::ComputeCommand<T>> once = h.commands();
    h.reduce();
    assert(h.commands() == once);

    // Reducing an empty history is a no-op.
    replicaflow::ComputeCommandHistory<T> empty;
    empty.reduce();
    assert(empty.empty());

    return 0;
}
