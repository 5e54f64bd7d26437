#pragma once

#include "protocol.hpp"

#include <map>
#include <optional>
#include <set>
#include <vector>

namespace replicaflow
{
    // Every command issued to the compute instance, in issue order, so that new
    // or restarted replicas can be brought up to speed by replaying it.
    template <class T>
    class ComputeCommandHistory
    {
    public:
        using Command = ComputeCommand<T>;

        void clear() { m_commands.clear(); }

        void push(Command cmd) { m_commands.push_back(std::move(cmd)); }

        // Drops peeks (and cancellations of peeks) that are no longer pending.
        // `pending` is any container with a `contains(Uuid)` member.
        template <class Pending>
        void retain_peeks(const Pending &pending)
        {
            for (auto &cmd : m_commands)
            {
                if (auto *cancel = cmd.template get_if<CancelPeeks>())
                {
                    std::erase_if(cancel->uuids, [&](const Uuid &u)
                                  { return !pending.contains(u); });
                }
            }
            std::erase_if(m_commands, [&](const Command &cmd)
                          {
                              if (const auto *peek = cmd.template get_if<Peek<T>>())
                              {
                                  return !pending.contains(peek->uuid);
                              }
                              if (const auto *cancel = cmd.template get_if<CancelPeeks>())
                              {
                                  return cancel->uuids.empty();
                              }
                              return false; });
        }

        // Rewrites the history into an equivalent, usually much shorter, one.
        //
        // Replaying the result against a fresh replica leaves it in the same
        // state as replaying the original: compaction is folded into dataflow
        // `asOf` frontiers, dataflows whose outputs were all retired are
        // dropped, and configuration updates are merged. Idempotent.
        void reduce()
        {
            std::optional<CreateTimely> createTimely;
            std::optional<CreateInstance> createInstance;
            bool initializationComplete = false;
            std::map<ComputeParameterKind, std::uint64_t> params;
            std::vector<DataflowDescription<T>> liveDataflows;
            std::map<GlobalId, Antichain<T>> finalFrontiers;
            std::vector<Peek<T>> livePeeks;
            std::set<Uuid> liveCancels;

            for (auto &cmd : m_commands)
            {
                std::visit(
                    [&](auto &c)
                    {
                        using C = std::decay_t<decltype(c)>;
                        if constexpr (std::is_same_v<C, CreateTimely>)
                        {
                            createTimely = std::move(c);
                        }
                        else if constexpr (std::is_same_v<C, CreateInstance>)
                        {
                            createInstance = std::move(c);
                        }
                        else if constexpr (std::is_same_v<C, InitializationComplete>)
                        {
                            initializationComplete = true;
                        }
                        else if constexpr (std::is_same_v<C, UpdateConfiguration>)
                        {
                            for (const auto &p : c.params)
                            {
                                params[p.kind] = p.value;
                            }
                        }
                        else if constexpr (std::is_same_v<C, CreateDataflows<T>>)
                        {
                            for (auto &d : c.dataflows)
                            {
                                liveDataflows.push_back(std::move(d));
                            }
                        }
                        else if constexpr (std::is_same_v<C, AllowCompaction<T>>)
                        {
                            for (auto &[id, frontier] : c.frontiers)
                            {
                                finalFrontiers[id] = std::move(frontier);
                            }
                        }
                        else if constexpr (std::is_same_v<C, Peek<T>>)
                        {
                            livePeeks.push_back(std::move(c));
                        }
                        else if constexpr (std::is_same_v<C, CancelPeeks>)
                        {
                            liveCancels.insert(c.uuids.begin(), c.uuids.end());
                        }
                    },
                    cmd.value);
            }

            // Fold allowed compaction into each dataflow's `asOf`.
            for (auto &dataflow : liveDataflows)
            {
                const Antichain<T> initial = dataflow.asOf.value_or(Antichain<T>::minimum());
                const auto exports = dataflow.export_ids();

                Antichain<T> asOf;
                if (exports.empty())
                {
                    asOf = initial;
                }
                for (const auto &id : exports)
                {
                    auto it = finalFrontiers.find(id);
                    asOf.extend(it != finalFrontiers.end() ? it->second : initial);
                }

                for (const auto &id : exports)
                {
                    auto it = finalFrontiers.find(id);
                    if (it != finalFrontiers.end() && it->second == asOf)
                    {
                        finalFrontiers.erase(it);
                    }
                }
                dataflow.asOf = std::move(asOf);
            }

            // Dataflows whose outputs were all compacted away need not be built.
            std::erase_if(liveDataflows, [](const DataflowDescription<T> &d)
                          { return d.asOf->empty(); });

            m_commands.clear();
            if (createTimely)
            {
                m_commands.emplace_back(std::move(*createTimely));
            }
            if (createInstance)
            {
                m_commands.emplace_back(std::move(*createInstance));
            }
            if (!params.empty())
            {
                UpdateConfiguration update;
                for (const auto &[kind, value] : params)
                {
                    update.params.insert(ComputeParameter{kind, value});
                }
                m_commands.emplace_back(std::move(update));
            }
            if (!liveDataflows.empty())
            {
                m_commands.emplace_back(CreateDataflows<T>{std::move(liveDataflows)});
            }
            if (!finalFrontiers.empty())
            {
                AllowCompaction<T> compaction;
                for (auto &[id, frontier] : finalFrontiers)
                {
                    compaction.frontiers.emplace_back(id, std::move(frontier));
                }
                m_commands.emplace_back(std::move(compaction));
            }
            for (auto &peek : livePeeks)
            {
                m_commands.emplace_back(std::move(peek));
            }
            if (!liveCancels.empty())
            {
                m_commands.emplace_back(CancelPeeks{std::move(liveCancels)});
            }
            if (initializationComplete)
            {
                m_commands.emplace_back(InitializationComplete{});
            }
        }

        std::size_t size() const noexcept { return m_commands.size(); }
        bool empty() const noexcept { return m_commands.empty(); }

        auto begin() const noexcept { return m_commands.begin(); }
        auto end() const noexcept { return m_commands.end(); }

        const std::vector<Command> &commands() const noexcept { return m_commands; }

    private:
        std::vector<Command> m_commands;
    };
}
