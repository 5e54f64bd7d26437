#pragma once

#include "command_history.hpp"
#include "log.hpp"
#include "protocol.hpp"

#include <chrono>
#include <deque>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace replicaflow
{
    // Context kept for a peek until its first answer (or its cancellation).
    struct PendingPeek
    {
        TraceContext otelCtx;
    };

    // Bookkeeping that turns the responses of several replicas running the same
    // commands into the responses of one reliable replica.
    //
    // Owned and mutated by the controller's thread only.
    template <class T>
    class ActiveReplicationState
    {
    public:
        using Response = ActiveReplicationResponse<T>;

        // Records `cmd` before it is forwarded to any replica.
        void handle_command(const ComputeCommand<T> &cmd)
        {
            if (const auto *peek = cmd.template get_if<Peek<T>>())
            {
                m_peeks.insert_or_assign(peek->uuid, PendingPeek{peek->otelCtx});
            }
            else if (const auto *cancel = cmd.template get_if<CancelPeeks>())
            {
                // Answer cancellations right away rather than waiting on a
                // replica; the peek is then free to be compacted from history.
                for (const auto &uuid : cancel->uuids)
                {
                    TraceContext ctx;
                    auto it = m_peeks.find(uuid);
                    if (it != m_peeks.end())
                    {
                        ctx = std::move(it->second.otelCtx);
                        m_peeks.erase(it);
                    }
                    else
                    {
                        Logger::instance().logf(LogLevel::Warn, "controller", "did not find pending peek for %s",
                                                to_string(uuid).c_str());
                    }
                    m_pendingResponse.push_back(Response{ComputeResponse<T>{PeekResponse{uuid, PeekCanceled{}, std::move(ctx)}}});
                }
            }

            std::vector<GlobalId> start;
            std::vector<GlobalId> cease;
            frontier_tracking(cmd, start, cease);
            for (const auto &id : start)
            {
                track_collection(id);
            }
            for (const auto &id : cease)
            {
                untrack_collection(id);
            }

            m_history.push(cmd);
        }

        // Absorbs a response from `replica`, returning what should be passed
        // upstream, if anything.
        std::optional<Response> handle_response(ComputeResponse<T> message, ReplicaId replica)
        {
            m_pendingResponse.push_back(Response{ReplicaHeartbeat{replica, std::chrono::system_clock::now()}});

            return std::visit(
                [&](auto &msg) -> std::optional<Response>
                {
                    using M = std::decay_t<decltype(msg)>;
                    if constexpr (std::is_same_v<M, PeekResponse>)
                    {
                        return absorb_peek_(std::move(msg), replica);
                    }
                    else if constexpr (std::is_same_v<M, FrontierUppers<T>>)
                    {
                        return absorb_uppers_(std::move(msg));
                    }
                    else
                    {
                        return absorb_tail_(std::move(msg));
                    }
                },
                message.value);
        }

        // Starts tracking the upper of `id` at the minimum frontier.
        // Throws if `id` is already tracked.
        void track_collection(const GlobalId &id)
        {
            auto [it, inserted] = m_uppers.emplace(id, Antichain<T>::minimum());
            (void)it;
            if (!inserted)
            {
                throw std::runtime_error("frontier tracking: collection " + to_string(id) + " is already tracked");
            }
        }

        // Throws if `id` is not tracked.
        void untrack_collection(const GlobalId &id)
        {
            if (m_uppers.erase(id) == 0)
            {
                throw std::runtime_error("frontier tracking: collection " + to_string(id) + " is not tracked");
            }
        }

        // Reinstates an upper already reported upstream for a tracked
        // collection, so that later reports must advance past it.
        void restore_upper(const GlobalId &id, Antichain<T> upper)
        {
            auto it = m_uppers.find(id);
            if (it == m_uppers.end())
            {
                throw std::runtime_error("frontier tracking: collection " + to_string(id) + " is not tracked");
            }
            it->second = std::move(upper);
        }

        std::optional<Response> pop_pending()
        {
            if (m_pendingResponse.empty())
            {
                return std::nullopt;
            }
            Response out = std::move(m_pendingResponse.front());
            m_pendingResponse.pop_front();
            return out;
        }

        bool has_pending() const noexcept { return !m_pendingResponse.empty(); }

        ComputeCommandHistory<T> &history() noexcept { return m_history; }
        const ComputeCommandHistory<T> &history() const noexcept { return m_history; }

        const std::unordered_map<Uuid, PendingPeek> &peeks() const noexcept { return m_peeks; }

        // The union of uppers reported by all replicas, or nullptr if untracked.
        const Antichain<T> *upper(const GlobalId &id) const
        {
            auto it = m_uppers.find(id);
            return it == m_uppers.end() ? nullptr : &it->second;
        }

        std::size_t tracked_collections() const noexcept { return m_uppers.size(); }

    private:
        std::optional<Response> absorb_peek_(PeekResponse msg, ReplicaId replica)
        {
            // First answer wins. The trace context of the response, not of the
            // pending peek, is forwarded: its parent is the replica's work.
            if (m_peeks.erase(msg.uuid) == 0)
            {
                Logger::instance().logf(LogLevel::Trace, "controller", "dropping duplicate answer for peek %s from replica %llu",
                                        to_string(msg.uuid).c_str(), static_cast<unsigned long long>(replica));
                return std::nullopt;
            }
            return Response{ComputeResponse<T>{std::move(msg)}};
        }

        std::optional<Response> absorb_uppers_(FrontierUppers<T> msg)
        {
            FrontierUppers<T> advanced;
            for (auto &[id, newUpper] : msg.uppers)
            {
                // Untracked ids were retired while the report was in flight.
                auto it = m_uppers.find(id);
                if (it == m_uppers.end())
                {
                    continue;
                }
                if (frontier_less_than(it->second, newUpper))
                {
                    it->second = newUpper;
                    advanced.uppers.emplace_back(id, std::move(newUpper));
                }
            }
            if (advanced.uppers.empty())
            {
                return std::nullopt;
            }
            return Response{ComputeResponse<T>{std::move(advanced)}};
        }

        std::optional<Response> absorb_tail_(TailResponse<T> msg)
        {
            if (auto *batch = std::get_if<TailBatch<T>>(&msg.value))
            {
                auto entry = m_tails.try_emplace(msg.id, Antichain<T>::minimum()).first;

                // Progress happened iff joining `upper` into the last reported
                // frontier changes it. Keep only updates at or beyond that
                // frontier; earlier ones were already delivered.
                Antichain<T> newUpper = frontier_join(entry->second, batch->upper);
                if (newUpper == entry->second)
                {
                    return std::nullopt;
                }

                Antichain<T> newLower = std::move(entry->second);
                entry->second = newUpper;
                std::erase_if(batch->updates, [&](const TailUpdate<T> &u)
                              { return !newLower.less_equal(u.time); });

                TailBatch<T> out{std::move(newLower), std::move(newUpper), std::move(batch->updates)};
                return Response{ComputeResponse<T>{TailResponse<T>{msg.id, std::move(out)}}};
            }

            // A drop is terminal: the empty frontier suppresses every later
            // message for this id. The entry cannot simply be removed, since
            // entries are created on demand by batches.
            auto &dropped = std::get<TailDroppedAt<T>>(msg.value);
            auto entry = m_tails.find(msg.id);
            if (entry != m_tails.end() && entry->second.empty())
            {
                return std::nullopt;
            }
            m_tails.insert_or_assign(msg.id, Antichain<T>{});
            return Response{ComputeResponse<T>{TailResponse<T>{msg.id, std::move(dropped)}}};
        }

        // Outstanding peeks, to decide which answers to forward.
        std::unordered_map<Uuid, PendingPeek> m_peeks;
        // Last reported frontier of each tail.
        std::unordered_map<GlobalId, Antichain<T>> m_tails;
        // Frontier of each tracked collection, unioned across replicas.
        std::unordered_map<GlobalId, Antichain<T>> m_uppers;
        ComputeCommandHistory<T> m_history;
        // Responses to emit before any newly received replica message.
        std::deque<Response> m_pendingResponse;
    };
}
