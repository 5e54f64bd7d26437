#pragma once

#include "client.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace replicaflow
{
    // Presents the processes of one replica as a single client.
    //
    // Every process receives every command; `CreateTimely` is specialized with
    // the index of the receiving process. Each process reports only for its
    // share of the data, so responses are merged before they are returned:
    // - frontiers: the meet over all processes, emitted when it advances;
    // - peeks: answered once all processes answered (an error wins over a
    //   cancellation, which wins over rows; rows are concatenated);
    // - tails: updates are buffered and released as the meet of the process
    //   uppers advances past them; a drop is forwarded once.
    template <class T>
    class PartitionedClient final : public IComputeClient<T>
    {
    public:
        // `addrs`, when given, names the processes in `parts` order and is
        // announced to each of them with `CreateTimely`.
        explicit PartitionedClient(std::vector<std::unique_ptr<IComputeClient<T>>> parts, std::vector<std::string> addrs = {})
            : m_parts(std::move(parts)), m_addrs(std::move(addrs))
        {
            if (m_parts.empty())
            {
                throw std::runtime_error("PartitionedClient: no parts");
            }
            for (const auto &p : m_parts)
            {
                if (!p)
                {
                    throw std::runtime_error("PartitionedClient: null part");
                }
            }
            if (!m_addrs.empty() && m_addrs.size() != m_parts.size())
            {
                throw std::runtime_error("PartitionedClient: address count does not match part count");
            }
        }

        std::size_t parts() const noexcept { return m_parts.size(); }

        void send(ComputeCommand<T> cmd) override
        {
            for (std::size_t i = 0; i < m_parts.size(); ++i)
            {
                ComputeCommand<T> part = cmd;
                if (auto *ct = part.template get_if<CreateTimely>())
                {
                    ct->config.process = i;
                    if (!m_addrs.empty())
                    {
                        ct->config.addresses = m_addrs;
                    }
                }
                m_parts[i]->send(std::move(part));
            }
        }

        std::optional<ComputeResponse<T>> poll() override
        {
            for (std::size_t n = 0; n < m_parts.size(); ++n)
            {
                const std::size_t i = m_cursor;
                m_cursor = (m_cursor + 1) % m_parts.size();
                while (auto resp = m_parts[i]->poll())
                {
                    if (auto out = absorb_(i, std::move(*resp)))
                    {
                        return out;
                    }
                }
            }
            return std::nullopt;
        }

    private:
        struct PeekState
        {
            std::size_t answered = 0;
            PeekResponse merged;
        };

        struct TailState
        {
            std::vector<Antichain<T>> uppers;
            Antichain<T> reported;
            std::vector<TailUpdate<T>> buffered;
            bool dropped = false;
        };

        std::vector<Antichain<T>> minimum_per_part_() const
        {
            return std::vector<Antichain<T>>(m_parts.size(), Antichain<T>::minimum());
        }

        static Antichain<T> meet_all_(const std::vector<Antichain<T>> &fs)
        {
            Antichain<T> out;
            for (const auto &f : fs)
            {
                out.extend(f);
            }
            return out;
        }

        std::optional<ComputeResponse<T>> absorb_(std::size_t part, ComputeResponse<T> resp)
        {
            if (auto *uppers = resp.template get_if<FrontierUppers<T>>())
            {
                return absorb_uppers_(part, std::move(*uppers));
            }
            if (auto *peek = resp.template get_if<PeekResponse>())
            {
                return absorb_peek_(std::move(*peek));
            }
            return absorb_tail_(part, std::move(*resp.template get_if<TailResponse<T>>()));
        }

        std::optional<ComputeResponse<T>> absorb_uppers_(std::size_t part, FrontierUppers<T> msg)
        {
            FrontierUppers<T> out;
            for (auto &[id, upper] : msg.uppers)
            {
                auto it = m_uppers.find(id);
                if (it == m_uppers.end())
                {
                    it = m_uppers.emplace(id, std::make_pair(minimum_per_part_(), Antichain<T>::minimum())).first;
                }
                auto &[perPart, reported] = it->second;
                perPart[part] = frontier_join(perPart[part], upper);

                Antichain<T> meet = meet_all_(perPart);
                if (frontier_less_than(reported, meet))
                {
                    reported = meet;
                    out.uppers.emplace_back(id, std::move(meet));
                }
                if (reported.empty())
                {
                    m_uppers.erase(it);
                }
            }
            if (out.uppers.empty())
            {
                return std::nullopt;
            }
            return ComputeResponse<T>{std::move(out)};
        }

        std::optional<ComputeResponse<T>> absorb_peek_(PeekResponse msg)
        {
            auto [it, inserted] = m_peeks.try_emplace(msg.uuid);
            auto &st = it->second;
            if (inserted)
            {
                st.merged = std::move(msg);
            }
            else if (std::holds_alternative<PeekError>(st.merged.result))
            {
                // Keep the first error.
            }
            else if (std::holds_alternative<PeekError>(msg.result) || std::holds_alternative<PeekCanceled>(msg.result))
            {
                st.merged.result = std::move(msg.result);
            }
            else if (auto *rows = std::get_if<PeekRows>(&st.merged.result))
            {
                auto &more = std::get<PeekRows>(msg.result).rows;
                rows->rows.insert(rows->rows.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
            }

            if (++st.answered < m_parts.size())
            {
                return std::nullopt;
            }
            PeekResponse out = std::move(st.merged);
            m_peeks.erase(it);
            return ComputeResponse<T>{std::move(out)};
        }

        std::optional<ComputeResponse<T>> absorb_tail_(std::size_t part, TailResponse<T> msg)
        {
            auto it = m_tails.find(msg.id);
            if (it == m_tails.end())
            {
                TailState fresh;
                fresh.uppers = minimum_per_part_();
                fresh.reported = Antichain<T>::minimum();
                it = m_tails.emplace(msg.id, std::move(fresh)).first;
            }
            auto &st = it->second;
            if (st.dropped)
            {
                return std::nullopt;
            }

            if (auto *dropped = std::get_if<TailDroppedAt<T>>(&msg.value))
            {
                st.dropped = true;
                st.buffered.clear();
                return ComputeResponse<T>{TailResponse<T>{msg.id, std::move(*dropped)}};
            }

            auto &batch = std::get<TailBatch<T>>(msg.value);
            st.buffered.insert(st.buffered.end(), std::make_move_iterator(batch.updates.begin()), std::make_move_iterator(batch.updates.end()));
            st.uppers[part] = frontier_join(st.uppers[part], batch.upper);

            Antichain<T> meet = meet_all_(st.uppers);
            if (meet == st.reported)
            {
                return std::nullopt;
            }

            // Release updates the merged upper has passed; hold the rest.
            TailBatch<T> out;
            out.lower = st.reported;
            out.upper = meet;
            std::vector<TailUpdate<T>> held;
            for (auto &u : st.buffered)
            {
                if (meet.less_equal(u.time))
                {
                    held.push_back(std::move(u));
                }
                else
                {
                    out.updates.push_back(std::move(u));
                }
            }
            st.buffered = std::move(held);
            st.reported = std::move(meet);
            return ComputeResponse<T>{TailResponse<T>{msg.id, std::move(out)}};
        }

        std::vector<std::unique_ptr<IComputeClient<T>>> m_parts;
        std::vector<std::string> m_addrs;
        std::size_t m_cursor = 0;
        // Per collection: the upper reported by each part, and the merged upper last emitted.
        std::map<GlobalId, std::pair<std::vector<Antichain<T>>, Antichain<T>>> m_uppers;
        std::map<Uuid, PeekState> m_peeks;
        std::map<GlobalId, TailState> m_tails;
    };

    // Connects to each address through `inner` and merges the connections
    // with PartitionedClient. A single address is passed straight through.
    template <class T>
    class PartitionedConnector final : public IClientConnector<T>
    {
    public:
        explicit PartitionedConnector(std::shared_ptr<IClientConnector<T>> inner) : m_inner(std::move(inner))
        {
            if (!m_inner)
            {
                throw std::runtime_error("PartitionedConnector: null inner connector");
            }
        }

        std::unique_ptr<IComputeClient<T>> connect(const std::vector<std::string> &addrs, std::string_view version, std::stop_token st = {}) override
        {
            if (addrs.empty())
            {
                throw ReplicaError("PartitionedConnector: replica has no addresses");
            }
            if (addrs.size() == 1)
            {
                return m_inner->connect(addrs, version, st);
            }
            std::vector<std::unique_ptr<IComputeClient<T>>> parts;
            parts.reserve(addrs.size());
            for (const auto &addr : addrs)
            {
                parts.push_back(m_inner->connect({addr}, version, st));
            }
            return std::make_unique<PartitionedClient<T>>(std::move(parts), addrs);
        }

    private:
        std::shared_ptr<IClientConnector<T>> m_inner;
    };
}
