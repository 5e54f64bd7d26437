#pragma once

#include "config.hpp"
#include "log.hpp"
#include "replica_task.hpp"
#include "replication_state.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace replicaflow
{
    // A compute endpoint backed by any number of replicas that may fail and
    // restart at any point.
    //
    // Commands are recorded and broadcast to every replica; a replica that
    // fails is rehydrated: reconnected and replayed the (reduced) history.
    // Responses are deduplicated so the caller observes one reliable replica:
    // peeks are answered at most once and frontiers only ever advance.
    //
    // Replaying history requires that dataflows be restartable. That is only
    // true as of the frontiers compaction was allowed to, so the history folds
    // compaction into the `asOf` of the dataflows it replays.
    //
    // Not thread-safe: `send`, `recv`, and replica management must be called
    // from one thread.
    template <class T>
    class ActiveReplication
    {
    public:
        using Response = ActiveReplicationResponse<T>;

        struct Stats
        {
            std::uint64_t commandsSent = 0;
            std::uint64_t responsesReceived = 0;
            std::uint64_t responsesSuppressed = 0;
            std::uint64_t responsesDelivered = 0;
            std::uint64_t heartbeats = 0;
            std::uint64_t rehydrations = 0;
            std::uint64_t staleMessages = 0;
            std::uint64_t peeksCanceled = 0;
        };

        ActiveReplication(ActiveReplicationConfig cfg, std::shared_ptr<IClientConnector<T>> connector)
            : m_cfg(std::move(cfg)), m_connector(std::move(connector)), m_inbound(std::make_shared<ResponseChannel<T>>())
        {
            if (!m_connector)
            {
                throw std::runtime_error("ActiveReplication requires a client connector");
            }

            if (m_cfg.logLevel)
            {
                Logger::instance().set_level(log_level_from_env(*m_cfg.logLevel));
            }
        }

        ActiveReplication(const ActiveReplication &) = delete;
        ActiveReplication &operator=(const ActiveReplication &) = delete;

        ~ActiveReplication()
        {
            // Cancel every task before joining any of them.
            for (auto &[id, replica] : m_replicas)
            {
                (void)id;
                replica.task->cancel();
            }
        }

        // Introduces a new replica and catches it up to the commands the other
        // replicas have seen. Throws if `id` is already present.
        void add_replica(ReplicaId id, std::vector<std::string> addrs, PersistedLogs persistedLogs = {})
        {
            if (m_replicas.count(id) != 0)
            {
                throw std::runtime_error("add_replica: duplicate ReplicaId " + std::to_string(id));
            }

            // Take this opportunity to clean up the history we present.
            m_state.history().retain_peeks(m_state.peeks());
            if (m_cfg.reduceHistoryOnAddReplica)
            {
                m_state.history().reduce();
            }

            ReplicaState replica;
            replica.addrs = std::move(addrs);
            replica.persistedLogs = std::move(persistedLogs);
            replica.incarnation = ++m_nextIncarnation;
            replica.commands = std::make_shared<CommandChannel<T>>();

            // Replay before the task starts so that nothing can interleave.
            for (const auto &cmd : m_state.history())
            {
                ComputeCommand<T> command = cmd;
                specialize_command_(command, id, replica.persistedLogs);
                replica.commands->send(std::move(command));
            }

            ReplicaTaskConfig taskCfg;
            taskCfg.replicaId = id;
            taskCfg.incarnation = replica.incarnation;
            taskCfg.addrs = replica.addrs;
            taskCfg.buildVersion = m_cfg.buildVersion;
            taskCfg.connectRetry = m_cfg.connectRetry;
            taskCfg.pollInterval = m_cfg.taskPollInterval;
            replica.task = std::make_unique<ReplicaTask<T>>(std::move(taskCfg), m_connector, replica.commands, m_inbound);

            // Introspection collections written by this replica exist only
            // while it does.
            for (const auto &[variant, entry] : replica.persistedLogs)
            {
                (void)variant;
                m_state.track_collection(entry.first);
            }

            Logger::instance().logf(LogLevel::Info, "controller", "added replica %llu (incarnation %llu, %zu commands replayed)",
                                    static_cast<unsigned long long>(id),
                                    static_cast<unsigned long long>(replica.incarnation),
                                    m_state.history().size());

            m_replicas.emplace(id, std::move(replica));
        }

        // Removes a replica, cancelling its task. Throws if `id` is absent.
        void remove_replica(ReplicaId id)
        {
            auto it = m_replicas.find(id);
            if (it == m_replicas.end())
            {
                throw std::runtime_error("remove_replica: unknown ReplicaId " + std::to_string(id));
            }

            ReplicaState replica = std::move(it->second);
            m_replicas.erase(it);
            replica.task->cancel();

            for (const auto &[variant, entry] : replica.persistedLogs)
            {
                (void)variant;
                m_state.untrack_collection(entry.first);
            }

            Logger::instance().logf(LogLevel::Info, "controller", "removed replica %llu", static_cast<unsigned long long>(id));
        }

        std::vector<ReplicaId> get_replica_ids() const
        {
            std::vector<ReplicaId> out;
            out.reserve(m_replicas.size());
            for (const auto &[id, replica] : m_replicas)
            {
                (void)replica;
                out.push_back(id);
            }
            return out;
        }

        bool has_replica(ReplicaId id) const { return m_replicas.count(id) != 0; }

        // Sends a command to all replicas. Never fails: replicas whose task is
        // gone are rehydrated after everyone else has been sent the command.
        void send(ComputeCommand<T> cmd)
        {
            m_state.handle_command(cmd);
            ++m_stats.commandsSent;
            if (const auto *cancel = cmd.template get_if<CancelPeeks>())
            {
                m_stats.peeksCanceled += cancel->uuids.size();
            }

            std::vector<ReplicaId> failed;
            for (auto &[id, replica] : m_replicas)
            {
                ComputeCommand<T> command = cmd;
                specialize_command_(command, id, replica.persistedLogs);
                if (!replica.commands->send(std::move(command)))
                {
                    failed.push_back(id);
                }
            }
            for (const auto id : failed)
            {
                rehydrate_replica_(id);
            }
        }

        // Receives the next response. Blocks until one is ready; with no
        // replicas and nothing pending that is forever.
        Response recv()
        {
            while (true)
            {
                if (auto pending = m_state.pop_pending())
                {
                    return deliver_(std::move(*pending));
                }

                auto msg = m_inbound->recv();
                if (!msg)
                {
                    throw std::runtime_error("ActiveReplication: inbound channel closed");
                }
                if (auto resp = absorb_(std::move(*msg)))
                {
                    return deliver_(std::move(*resp));
                }
            }
        }

        // Like recv, but gives up after `timeout`. A timeout loses nothing:
        // every message taken off the inbound channel has been absorbed.
        template <class Rep, class Period>
        std::optional<Response> recv_for(std::chrono::duration<Rep, Period> timeout)
        {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (true)
            {
                if (auto pending = m_state.pop_pending())
                {
                    return deliver_(std::move(*pending));
                }

                auto msg = m_inbound->recv_until(deadline);
                if (!msg)
                {
                    return std::nullopt;
                }
                if (auto resp = absorb_(std::move(*msg)))
                {
                    return deliver_(std::move(*resp));
                }
            }
        }

        // Returns a response only if one is ready without waiting.
        std::optional<Response> try_recv()
        {
            while (true)
            {
                if (auto pending = m_state.pop_pending())
                {
                    return deliver_(std::move(*pending));
                }

                auto msg = m_inbound->try_recv();
                if (!msg)
                {
                    return std::nullopt;
                }
                if (auto resp = absorb_(std::move(*msg)))
                {
                    return deliver_(std::move(*resp));
                }
            }
        }

        const Stats &stats() const noexcept { return m_stats; }
        const ActiveReplicationState<T> &state() const noexcept { return m_state; }
        const ActiveReplicationConfig &config() const noexcept { return m_cfg; }

    private:
        struct ReplicaState
        {
            // If sending fails, the replica's task is gone and the replica
            // requires rehydration.
            std::shared_ptr<CommandChannel<T>> commands;
            std::unique_ptr<ReplicaTask<T>> task;
            std::vector<std::string> addrs;
            // Where this replica persists its introspection collections.
            PersistedLogs persistedLogs;
            std::uint64_t incarnation = 0;
        };

        // Most commands are identical for every replica; CreateInstance carries
        // the replica's id and the introspection sinks only it writes.
        static void specialize_command_(ComputeCommand<T> &command, ReplicaId id, const PersistedLogs &persistedLogs)
        {
            if (auto *ci = command.template get_if<CreateInstance>())
            {
                if (ci->config.logging)
                {
                    ci->config.logging->sinkLogs = persistedLogs;
                }
                ci->config.replicaId = id;
            }
        }

        void rehydrate_replica_(ReplicaId id)
        {
            auto it = m_replicas.find(id);
            if (it == m_replicas.end())
            {
                throw std::runtime_error("rehydrate_replica: unknown ReplicaId " + std::to_string(id));
            }
            auto addrs = it->second.addrs;
            auto persistedLogs = it->second.persistedLogs;

            Logger::instance().logf(LogLevel::Info, "controller", "rehydrating replica %llu", static_cast<unsigned long long>(id));
            ++m_stats.rehydrations;

            // The replica's introspection collections are retracked from
            // scratch; keep what was already reported for them.
            std::vector<std::pair<GlobalId, Antichain<T>>> reported;
            for (const auto &[variant, entry] : persistedLogs)
            {
                (void)variant;
                if (const auto *u = m_state.upper(entry.first))
                {
                    reported.emplace_back(entry.first, *u);
                }
            }

            remove_replica(id);
            add_replica(id, std::move(addrs), std::move(persistedLogs));

            for (auto &[collection, upper] : reported)
            {
                m_state.restore_upper(collection, std::move(upper));
            }
        }

        // Handles one message from a replica task. Returns a response to pass
        // upstream, if any.
        std::optional<Response> absorb_(ReplicaMessage<T> msg)
        {
            auto it = m_replicas.find(msg.replica);
            if (it == m_replicas.end() || it->second.incarnation != msg.incarnation)
            {
                // From a task that was removed or replaced since.
                ++m_stats.staleMessages;
                return std::nullopt;
            }

            if (!msg.response)
            {
                // The task ended: the replica requires rehydration.
                rehydrate_replica_(msg.replica);
                return std::nullopt;
            }

            ++m_stats.responsesReceived;
            auto out = m_state.handle_response(std::move(*msg.response), msg.replica);
            if (!out)
            {
                ++m_stats.responsesSuppressed;
            }
            return out;
        }

        Response deliver_(Response resp)
        {
            if (resp.is_heartbeat())
            {
                ++m_stats.heartbeats;
            }
            else
            {
                ++m_stats.responsesDelivered;
            }
            return resp;
        }

        ActiveReplicationConfig m_cfg;
        std::shared_ptr<IClientConnector<T>> m_connector;
        // Fan-in of every replica task's responses, tagged with their origin.
        std::shared_ptr<ResponseChannel<T>> m_inbound;
        std::map<ReplicaId, ReplicaState> m_replicas;
        ActiveReplicationState<T> m_state;
        std::uint64_t m_nextIncarnation = 0;
        Stats m_stats;
    };
}
