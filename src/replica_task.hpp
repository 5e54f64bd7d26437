#pragma once

#include "channel.hpp"
#include "client.hpp"
#include "log.hpp"
#include "retry.hpp"

#include <exception>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace replicaflow
{
    // What a replica task hands the controller. `response == nullopt` marks the
    // end of that task: the replica requires rehydration.
    //
    // `incarnation` distinguishes tasks for the same replica id across
    // rehydrations, so messages from a replaced task can be recognized.
    template <class T>
    struct ReplicaMessage
    {
        ReplicaId replica = 0;
        std::uint64_t incarnation = 0;
        std::optional<ComputeResponse<T>> response;
    };

    template <class T>
    using CommandChannel = Channel<ComputeCommand<T>>;

    template <class T>
    using ResponseChannel = Channel<ReplicaMessage<T>>;

    struct ReplicaTaskConfig
    {
        ReplicaId replicaId = 0;
        std::uint64_t incarnation = 0;
        // Network addresses of the processes that make up the replica.
        std::vector<std::string> addrs;
        std::string buildVersion;
        RetryPolicy connectRetry{};
        std::chrono::milliseconds pollInterval{1};
    };

    // Owns the only connection to one replica, on its own thread.
    //
    // Commands arriving on `commands` are forwarded to the replica; responses
    // from the replica are forwarded to `responses`. The task ends when the
    // command channel is closed (the controller lost interest), when it is
    // cancelled, or when the connection fails. It never reconnects after a
    // failure: the controller rehydrates the replica instead, since the new
    // connection also needs the command history replayed.
    template <class T>
    class ReplicaTask
    {
    public:
        ReplicaTask(ReplicaTaskConfig cfg,
                    std::shared_ptr<IClientConnector<T>> connector,
                    std::shared_ptr<CommandChannel<T>> commands,
                    std::shared_ptr<ResponseChannel<T>> responses)
            : m_commands(commands)
        {
            if (!connector || !commands || !responses)
            {
                throw std::runtime_error("ReplicaTask: null connector or channel");
            }
            m_thread = std::jthread(
                [cfg = std::move(cfg), connector = std::move(connector), commands = std::move(commands), responses = std::move(responses)](std::stop_token st) mutable
                { run_(st, cfg, *connector, *commands, *responses); });
        }

        ReplicaTask(const ReplicaTask &) = delete;
        ReplicaTask &operator=(const ReplicaTask &) = delete;

        ~ReplicaTask()
        {
            cancel();
        }

        // Aborts the task at its next suspension point (connect backoff, command
        // wait, or between forwarded messages). Anything in flight is dropped.
        void cancel() noexcept
        {
            m_thread.request_stop();
            m_commands->close();
        }

        bool joinable() const noexcept { return m_thread.joinable(); }

    private:
        static std::string scope_(const ReplicaTaskConfig &cfg)
        {
            return "replica-" + std::to_string(cfg.replicaId);
        }

        static void run_(std::stop_token st,
                         const ReplicaTaskConfig &cfg,
                         IClientConnector<T> &connector,
                         CommandChannel<T> &commands,
                         ResponseChannel<T> &responses)
        {
            const std::string scope = scope_(cfg);
            auto &log = Logger::instance();
            log.logf(LogLevel::Info, scope.c_str(), "starting replica task (incarnation %llu)",
                     static_cast<unsigned long long>(cfg.incarnation));
            try
            {
                run_core_(st, cfg, connector, commands, responses);
                log.logf(LogLevel::Info, scope.c_str(), "gracefully stopping replica task");
            }
            catch (const std::exception &e)
            {
                log.logf(LogLevel::Warn, scope.c_str(), "replica task failed: %s", e.what());
            }

            // The controller detects a dead task either through a failed
            // command send or through this end-of-stream marker.
            commands.close();
            responses.send(ReplicaMessage<T>{cfg.replicaId, cfg.incarnation, std::nullopt});
        }

        static std::unique_ptr<IComputeClient<T>> connect_(std::stop_token st,
                                                           const ReplicaTaskConfig &cfg,
                                                           IClientConnector<T> &connector,
                                                           const std::string &scope)
        {
            Backoff backoff(cfg.connectRetry);
            while (!st.stop_requested())
            {
                try
                {
                    auto client = connector.connect(cfg.addrs, cfg.buildVersion, st);
                    if (!client)
                    {
                        throw ReplicaError("connector returned no client");
                    }
                    return client;
                }
                catch (const std::exception &e)
                {
                    // Any failure to connect is retried.
                    const auto delay = backoff.next_delay();
                    Logger::instance().logf(LogLevel::Warn, scope.c_str(), "error connecting to replica, retrying in %lldms: %s",
                                            static_cast<long long>(delay.count()), e.what());
                    if (!sleep_unless_stopped(st, delay))
                    {
                        break;
                    }
                }
            }
            return nullptr;
        }

        static void run_core_(std::stop_token st,
                              const ReplicaTaskConfig &cfg,
                              IClientConnector<T> &connector,
                              CommandChannel<T> &commands,
                              ResponseChannel<T> &responses)
        {
            const std::string scope = scope_(cfg);
            auto client = connect_(st, cfg, connector, scope);
            if (!client)
            {
                return;
            }
            Logger::instance().logf(LogLevel::Debug, scope.c_str(), "connected");

            while (!st.stop_requested())
            {
                bool progressed = false;

                // Command from controller to forward to replica.
                while (auto cmd = commands.try_recv())
                {
                    client->send(std::move(*cmd));
                    progressed = true;
                    if (st.stop_requested())
                    {
                        return;
                    }
                }
                if (commands.is_closed() && commands.size() == 0)
                {
                    // Controller is no longer interested in this replica.
                    return;
                }

                // Response from replica to forward to controller.
                while (auto resp = client->poll())
                {
                    if (!responses.send(ReplicaMessage<T>{cfg.replicaId, cfg.incarnation, std::move(*resp)}))
                    {
                        return;
                    }
                    progressed = true;
                    if (st.stop_requested())
                    {
                        return;
                    }
                }

                if (!progressed)
                {
                    commands.wait_ready(st, cfg.pollInterval);
                }
            }
        }

        std::shared_ptr<CommandChannel<T>> m_commands;
        std::jthread m_thread;
    };
}
