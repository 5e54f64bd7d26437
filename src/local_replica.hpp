#pragma once

#include "client.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace replicaflow
{
    // An in-process stand-in for one replica process.
    //
    // Each connection opens a new session; the endpoint records every command
    // a session received. Tests inject responses, break the live session, or
    // refuse connections to exercise the controller's failure handling.
    // Thread-safe.
    template <class T>
    class LocalReplicaEndpoint
    {
    public:
        using Command = ComputeCommand<T>;
        using Response = ComputeResponse<T>;

        // Called for every command the live session receives, outside any lock.
        // Emulates an execution engine, typically by pushing responses.
        using CommandHook = std::function<void(const Command &, LocalReplicaEndpoint &)>;

        explicit LocalReplicaEndpoint(std::string address) : m_address(std::move(address)) {}

        const std::string &address() const noexcept { return m_address; }

        void set_command_hook(CommandHook hook)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_hook = std::move(hook);
        }

        // Queues a response on the live session. Dropped if there is none.
        void push_response(Response resp)
        {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                if (m_live == 0)
                {
                    return;
                }
                m_outbox.push_back(std::move(resp));
            }
            m_cv.notify_all();
        }

        // Breaks the live session: its next send or poll throws.
        void fail()
        {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                m_live = 0;
                m_outbox.clear();
            }
            m_cv.notify_all();
        }

        // The live session reports an orderly end of stream, which is still
        // unexpected from the controller's point of view.
        void close_gracefully()
        {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                m_closedGracefully = m_live;
                m_live = 0;
                m_outbox.clear();
            }
            m_cv.notify_all();
        }

        // The next `n` connection attempts fail.
        void refuse_connections(std::size_t n)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_refuse = n;
        }

        std::size_t connection_attempts() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_attempts;
        }

        std::size_t sessions() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_sessions.size();
        }

        bool connected() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_live != 0;
        }

        std::string last_version() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_lastVersion;
        }

        // Commands received by session `index` (0-based, in connection order).
        std::vector<Command> commands(std::size_t index) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (index >= m_sessions.size())
            {
                throw std::runtime_error("LocalReplicaEndpoint: no session " + std::to_string(index));
            }
            return m_sessions[index];
        }

        template <class Rep, class Period>
        bool wait_for_sessions(std::size_t n, std::chrono::duration<Rep, Period> timeout) const
        {
            std::unique_lock<std::mutex> lk(m_mu);
            return m_cv.wait_for(lk, timeout, [&]
                                 { return m_sessions.size() >= n && m_live == m_sessions.size(); });
        }

        template <class Rep, class Period>
        bool wait_for_commands(std::size_t index, std::size_t n, std::chrono::duration<Rep, Period> timeout) const
        {
            std::unique_lock<std::mutex> lk(m_mu);
            return m_cv.wait_for(lk, timeout, [&]
                                 { return index < m_sessions.size() && m_sessions[index].size() >= n; });
        }

        // ---- used by LocalComputeClient ----

        std::size_t open_session(std::string_view version)
        {
            std::size_t session = 0;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                ++m_attempts;
                if (m_refuse > 0)
                {
                    --m_refuse;
                    throw ReplicaError("connection refused by " + m_address);
                }
                m_sessions.emplace_back();
                m_outbox.clear();
                m_live = m_sessions.size();
                m_lastVersion = std::string(version);
                session = m_live;
            }
            m_cv.notify_all();
            return session;
        }

        void deliver(std::size_t session, Command cmd)
        {
            CommandHook hook;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                check_live_locked_(session);
                m_sessions[session - 1].push_back(cmd);
                hook = m_hook;
            }
            m_cv.notify_all();
            if (hook)
            {
                hook(cmd, *this);
            }
        }

        std::optional<Response> take(std::size_t session)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            check_live_locked_(session);
            if (m_outbox.empty())
            {
                return std::nullopt;
            }
            Response out = std::move(m_outbox.front());
            m_outbox.pop_front();
            return out;
        }

    private:
        void check_live_locked_(std::size_t session) const
        {
            if (session == m_live)
            {
                return;
            }
            if (session == m_closedGracefully)
            {
                throw ReplicaError("replica unexpectedly gracefully terminated connection");
            }
            throw ReplicaError("connection to " + m_address + " lost");
        }

        std::string m_address;
        mutable std::mutex m_mu;
        mutable std::condition_variable m_cv;
        CommandHook m_hook;
        // Sessions are numbered from 1; 0 means no live session.
        std::vector<std::vector<Command>> m_sessions;
        std::size_t m_live = 0;
        std::size_t m_closedGracefully = 0;
        std::deque<Response> m_outbox;
        std::size_t m_refuse = 0;
        std::size_t m_attempts = 0;
        std::string m_lastVersion;
    };

    template <class T>
    class LocalComputeClient final : public IComputeClient<T>
    {
    public:
        LocalComputeClient(std::shared_ptr<LocalReplicaEndpoint<T>> endpoint, std::size_t session)
            : m_endpoint(std::move(endpoint)), m_session(session)
        {
        }

        void send(ComputeCommand<T> cmd) override { m_endpoint->deliver(m_session, std::move(cmd)); }

        std::optional<ComputeResponse<T>> poll() override { return m_endpoint->take(m_session); }

    private:
        std::shared_ptr<LocalReplicaEndpoint<T>> m_endpoint;
        std::size_t m_session = 0;
    };

    // Resolves addresses to in-process endpoints. Each connection covers a
    // single address; compose with PartitionedConnector for multi-process
    // replicas.
    template <class T>
    class LocalConnector final : public IClientConnector<T>
    {
    public:
        std::shared_ptr<LocalReplicaEndpoint<T>> add_endpoint(const std::string &address)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_endpoints.count(address) != 0)
            {
                throw std::runtime_error("LocalConnector: duplicate address " + address);
            }
            auto ep = std::make_shared<LocalReplicaEndpoint<T>>(address);
            m_endpoints.emplace(address, ep);
            return ep;
        }

        std::shared_ptr<LocalReplicaEndpoint<T>> endpoint(const std::string &address) const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_endpoints.find(address);
            return it == m_endpoints.end() ? nullptr : it->second;
        }

        std::unique_ptr<IComputeClient<T>> connect(const std::vector<std::string> &addrs, std::string_view version, std::stop_token = {}) override
        {
            if (addrs.size() != 1)
            {
                throw ReplicaError("LocalConnector: expected exactly one address, got " + std::to_string(addrs.size()));
            }
            auto ep = endpoint(addrs.front());
            if (!ep)
            {
                throw ReplicaError("LocalConnector: no replica listening at " + addrs.front());
            }
            const auto session = ep->open_session(version);
            return std::make_unique<LocalComputeClient<T>>(std::move(ep), session);
        }

    private:
        mutable std::mutex m_mu;
        std::map<std::string, std::shared_ptr<LocalReplicaEndpoint<T>>> m_endpoints;
    };
}
