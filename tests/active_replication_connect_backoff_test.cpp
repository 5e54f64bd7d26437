/*
Purpose: Connection establishment retries and stays cancellable.

What this tests: a replica that refuses the first connection attempts is
eventually connected and receives the commands queued meanwhile; a replica
that is never reachable keeps being retried without disturbing the others;
removing it, or destroying the controller, interrupts a long backoff sleep
promptly; a connector failing with something other than ReplicaError is
retried on the same backoff schedule instead of rehydrating in a tight loop.
*/

#include "active_replication.hpp"
#include "local_replica.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{
    using T = replicaflow::Timestamp;
    using namespace std::chrono_literals;

    // Fails every attempt the way a broken transport layer would.
    class FailingConnector final : public replicaflow::IClientConnector<T>
    {
    public:
        std::unique_ptr<replicaflow::IComputeClient<T>> connect(const std::vector<std::string> &, std::string_view, std::stop_token = {}) override
        {
            ++m_attempts;
            throw std::runtime_error("FailingConnector: transport setup failed");
        }

        std::size_t attempts() const { return m_attempts.load(); }

    private:
        std::atomic<std::size_t> m_attempts{0};
    };
}

int main()
{
    // Refused three times, then connected.
    {
        auto connector = std::make_shared<replicaflow::LocalConnector<T>>();
        auto r1 = connector->add_endpoint("r1");
        r1->refuse_connections(3);

        replicaflow::ActiveReplicationConfig cfg;
        cfg.connectRetry.initialBackoff = std::chrono::milliseconds(5);
        cfg.connectRetry.maxBackoff = std::chrono::milliseconds(20);
        replicaflow::ActiveReplication<T> ar(cfg, connector);

        ar.add_replica(1, {"r1"});
        ar.send(replicaflow::CreateTimely{});
        ar.send(replicaflow::InitializationComplete{});

        assert(r1->wait_for_sessions(1, 5s));
        assert(r1->connection_attempts() == 4);
        assert(r1->wait_for_commands(0, 2, 5s));
        const auto cmds = r1->commands(0);
        assert(cmds[0].is<replicaflow::CreateTimely>());
        assert(cmds[1].is<replicaflow::InitializationComplete>());

        // An unreachable replica does not hold anyone up.
        ar.add_replica(2, {"nowhere"});
        ar.send(replicaflow::UpdateConfiguration{});
        assert(r1->wait_for_commands(0, 3, 5s));
        assert(!ar.recv_for(50ms).has_value());
        ar.remove_replica(2);
        assert(ar.stats().rehydrations == 0);
    }

    // A long backoff is interrupted by removal and by destruction.
    {
        auto connector = std::make_shared<replicaflow::LocalConnector<T>>();
        replicaflow::ActiveReplicationConfig cfg;
        cfg.connectRetry.initialBackoff = std::chrono::milliseconds(60'000);

        const auto start = std::chrono::steady_clock::now();
        {
            replicaflow::ActiveReplication<T> ar(cfg, connector);
            ar.add_replica(1, {"nowhere"});
            ar.add_replica(2, {"nowhere-either"});
            std::this_thread::sleep_for(50ms);

            ar.remove_replica(1);
            assert(!ar.has_replica(1));
            assert(ar.has_replica(2));
        }
        assert(std::chrono::steady_clock::now() - start < 10s);
    }

    // Non-ReplicaError failures back off too: 50ms, 100ms, 200ms, ...
    {
        auto connector = std::make_shared<FailingConnector>();
        replicaflow::ActiveReplicationConfig cfg;
        cfg.connectRetry.initialBackoff = std::chrono::milliseconds(50);
        cfg.connectRetry.maxBackoff = std::chrono::milliseconds(1000);
        replicaflow::ActiveReplication<T> ar(cfg, connector);

        ar.add_replica(1, {"broken"});
        assert(!ar.recv_for(500ms).has_value());

        // Attempts at roughly 0, 50, 150 and 350ms.
        const auto attempts = connector->attempts();
        assert(attempts >= 2);
        assert(attempts <= 6);
        assert(ar.stats().rehydrations == 0);
        assert(ar.has_replica(1));
    }

    return 0;
}
