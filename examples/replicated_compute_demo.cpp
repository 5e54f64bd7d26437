#include "active_replication.hpp"
#include "local_replica.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    using T = replicaflow::Timestamp;
    using Endpoint = replicaflow::LocalReplicaEndpoint<T>;

    struct Params
    {
        std::uint32_t replicas = 3;
        std::uint32_t steps = 30;
        // Breaks one replica's connection every `killEvery` steps (0 disables).
        std::uint32_t killEvery = 7;
        replicaflow::LogLevel logLevel = replicaflow::LogLevel::Warn;
    };

    bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "Replicated compute demo (in-process replicas)\n"
                  << "  --replicas N      number of replicas (default 3)\n"
                  << "  --steps N         number of peeks to issue (default 30)\n"
                  << "  --kill-every K    break a replica every K steps, 0 disables (default 7)\n"
                  << "  --log LEVEL       error|warn|info|debug|trace|off (default warn, or REPLICAFLOW_LOG)\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        p.logLevel = replicaflow::log_level_from_env(p.logLevel);
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--replicas")
            {
                if (!parse_u32(need(), p.replicas))
                    usage_and_exit();
            }
            else if (a == "--steps")
            {
                if (!parse_u32(need(), p.steps))
                    usage_and_exit();
            }
            else if (a == "--kill-every")
            {
                if (!parse_u32(need(), p.killEvery))
                    usage_and_exit();
            }
            else if (a == "--log")
            {
                auto lvl = replicaflow::parse_log_level(need());
                if (!lvl)
                    usage_and_exit();
                p.logLevel = *lvl;
            }
            else
            {
                usage_and_exit();
            }
        }
        if (p.replicas == 0)
        {
            usage_and_exit();
        }
        return p;
    }

    // A toy execution engine behind each endpoint: remembers the collections
    // it maintains and answers peeks immediately.
    class ToyEngine
    {
    public:
        void on_command(const replicaflow::ComputeCommand<T> &cmd, Endpoint &ep)
        {
            if (const auto *create = cmd.get_if<replicaflow::CreateDataflows<T>>())
            {
                std::lock_guard<std::mutex> lk(m_mu);
                for (const auto &d : create->dataflows)
                {
                    for (const auto &id : d.export_ids())
                    {
                        m_exports.insert(id);
                    }
                }
            }
            else if (const auto *peek = cmd.get_if<replicaflow::Peek<T>>())
            {
                replicaflow::PeekResponse r;
                r.uuid = peek->uuid;
                r.result = replicaflow::PeekRows{{{"answered by " + ep.address(), 1}}};
                ep.push_response(std::move(r));
            }
        }

        // Reports every maintained collection complete up to `t`.
        void advance(T t, Endpoint &ep)
        {
            replicaflow::FrontierUppers<T> uppers;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                for (const auto &id : m_exports)
                {
                    uppers.uppers.emplace_back(id, replicaflow::Antichain<T>{t});
                }
            }
            if (!uppers.uppers.empty())
            {
                ep.push_response(std::move(uppers));
            }
        }

    private:
        std::mutex m_mu;
        std::set<replicaflow::GlobalId> m_exports;
    };
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    auto connector = std::make_shared<replicaflow::LocalConnector<T>>();
    std::vector<std::shared_ptr<Endpoint>> endpoints;
    std::vector<std::shared_ptr<ToyEngine>> engines;
    for (std::uint32_t i = 0; i < p.replicas; ++i)
    {
        auto ep = connector->add_endpoint("replica-" + std::to_string(i + 1));
        auto engine = std::make_shared<ToyEngine>();
        ep->set_command_hook([engine](const replicaflow::ComputeCommand<T> &cmd, Endpoint &e)
                             { engine->on_command(cmd, e); });
        endpoints.push_back(ep);
        engines.push_back(engine);
    }

    replicaflow::ActiveReplicationConfig cfg;
    cfg.buildVersion = "demo";
    cfg.logLevel = p.logLevel;
    cfg.connectRetry.initialBackoff = std::chrono::milliseconds(10);
    cfg.connectRetry.maxBackoff = std::chrono::milliseconds(200);

    replicaflow::ActiveReplication<T> ar(cfg, connector);
    for (std::uint32_t i = 0; i < p.replicas; ++i)
    {
        ar.add_replica(i + 1, {endpoints[i]->address()});
    }

    const replicaflow::GlobalId index = replicaflow::GlobalId::user(1);
    {
        replicaflow::DataflowDescription<T> d;
        d.objectsToBuild.push_back(replicaflow::BuildDesc{replicaflow::GlobalId::transient(1), "Get(u0)"});
        d.indexExports.push_back(replicaflow::IndexExport{index, replicaflow::GlobalId::transient(1), {0}});
        d.asOf = replicaflow::Antichain<T>{0};
        d.debugName = "demo_index";

        ar.send(replicaflow::CreateTimely{});
        ar.send(replicaflow::CreateInstance{});
        ar.send(replicaflow::CreateDataflows<T>{{d}});
        ar.send(replicaflow::InitializationComplete{});
    }

    std::map<replicaflow::Uuid, std::string> answers;
    std::uint64_t duplicateAnswers = 0;
    std::uint64_t frontierRegressions = 0;
    replicaflow::Antichain<T> lastUpper = replicaflow::Antichain<T>::minimum();

    const auto absorb = [&](const replicaflow::ComputeResponse<T> &resp)
    {
        if (const auto *peek = resp.get_if<replicaflow::PeekResponse>())
        {
            const auto *rows = std::get_if<replicaflow::PeekRows>(&peek->result);
            const std::string who = rows && !rows->rows.empty() ? rows->rows.front().first : "canceled";
            if (!answers.emplace(peek->uuid, who).second)
            {
                ++duplicateAnswers;
            }
        }
        else if (const auto *uppers = resp.get_if<replicaflow::FrontierUppers<T>>())
        {
            for (const auto &[id, f] : uppers->uppers)
            {
                if (id == index)
                {
                    if (!replicaflow::frontier_less_than(lastUpper, f))
                    {
                        ++frontierRegressions;
                    }
                    lastUpper = f;
                }
            }
        }
    };

    const auto drain = [&](std::chrono::milliseconds quiet)
    {
        while (auto r = ar.recv_for(quiet))
        {
            if (const auto *c = r->compute())
            {
                absorb(*c);
            }
        }
    };

    for (std::uint32_t step = 1; step <= p.steps; ++step)
    {
        replicaflow::Peek<T> peek;
        peek.id = index;
        peek.uuid = replicaflow::Uuid{0, step};
        peek.timestamp = step;
        ar.send(peek);

        // Replicas progress at different rates; replica i reports every i-th step.
        for (std::size_t i = 0; i < endpoints.size(); ++i)
        {
            if (step % (i + 1) == 0)
            {
                engines[i]->advance(step, *endpoints[i]);
            }
        }

        if (p.killEvery != 0 && step % p.killEvery == 0)
        {
            const std::size_t victim = (step / p.killEvery) % endpoints.size();
            std::cout << "step " << step << ": breaking " << endpoints[victim]->address() << "\n";
            endpoints[victim]->fail();
        }

        drain(std::chrono::milliseconds(20));
    }
    drain(std::chrono::milliseconds(200));

    const auto &stats = ar.stats();
    std::cout << "replicated_compute_demo"
              << " replicas=" << p.replicas
              << " peeks=" << p.steps
              << " answered=" << answers.size()
              << " upper=" << replicaflow::to_string(lastUpper)
              << " delivered=" << stats.responsesDelivered
              << " suppressed=" << stats.responsesSuppressed
              << " heartbeats=" << stats.heartbeats
              << " rehydrations=" << stats.rehydrations << "\n";

    if (duplicateAnswers != 0 || frontierRegressions != 0)
    {
        std::cerr << "deduplication failed: duplicates=" << duplicateAnswers << " regressions=" << frontierRegressions << "\n";
        return 2;
    }
    return 0;
}
