#pragma once

#include "log.hpp"
#include "retry.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace replicaflow
{
    struct ActiveReplicationConfig
    {
        // Version token announced to replicas when connecting. Replicas may
        // refuse controllers built from a different version.
        std::string buildVersion = "0.1.0";

        // Backoff between connection attempts of a replica task. Attempts never
        // stop on their own; only removing the replica ends them.
        RetryPolicy connectRetry{};

        // How long a connected replica task sleeps waiting for a command before
        // polling the replica for responses again.
        std::chrono::milliseconds taskPollInterval{1};

        // Reduce the command history whenever a replica is added. Disabling
        // this replays the full history, which is equivalent but longer.
        bool reduceHistoryOnAddReplica = true;

        // Level applied to the process-wide logger on construction, unless
        // REPLICAFLOW_LOG overrides it. Unset leaves the logger as it is.
        std::optional<LogLevel> logLevel;
    };
}
