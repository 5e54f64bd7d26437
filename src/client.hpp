#pragma once

#include "protocol.hpp"

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace replicaflow
{
    // A live, bidirectional connection to one replica (or one process of it).
    //
    // Any failure, including the replica closing the stream, is reported by
    // throwing ReplicaError. A client that threw is dead and is not reused.
    template <class T>
    class IComputeClient
    {
    public:
        virtual ~IComputeClient() = default;

        virtual void send(ComputeCommand<T> cmd) = 0;

        // Returns the next response if one is available, nullopt otherwise.
        virtual std::optional<ComputeResponse<T>> poll() = 0;
    };

    template <class T>
    class IClientConnector
    {
    public:
        virtual ~IClientConnector() = default;

        // Connects to the processes at `addrs`, announcing `version`.
        // Throws ReplicaError if the replica cannot be reached, or if `st` is
        // stopped while waiting for it.
        virtual std::unique_ptr<IComputeClient<T>> connect(const std::vector<std::string> &addrs,
                                                           std::string_view version,
                                                           std::stop_token st = {}) = 0;
    };
}
