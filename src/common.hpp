#pragma once

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace replicaflow
{
    using ReplicaId = std::uint64_t;

    using ByteBuffer = std::vector<std::byte>;

    // Raised by clients and connectors when a replica cannot be reached or its
    // stream breaks. Never escapes a replica task: it is turned into rehydration.
    class ReplicaError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    template <class T>
    inline ByteBuffer bytes_from_trivially_copyable(const T &value)
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        ByteBuffer out(sizeof(T));
        std::memcpy(out.data(), &value, sizeof(T));
        return out;
    }

    inline ByteBuffer bytes_from_string(const std::string &s)
    {
        ByteBuffer out(s.size());
        if (!s.empty())
        {
            std::memcpy(out.data(), s.data(), s.size());
        }
        return out;
    }

    inline std::string string_from_bytes(std::span<const std::byte> b)
    {
        return std::string(reinterpret_cast<const char *>(b.data()), b.size());
    }
}
