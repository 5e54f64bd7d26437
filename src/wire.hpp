#pragma once

#include "common.hpp"

#include <stdexcept>
#include <string>

namespace replicaflow
{
    // Little-endian byte writer for the replica wire protocol.
    class WireWriter
    {
    public:
        void write_u8(std::uint8_t v) { m_buf.push_back(static_cast<std::byte>(v)); }
        void write_bool(bool v) { write_u8(v ? 1 : 0); }
        void write_u32(std::uint32_t v)
        {
            for (int i = 0; i < 4; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }
        void write_u64(std::uint64_t v)
        {
            for (int i = 0; i < 8; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }
        void write_i64(std::int64_t v) { write_u64(static_cast<std::uint64_t>(v)); }

        // Element counts of sequences and maps.
        void write_count(std::size_t n)
        {
            if (n > std::numeric_limits<std::uint32_t>::max())
            {
                throw std::runtime_error("WireWriter: sequence too long");
            }
            write_u32(static_cast<std::uint32_t>(n));
        }

        void write_bytes(std::span<const std::byte> bytes)
        {
            write_count(bytes.size());
            m_buf.insert(m_buf.end(), bytes.begin(), bytes.end());
        }
        void write_string(const std::string &s)
        {
            write_count(s.size());
            const auto *p = reinterpret_cast<const std::byte *>(s.data());
            m_buf.insert(m_buf.end(), p, p + s.size());
        }

        std::size_t size() const noexcept { return m_buf.size(); }
        ByteBuffer take() { return std::move(m_buf); }

    private:
        ByteBuffer m_buf;
    };

    // Reads what WireWriter wrote. Every read throws std::runtime_error on a
    // truncated or malformed buffer.
    class WireReader
    {
    public:
        explicit WireReader(std::span<const std::byte> bytes) : m_bytes(bytes) {}

        bool eof() const { return m_pos >= m_bytes.size(); }
        std::size_t remaining() const { return m_bytes.size() - m_pos; }

        std::uint8_t read_u8()
        {
            require_(1);
            return static_cast<std::uint8_t>(m_bytes[m_pos++]);
        }

        bool read_bool()
        {
            const auto v = read_u8();
            if (v > 1)
            {
                throw std::runtime_error("WireReader: invalid bool");
            }
            return v == 1;
        }

        std::uint32_t read_u32()
        {
            require_(4);
            std::uint32_t out = 0;
            for (int i = 0; i < 4; ++i)
            {
                out |= (static_cast<std::uint32_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i));
            }
            return out;
        }

        std::uint64_t read_u64()
        {
            require_(8);
            std::uint64_t out = 0;
            for (int i = 0; i < 8; ++i)
            {
                out |= (static_cast<std::uint64_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i));
            }
            return out;
        }

        std::int64_t read_i64() { return static_cast<std::int64_t>(read_u64()); }

        // Every encoded element takes at least one byte, so a count larger
        // than what is left cannot be genuine.
        std::size_t read_count()
        {
            const std::size_t n = read_u32();
            if (n > remaining())
            {
                throw std::runtime_error("WireReader: truncated buffer");
            }
            return n;
        }

        ByteBuffer read_bytes()
        {
            auto n = read_u32();
            require_(n);
            ByteBuffer out;
            out.insert(out.end(), m_bytes.begin() + static_cast<std::ptrdiff_t>(m_pos), m_bytes.begin() + static_cast<std::ptrdiff_t>(m_pos + n));
            m_pos += n;
            return out;
        }

        std::string read_string()
        {
            auto n = read_u32();
            require_(n);
            std::string out = string_from_bytes(m_bytes.subspan(m_pos, n));
            m_pos += n;
            return out;
        }

    private:
        void require_(std::size_t n) const
        {
            if (n > m_bytes.size() - m_pos)
            {
                throw std::runtime_error("WireReader: truncated buffer");
            }
        }

        std::span<const std::byte> m_bytes;
        std::size_t m_pos = 0;
    };
}
