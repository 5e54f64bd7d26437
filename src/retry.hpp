#pragma once

#include "common.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace replicaflow
{
    struct RetryPolicy
    {
        std::chrono::milliseconds initialBackoff{125};
        double factor = 2.0;
        // Delays never exceed this, no matter how many attempts failed.
        std::chrono::milliseconds maxBackoff{32'000};
    };

    // Exponential backoff schedule: initial, initial*factor, ... clamped to max.
    class Backoff
    {
    public:
        explicit Backoff(RetryPolicy policy) : m_policy(policy), m_next(policy.initialBackoff)
        {
            if (m_policy.factor < 1.0)
            {
                throw std::runtime_error("Backoff: factor must be >= 1");
            }
            if (m_next > m_policy.maxBackoff)
            {
                m_next = m_policy.maxBackoff;
            }
        }

        // Returns the delay to wait before the next attempt and advances.
        std::chrono::milliseconds next_delay()
        {
            const auto out = m_next;
            const double scaled = static_cast<double>(m_next.count()) * m_policy.factor;
            const double cap = static_cast<double>(m_policy.maxBackoff.count());
            m_next = std::chrono::milliseconds(static_cast<std::int64_t>(scaled < cap ? scaled : cap));
            ++m_attempts;
            return out;
        }

        void reset()
        {
            m_next = m_policy.initialBackoff < m_policy.maxBackoff ? m_policy.initialBackoff : m_policy.maxBackoff;
            m_attempts = 0;
        }

        std::uint64_t attempts() const noexcept { return m_attempts; }

    private:
        RetryPolicy m_policy;
        std::chrono::milliseconds m_next;
        std::uint64_t m_attempts = 0;
    };

    // Sleeps for `d` unless `st` is stopped first. Returns false if stopped.
    inline bool sleep_unless_stopped(std::stop_token st, std::chrono::milliseconds d)
    {
        std::mutex mu;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lk(mu);
        cv.wait_for(lk, st, d, []
                    { return false; });
        return !st.stop_requested();
    }
}
