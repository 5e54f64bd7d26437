#pragma once

#include "common.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>

namespace replicaflow
{
    // Unbounded FIFO channel. Thread-safe for many producers and one consumer.
    //
    // Either side may close it. Once closed, `send` fails; receivers still
    // drain whatever was queued before the close.
    template <class T>
    class Channel
    {
    public:
        // Returns false if the channel is closed; the value is dropped.
        bool send(T value)
        {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                if (m_closed)
                {
                    return false;
                }
                m_queue.push_back(std::move(value));
            }
            m_cv.notify_one();
            return true;
        }

        std::optional<T> try_recv()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return pop_locked_();
        }

        // Blocks until a value arrives. Returns nullopt once closed and drained.
        std::optional<T> recv()
        {
            std::unique_lock<std::mutex> lk(m_mu);
            m_cv.wait(lk, [&]
                      { return !m_queue.empty() || m_closed; });
            return pop_locked_();
        }

        // Like recv, but gives up at `deadline`. A nullopt result is a timeout
        // unless `is_closed()` reports otherwise.
        template <class Clock, class Duration>
        std::optional<T> recv_until(std::chrono::time_point<Clock, Duration> deadline)
        {
            std::unique_lock<std::mutex> lk(m_mu);
            m_cv.wait_until(lk, deadline, [&]
                            { return !m_queue.empty() || m_closed; });
            return pop_locked_();
        }

        template <class Rep, class Period>
        std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout)
        {
            return recv_until(std::chrono::steady_clock::now() + timeout);
        }

        // Waits until a value is queued, the channel closes, `st` is stopped, or
        // `timeout` elapses. Does not consume anything.
        template <class Rep, class Period>
        void wait_ready(std::stop_token st, std::chrono::duration<Rep, Period> timeout)
        {
            std::unique_lock<std::mutex> lk(m_mu);
            m_cv.wait_for(lk, st, timeout, [&]
                          { return !m_queue.empty() || m_closed; });
        }

        void close()
        {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                m_closed = true;
            }
            m_cv.notify_all();
        }

        bool is_closed() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_closed;
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_queue.size();
        }

    private:
        std::optional<T> pop_locked_()
        {
            if (m_queue.empty())
            {
                return std::nullopt;
            }
            T out = std::move(m_queue.front());
            m_queue.pop_front();
            return out;
        }

        mutable std::mutex m_mu;
        std::condition_variable_any m_cv;
        std::deque<T> m_queue;
        bool m_closed = false;
    };
}
