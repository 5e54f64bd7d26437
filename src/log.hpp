#pragma once

#include "common.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string_view>

namespace replicaflow
{
    enum class LogLevel : std::uint8_t
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    inline const char *log_level_name(LogLevel lvl) noexcept
    {
        switch (lvl)
        {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Accepts the names printed by log_level_name, upper or lower case.
    inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept
    {
        if (s == "ERROR" || s == "error")
            return LogLevel::Error;
        if (s == "WARN" || s == "warn")
            return LogLevel::Warn;
        if (s == "INFO" || s == "info")
            return LogLevel::Info;
        if (s == "DEBUG" || s == "debug")
            return LogLevel::Debug;
        if (s == "TRACE" || s == "trace")
            return LogLevel::Trace;
        if (s == "OFF" || s == "off")
            return LogLevel::Off;
        return std::nullopt;
    }

    // Level from the REPLICAFLOW_LOG environment variable, or `fallback`.
    inline LogLevel log_level_from_env(LogLevel fallback) noexcept
    {
        const char *v = std::getenv("REPLICAFLOW_LOG");
        if (!v)
        {
            return fallback;
        }
        return parse_log_level(v).value_or(fallback);
    }

    class Logger
    {
    public:
        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl) noexcept { m_level.store(lvl, std::memory_order_relaxed); }

        LogLevel level() const noexcept { return m_level.load(std::memory_order_relaxed); }

        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        // `scope` names the emitter, e.g. "controller" or "replica-3".
        void logf(LogLevel lvl, const char *scope, const char *fmt, ...)
        {
            if (!log_enabled(level(), lvl))
            {
                return;
            }

            char buf[1024];
            va_list args;
            va_start(args, fmt);
            std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);

            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_sink)
            {
                return;
            }
            std::fprintf(m_sink, "[%s][%s] %s\n", log_level_name(lvl), scope, buf);
            std::fflush(m_sink);
        }

    private:
        Logger() = default;

        // Replica tasks log from their own threads.
        mutable std::mutex m_mu;
        std::atomic<LogLevel> m_level{LogLevel::Off};
        FILE *m_sink = stderr;
    };
}
