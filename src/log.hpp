#pragma once

#include "common.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace detsim
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

    // Accepts the names printed by log_level_name, in either case.
    inline std::optional<LogLevel> parse_log_level(std::string_view s)
    {
        std::string up(s);
        for (char &c : up)
        {
            if (c >= 'a' && c <= 'z')
            {
                c = static_cast<char>(c - 'a' + 'A');
            }
        }
        for (LogLevel lvl : {LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug, LogLevel::Trace, LogLevel::Off})
        {
            if (up == log_level_name(lvl))
            {
                return lvl;
            }
        }
        return std::nullopt;
    }

    inline LogLevel log_level_from_env(const char *name, LogLevel fallback)
    {
        const char *raw = std::getenv(name);
        if (!raw || *raw == '\0')
        {
            return fallback;
        }
        const auto lvl = parse_log_level(raw);
        if (!lvl)
        {
            throw std::invalid_argument(std::string("log_level_from_env: ") + name + " is not a log level: '" + raw + "'");
        }
        return *lvl;
    }

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept
    {
        if (configured == LogLevel::Off || msg == LogLevel::Off)
        {
            return false;
        }
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Simulated time as seconds with a nanosecond fraction: 1500000 -> "0.001500000".
    inline std::string format_instant(SimInstant at)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%llu.%09llu",
                      static_cast<unsigned long long>(at / 1000000000ull),
                      static_cast<unsigned long long>(at % 1000000000ull));
        return std::string(buf);
    }

    // Process-wide diagnostic sink. Only output goes through here: nothing a
    // simulation decides may depend on whether a line was logged.
    class Logger
    {
    public:
        using LineSink = std::function<void(LogLevel, const std::string &)>;

        static Logger &instance()
        {
            static Logger g;
            return g;
        }

        void set_level(LogLevel lvl)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_level = lvl;
        }

        LogLevel level() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_level;
        }

        bool enabled(LogLevel lvl) const { return log_enabled(level(), lvl); }

        void set_sink(FILE *f)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_sink = f;
        }

        // Receives every formatted line instead of the FILE* sink. An empty
        // function restores the FILE* sink.
        void set_line_sink(LineSink sink)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_lineSink = std::move(sink);
        }

        // "[LEVEL][host=H][t=S.NNNNNNNNN] message". Host 0 is the runtime itself.
        void logf(LogLevel lvl, HostId host, SimInstant at, const char *fmt, ...)
        {
            if (!enabled(lvl))
            {
                return;
            }

            va_list args;
            va_start(args, fmt);
            const std::string msg = vformat_(fmt, args);
            va_end(args);

            std::string line = "[";
            line += log_level_name(lvl);
            line += "][host=" + std::to_string(host) + "][t=" + format_instant(at) + "] ";
            line += msg;

            std::lock_guard<std::mutex> lk(m_mu);
            if (m_lineSink)
            {
                m_lineSink(lvl, line);
                return;
            }
            if (!m_sink)
            {
                return;
            }
            std::fprintf(m_sink, "%s\n", line.c_str());
            std::fflush(m_sink);
        }

    private:
        Logger() = default;

        static std::string vformat_(const char *fmt, va_list args)
        {
            va_list sizing;
            va_copy(sizing, args);
            const int n = std::vsnprintf(nullptr, 0, fmt, sizing);
            va_end(sizing);
            if (n <= 0)
            {
                return std::string();
            }
            std::string out(static_cast<std::size_t>(n) + 1, '\0');
            std::vsnprintf(out.data(), out.size(), fmt, args);
            out.resize(static_cast<std::size_t>(n));
            return out;
        }

        mutable std::mutex m_mu;
        LogLevel m_level = LogLevel::Off;
        FILE *m_sink = stderr;
        LineSink m_lineSink;
    };
}
