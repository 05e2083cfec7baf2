#include "merkle/log.hpp"
#include <atomic>
#include <iostream>
#include <string>
#include <utility>

namespace Hashwood::Merkle {

namespace {
    LogSink& sink_slot()
    {
        static LogSink sink;
        return sink;
    }

    std::atomic<LogLevel>& level_slot()
    {
        static std::atomic<LogLevel> level { LogLevel::Info };
        return level;
    }
} // namespace

void set_log_sink(LogSink sink)
{
    sink_slot() = std::move(sink);
}

void set_log_level(LogLevel level)
{
    level_slot().store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept
{
    return level_slot().load(std::memory_order_relaxed);
}

std::string_view level_name(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "UNKNOWN";
}

LogSink stderr_sink()
{
    return [](LogLevel level, std::string_view message) {
        std::cerr << "[" << level_name(level) << "] " << message << '\n';
    };
}

namespace detail {
    void log(LogLevel level, std::string_view message)
    {
        if (level < log_level() || level == LogLevel::Off) {
            return;
        }
        const auto& sink = sink_slot();
        if (sink) {
            sink(level, message);
        }
    }
} // namespace detail

} // namespace Hashwood::Merkle
