#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace Hashwood::Merkle {

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

using LogSink = std::function<void(LogLevel, std::string_view)>;

// The library never writes anywhere unless a sink is installed.
// Installing or replacing the sink is not synchronized with logging calls.
void set_log_sink(LogSink sink);
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level() noexcept;

[[nodiscard]] std::string_view level_name(LogLevel level) noexcept;

// Sink writing "[LEVEL] message" lines to std::cerr
[[nodiscard]] LogSink stderr_sink();

namespace detail {
    void log(LogLevel level, std::string_view message);
}

} // namespace Hashwood::Merkle
