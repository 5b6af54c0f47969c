//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/log.cpp
// Purpose: Implement the line-oriented log sink.
// Key invariants: One call to log() produces at most one output line.
// Ownership/Lifetime: The sink never owns the stream it writes to.
//
//===----------------------------------------------------------------------===//

#include "syndrql/support/log.hpp"

#include "syndrql/support/char_utils.hpp"

#include <ostream>

namespace syndrql::support
{

bool LogConfig::enabled() const
{
    return level != Off;
}

std::optional<LogConfig::Level> parseLogLevel(std::string_view name)
{
    const std::string upper = char_utils::toUppercase(name);
    if (upper == "OFF" || upper == "NONE")
        return LogConfig::Off;
    if (upper == "ERROR")
        return LogConfig::Error;
    if (upper == "INFO")
        return LogConfig::Info;
    if (upper == "DEBUG")
        return LogConfig::Debug;
    return std::nullopt;
}

std::string_view logLevelName(LogConfig::Level level) noexcept
{
    switch (level)
    {
        case LogConfig::Off:
            return "off";
        case LogConfig::Error:
            return "error";
        case LogConfig::Info:
            return "info";
        case LogConfig::Debug:
            return "debug";
    }
    return "off";
}

LogSink::LogSink(std::ostream &out, LogConfig cfg) : out_(&out), cfg_(cfg) {}

bool LogSink::shouldLog(LogConfig::Level level) const
{
    return cfg_.enabled() && level != LogConfig::Off && level <= cfg_.level;
}

void LogSink::log(LogConfig::Level level, std::string_view component, std::string_view message)
{
    if (!shouldLog(level))
        return;
    *out_ << "[syndrql:" << logLevelName(level) << "] " << component << ": " << message << '\n';
}

} // namespace syndrql::support
