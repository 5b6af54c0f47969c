//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/support/log.hpp
// Purpose: Declare logging configuration and sink for language-service events.
// Key invariants: Log output is deterministic and line-oriented; a disabled
//                 sink writes nothing.
// Ownership/Lifetime: Sink holds configuration by value and borrows the output
//                     stream, which must outlive the sink.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace syndrql::support
{

/// @brief Configuration for diagnostic logging.
struct LogConfig
{
    /// @brief Verbosity levels, ordered from quietest to noisiest.
    enum Level
    {
        Off,   ///< Logging disabled
        Error, ///< Failures only
        Info,  ///< Lifecycle events
        Debug  ///< Per-pass details
    } level{Off};

    /// @brief Check whether logging is enabled at all.
    [[nodiscard]] bool enabled() const;
};

/// @brief Parse a level name ("off", "error", "info", "debug"), case-insensitively.
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<LogConfig::Level> parseLogLevel(std::string_view name);

/// @brief Lowercase name of @p level.
[[nodiscard]] std::string_view logLevelName(LogConfig::Level level) noexcept;

/// @brief Sink that formats and emits log lines.
/// @details Each line reads `[syndrql:<level>] <component>: <message>`.
class LogSink
{
  public:
    /// @brief Create sink writing to @p out with configuration @p cfg.
    explicit LogSink(std::ostream &out, LogConfig cfg = {});

    /// @brief True when a message at @p level would be written.
    [[nodiscard]] bool shouldLog(LogConfig::Level level) const;

    /// @brief Emit @p message from @p component at @p level.
    void log(LogConfig::Level level, std::string_view component, std::string_view message);

    void error(std::string_view component, std::string_view message)
    {
        log(LogConfig::Error, component, message);
    }

    void info(std::string_view component, std::string_view message)
    {
        log(LogConfig::Info, component, message);
    }

    void debug(std::string_view component, std::string_view message)
    {
        log(LogConfig::Debug, component, message);
    }

    /// @brief Replace the active configuration.
    void setConfig(LogConfig cfg)
    {
        cfg_ = cfg;
    }

    [[nodiscard]] const LogConfig &config() const
    {
        return cfg_;
    }

  private:
    std::ostream *out_; ///< Borrowed destination stream.
    LogConfig cfg_;     ///< Active configuration.
};

} // namespace syndrql::support
