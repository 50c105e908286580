#pragma once
#include <functional>
#include <string>

namespace warden
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(LogLevel level);

/// Parse "debug", "INFO", "warn", "warning", "error" (case-insensitive).
/// Throws ConfigError for anything else.
LogLevel log_level_from_string(const std::string& s);

using LogCallback = std::function<void(LogLevel, const std::string&)>;

/// Leveled console reporter shared by the supervisor and the CLI
class Logger
{
  public:
    explicit Logger(LogLevel threshold = LogLevel::Info, LogCallback sink = nullptr);

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }

    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }

    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }

    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

    LogLevel threshold() const
    {
        return threshold_;
    }

    void set_threshold(LogLevel level)
    {
        threshold_ = level;
    }

    /// Default sink: Debug/Info to stdout, Warning/Error to stderr
    static void console_sink(LogLevel level, const std::string& message);

  private:
    LogLevel threshold_;
    LogCallback sink_;
};

} // namespace warden
