#include "warden/logging.hpp"

#include "warden/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace warden
{

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

LogLevel log_level_from_string(const std::string& s)
{
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "INFO")
        return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    throw ConfigError("Unknown log level: " + s);
}

Logger::Logger(LogLevel threshold, LogCallback sink)
    : threshold_(threshold), sink_(std::move(sink))
{
    if (!sink_)
        sink_ = &Logger::console_sink;
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (static_cast<int>(level) < static_cast<int>(threshold_))
        return;
    sink_(level, message);
}

void Logger::console_sink(LogLevel level, const std::string& message)
{
    switch (level)
    {
    case LogLevel::Debug:
        std::cout << "[warden] DEBUG: " << message << std::endl;
        break;
    case LogLevel::Info:
        std::cout << "[warden] " << message << std::endl;
        break;
    default:
        std::cerr << "[warden] " << to_string(level) << ": " << message << std::endl;
        break;
    }
}

} // namespace warden
