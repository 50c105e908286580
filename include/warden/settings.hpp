#pragma once
#include "warden/types.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace warden
{

/// How the child's log file is opened on Start
enum class LogMode
{
    Truncate,
    Append
};

struct Settings
{
    std::string name{"service"};
    std::vector<std::string> command;
    std::string working_directory;
    std::string pid_file{"process.pid"};
    std::string log_file;
    LogMode log_mode{LogMode::Truncate};
    std::string runtime_env;
    std::map<std::string, std::string> environment;
    std::string stop_signal{"INT"};
    std::chrono::milliseconds poll_interval{5000};
    std::chrono::milliseconds restart_delay{2000};
    std::chrono::milliseconds stop_timeout{0}; ///< 0 waits forever
    std::string log_level{"INFO"};

    /// log_file, or "<name>.log" when unset
    std::string effective_log_file() const;

    /// Throws ConfigError describing the first invalid field
    void validate() const;

    /// Overlay WARDEN_* environment variables on base
    static Settings from_env();
    static Settings from_env(Settings base);
    /// Overlay the keys present in j on base
    static Settings from_json(const Json& j);
    static Settings from_json(const Json& j, Settings base);
    static Settings from_file(const std::filesystem::path& path);
    static Settings from_file(const std::filesystem::path& path, Settings base);
};

} // namespace warden
