#include "warden/settings.hpp"

#include "internal/process.hpp"
#include "warden/exceptions.hpp"
#include "warden/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace warden
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::chrono::milliseconds getenv_ms(const char* key, std::chrono::milliseconds defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        size_t pos = 0;
        long long ms = std::stoll(v, &pos, 10);
        if (pos != std::string(v).size())
            throw ConfigError(std::string(key) + " is not an integer: " + v);
        return std::chrono::milliseconds(ms);
    }
    catch (const std::logic_error&)
    {
        throw ConfigError(std::string(key) + " is not an integer: " + v);
    }
}

static LogMode log_mode_from_string(const std::string& s)
{
    if (s == "truncate")
        return LogMode::Truncate;
    if (s == "append")
        return LogMode::Append;
    throw ConfigError("log_mode must be \"truncate\" or \"append\", got \"" + s + "\"");
}

std::string Settings::effective_log_file() const
{
    if (!log_file.empty())
        return log_file;
    return name + ".log";
}

void Settings::validate() const
{
    if (name.empty())
        throw ConfigError("name must not be empty");
    if (pid_file.empty())
        throw ConfigError("pid_file must not be empty");
    if (poll_interval.count() <= 0)
        throw ConfigError("poll_interval_ms must be positive");
    if (restart_delay.count() < 0)
        throw ConfigError("restart_delay_ms must not be negative");
    if (stop_timeout.count() < 0)
        throw ConfigError("stop_timeout_ms must not be negative");
    if (!process::signal_from_name(stop_signal))
        throw ConfigError("Unknown stop_signal: " + stop_signal);
    log_level_from_string(log_level);
}

Settings Settings::from_env()
{
    return from_env(Settings{});
}

Settings Settings::from_env(Settings base)
{
    Settings s = std::move(base);
    auto lvl = getenv_str("WARDEN_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.pid_file = getenv_str("WARDEN_PID_FILE", s.pid_file);
    s.log_file = getenv_str("WARDEN_LOG_FILE", s.log_file);
    s.runtime_env = getenv_str("WARDEN_RUNTIME_ENV", s.runtime_env);
    s.poll_interval = getenv_ms("WARDEN_POLL_INTERVAL_MS", s.poll_interval);
    s.stop_timeout = getenv_ms("WARDEN_STOP_TIMEOUT_MS", s.stop_timeout);
    s.restart_delay = getenv_ms("WARDEN_RESTART_DELAY_MS", s.restart_delay);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    return from_json(j, Settings{});
}

Settings Settings::from_json(const Json& j, Settings base)
{
    Settings s = std::move(base);
    try
    {
        if (j.contains("name"))
            s.name = j.at("name").get<std::string>();
        if (j.contains("command"))
        {
            // Accept either an argv array or a single program path
            const auto& cmd = j.at("command");
            if (cmd.is_string())
                s.command = {cmd.get<std::string>()};
            else
                s.command = cmd.get<std::vector<std::string>>();
        }
        if (j.contains("working_directory"))
            s.working_directory = j.at("working_directory").get<std::string>();
        if (j.contains("pid_file"))
            s.pid_file = j.at("pid_file").get<std::string>();
        if (j.contains("log_file"))
            s.log_file = j.at("log_file").get<std::string>();
        if (j.contains("log_mode"))
            s.log_mode = log_mode_from_string(j.at("log_mode").get<std::string>());
        if (j.contains("runtime_env"))
            s.runtime_env = j.at("runtime_env").get<std::string>();
        if (j.contains("environment"))
            s.environment = j.at("environment").get<std::map<std::string, std::string>>();
        if (j.contains("stop_signal"))
            s.stop_signal = j.at("stop_signal").get<std::string>();
        if (j.contains("poll_interval_ms"))
            s.poll_interval = std::chrono::milliseconds(j.at("poll_interval_ms").get<long long>());
        if (j.contains("restart_delay_ms"))
            s.restart_delay = std::chrono::milliseconds(j.at("restart_delay_ms").get<long long>());
        if (j.contains("stop_timeout_ms"))
            s.stop_timeout = std::chrono::milliseconds(j.at("stop_timeout_ms").get<long long>());
        if (j.contains("log_level"))
            s.log_level = j.at("log_level").get<std::string>();
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("Invalid settings: ") + e.what());
    }
    return s;
}

Settings Settings::from_file(const std::filesystem::path& path)
{
    return from_file(path, Settings{});
}

Settings Settings::from_file(const std::filesystem::path& path, Settings base)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw ConfigError("Cannot open config file: " + path.string());

    Json j;
    try
    {
        in >> j;
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("Cannot parse config file " + path.string() + ": " + e.what());
    }
    if (!j.is_object())
        throw ConfigError("Config file " + path.string() + " must contain a JSON object");
    return from_json(j, std::move(base));
}

} // namespace warden
