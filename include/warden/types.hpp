#pragma once
#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace warden
{

using Json = nlohmann::json;

/// Lifecycle of the supervised child as seen by one invocation.
enum class ProcessState
{
    NotRunning,
    Starting,
    Running,
    Stopping
};

inline std::string to_string(ProcessState state)
{
    switch (state)
    {
    case ProcessState::NotRunning:
        return "not_running";
    case ProcessState::Starting:
        return "starting";
    case ProcessState::Running:
        return "running";
    case ProcessState::Stopping:
        return "stopping";
    }
    return "not_running";
}

/// A child launched by Start and tracked through the PID record
struct SupervisedProcess
{
    int pid = 0;
    std::vector<std::string> command;
    std::filesystem::path log_file;
    std::chrono::system_clock::time_point started_at;
};

/// Outcome of a completed graceful stop
struct StopResult
{
    int pid = 0;
    int polls = 0;                     ///< Sleep intervals spent waiting for exit
    std::chrono::milliseconds elapsed{0};
};

// nlohmann::json adapters
inline void to_json(Json& j, const SupervisedProcess& p)
{
    auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(
        p.started_at.time_since_epoch());
    j = Json{{"pid", p.pid},
             {"command", p.command},
             {"log_file", p.log_file.string()},
             {"started_at", since_epoch.count()}};
}

inline void to_json(Json& j, const StopResult& r)
{
    j = Json{{"pid", r.pid}, {"polls", r.polls}, {"elapsed_ms", r.elapsed.count()}};
}

} // namespace warden
