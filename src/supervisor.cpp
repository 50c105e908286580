#include "warden/supervisor.hpp"

#include "internal/process.hpp"
#include "warden/exceptions.hpp"
#include "warden/runtime_env.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <thread>

namespace warden
{

namespace fs = std::filesystem;

namespace
{

/// Restores the steady state if an operation leaves through an exception
class StateGuard
{
  public:
    StateGuard(ProcessState& state, ProcessState during, ProcessState on_failure)
        : state_(state), on_failure_(on_failure)
    {
        state_ = during;
    }

    ~StateGuard()
    {
        if (!committed_)
            state_ = on_failure_;
    }

    void commit(ProcessState final_state)
    {
        state_ = final_state;
        committed_ = true;
    }

  private:
    ProcessState& state_;
    ProcessState on_failure_;
    bool committed_ = false;
};

} // namespace

Supervisor::Supervisor(Settings settings, Logger logger)
    : settings_(std::move(settings)), logger_(std::move(logger)), record_(settings_.pid_file)
{
    settings_.validate();
}

SupervisedProcess Supervisor::start()
{
    auto lock = record_.lock();
    return start_locked();
}

StopResult Supervisor::stop(const std::atomic<bool>* cancel)
{
    auto lock = record_.lock();
    return stop_locked(cancel);
}

SupervisedProcess Supervisor::restart(const std::atomic<bool>* cancel)
{
    auto lock = record_.lock();

    try
    {
        stop_locked(cancel);
    }
    catch (const NotRunningError& e)
    {
        logger_.info(e.what());
    }

    if (settings_.restart_delay.count() > 0)
    {
        logger_.debug("Waiting " + std::to_string(settings_.restart_delay.count()) +
                      " ms before restarting");
        auto deadline = std::chrono::steady_clock::now() + settings_.restart_delay;
        while (!(cancel && cancel->load()))
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                break;
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                             std::chrono::milliseconds(100)));
        }
    }

    if (cancel && cancel->load())
        throw StopCancelledError("Restart of " + settings_.name + " cancelled before start");

    auto proc = start_locked();
    logger_.info(settings_.name + " restarted with PID " + std::to_string(proc.pid));
    return proc;
}

std::optional<SupervisedProcess> Supervisor::status() const
{
    auto pid = record_.read();
    if (!pid || !process::is_alive(*pid))
        return std::nullopt;

    SupervisedProcess proc;
    proc.pid = *pid;
    proc.command = settings_.command;
    proc.log_file = settings_.effective_log_file();
    if (auto when = record_.modified_at())
        proc.started_at = *when;
    return proc;
}

ProcessState Supervisor::state() const
{
    if (state_ == ProcessState::Starting || state_ == ProcessState::Stopping)
        return state_;
    return status() ? ProcessState::Running : ProcessState::NotRunning;
}

std::string Supervisor::resolve_executable(const std::string& name,
                                           const std::string& search_path) const
{
    std::string candidate = name;
    if (name.find('/') != std::string::npos && fs::path(name).is_relative() &&
        !settings_.working_directory.empty())
        candidate = (fs::path(settings_.working_directory) / name).string();

    auto resolved = process::find_executable(candidate, search_path);
    if (!resolved)
        throw LaunchError("Executable not found: " + name);
    return *resolved;
}

SupervisedProcess Supervisor::start_locked()
{
    if (settings_.command.empty())
        throw LaunchError("No command configured for " + settings_.name);

    if (auto existing = record_.read())
    {
        if (process::is_alive(*existing))
            throw AlreadyRunningError(settings_.name + " is already running (PID: " +
                                          std::to_string(*existing) + ")",
                                      *existing);
        logger_.warning("Removing stale PID record " + record_.path().string() + " (PID " +
                        std::to_string(*existing) + " is not running)");
        record_.remove();
    }

    StateGuard guard(state_, ProcessState::Starting, ProcessState::NotRunning);

    ChildEnvironment env = build_child_environment(settings_);
    std::string executable = resolve_executable(settings_.command.front(), env.search_path);
    std::vector<std::string> args(settings_.command.begin() + 1, settings_.command.end());

    process::DetachedOptions options;
    options.working_directory = settings_.working_directory;
    options.environment = env.set;
    options.unset_environment = env.unset;
    options.output_path = settings_.effective_log_file();
    options.append_output = settings_.log_mode == LogMode::Append;

    logger_.debug("Launching " + executable + " with output to " + options.output_path);

    SupervisedProcess proc;
    try
    {
        proc.pid = process::spawn_detached(executable, args, options);
    }
    catch (const process::ProcessError& e)
    {
        throw LaunchError(e.what());
    }
    proc.command = settings_.command;
    proc.log_file = options.output_path;
    proc.started_at = std::chrono::system_clock::now();

    try
    {
        record_.write(proc.pid);
    }
    catch (const RecordError& e)
    {
        throw RecordError(std::string(e.what()) + " (" + settings_.name + " is running as PID " +
                          std::to_string(proc.pid) + " without a record)");
    }

    guard.commit(ProcessState::Running);
    logger_.info(settings_.name + " started with PID " + std::to_string(proc.pid));
    return proc;
}

StopResult Supervisor::stop_locked(const std::atomic<bool>* cancel)
{
    auto pid = record_.read();
    if (!pid)
        throw NotRunningError("No running process found");

    if (!process::is_alive(*pid))
    {
        record_.remove();
        throw StaleRecordError("Removed stale PID record (PID " + std::to_string(*pid) +
                                   " is not running)",
                               *pid);
    }

    StateGuard guard(state_, ProcessState::Stopping, ProcessState::Running);

    // validate() guarantees the name resolves
    int sig = process::signal_from_name(settings_.stop_signal).value_or(SIGINT);
    logger_.info("Gracefully stopping " + settings_.name + " (PID: " + std::to_string(*pid) +
                 ")...");
    try
    {
        process::send_signal(*pid, sig);
    }
    catch (const process::ProcessError& e)
    {
        throw Error(e.what());
    }

    process::WaitOptions wait;
    wait.poll_interval = settings_.poll_interval;
    if (settings_.stop_timeout.count() > 0)
        wait.timeout = settings_.stop_timeout;
    wait.cancel = cancel;
    wait.on_poll = [this]() { logger_.info("Waiting for the current operation to finish..."); };

    auto waited = process::wait_for_exit(*pid, wait);
    switch (waited.status)
    {
    case process::WaitStatus::TimedOut:
        throw StopTimeoutError(settings_.name + " (PID " + std::to_string(*pid) +
                               ") did not exit within " +
                               std::to_string(settings_.stop_timeout.count()) + " ms");
    case process::WaitStatus::Cancelled:
        throw StopCancelledError("Stopped waiting for " + settings_.name + " (PID " +
                                 std::to_string(*pid) + "); it is still running");
    case process::WaitStatus::Exited:
        break;
    }

    record_.remove();
    guard.commit(ProcessState::NotRunning);
    logger_.info(settings_.name + " stopped successfully");

    StopResult result;
    result.pid = *pid;
    result.polls = waited.polls;
    result.elapsed = waited.elapsed;
    return result;
}

} // namespace warden
