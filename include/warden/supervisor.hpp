#pragma once
#include "warden/logging.hpp"
#include "warden/pid_record.hpp"
#include "warden/settings.hpp"
#include "warden/types.hpp"

#include <atomic>
#include <optional>

namespace warden
{

/// Starts, stops and restarts one detached child, handing control between
/// separate invocations through a PID record.
///
/// Each public operation holds the record lock for its whole duration, so
/// two invocations never interleave on the same record.
class Supervisor
{
  public:
    explicit Supervisor(Settings settings, Logger logger = Logger{});

    /// Launch the configured command detached and record its pid.
    /// A stale record is replaced.
    /// @throws AlreadyRunningError if the recorded process is alive
    /// @throws LaunchError if the command or runtime environment is missing
    SupervisedProcess start();

    /// Signal the recorded process and wait for it to exit, then remove
    /// the record. Waits forever unless settings().stop_timeout is set.
    /// @param cancel Optional flag; once true the wait gives up
    /// @throws NotRunningError when there is no record
    /// @throws StaleRecordError when the record names a dead process (record removed)
    /// @throws StopTimeoutError, StopCancelledError with the record kept
    StopResult stop(const std::atomic<bool>* cancel = nullptr);

    /// Stop (tolerating nothing running), pause restart_delay, Start.
    /// A cancel raised after Stop skips Start with StopCancelledError.
    SupervisedProcess restart(const std::atomic<bool>* cancel = nullptr);

    /// The recorded process if it is alive. Never modifies the record.
    std::optional<SupervisedProcess> status() const;

    ProcessState state() const;

    const Settings& settings() const
    {
        return settings_;
    }

    const PidRecord& record() const
    {
        return record_;
    }

  private:
    SupervisedProcess start_locked();
    StopResult stop_locked(const std::atomic<bool>* cancel);
    std::string resolve_executable(const std::string& name, const std::string& search_path) const;

    Settings settings_;
    Logger logger_;
    PidRecord record_;
    ProcessState state_ = ProcessState::NotRunning;
};

} // namespace warden
