// POSIX process primitives for warden's detached-child supervision

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden::process
{

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Options for spawning a detached process
struct DetachedOptions
{
    std::string working_directory;
    /// Variables set on top of the inherited (or empty) environment
    std::map<std::string, std::string> environment;
    /// Variables removed from the inherited environment
    std::vector<std::string> unset_environment;
    bool inherit_environment = true;
    /// Receives both stdout and stderr; empty means /dev/null
    std::string output_path;
    bool append_output = false;
};

/// Spawn a process in its own session, reparented away from the caller.
/// SIGHUP is ignored in the child, stdin reads from /dev/null.
/// @return pid of the running child
/// @throws ProcessError if the output file, fork or exec fails
int spawn_detached(const std::string& executable, const std::vector<std::string>& args,
                   const DetachedOptions& options = {});

/// True if pid names an existing, non-zombie process
bool is_alive(int pid);

/// Deliver a signal. Returns false if the process no longer exists.
bool send_signal(int pid, int signal);

enum class WaitStatus
{
    Exited,
    TimedOut,
    Cancelled
};

struct WaitOptions
{
    std::chrono::milliseconds poll_interval{5000};
    std::optional<std::chrono::milliseconds> timeout;
    const std::atomic<bool>* cancel = nullptr;
    /// Invoked before each sleep while the process is still alive
    std::function<void()> on_poll;
};

struct WaitResult
{
    WaitStatus status = WaitStatus::Exited;
    int polls = 0;
    std::chrono::milliseconds elapsed{0};
};

/// Poll until pid is gone, the timeout passes, or *cancel becomes true
WaitResult wait_for_exit(int pid, const WaitOptions& options);

/// Find an executable in a colon-separated search path
std::optional<std::string> find_executable(const std::string& name, const std::string& search_path);

/// Find an executable in the system PATH
std::optional<std::string> find_executable(const std::string& name);

/// "INT", "SIGINT", "int" or a decimal number
std::optional<int> signal_from_name(const std::string& name);

std::string signal_name(int signal);

} // namespace warden::process
