// POSIX implementation of detached process supervision

#include "process.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char** environ;

namespace warden::process
{

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pair(int fds[2])
{
    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

static void make_cloexec_pipe(int fds[2], const char* what)
{
    if (pipe(fds) != 0)
        throw ProcessError(std::string("Failed to create ") + what + " pipe: " +
                           get_errno_message());
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

/// Report errno to the parent over the error pipe and leave
[[noreturn]] static void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

static std::map<std::string, std::string> build_environment(const DetachedOptions& options)
{
    std::map<std::string, std::string> env;
    if (options.inherit_environment && environ)
    {
        for (char** e = environ; *e; ++e)
        {
            std::string entry(*e);
            auto eq = entry.find('=');
            if (eq == std::string::npos)
                continue;
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto& key : options.unset_environment)
        env.erase(key);
    for (const auto& [key, value] : options.environment)
        env[key] = value;
    return env;
}

// =============================================================================
// Spawning
// =============================================================================

int spawn_detached(const std::string& executable, const std::vector<std::string>& args,
                   const DetachedOptions& options)
{
    auto env = build_environment(options);

    std::string program = executable;
    if (program.find('/') == std::string::npos)
    {
        auto path_it = env.find("PATH");
        auto resolved = find_executable(program, path_it != env.end() ? path_it->second : "");
        if (!resolved)
            throw ProcessError("Failed to execute '" + executable + "': not found in PATH");
        program = *resolved;
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto& [key, value] : env)
        env_strings.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& s : env_strings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0)
        throw ProcessError("Failed to open /dev/null: " + get_errno_message());

    int out_fd = null_fd;
    if (!options.output_path.empty())
    {
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (options.append_output ? O_APPEND : O_TRUNC);
        out_fd = ::open(options.output_path.c_str(), flags, 0644);
        if (out_fd < 0)
        {
            std::string message = get_errno_message();
            ::close(null_fd);
            throw ProcessError("Failed to open log file '" + options.output_path + "': " + message);
        }
    }

    auto close_io = [&]()
    {
        if (out_fd != null_fd)
            ::close(out_fd);
        ::close(null_fd);
    };

    // Error pipe for detecting exec failures, pid pipe for the grandchild's pid
    int error_pipe[2] = {-1, -1};
    int pid_pipe[2] = {-1, -1};
    try
    {
        make_cloexec_pipe(error_pipe, "error");
        make_cloexec_pipe(pid_pipe, "pid");
    }
    catch (const ProcessError&)
    {
        close_pair(error_pipe);
        close_io();
        throw;
    }

    pid_t intermediate = fork();
    if (intermediate < 0)
    {
        std::string message = get_errno_message();
        close_pair(error_pipe);
        close_pair(pid_pipe);
        close_io();
        throw ProcessError("Failed to fork process: " + message);
    }

    if (intermediate == 0)
    {
        // Intermediate child: leave the caller's session, then fork the real child
        ::close(error_pipe[0]);
        ::close(pid_pipe[0]);

        if (setsid() < 0)
            child_fail(error_pipe[1]);
        signal(SIGHUP, SIG_IGN);

        pid_t child = fork();
        if (child < 0)
            child_fail(error_pipe[1]);

        if (child > 0)
        {
            (void)::write(pid_pipe[1], &child, sizeof(child));
            _exit(0);
        }

        // Grandchild
        ::close(pid_pipe[1]);

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGCHLD, SIG_DFL);

        if (dup2(null_fd, STDIN_FILENO) < 0)
            child_fail(error_pipe[1]);
        if (dup2(out_fd, STDOUT_FILENO) < 0)
            child_fail(error_pipe[1]);
        if (dup2(out_fd, STDERR_FILENO) < 0)
            child_fail(error_pipe[1]);

        if (!options.working_directory.empty())
        {
            if (chdir(options.working_directory.c_str()) != 0)
                child_fail(error_pipe[1]);
        }

        execve(program.c_str(), argv.data(), envp.data());
        child_fail(error_pipe[1]);
    }

    // Parent process
    ::close(error_pipe[1]);
    ::close(pid_pipe[1]);
    close_io();

    int status = 0;
    while (waitpid(intermediate, &status, 0) < 0 && errno == EINTR)
    {
    }

    pid_t child = 0;
    ssize_t pid_bytes = ::read(pid_pipe[0], &child, sizeof(child));
    ::close(pid_pipe[0]);

    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);
    ::close(error_pipe[0]);

    if (error_bytes > 0)
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));

    if (pid_bytes != static_cast<ssize_t>(sizeof(child)) || child <= 0)
        throw ProcessError("Failed to detach '" + executable + "'");

    return static_cast<int>(child);
}

// =============================================================================
// Liveness and signals
// =============================================================================

#ifdef __linux__
/// Process state letter from /proc/<pid>/stat, 0 if unavailable
static char proc_state(int pid)
{
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open())
        return 0;
    std::string line;
    std::getline(stat, line);
    // comm may contain spaces and parentheses; the state follows the last ')'
    auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size())
        return 0;
    return line[close + 2];
}
#endif

bool is_alive(int pid)
{
    if (pid <= 0)
        return false;

    if (::kill(pid, 0) != 0)
    {
        if (errno == ESRCH)
            return false;
        // EPERM: exists but belongs to someone else
    }

#ifdef __linux__
    char state = proc_state(pid);
    if (state == 'Z' || state == 'X')
        return false;
#endif
    return true;
}

bool send_signal(int pid, int signal)
{
    if (pid <= 0)
        throw ProcessError("Refusing to signal pid " + std::to_string(pid));

    if (::kill(pid, signal) == 0)
        return true;
    if (errno == ESRCH)
        return false;
    throw ProcessError("Failed to send " + signal_name(signal) + " to pid " + std::to_string(pid) +
                       ": " + get_errno_message());
}

// =============================================================================
// Waiting
// =============================================================================

static bool is_cancelled(const std::atomic<bool>* cancel)
{
    return cancel && cancel->load();
}

/// Sleep for d, waking early if cancelled. Returns false on cancellation.
static bool interruptible_sleep(std::chrono::milliseconds d, const std::atomic<bool>* cancel)
{
    using namespace std::chrono;
    constexpr milliseconds slice{100};
    auto deadline = steady_clock::now() + d;
    while (true)
    {
        if (is_cancelled(cancel))
            return false;
        auto now = steady_clock::now();
        if (now >= deadline)
            return true;
        auto remaining = duration_cast<milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + milliseconds(1), slice));
    }
}

WaitResult wait_for_exit(int pid, const WaitOptions& options)
{
    using namespace std::chrono;
    auto start = steady_clock::now();
    auto elapsed = [&]() { return duration_cast<milliseconds>(steady_clock::now() - start); };

    WaitResult result;
    while (true)
    {
        if (!is_alive(pid))
        {
            result.status = WaitStatus::Exited;
            break;
        }
        if (is_cancelled(options.cancel))
        {
            result.status = WaitStatus::Cancelled;
            break;
        }
        if (options.timeout && elapsed() >= *options.timeout)
        {
            result.status = WaitStatus::TimedOut;
            break;
        }

        if (options.on_poll)
            options.on_poll();

        auto nap = options.poll_interval;
        if (options.timeout)
            nap = std::min(nap, *options.timeout - elapsed());
        if (nap.count() < 1)
            nap = milliseconds(1);

        if (!interruptible_sleep(nap, options.cancel))
            continue;
        ++result.polls;
    }

    result.elapsed = elapsed();
    return result;
}

// =============================================================================
// Utility functions
// =============================================================================

static bool is_executable_file(const std::filesystem::path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& name, const std::string& search_path)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (is_executable_file(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    size_t start = 0;
    while (start <= search_path.size())
    {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos)
            end = search_path.size();
        std::string dir = search_path.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (is_executable_file(test_path))
                return test_path.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

std::optional<std::string> find_executable(const std::string& name)
{
    const char* path_env = std::getenv("PATH");
    return find_executable(name, path_env ? path_env : "/usr/bin:/bin");
}

namespace
{
struct SignalName
{
    const char* name;
    int number;
};

const SignalName kSignals[] = {
    {"HUP", SIGHUP},   {"INT", SIGINT},   {"QUIT", SIGQUIT}, {"KILL", SIGKILL},
    {"USR1", SIGUSR1}, {"USR2", SIGUSR2}, {"TERM", SIGTERM},
};
} // namespace

std::optional<int> signal_from_name(const std::string& name)
{
    if (name.empty())
        return std::nullopt;

    if (std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); }))
    {
        int number = std::atoi(name.c_str());
        if (number > 0 && number < NSIG)
            return number;
        return std::nullopt;
    }

    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper.rfind("SIG", 0) == 0)
        upper = upper.substr(3);
    for (const auto& s : kSignals)
        if (upper == s.name)
            return s.number;
    return std::nullopt;
}

std::string signal_name(int signal)
{
    for (const auto& s : kSignals)
        if (s.number == signal)
            return std::string("SIG") + s.name;
    return "signal " + std::to_string(signal);
}

} // namespace warden::process
