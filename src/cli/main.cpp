#include "warden/exceptions.hpp"
#include "warden/logging.hpp"
#include "warden/settings.hpp"
#include "warden/supervisor.hpp"
#include "warden/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

enum ExitCode
{
    kOk = 0,
    kFailure = 1,
    kUsage = 2,
    kAlreadyRunning = 3,
    kNotRunning = 3,
    kStopTimeout = 4,
    kStopCancelled = 5,
    kBusy = 6,
};

std::atomic<bool> g_cancel{false};

static void on_cancel_signal(int)
{
    g_cancel.store(true);
}

static void install_cancel_handlers()
{
    struct sigaction sa{};
    sa.sa_handler = on_cancel_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static int usage(int exit_code = kUsage)
{
    std::ostream& out = exit_code == kOk ? std::cout : std::cerr;
    out << "warden " << warden::VERSION_MAJOR << "." << warden::VERSION_MINOR << "."
        << warden::VERSION_PATCH << "\n";
    out << "Usage:\n";
    out << "  warden [options] start|stop|restart|status [-- <command...>]\n";
    out << "  warden --help | --version\n";
    out << "\n";
    out << "Options:\n";
    out << "  -c, --config <file>     JSON settings (default: ./warden.json if present)\n";
    out << "  --name <name>           Display name of the supervised program\n";
    out << "  --pid-file <path>       PID record (default: process.pid)\n";
    out << "  --log-file <path>       Child output log (default: <name>.log)\n";
    out << "  --append                Append to the log instead of truncating it\n";
    out << "  --runtime-env <dir>     Runtime directory whose bin/ is prepended to PATH\n";
    out << "  --timeout <seconds>     Give up a graceful stop after this long (0 = never)\n";
    out << "  --poll-interval <ms>    How often stop re-checks the process\n";
    out << "  --json                  Machine-readable status output\n";
    out << "  -v, --verbose           Debug logging\n";
    out << "\n";
    out << "Exit codes:\n";
    out << "  0 ok, 1 error, 2 usage, 3 already running (start) / not running (status),\n";
    out << "  4 stop timed out, 5 stop cancelled, 6 another invocation is busy\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            if (i + 1 >= args.size())
                throw warden::ConfigError("Missing value for " + flag);
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static long long parse_number(const std::string& flag, const std::string& s)
{
    try
    {
        size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos == s.size() && v >= 0)
            return v;
    }
    catch (const std::logic_error&)
    {
    }
    throw warden::ConfigError(flag + " expects a non-negative integer, got \"" + s + "\"");
}

static std::string format_time(std::chrono::system_clock::time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

struct Invocation
{
    std::string command;
    bool json = false;
    warden::Settings settings;
};

/// Defaults < config file < WARDEN_* environment < command-line flags
static Invocation parse_invocation(int argc, char** argv)
{
    std::vector<std::string> args;
    std::vector<std::string> child_command;
    bool after_separator = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (!after_separator && a == "--")
        {
            after_separator = true;
            continue;
        }
        (after_separator ? child_command : args).push_back(a);
    }

    Invocation inv;
    std::optional<std::string> config = consume_flag_value(args, "--config");
    if (!config)
        config = consume_flag_value(args, "-c");

    warden::Settings s;
    if (config)
        s = warden::Settings::from_file(*config);
    else if (std::filesystem::exists("warden.json"))
        s = warden::Settings::from_file("warden.json");
    s = warden::Settings::from_env(std::move(s));

    if (auto v = consume_flag_value(args, "--name"))
        s.name = *v;
    if (auto v = consume_flag_value(args, "--pid-file"))
        s.pid_file = *v;
    if (auto v = consume_flag_value(args, "--log-file"))
        s.log_file = *v;
    if (auto v = consume_flag_value(args, "--runtime-env"))
        s.runtime_env = *v;
    if (auto v = consume_flag_value(args, "--timeout"))
    {
        long long seconds = parse_number("--timeout", *v);
        if (seconds > std::chrono::milliseconds::max().count() / 1000)
            throw warden::ConfigError("--timeout is out of range: " + *v);
        s.stop_timeout = std::chrono::seconds(seconds);
    }
    if (auto v = consume_flag_value(args, "--poll-interval"))
        s.poll_interval = std::chrono::milliseconds(parse_number("--poll-interval", *v));
    if (consume_flag(args, "--append"))
        s.log_mode = warden::LogMode::Append;
    bool verbose = consume_flag(args, "--verbose");
    verbose = consume_flag(args, "-v") || verbose;
    if (verbose)
        s.log_level = "DEBUG";
    inv.json = consume_flag(args, "--json");

    if (!child_command.empty())
        s.command = child_command;

    for (const auto& a : args)
        if (!a.empty() && a[0] == '-')
            throw warden::ConfigError("Unknown option: " + a);
    if (args.size() != 1)
        throw warden::ConfigError(args.empty() ? "Missing command"
                                               : "Unexpected argument: " + args[1]);

    inv.command = args.front();
    inv.settings = std::move(s);
    return inv;
}

static int run_status(warden::Supervisor& supervisor, bool json)
{
    const auto& settings = supervisor.settings();
    auto recorded = supervisor.record().read();
    auto proc = supervisor.status();

    if (json)
    {
        warden::Json out = {{"name", settings.name},
                            {"pid_file", settings.pid_file},
                            {"state", warden::to_string(supervisor.state())}};
        if (proc)
            out["process"] = *proc;
        else if (recorded)
            out["stale_pid"] = *recorded;
        std::cout << out.dump(2) << "\n";
    }
    else if (proc)
    {
        std::cout << settings.name << " is running (PID: " << proc->pid << ", since "
                  << format_time(proc->started_at) << ", log: " << proc->log_file.string()
                  << ")\n";
    }
    else if (recorded)
    {
        std::cout << settings.name << " is not running (stale PID record: " << *recorded << ")\n";
    }
    else
    {
        std::cout << settings.name << " is not running\n";
    }

    if (proc)
        return kOk;
    return recorded ? kFailure : kNotRunning;
}

static int dispatch(const Invocation& inv, warden::Supervisor& supervisor)
{
    if (inv.command == "start")
    {
        supervisor.start();
        return kOk;
    }
    if (inv.command == "stop")
    {
        install_cancel_handlers();
        try
        {
            supervisor.stop(&g_cancel);
        }
        catch (const warden::NotRunningError& e)
        {
            std::cout << "[warden] " << e.what() << "\n";
        }
        return kOk;
    }
    if (inv.command == "restart")
    {
        install_cancel_handlers();
        supervisor.restart(&g_cancel);
        return kOk;
    }
    if (inv.command == "status")
        return run_status(supervisor, inv.json);

    std::cerr << "Unknown command: " << inv.command << "\n";
    return usage();
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string first = argv[1];
    if (first == "--help" || first == "-h")
        return usage(kOk);
    if (first == "--version")
    {
        std::cout << "warden " << warden::VERSION_MAJOR << "." << warden::VERSION_MINOR << "."
                  << warden::VERSION_PATCH << "\n";
        return kOk;
    }

    Invocation inv;
    std::optional<warden::Supervisor> supervisor;
    try
    {
        inv = parse_invocation(argc, argv);
        warden::Logger logger(warden::log_level_from_string(inv.settings.log_level));
        supervisor.emplace(inv.settings, logger);
    }
    catch (const warden::ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return usage();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return kFailure;
    }

    try
    {
        return dispatch(inv, *supervisor);
    }
    catch (const warden::AlreadyRunningError& e)
    {
        std::cerr << "[warden] " << e.what() << "\n";
        return kAlreadyRunning;
    }
    catch (const warden::StopTimeoutError& e)
    {
        std::cerr << "[warden] " << e.what() << "\n";
        return kStopTimeout;
    }
    catch (const warden::StopCancelledError& e)
    {
        std::cerr << "[warden] " << e.what() << "\n";
        return kStopCancelled;
    }
    catch (const warden::RecordBusyError& e)
    {
        std::cerr << "[warden] " << e.what() << "\n";
        return kBusy;
    }
    catch (const warden::ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return kUsage;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return kFailure;
    }
}
