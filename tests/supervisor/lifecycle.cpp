#include "internal/process.hpp"
#include "test_helpers.hpp"
#include "warden/exceptions.hpp"
#include "warden/supervisor.hpp"

#include <cassert>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>

using namespace warden;

/// A pid that certainly names no live process
static int dead_pid()
{
    pid_t child = fork();
    if (child == 0)
        _exit(0);
    waitpid(child, nullptr, 0);
    return static_cast<int>(child);
}

int main()
{
    std::cout << "Test: start records a live pid...\n";
    {
        ScratchDir dir("life_start");
        CapturedLog log;
        Supervisor sup(test_settings(dir), log.logger());
        assert(sup.state() == ProcessState::NotRunning);
        assert(!sup.status());

        auto proc = sup.start();
        assert(proc.pid > 0);
        assert(process::is_alive(proc.pid));
        assert(sup.record().read() == proc.pid);
        assert(proc.log_file == dir / "service.log");
        assert(fs::exists(dir / "service.log"));
        assert(proc.command == sup.settings().command);
        assert(log.contains("test-service started with PID " + std::to_string(proc.pid)));
        assert(sup.state() == ProcessState::Running);

        auto st = sup.status();
        assert(st && st->pid == proc.pid);

        sup.stop();
        std::cout << "  [PASS] record holds a live pid\n";
    }

    std::cout << "Test: stop blocks until exit and removes the record...\n";
    {
        ScratchDir dir("life_stop");
        CapturedLog log;
        auto settings = test_settings(dir);
        settings.command = graceful_child("sleep 0.3; exit 0");
        Supervisor sup(settings, log.logger());

        auto proc = sup.start();
        std::this_thread::sleep_for(100ms);
        auto result = sup.stop();
        assert(result.pid == proc.pid);
        assert(result.polls >= 1);
        assert(!process::is_alive(proc.pid));
        assert(!sup.record().exists());
        assert(sup.state() == ProcessState::NotRunning);
        assert(log.contains("Gracefully stopping test-service (PID: " + std::to_string(proc.pid) +
                            ")..."));
        assert(log.contains("Waiting for the current operation to finish..."));
        assert(log.contains("test-service stopped successfully"));
        std::cout << "  [PASS] record absent and process gone after stop\n";
    }

    std::cout << "Test: stop with nothing recorded...\n";
    {
        ScratchDir dir("life_none");
        Supervisor sup(test_settings(dir), CapturedLog().logger());
        bool not_running = false;
        try
        {
            sup.stop();
        }
        catch (const StaleRecordError&)
        {
            assert(false && "no record should not be reported as stale");
        }
        catch (const NotRunningError& e)
        {
            not_running = true;
            assert(std::string(e.what()) == "No running process found");
        }
        assert(not_running);
        assert(!sup.record().exists());
        assert(!fs::exists(dir / "service.log"));
        std::cout << "  [PASS] NotRunningError, state unchanged\n";
    }

    std::cout << "Test: stop twice...\n";
    {
        ScratchDir dir("life_twice");
        Supervisor sup(test_settings(dir), CapturedLog().logger());
        sup.start();
        sup.stop();
        bool not_running = false;
        try
        {
            sup.stop();
        }
        catch (const NotRunningError&)
        {
            not_running = true;
        }
        assert(not_running);
        std::cout << "  [PASS] second stop reports NotRunningError\n";
    }

    std::cout << "Test: stale record on stop is cleaned up without signalling...\n";
    {
        ScratchDir dir("life_stale_stop");
        Supervisor sup(test_settings(dir), CapturedLog().logger());
        int gone = dead_pid();
        PidRecord(sup.settings().pid_file).write(gone);

        bool stale = false;
        try
        {
            sup.stop();
        }
        catch (const StaleRecordError& e)
        {
            stale = true;
            assert(e.pid == gone);
        }
        assert(stale);
        assert(!sup.record().exists());
        std::cout << "  [PASS] StaleRecordError and record removed\n";
    }

    std::cout << "Test: start refuses to double-launch...\n";
    {
        ScratchDir dir("life_double");
        Supervisor sup(test_settings(dir), CapturedLog().logger());
        auto proc = sup.start();

        Supervisor second(test_settings(dir), CapturedLog().logger());
        bool already = false;
        try
        {
            second.start();
        }
        catch (const AlreadyRunningError& e)
        {
            already = true;
            assert(e.pid == proc.pid);
        }
        assert(already);
        assert(sup.record().read() == proc.pid);

        second.stop();
        assert(!process::is_alive(proc.pid));
        std::cout << "  [PASS] AlreadyRunningError, record untouched\n";
    }

    std::cout << "Test: start replaces a stale record...\n";
    {
        ScratchDir dir("life_stale_start");
        CapturedLog log;
        Supervisor sup(test_settings(dir), log.logger());
        int gone = dead_pid();
        PidRecord(sup.settings().pid_file).write(gone);

        auto proc = sup.start();
        assert(proc.pid != gone);
        assert(sup.record().read() == proc.pid);
        assert(log.has_level(LogLevel::Warning));
        assert(log.contains("stale"));
        sup.stop();
        std::cout << "  [PASS] stale record overwritten\n";
    }

    std::cout << "Test: scenario - exit 12 units after the signal, polled every 5...\n";
    {
        // 1 unit = 50 ms
        ScratchDir dir("life_scenario");
        CapturedLog log;
        auto settings = test_settings(dir);
        settings.command = graceful_child("sleep 0.6; exit 0");
        settings.poll_interval = 250ms;
        Supervisor sup(settings, log.logger());

        auto proc = sup.start();
        std::this_thread::sleep_for(100ms);
        auto result = sup.stop();
        assert(result.pid == proc.pid);
        assert(result.polls >= 1);
        assert(result.elapsed >= 500ms);
        assert(!sup.record().exists());
        assert(log.count("Waiting for the current operation to finish...") >= 1);

        bool not_running = false;
        try
        {
            sup.stop();
        }
        catch (const NotRunningError&)
        {
            not_running = true;
        }
        assert(not_running);
        std::cout << "  [PASS] removed after " << result.polls << " polls\n";
    }

    std::cout << "\n[OK] supervisor lifecycle tests passed\n";
    return 0;
}
