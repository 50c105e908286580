#include "test_helpers.hpp"
#include "warden/exceptions.hpp"
#include "warden/settings.hpp"

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>

static void expect_config_error(const warden::Settings& s)
{
    bool caught = false;
    try
    {
        s.validate();
    }
    catch (const warden::ConfigError&)
    {
        caught = true;
    }
    assert(caught);
}

int main()
{
    using namespace warden;

    // Defaults: SIGINT, 5 s polls, 2 s restart pause
    {
        Settings s;
        assert(s.pid_file == "process.pid");
        assert(s.stop_signal == "INT");
        assert(s.poll_interval == std::chrono::seconds(5));
        assert(s.restart_delay == std::chrono::seconds(2));
        assert(s.stop_timeout.count() == 0);
        assert(s.log_mode == LogMode::Truncate);
        assert(s.effective_log_file() == "service.log");
        s.validate();
        std::cout << "  [PASS] defaults\n";
    }

    // JSON parse
    {
        auto s = Settings::from_json(Json{{"name", "uploader"},
                                          {"command", {"python", "run.py"}},
                                          {"log_mode", "append"},
                                          {"runtime_env", "env"},
                                          {"environment", {{"OAUTHLIB_INSECURE_TRANSPORT", "1"}}},
                                          {"poll_interval_ms", 250},
                                          {"stop_timeout_ms", 60000},
                                          {"log_level", "debug"}});
        assert(s.name == "uploader");
        assert(s.command.size() == 2 && s.command[1] == "run.py");
        assert(s.log_mode == LogMode::Append);
        assert(s.runtime_env == "env");
        assert(s.environment.at("OAUTHLIB_INSECURE_TRANSPORT") == "1");
        assert(s.poll_interval.count() == 250);
        assert(s.stop_timeout.count() == 60000);
        assert(s.log_level == "debug");
        assert(s.effective_log_file() == "uploader.log");
        s.validate();

        auto single = Settings::from_json(Json{{"command", "/usr/bin/env"}});
        assert(single.command.size() == 1 && single.command[0] == "/usr/bin/env");
        std::cout << "  [PASS] from_json\n";
    }

    // Wrong JSON types surface as ConfigError
    {
        bool caught = false;
        try
        {
            Settings::from_json(Json{{"poll_interval_ms", "soon"}});
        }
        catch (const ConfigError&)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            Settings::from_json(Json{{"log_mode", "rotate"}});
        }
        catch (const ConfigError&)
        {
            caught = true;
        }
        assert(caught);
        std::cout << "  [PASS] from_json type errors\n";
    }

    // Env overlays the base it is given
    {
        auto base = Settings::from_json(Json{{"pid_file", "from-json.pid"}, {"name", "svc"}});
        setenv("WARDEN_LOG_LEVEL", "warn", 1);
        setenv("WARDEN_PID_FILE", "from-env.pid", 1);
        setenv("WARDEN_POLL_INTERVAL_MS", "75", 1);
        auto e = Settings::from_env(base);
        assert(e.log_level == "WARN"); // uppercased
        assert(e.pid_file == "from-env.pid");
        assert(e.poll_interval.count() == 75);
        assert(e.name == "svc");

        setenv("WARDEN_STOP_TIMEOUT_MS", "later", 1);
        bool caught = false;
        try
        {
            Settings::from_env();
        }
        catch (const ConfigError&)
        {
            caught = true;
        }
        assert(caught);

        unsetenv("WARDEN_LOG_LEVEL");
        unsetenv("WARDEN_PID_FILE");
        unsetenv("WARDEN_POLL_INTERVAL_MS");
        unsetenv("WARDEN_STOP_TIMEOUT_MS");
        std::cout << "  [PASS] from_env\n";
    }

    // Config file
    {
        ScratchDir dir("settings");
        auto path = dir / "warden.json";
        {
            std::ofstream out(path);
            out << R"({"name": "uploader", "command": ["python", "run.py"], "restart_delay_ms": 0})";
        }
        auto s = Settings::from_file(path);
        assert(s.name == "uploader");
        assert(s.restart_delay.count() == 0);

        {
            std::ofstream out(dir / "broken.json");
            out << "{ not json";
        }
        bool caught = false;
        try
        {
            Settings::from_file(dir / "broken.json");
        }
        catch (const ConfigError&)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            Settings::from_file(dir / "missing.json");
        }
        catch (const ConfigError&)
        {
            caught = true;
        }
        assert(caught);
        std::cout << "  [PASS] from_file\n";
    }

    // Validation
    {
        Settings s;
        s.stop_signal = "SIGTERM";
        s.validate();
        s.stop_signal = "15";
        s.validate();

        Settings bad_signal;
        bad_signal.stop_signal = "NOPE";
        expect_config_error(bad_signal);

        Settings bad_poll;
        bad_poll.poll_interval = std::chrono::milliseconds(0);
        expect_config_error(bad_poll);

        Settings bad_timeout;
        bad_timeout.stop_timeout = std::chrono::milliseconds(-1);
        expect_config_error(bad_timeout);

        Settings bad_pid;
        bad_pid.pid_file.clear();
        expect_config_error(bad_pid);

        Settings bad_level;
        bad_level.log_level = "chatty";
        expect_config_error(bad_level);
        std::cout << "  [PASS] validate\n";
    }

    std::cout << "\n[OK] settings tests passed\n";
    return 0;
}
