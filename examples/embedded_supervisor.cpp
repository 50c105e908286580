// Drives a supervisor from code instead of the warden CLI.
//
// Starts a shell loop that finishes its current "unit of work" when it
// receives SIGINT, shows its status, then stops it gracefully.

#include "warden.hpp"

#include <chrono>
#include <iostream>
#include <thread>

int main()
{
    using namespace warden;

    Settings settings;
    settings.name = "demo-worker";
    settings.command = {"/bin/sh", "-c",
                        "trap 'echo finishing; sleep 1; exit 0' INT; "
                        "while :; do echo working; sleep 1; done"};
    settings.pid_file = "demo-worker.pid";
    settings.poll_interval = std::chrono::milliseconds(500);

    Supervisor supervisor(settings);

    try
    {
        auto proc = supervisor.start();
        std::cout << "Output goes to " << proc.log_file << "\n";

        std::this_thread::sleep_for(std::chrono::seconds(2));
        if (auto running = supervisor.status())
            std::cout << "Status: " << Json(*running).dump() << "\n";

        auto result = supervisor.stop();
        std::cout << "Stopped after " << result.elapsed.count() << " ms (" << result.polls
                  << " polls)\n";
    }
    catch (const AlreadyRunningError& e)
    {
        std::cerr << e.what() << " - run `warden --pid-file demo-worker.pid stop` first\n";
        return 3;
    }
    catch (const Error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
