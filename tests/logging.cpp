#include "test_helpers.hpp"
#include "warden/exceptions.hpp"
#include "warden/logging.hpp"

#include <cassert>
#include <iostream>

int main()
{
    using namespace warden;

    assert(log_level_from_string("debug") == LogLevel::Debug);
    assert(log_level_from_string("INFO") == LogLevel::Info);
    assert(log_level_from_string("warn") == LogLevel::Warning);
    assert(log_level_from_string("Warning") == LogLevel::Warning);
    assert(log_level_from_string("ERROR") == LogLevel::Error);
    assert(to_string(LogLevel::Warning) == "WARNING");

    bool caught = false;
    try
    {
        log_level_from_string("verbose");
    }
    catch (const ConfigError&)
    {
        caught = true;
    }
    assert(caught);
    std::cout << "  [PASS] level parsing\n";

    // Messages below the threshold never reach the sink
    CapturedLog captured;
    Logger logger = captured.logger(LogLevel::Warning);
    logger.debug("debug line");
    logger.info("info line");
    logger.warning("warning line");
    logger.error("error line");
    assert(!captured.contains("debug line"));
    assert(!captured.contains("info line"));
    assert(captured.contains("warning line"));
    assert(captured.contains("error line"));

    logger.set_threshold(LogLevel::Debug);
    logger.debug("now visible");
    assert(captured.contains("now visible"));
    std::cout << "  [PASS] threshold filtering\n";

    // Default sink goes to the console without throwing
    Logger console;
    assert(console.threshold() == LogLevel::Info);
    console.info("console sink smoke test");
    std::cout << "  [PASS] console sink\n";

    std::cout << "\n[OK] logging tests passed\n";
    return 0;
}
