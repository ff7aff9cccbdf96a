#include "apischema/logging.hpp"

#include <cassert>
#include <string>
#include <tuple>
#include <vector>

using namespace apischema::logging;

int main()
{
    assert(log_level_from_string("debug") == LogLevel::Debug);
    assert(log_level_from_string("Warn") == LogLevel::Warning);
    assert(log_level_from_string("WARNING") == LogLevel::Warning);
    assert(log_level_from_string("error") == LogLevel::Error);
    assert(log_level_from_string("verbose") == LogLevel::Info);
    assert(to_string(LogLevel::Error) == "ERROR");

    std::vector<std::tuple<LogLevel, std::string, std::string>> records;
    set_log_callback([&records](LogLevel level, const std::string& message,
                                const std::string& logger)
                     { records.emplace_back(level, message, logger); });

    // Default threshold drops debug and info.
    assert(level() == LogLevel::Warning);
    debug("hidden");
    info("hidden");
    warning("shown");
    error("boom", "apischema.resolver");
    assert(records.size() == 2);
    assert(std::get<0>(records[0]) == LogLevel::Warning);
    assert(std::get<2>(records[0]) == "apischema");
    assert(std::get<1>(records[1]) == "boom");
    assert(std::get<2>(records[1]) == "apischema.resolver");

    set_level(LogLevel::Debug);
    debug("visible");
    assert(records.size() == 3);

    set_level(LogLevel::Error);
    warning("dropped");
    assert(records.size() == 3);

    // Empty callback restores the stderr sink.
    set_log_callback(nullptr);
    error("to stderr");
    assert(records.size() == 3);
    set_level(LogLevel::Warning);
    return 0;
}
