#include "apischema/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace apischema::logging
{
namespace
{

struct Sink
{
    std::mutex mutex;
    LogCallback callback;
    LogLevel threshold{LogLevel::Warning};
};

Sink& sink()
{
    static Sink s;
    return s;
}

} // namespace

LogLevel log_level_from_string(const std::string& s)
{
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_callback(LogCallback callback)
{
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.callback = std::move(callback);
}

void set_level(LogLevel level)
{
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threshold = level;
}

LogLevel level()
{
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.threshold;
}

void log(LogLevel level, const std::string& message, const std::string& logger)
{
    auto& s = sink();
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (level < s.threshold)
            return;
        callback = s.callback;
    }
    if (callback)
    {
        callback(level, message, logger);
        return;
    }
    std::cerr << "[" << to_string(level) << "] " << logger << ": " << message << std::endl;
}

} // namespace apischema::logging
