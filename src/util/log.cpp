#include "oshub/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace oshub::util
{

LogLevel log_level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    if (upper == "OFF" || upper == "NONE")
        return LogLevel::Off;
    return LogLevel::Info;
}

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "INFO";
}

Logger::Logger(LogLevel level, Sink sink) : level_(level), sink_(std::move(sink))
{
    if (!sink_)
    {
        sink_ = [](LogLevel lvl, const std::string& msg)
        {
            // Default: print to stderr
            std::cerr << "[oshub] " << to_string(lvl) << " " << msg << std::endl;
        };
    }
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level))
        return;
    sink_(level, message);
}

} // namespace oshub::util
