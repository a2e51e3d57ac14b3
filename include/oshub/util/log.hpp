#pragma once
#include <functional>
#include <string>

namespace oshub::util
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/// Parses "DEBUG", "INFO", "WARNING"/"WARN", "ERROR", "OFF" (any case).
/// Unknown names fall back to Info.
LogLevel log_level_from_string(const std::string& name);
const char* to_string(LogLevel level);

/**
 * Leveled logger writing one line per message.
 *
 * stdout carries the protocol stream, so the default sink is stderr:
 *   [oshub] INFO server ready
 *
 * Tests pass their own sink to capture lines.
 */
class Logger
{
  public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    explicit Logger(LogLevel level = LogLevel::Info, Sink sink = nullptr);

    void set_level(LogLevel level)
    {
        level_ = level;
    }
    LogLevel level() const
    {
        return level_;
    }
    bool enabled(LogLevel level) const
    {
        return level_ != LogLevel::Off && level >= level_;
    }

    void log(LogLevel level, const std::string& message) const;
    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

    /// A logger that drops everything.
    static Logger silent()
    {
        return Logger(LogLevel::Off);
    }

  private:
    LogLevel level_;
    Sink sink_;
};

} // namespace oshub::util
