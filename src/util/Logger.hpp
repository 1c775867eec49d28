#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace gitcontext {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide diagnostic logger
 *
 * Level is read once from GITCONTEXT_LOG (error|warn|info|debug or 0-3),
 * defaulting to warn. Everything goes to stderr so that generated output on
 * stdout stays clean.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Redirect output (tests capture diagnostics this way)
    void setStream(std::ostream& out);
    void resetStream();

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    std::ostream* stream;
    mutable std::mutex mtx;
};

}
