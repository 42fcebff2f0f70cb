#pragma once

#include <fstream>
#include <functional>
#include <mutex>
#include <source_location>
#include <sstream>
#include <string>
#include <vector>

namespace platmon::log
{

enum class Level
{
    Debug = 10,
    Info = 20,
    Warning = 30,
    Error = 40,
};

const char* levelName(Level level);

// One log record as handed to every sink.
struct Record
{
    std::string time; // HH:MM:SS, local time
    std::string file;
    int line{};
    Level level{Level::Info};
    std::string message;
};

using Sink = std::function<void(const Record&)>;

// "[12:00:01] {fan/fan_monitor.cpp:42} WARNING - message"
std::string formatRecord(const Record& rec);

// Local wall clock as HH:MM:SS.
std::string nowClock();

// Process-wide leveled logger. Records below the threshold are dropped
// before any sink sees them.
class Logger
{
  public:
    static Logger& instance();

    void setLevel(Level level);
    Level level() const;
    bool enabled(Level level) const;

    // Truncate and open the log file. Throws std::runtime_error on failure.
    void openFile(const std::string& path);
    void closeFile();

    void enableConsole(bool on);

    // Forward records at or above minLevel to syslog(3).
    void enableSyslog(const std::string& ident, Level minLevel = Level::Info);
    bool forwardsToSyslog(Level level) const;

    void addSink(Sink sink);

    void write(Level level, const char* file, int line,
               const std::string& message);

    // Drop all sinks and return to the INFO threshold.
    void reset();

  private:
    Logger() = default;

    mutable std::mutex mutex;
    Level threshold{Level::Info};
    std::ofstream file;
    bool console{false};
    bool syslogOn{false};
    Level syslogLevel{Level::Info};
    std::string syslogIdent; // openlog() keeps the pointer
    std::vector<Sink> sinks;
};

// Stream every argument into one message string.
template <typename... Args>
std::string concat(const Args&... args)
{
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

void debug(const std::string& message,
           std::source_location loc = std::source_location::current());
void info(const std::string& message,
          std::source_location loc = std::source_location::current());
void warning(const std::string& message,
             std::source_location loc = std::source_location::current());
void error(const std::string& message,
           std::source_location loc = std::source_location::current());

} // namespace platmon::log
