#include "logging.hpp"

#include <syslog.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace platmon::log
{

const char* levelName(Level level)
{
    switch (level)
    {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warning:
            return "WARNING";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

static int syslogPriority(Level level)
{
    switch (level)
    {
        case Level::Debug:
            return LOG_DEBUG;
        case Level::Info:
            return LOG_INFO;
        case Level::Warning:
            return LOG_WARNING;
        case Level::Error:
            return LOG_ERR;
    }
    return LOG_NOTICE;
}

std::string nowClock()
{
    using namespace std::chrono;
    auto t = system_clock::now();
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

std::string formatRecord(const Record& rec)
{
    std::ostringstream oss;
    oss << "[" << rec.time << "] {" << rec.file << ":" << rec.line << "} "
        << levelName(rec.level) << " - " << rec.message;
    return oss.str();
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::setLevel(Level level)
{
    std::lock_guard<std::mutex> lk(mutex);
    threshold = level;
}

Level Logger::level() const
{
    std::lock_guard<std::mutex> lk(mutex);
    return threshold;
}

bool Logger::enabled(Level level) const
{
    return static_cast<int>(level) >= static_cast<int>(this->level());
}

void Logger::openFile(const std::string& path)
{
    std::lock_guard<std::mutex> lk(mutex);
    if (file.is_open())
        file.close();

    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    file.open(path, std::ios::out | std::ios::trunc);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open log file: " + path);
    }
}

void Logger::closeFile()
{
    std::lock_guard<std::mutex> lk(mutex);
    if (file.is_open())
        file.close();
}

void Logger::enableConsole(bool on)
{
    std::lock_guard<std::mutex> lk(mutex);
    console = on;
}

void Logger::enableSyslog(const std::string& ident, Level minLevel)
{
    std::lock_guard<std::mutex> lk(mutex);
    if (syslogOn)
        closelog();
    syslogIdent = ident;
    syslogLevel = minLevel;
    openlog(syslogIdent.c_str(), LOG_PID | LOG_CONS, LOG_DAEMON);
    syslogOn = true;
}

bool Logger::forwardsToSyslog(Level level) const
{
    std::lock_guard<std::mutex> lk(mutex);
    return syslogOn &&
           static_cast<int>(level) >= static_cast<int>(syslogLevel);
}

void Logger::addSink(Sink sink)
{
    std::lock_guard<std::mutex> lk(mutex);
    sinks.push_back(std::move(sink));
}

void Logger::write(Level level, const char* srcFile, int line,
                   const std::string& message)
{
    Record rec;
    rec.time = nowClock();
    rec.file = srcFile;
    rec.line = line;
    rec.level = level;
    rec.message = message;

    std::lock_guard<std::mutex> lk(mutex);
    if (static_cast<int>(level) < static_cast<int>(threshold))
        return;

    if (file.is_open())
    {
        file << formatRecord(rec) << "\n";
        file.flush();
    }

    if (console)
    {
        std::ostringstream oss;
        oss << std::left << std::setw(12) << "root"
            << ": " << std::setw(8) << levelName(level) << " " << message;
        std::cerr << oss.str() << "\n";
    }

    if (syslogOn && static_cast<int>(level) >= static_cast<int>(syslogLevel))
    {
        ::syslog(syslogPriority(level), "%s", message.c_str());
    }

    for (const auto& sink : sinks)
    {
        sink(rec);
    }
}

void Logger::reset()
{
    std::lock_guard<std::mutex> lk(mutex);
    if (file.is_open())
        file.close();
    if (syslogOn)
    {
        closelog();
        syslogOn = false;
    }
    console = false;
    threshold = Level::Info;
    sinks.clear();
}

void debug(const std::string& message, std::source_location loc)
{
    Logger::instance().write(Level::Debug, loc.file_name(),
                             static_cast<int>(loc.line()), message);
}

void info(const std::string& message, std::source_location loc)
{
    Logger::instance().write(Level::Info, loc.file_name(),
                             static_cast<int>(loc.line()), message);
}

void warning(const std::string& message, std::source_location loc)
{
    Logger::instance().write(Level::Warning, loc.file_name(),
                             static_cast<int>(loc.line()), message);
}

void error(const std::string& message, std::source_location loc)
{
    Logger::instance().write(Level::Error, loc.file_name(),
                             static_cast<int>(loc.line()), message);
}

} // namespace platmon::log
