#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <trigon/logger.hpp>

namespace trigon
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard lock(mutex_);
    return min_level_;
}

bool Logger::is_enabled(LogLevel level) const
{
    return level >= get_level();
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    if (!is_enabled(level))
        return;

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level     = level;
    entry.category  = std::string(category);
    entry.message   = std::string(message);

    // Sinks run under the lock so lines from different threads never interleave
    std::lock_guard lock(mutex_);
    for (const auto& sink : sinks_)
        sink(entry);
}

// ─── Text helpers ────────────────────────────────────────────────────────────

std::string Logger::level_to_string(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    struct Named
    {
        std::string_view name;
        LogLevel         level;
    };
    static constexpr Named kNames[] = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warning},
        {"warning", LogLevel::Warning},
        {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
    };

    std::string lower(name);
    for (char& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (const auto& n : kNames)
    {
        if (n.name == lower)
            return n.level;
    }
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    auto        ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &secs);
#else
    localtime_r(&secs, &local);
#endif

    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms;
    return os.str();
}

std::string Logger::format_line(const LogEntry& entry)
{
    std::string line = timestamp_to_string(entry.timestamp);
    line += ' ';
    line += level_to_string(entry.level);
    line += " [";
    line += entry.category;
    line += "] ";
    line += entry.message;
    return line;
}

// ─── Sinks ───────────────────────────────────────────────────────────────────

namespace sinks
{

static const char* ansi_color(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "\033[37m";
        case LogLevel::Debug:
            return "\033[36m";
        case LogLevel::Info:
            return "\033[32m";
        case LogLevel::Warning:
            return "\033[33m";
        case LogLevel::Error:
            return "\033[31m";
        case LogLevel::Critical:
            return "\033[35m";
    }
    return "";
}

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        out << ansi_color(entry.level) << Logger::format_line(entry) << "\033[0m" << std::endl;
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
    {
        // Reports through the sinks already installed
        TRIGON_LOG_ERROR("app", "Cannot open log file {}", filename);
    }
    return [file](const Logger::LogEntry& entry)
    {
        if (file->is_open())
            *file << Logger::format_line(entry) << std::endl;
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

}   // namespace sinks

}   // namespace trigon
