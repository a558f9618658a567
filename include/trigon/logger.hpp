#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace trigon
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide logger. Entries below the level are dropped before formatting;
// the rest go to every sink, in the order the sinks were added.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level = LogLevel::Info;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;
    bool     is_enabled(LogLevel level) const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
    {
        if (is_enabled(level))
            log(level, category, format_message(format, std::forward<Args>(args)...));
    }

    // Each "{}" takes the next argument. Surplus arguments are dropped and
    // surplus placeholders stay as written.
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string out(format);
        size_t      from = 0;
        (substitute(out, from, to_text(std::forward<Args>(args))), ...);
        return out;
    }

    // "2026-01-31 12:00:00.250 WARN [settings] message"
    static std::string format_line(const LogEntry& entry);

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // trace, debug, info, warn or warning, error, critical; any case.
    static std::optional<LogLevel> level_from_string(std::string_view name);

   private:
    Logger()                         = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    static void substitute(std::string& out, size_t& from, const std::string& text)
    {
        auto pos = out.find("{}", from);
        if (pos == std::string::npos)
            return;
        out.replace(pos, 2, text);
        from = pos + text.size();
    }

    template <typename T>
    static std::string to_text(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
            return v ? std::string(v) : std::string("(null)");
        else if constexpr (std::is_convertible_v<D, std::string_view>)
            return std::string(std::string_view(v));
        else
            return std::to_string(v);
    }

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks
{
// Coloured; Warning and above on stderr, the rest on stdout.
Logger::LogSink console_sink();

// Appends and flushes every line. Logs an error once if the file cannot be opened.
Logger::LogSink file_sink(const std::string& filename);

Logger::LogSink null_sink();
}   // namespace sinks

}   // namespace trigon

#define TRIGON_LOG_AT(level, category, ...)                                                 \
    do                                                                                      \
    {                                                                                       \
        if (::trigon::Logger::instance().is_enabled(level))                                 \
            ::trigon::Logger::instance().log_formatted(level, category, __VA_ARGS__);       \
    } while (0)

#define TRIGON_LOG_TRACE(category, ...)    TRIGON_LOG_AT(::trigon::LogLevel::Trace, category, __VA_ARGS__)
#define TRIGON_LOG_DEBUG(category, ...)    TRIGON_LOG_AT(::trigon::LogLevel::Debug, category, __VA_ARGS__)
#define TRIGON_LOG_INFO(category, ...)     TRIGON_LOG_AT(::trigon::LogLevel::Info, category, __VA_ARGS__)
#define TRIGON_LOG_WARN(category, ...)     TRIGON_LOG_AT(::trigon::LogLevel::Warning, category, __VA_ARGS__)
#define TRIGON_LOG_ERROR(category, ...)    TRIGON_LOG_AT(::trigon::LogLevel::Error, category, __VA_ARGS__)
#define TRIGON_LOG_CRITICAL(category, ...) TRIGON_LOG_AT(::trigon::LogLevel::Critical, category, __VA_ARGS__)
