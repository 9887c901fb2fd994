#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace jettison
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

// Process-wide logger. The codec logs failures under the "codec" category and
// schema registration under "schema". With no sinks installed nothing is
// written; the level check is a single atomic load so the codec's hot paths
// stay cheap when logging is disabled.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel get_level() const { return min_level_.load(std::memory_order_relaxed); }

    bool is_enabled(LogLevel level) const
    {
        return level != LogLevel::Off && level >= get_level();
    }

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    // "{}" placeholders are replaced left to right by the arguments.
    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
            return v ? std::string(v) : std::string("(null)");
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_enum_v<D>)
            return std::to_string(static_cast<std::underlying_type_t<D>>(v));
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        size_t      pos = 0;
        auto        replace_next = [&](auto&& arg)
        {
            pos = result.find("{}", pos);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            pos += text.size();
        };
        (replace_next(std::forward<decltype(args)>(args)), ...);
        return result;
    }

    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::mutex            sinks_mutex_;
    std::vector<LogSink>  sinks_;
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("format error: ") + e.what());
    }
}

namespace sinks
{
// Writes to stderr; `color` wraps each line in an ANSI color per level.
Logger::LogSink console_sink(bool color = true);
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
// Appends every entry to `entries` (guarded by its own mutex).
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> entries);
}  // namespace sinks

#define JETTISON_LOG_AT(level, category, ...)                                          \
    do                                                                                 \
    {                                                                                  \
        if (::jettison::Logger::instance().is_enabled(level))                          \
        {                                                                              \
            ::jettison::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
        }                                                                              \
    } while (0)

#define JETTISON_LOG_TRACE(category, ...) \
    JETTISON_LOG_AT(::jettison::LogLevel::Trace, category, __VA_ARGS__)
#define JETTISON_LOG_DEBUG(category, ...) \
    JETTISON_LOG_AT(::jettison::LogLevel::Debug, category, __VA_ARGS__)
#define JETTISON_LOG_INFO(category, ...) \
    JETTISON_LOG_AT(::jettison::LogLevel::Info, category, __VA_ARGS__)
#define JETTISON_LOG_WARN(category, ...) \
    JETTISON_LOG_AT(::jettison::LogLevel::Warning, category, __VA_ARGS__)
#define JETTISON_LOG_ERROR(category, ...) \
    JETTISON_LOG_AT(::jettison::LogLevel::Error, category, __VA_ARGS__)
#define JETTISON_LOG_CRITICAL(category, ...) \
    JETTISON_LOG_AT(::jettison::LogLevel::Critical, category, __VA_ARGS__)

}  // namespace jettison
