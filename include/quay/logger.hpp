#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace quay
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

// Process-wide logger. Categories are dotted names ("dock.stack"); a level
// override set on "dock" also applies to every "dock.*" category.
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

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void set_category_level(std::string_view category, LogLevel level);
    void clear_category_levels();

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;
    bool is_enabled(LogLevel level, std::string_view category) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel threshold_for(std::string_view category) const;

    mutable std::mutex                        mutex_;
    LogLevel                                  min_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels_;
    std::vector<LogSink>                      sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos != std::string::npos)
                {
                    std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                    result.replace(pos, 2, text);
                    search_from = pos + text.size();
                }
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level, category))
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
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
// Appends every entry to *out.
Logger::LogSink capture_sink(std::shared_ptr<std::vector<Logger::LogEntry>> out);
}   // namespace sinks

#define QUAY_LOG_AT(level, category, ...)                                          \
    do                                                                             \
    {                                                                              \
        if (::quay::Logger::instance().is_enabled(level, category))                \
        {                                                                          \
            ::quay::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
        }                                                                          \
    } while (0)

#define QUAY_LOG_TRACE(category, ...)    QUAY_LOG_AT(::quay::LogLevel::Trace, category, __VA_ARGS__)
#define QUAY_LOG_DEBUG(category, ...)    QUAY_LOG_AT(::quay::LogLevel::Debug, category, __VA_ARGS__)
#define QUAY_LOG_INFO(category, ...)     QUAY_LOG_AT(::quay::LogLevel::Info, category, __VA_ARGS__)
#define QUAY_LOG_WARN(category, ...)     QUAY_LOG_AT(::quay::LogLevel::Warning, category, __VA_ARGS__)
#define QUAY_LOG_ERROR(category, ...)    QUAY_LOG_AT(::quay::LogLevel::Error, category, __VA_ARGS__)
#define QUAY_LOG_CRITICAL(category, ...) QUAY_LOG_AT(::quay::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace quay
