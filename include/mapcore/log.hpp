#ifndef MAPCORE_LOG_HPP
#define MAPCORE_LOG_HPP

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace mapcore
{
namespace util
{

namespace detail
{

template <typename T>
std::string to_string(const T& value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

inline std::string to_string(bool value) { return value ? "true" : "false"; }

}  // namespace detail

// Replaces each "{}" in template_str with the next argument, in order.
// Surplus placeholders expand to nothing, surplus arguments are dropped.
template <typename... Args>
std::string format(const std::string& template_str, const Args&... args)
{
    std::ostringstream stream;
    std::vector<std::string> arg_list = {detail::to_string(args)...};

    size_t start_pos = 0;
    size_t arg_index = 0;
    while (start_pos < template_str.size())
    {
        size_t open_brace  = template_str.find('{', start_pos);
        size_t close_brace = template_str.find('}', open_brace);

        if (open_brace == std::string::npos ||
            close_brace == std::string::npos)
        {
            stream << template_str.substr(start_pos);
            break;
        }

        stream << template_str.substr(start_pos, open_brace - start_pos);

        if (arg_index < arg_list.size())
        {
            stream << arg_list[arg_index++];
        }

        start_pos = close_brace + 1;
    }

    return stream.str();
}

template <typename... Args>
void println(const std::string& message, const Args&... args)
{
    std::cout << format(message, args...) << std::endl;
}

}  // namespace util

/*-------------------------------------------------------------------------
 *  Levelled diagnostics
 *-------------------------------------------------------------------------
 *  Containers report structural events (table growth, bucket
 *  treeification, evictions) at Debug.  The threshold is process-wide and
 *  defaults to Warn, so a library user sees nothing unless asked.
 *-------------------------------------------------------------------------*/
enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

namespace detail
{

inline std::atomic<int>& log_threshold() noexcept
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Warn)};
    return level;
}

inline const char* level_name(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
    }
    return "?";
}

}  // namespace detail

inline void set_log_level(LogLevel level) noexcept
{
    detail::log_threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline LogLevel log_level() noexcept
{
    return static_cast<LogLevel>(detail::log_threshold().load(std::memory_order_relaxed));
}

inline bool log_enabled(LogLevel level) noexcept
{
    return level != LogLevel::Off &&
           static_cast<int>(level) >= detail::log_threshold().load(std::memory_order_relaxed);
}

// Parses "trace|debug|info|warn|error|off"; unknown names leave `out` alone.
inline bool parse_log_level(const char* name, LogLevel& out) noexcept
{
    if (name == nullptr) return false;
    for (int i = static_cast<int>(LogLevel::Trace); i <= static_cast<int>(LogLevel::Off); ++i)
    {
        auto level = static_cast<LogLevel>(i);
        if (std::strcmp(name, detail::level_name(level)) == 0)
        {
            out = level;
            return true;
        }
    }
    return false;
}

// Applies MAPCORE_LOG_LEVEL if it is set and well-formed.
inline void init_log_from_env() noexcept
{
    LogLevel level = log_level();
    if (parse_log_level(std::getenv("MAPCORE_LOG_LEVEL"), level))
        set_log_level(level);
}

template <typename... Args>
void log(LogLevel level, const std::string& message, const Args&... args)
{
    if (!log_enabled(level)) return;
    std::clog << "[mapcore:" << detail::level_name(level) << "] "
              << util::format(message, args...) << '\n';
}

template <typename... Args>
void log_debug(const std::string& message, const Args&... args) { log(LogLevel::Debug, message, args...); }

template <typename... Args>
void log_info(const std::string& message, const Args&... args) { log(LogLevel::Info, message, args...); }

template <typename... Args>
void log_warn(const std::string& message, const Args&... args) { log(LogLevel::Warn, message, args...); }

template <typename... Args>
void log_error(const std::string& message, const Args&... args) { log(LogLevel::Error, message, args...); }

}  // namespace mapcore

#endif  // MAPCORE_LOG_HPP
