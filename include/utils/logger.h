#pragma once

// Windows defines ERROR as a macro
#ifdef ERROR
#undef ERROR
#endif

#include <memory>
#include <optional>
#include <string>

namespace spdlog { class logger; }

namespace searchlink {
namespace utils {

/**
 * Process-wide logging for the client library, backed by one spdlog logger
 * named "searchlink".
 *
 * The library never initializes logging on its own: until the application
 * calls init(), the SEARCHLINK_* macros are no-ops. Once initialized, output
 * goes to a colored console sink and, when a file is named, to that file.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    static constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";

    struct Options {
        std::string log_file;                   // Empty: console only
        Level level = Level::INFO;
        std::string pattern = kDefaultPattern;
    };

    static void init(const Options& options);
    static void init(const std::string& log_file = "", Level level = Level::INFO);

    // Flushes and detaches the logger; later calls are dropped again
    static void shutdown();

    // Initializes with defaults when needed
    static std::shared_ptr<spdlog::logger> get();
    static bool isInitialized();

    static void setLevel(Level level);
    static void setPattern(const std::string& pattern);

    /**
     * Case-insensitive; accepts "warning", "err" and "crit" as aliases.
     * @return nullopt for an unknown name
     */
    static std::optional<Level> levelFromString(const std::string& name);
    static const char* levelToString(Level level);

    template<typename FormatString, typename... Args>
    static void log(Level level, FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace searchlink

#include "utils/logger_impl.h"

#define SEARCHLINK_TRACE(...) ::searchlink::utils::Logger::trace(__VA_ARGS__)
#define SEARCHLINK_DEBUG(...) ::searchlink::utils::Logger::debug(__VA_ARGS__)
#define SEARCHLINK_INFO(...) ::searchlink::utils::Logger::info(__VA_ARGS__)
#define SEARCHLINK_WARN(...) ::searchlink::utils::Logger::warn(__VA_ARGS__)
#define SEARCHLINK_ERROR(...) ::searchlink::utils::Logger::error(__VA_ARGS__)
#define SEARCHLINK_CRITICAL(...) ::searchlink::utils::Logger::critical(__VA_ARGS__)
