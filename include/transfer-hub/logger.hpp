#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace TransferHub
{

enum class LogLevel : std::uint8_t
{
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    OFF = 6
};

enum class LogOutput : std::uint8_t
{
    CONSOLE = 0,
    FILE = 1,
    BOTH = 2,
    DISABLED = 3
};

enum class LogCategory : std::uint32_t
{
    GENERAL = 1 << 0,    // 0x001 - General operations, CLI
    CACHE = 1 << 1,      // 0x002 - Content cache lookups, puts, eviction
    REGISTRY = 1 << 2,   // 0x004 - Transfer registry and channels
    TRANSLATOR = 1 << 3, // 0x008 - Update translation
    TRANSPORT = 1 << 4,  // 0x010 - Transport engine workers and journal
    SERVICE = 1 << 5,    // 0x020 - Facade lifecycle and operations
    CONFIG = 1 << 6,     // 0x040 - Configuration
    METRICS = 1 << 7,    // 0x080 - Metrics exporter
    ALL = 0xFFFFFFFF
};

/**
 * Process-wide logger with level and category filtering.
 *
 * Lines look like "[2024-01-01 12:00:00.000] [INFO ] [REG] [t3] message";
 * the thread tag separates engine workers from the event loop. Format
 * strings use fmt syntax. A call without arguments logs the text as is.
 */
class Logger
{
    public:
    static void initialize(LogLevel level = LogLevel::INFO, LogOutput output = LogOutput::CONSOLE);
    static void setLevel(LogLevel level);
    static void setOutput(LogOutput output);
    static void setLogFile(const std::string &filename);
    static void setCategories(LogCategory categories);

    // Comma separated category names, or "all"; unknown names are reported and skipped
    static void setCategoriesFromString(const std::string &categories_str);
    static void shutdown();

    template <typename... Args>
    static void log(LogLevel level, LogCategory category, std::string_view format, Args &&...args);

    template <typename... Args>
    static void trace(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::TRACE, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::DEBUG, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::INFO, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::WARN, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::ERR, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::FATAL, category, format, std::forward<Args>(args)...);
    }

    // GENERAL category shorthands
    template <typename... Args>
    static void info(std::string_view format, Args &&...args)
    {
        log(LogLevel::INFO, LogCategory::GENERAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(std::string_view format, Args &&...args)
    {
        log(LogLevel::WARN, LogCategory::GENERAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(std::string_view format, Args &&...args)
    {
        log(LogLevel::ERR, LogCategory::GENERAL, format, std::forward<Args>(args)...);
    }

    static bool isEnabled(LogLevel level, LogCategory category);
    static std::string_view levelToString(LogLevel level);
    static std::string_view categoryToString(LogCategory category);

    static std::optional<LogLevel> parseLevel(std::string_view text);
    static std::optional<LogCategory> parseCategory(std::string_view text);

    // Lenient variants for config and CLI input; unknown values fall back with a notice on stderr
    static LogLevel levelFromString(const std::string &level_str);
    static LogOutput outputFromString(const std::string &output_str);

    private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    static Logger &getInstance();
    static void notice(std::string_view message);
    static std::string currentTimestamp();
    static std::string threadTag();

    void writeLine(LogLevel level, LogCategory category, const std::string &message);
    void openLogFile();

    LogLevel current_level{ LogLevel::INFO };
    LogOutput output_type{ LogOutput::CONSOLE };
    uint32_t enabled_categories{ static_cast<uint32_t>(LogCategory::ALL) };
    std::string log_filename;
    std::unique_ptr<std::ofstream> log_file;
    mutable std::mutex log_mutex;
    bool initialized{ false };
};

template <typename... Args>
void Logger::log(LogLevel level, LogCategory category, std::string_view format, Args &&...args)
{
#ifndef NO_LOGGING
    if (!isEnabled(level, category))
    {
        return;
    }

    if constexpr (sizeof...(args) == 0)
    {
        getInstance().writeLine(level, category, std::string(format));
    }
    else
    {
        getInstance().writeLine(level, category, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
    }
#else
    (void)level;
    (void)category;
    (void)format;
    ((void)args, ...);
#endif
}

} // namespace TransferHub
