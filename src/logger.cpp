#include <transfer-hub/logger.hpp>
#include <transfer-hub/string_utils.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <iostream>

namespace TransferHub
{

namespace
{

struct CategoryName
{
    LogCategory category;
    std::string_view name;
    std::string_view tag;
};

constexpr std::array<CategoryName, 8> category_names{ {
{ LogCategory::GENERAL, "general", "GEN" },
{ LogCategory::CACHE, "cache", "CAC" },
{ LogCategory::REGISTRY, "registry", "REG" },
{ LogCategory::TRANSLATOR, "translator", "TRN" },
{ LogCategory::TRANSPORT, "transport", "XPT" },
{ LogCategory::SERVICE, "service", "SVC" },
{ LogCategory::CONFIG, "config", "CFG" },
{ LogCategory::METRICS, "metrics", "MET" },
} };

struct LevelName
{
    LogLevel level;
    std::string_view name;
    std::string_view label;
};

constexpr std::array<LevelName, 7> level_names{ {
{ LogLevel::TRACE, "trace", "TRACE" },
{ LogLevel::DEBUG, "debug", "DEBUG" },
{ LogLevel::INFO, "info", "INFO " },
{ LogLevel::WARN, "warn", "WARN " },
{ LogLevel::ERR, "error", "ERROR" },
{ LogLevel::FATAL, "fatal", "FATAL" },
{ LogLevel::OFF, "off", "OFF  " },
} };

} // namespace

void Logger::initialize(LogLevel level, LogOutput output)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    instance.current_level = level;
    instance.output_type = output;
    instance.initialized = true;
    instance.openLogFile();
}

void Logger::setLevel(LogLevel level)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.current_level = level;
}

void Logger::setOutput(LogOutput output)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.output_type = output;
    if (instance.initialized)
    {
        instance.openLogFile();
    }
}

void Logger::setLogFile(const std::string &filename)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    if (instance.log_filename == filename && instance.log_file)
    {
        return;
    }
    instance.log_filename = filename;
    instance.log_file.reset();
    if (instance.initialized)
    {
        instance.openLogFile();
    }
}

void Logger::setCategories(LogCategory categories)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.enabled_categories = static_cast<uint32_t>(categories);
}

void Logger::setCategoriesFromString(const std::string &categories_str)
{
    if (StringUtils::toLower(StringUtils::trim(categories_str)) == "all")
    {
        setCategories(LogCategory::ALL);
        return;
    }

    uint32_t mask = 0;
    std::string_view remaining = categories_str;
    while (!remaining.empty())
    {
        size_t comma = remaining.find(',');
        std::string name = StringUtils::toLower(StringUtils::trim(remaining.substr(0, comma)));

        if (std::optional<LogCategory> category = parseCategory(name))
        {
            mask |= static_cast<uint32_t>(*category);
        }
        else if (!name.empty())
        {
            notice(fmt::format("Unknown log category '{}' ignored", name));
        }

        if (comma == std::string_view::npos)
        {
            break;
        }
        remaining.remove_prefix(comma + 1);
    }

    setCategories(static_cast<LogCategory>(mask));
}

void Logger::shutdown()
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    if (instance.log_file)
    {
        instance.log_file->flush();
    }
    instance.log_file.reset();
    instance.initialized = false;
}

bool Logger::isEnabled(LogLevel level, LogCategory category)
{
    const Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    return instance.initialized && instance.output_type != LogOutput::DISABLED && level != LogLevel::OFF &&
           level >= instance.current_level && (instance.enabled_categories & static_cast<uint32_t>(category)) != 0;
}

std::string_view Logger::levelToString(LogLevel level)
{
    for (const auto &entry : level_names)
    {
        if (entry.level == level)
        {
            return entry.label;
        }
    }
    return "UNKN ";
}

std::string_view Logger::categoryToString(LogCategory category)
{
    for (const auto &entry : category_names)
    {
        if (entry.category == category)
        {
            return entry.tag;
        }
    }
    return "UNK";
}

std::optional<LogLevel> Logger::parseLevel(std::string_view text)
{
    std::string lower = StringUtils::toLower(StringUtils::trim(text));
    if (lower == "warning")
    {
        return LogLevel::WARN;
    }
    for (const auto &entry : level_names)
    {
        if (entry.name == lower)
        {
            return entry.level;
        }
    }
    return std::nullopt;
}

std::optional<LogCategory> Logger::parseCategory(std::string_view text)
{
    std::string lower = StringUtils::toLower(StringUtils::trim(text));
    if (lower == "engine")
    {
        return LogCategory::TRANSPORT;
    }
    for (const auto &entry : category_names)
    {
        if (entry.name == lower)
        {
            return entry.category;
        }
    }
    return std::nullopt;
}

LogLevel Logger::levelFromString(const std::string &level_str)
{
    if (std::optional<LogLevel> level = parseLevel(level_str))
    {
        return *level;
    }
    notice(fmt::format("Unknown log level '{}', using info", level_str));
    return LogLevel::INFO;
}

LogOutput Logger::outputFromString(const std::string &output_str)
{
    std::string lower = StringUtils::toLower(StringUtils::trim(output_str));

    if (lower == "console")
        return LogOutput::CONSOLE;
    if (lower == "file")
        return LogOutput::FILE;
    if (lower == "both")
        return LogOutput::BOTH;
    if (lower == "disabled" || lower == "none")
        return LogOutput::DISABLED;

    notice(fmt::format("Unknown log output '{}', using console", output_str));
    return LogOutput::CONSOLE;
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

void Logger::notice(std::string_view message)
{
    std::cerr << fmt::format("[Logger] {}\n", message);
}

std::string Logger::currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local_tm, ms.count());
}

std::string Logger::threadTag()
{
    // Small per-thread numbers read better than native thread ids
    static std::atomic<uint32_t> next_thread{ 0 };
    thread_local uint32_t this_thread = next_thread++;
    return fmt::format("t{}", this_thread);
}

void Logger::writeLine(LogLevel level, LogCategory category, const std::string &message)
{
    std::string line = fmt::format("[{}] [{}] [{}] [{}] {}\n", currentTimestamp(), levelToString(level),
                                   categoryToString(category), threadTag(), message);

    std::lock_guard<std::mutex> lock(log_mutex);

    if (output_type == LogOutput::CONSOLE || output_type == LogOutput::BOTH)
    {
        // Warnings and worse go to stderr
        std::ostream &out = level >= LogLevel::WARN ? std::cerr : std::cout;
        out << line;
    }

    if ((output_type == LogOutput::FILE || output_type == LogOutput::BOTH) && log_file)
    {
        *log_file << line;
        log_file->flush();
    }
}

void Logger::openLogFile()
{
    if (output_type != LogOutput::FILE && output_type != LogOutput::BOTH)
    {
        return;
    }
    if (log_file)
    {
        return;
    }

    if (log_filename.empty())
    {
        log_filename = "transfer-hub.log";
    }

    auto file = std::make_unique<std::ofstream>(log_filename, std::ios::app);
    if (!file->is_open())
    {
        output_type = LogOutput::CONSOLE;
        notice(fmt::format("Could not open log file '{}', falling back to console output", log_filename));
        return;
    }
    log_file = std::move(file);
}

} // namespace TransferHub
