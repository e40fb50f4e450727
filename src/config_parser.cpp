#include <transfer-hub/config_parser.hpp>
#include <transfer-hub/logger.hpp>
#include <fstream>
#include <nlohmann/json.hpp>
#include <type_traits>

namespace TransferHub
{

namespace
{
// Copies j[key] into target when present with the expected JSON type
template <typename T>
void readField(const nlohmann::json &section, const char *key, T &target)
{
    if (!section.contains(key))
    {
        return;
    }

    const auto &value = section[key];
    if constexpr (std::is_same_v<T, bool>)
    {
        if (value.is_boolean())
            target = value.get<bool>();
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        if (value.is_string())
            target = value.get<std::string>();
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        if (value.is_number())
            target = value.get<T>();
    }
    else
    {
        if (value.is_number_integer() || value.is_number_unsigned())
            target = value.get<T>();
    }
}
} // namespace

std::optional<Config> ConfigParser::parseJsonFile(const std::filesystem::path &file_path)
{
    Logger::debug(LogCategory::CONFIG, "Attempting to open config file: {}", file_path.string());

    std::ifstream file(file_path, std::ios::in);
    if (!file.is_open())
    {
        std::error_code ec;
        if (std::filesystem::exists(file_path, ec))
        {
            Logger::error(LogCategory::CONFIG, "Config file exists but cannot be opened: {}", file_path.string());
        }
        else
        {
            Logger::error(LogCategory::CONFIG, "Config file does not exist: {}", file_path.string());
        }
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    Logger::debug(LogCategory::CONFIG, "Read {} bytes from config file", content.size());

    return parseJsonString(content);
}

std::optional<Config> ConfigParser::parseJsonString(std::string_view json_content)
{
    try
    {
        nlohmann::json j = nlohmann::json::parse(json_content);
        Config config;

        if (!j.is_object())
        {
            Logger::error(LogCategory::CONFIG, "Configuration root must be a JSON object");
            return std::nullopt;
        }

        if (j.contains("cache") && j["cache"].is_object())
        {
            const auto &cache = j["cache"];
            readField(cache, "max_entries", config.cache.max_entries);
            readField(cache, "eviction_ratio", config.cache.eviction_ratio);
            readField(cache, "verify_on_lookup", config.cache.verify_on_lookup);
        }

        if (j.contains("transfers") && j["transfers"].is_object())
        {
            const auto &transfers = j["transfers"];
            readField(transfers, "base_directory", config.transfers.base_directory);
            readField(transfers, "max_retries", config.transfers.max_retries);
            readField(transfers, "allow_pause", config.transfers.allow_pause);
            readField(transfers, "check_available_space", config.transfers.check_available_space);
        }

        if (j.contains("engine") && j["engine"].is_object())
        {
            const auto &engine = j["engine"];
            readField(engine, "worker_threads", config.engine.worker_threads);
            readField(engine, "chunk_size_bytes", config.engine.chunk_size_bytes);
            readField(engine, "max_bytes_per_second", config.engine.max_bytes_per_second);
            readField(engine, "journal_path", config.engine.journal_path);
        }

        if (j.contains("logging") && j["logging"].is_object())
        {
            const auto &logging = j["logging"];
            readField(logging, "level", config.logging.level);
            readField(logging, "output", config.logging.output);
            readField(logging, "file", config.logging.file);
            readField(logging, "categories", config.logging.categories);
        }

        if (j.contains("metrics") && j["metrics"].is_object())
        {
            const auto &metrics = j["metrics"];
            readField(metrics, "enabled", config.metrics.enabled);
            readField(metrics, "bind_address", config.metrics.bind_address);
            readField(metrics, "port", config.metrics.port);
            readField(metrics, "endpoint_path", config.metrics.endpoint_path);
        }

        if (!validate(config))
        {
            return std::nullopt;
        }

        Logger::info(LogCategory::CONFIG, "Configuration loaded: cache max_entries={}, base_directory={}, workers={}",
                     config.cache.max_entries, config.transfers.base_directory, config.engine.worker_threads);
        return config;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error(LogCategory::CONFIG, "JSON parsing error: {}", e.what());
        return std::nullopt;
    }
}

void ConfigParser::applyLogging(const LoggingConfig &logging)
{
    Logger::setLogFile(logging.file);
    Logger::initialize(Logger::levelFromString(logging.level), Logger::outputFromString(logging.output));
    Logger::setCategoriesFromString(logging.categories);
}

bool ConfigParser::validate(const Config &config)
{
    if (config.cache.max_entries == 0)
    {
        Logger::error(LogCategory::CONFIG, "cache.max_entries must be greater than zero");
        return false;
    }

    if (!(config.cache.eviction_ratio > 0.0 && config.cache.eviction_ratio <= 1.0))
    {
        Logger::error(LogCategory::CONFIG, "cache.eviction_ratio must be in (0, 1], got {}", config.cache.eviction_ratio);
        return false;
    }

    if (config.engine.worker_threads == 0)
    {
        Logger::error(LogCategory::CONFIG, "engine.worker_threads must be greater than zero");
        return false;
    }

    if (config.engine.chunk_size_bytes == 0)
    {
        Logger::error(LogCategory::CONFIG, "engine.chunk_size_bytes must be greater than zero");
        return false;
    }

    if (config.transfers.base_directory.empty())
    {
        Logger::error(LogCategory::CONFIG, "transfers.base_directory must not be empty");
        return false;
    }

    return true;
}

} // namespace TransferHub
