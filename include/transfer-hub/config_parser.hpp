#pragma once

#include <types/config.hpp>
#include <filesystem>
#include <optional>
#include <string_view>

namespace TransferHub
{

class ConfigParser
{
    public:
    static std::optional<Config> parseJsonFile(const std::filesystem::path &file_path);
    static std::optional<Config> parseJsonString(std::string_view json_content);

    // Applies the logging section to the global Logger
    static void applyLogging(const LoggingConfig &logging);

    private:
    static bool validate(const Config &config);
};

} // namespace TransferHub
