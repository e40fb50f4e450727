#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace TransferHub
{

struct CacheEntry
{
    std::string resource_id;
    std::filesystem::path local_path;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();

    // Refreshed on every verified hit, drives LRU eviction
    std::chrono::system_clock::time_point last_accessed_at = created_at;

    std::optional<uint64_t> size_bytes{};

    void touch()
    {
        last_accessed_at = std::chrono::system_clock::now();
    }
};

struct CacheStats
{
    size_t entries{};
    size_t max_entries{};
    size_t path_mappings{};
};

} // namespace TransferHub
