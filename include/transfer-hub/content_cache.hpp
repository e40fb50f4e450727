#pragma once

#include <types/cache_entry.hpp>
#include <types/config.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace TransferHub
{

enum class LookupOutcome
{
    HIT, // Entry present and its file verified on disk
    MISS, // No entry
    STALE // Entry present but its file is gone
};

struct CacheLookup
{
    LookupOutcome outcome = LookupOutcome::MISS;
    std::optional<CacheEntry> entry{};
};

/**
 * Bounded map from resource identifier to the local copy of that resource.
 *
 * A forward index (resource -> entry) and a reverse index (local path ->
 * resource) are kept as a bijection; only this class mutates them. When the
 * map is full, the oldest eviction_ratio share of entries by last access is
 * dropped in one batch before the insert.
 *
 * Not thread-safe. It lives on the service's event loop.
 */
class ContentCache
{
    public:
    using ExistsCheck = std::function<bool(const std::filesystem::path &)>;
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    explicit ContentCache(const CacheConfig &config = {}, ExistsCheck exists = {}, TimeSource now = {});

    ContentCache(const ContentCache &) = delete;
    ContentCache &operator=(const ContentCache &) = delete;

    CacheLookup lookup(const std::string &resource_id);

    // Local path when lookup() is a hit
    std::optional<std::filesystem::path> get(const std::string &resource_id);

    void put(const std::string &resource_id, const std::filesystem::path &local_path,
             std::optional<uint64_t> size_bytes = std::nullopt);

    bool remove(const std::string &resource_id);
    bool removeByPath(const std::filesystem::path &local_path);

    // Drops every entry whose file no longer exists, returns how many
    size_t cleanStaleEntries();

    // Index queries, no disk access
    bool contains(const std::string &resource_id) const;
    bool containsPath(const std::filesystem::path &local_path) const;
    std::optional<std::filesystem::path> pathFor(const std::string &resource_id) const;
    std::optional<std::string> resourceForPath(const std::filesystem::path &local_path) const;

    void clear();
    size_t size() const;
    CacheStats stats() const;
    size_t evictionBatchSize() const;

    private:
    void enforceLimit();
    void eraseEntry(std::unordered_map<std::string, CacheEntry>::iterator it);
    void publishSize() const;

    CacheConfig config;
    ExistsCheck file_exists;
    TimeSource clock;

    std::unordered_map<std::string, CacheEntry> entries;
    std::unordered_map<std::string, std::string> path_to_resource;
};

} // namespace TransferHub
