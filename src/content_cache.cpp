#include <transfer-hub/content_cache.hpp>
#include <transfer-hub/logger.hpp>
#include <transfer-hub/metrics_collector.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace TransferHub
{

namespace
{
bool fileExistsOnDisk(const std::filesystem::path &path)
{
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}
} // namespace

ContentCache::ContentCache(const CacheConfig &config, ExistsCheck exists, TimeSource now)
: config(config), file_exists(exists ? std::move(exists) : ExistsCheck(fileExistsOnDisk)),
  clock(now ? std::move(now) : TimeSource([] { return std::chrono::system_clock::now(); }))
{
}

CacheLookup ContentCache::lookup(const std::string &resource_id)
{
    auto it = entries.find(resource_id);
    if (it == entries.end())
    {
        GlobalMetrics::instance().recordCacheMiss();
        return CacheLookup{ LookupOutcome::MISS, std::nullopt };
    }

    if (config.verify_on_lookup && !file_exists(it->second.local_path))
    {
        Logger::debug(LogCategory::CACHE, "Stale entry for {}: {} is gone", resource_id, it->second.local_path.string());
        GlobalMetrics::instance().recordCacheStale();
        return CacheLookup{ LookupOutcome::STALE, it->second };
    }

    it->second.last_accessed_at = clock();
    GlobalMetrics::instance().recordCacheHit();
    return CacheLookup{ LookupOutcome::HIT, it->second };
}

std::optional<std::filesystem::path> ContentCache::get(const std::string &resource_id)
{
    CacheLookup result = lookup(resource_id);
    if (result.outcome == LookupOutcome::HIT)
    {
        return result.entry->local_path;
    }
    return std::nullopt;
}

void ContentCache::put(const std::string &resource_id, const std::filesystem::path &local_path,
                       std::optional<uint64_t> size_bytes)
{
    auto existing = entries.find(resource_id);
    if (existing != entries.end())
    {
        eraseEntry(existing);
    }
    else
    {
        enforceLimit();
    }

    // A path names one resource; a new owner replaces the old one
    auto owner = path_to_resource.find(local_path.string());
    if (owner != path_to_resource.end())
    {
        auto previous = entries.find(owner->second);
        if (previous != entries.end())
        {
            eraseEntry(previous);
        }
    }

    CacheEntry entry;
    entry.resource_id = resource_id;
    entry.local_path = local_path;
    entry.created_at = clock();
    entry.last_accessed_at = entry.created_at;
    entry.size_bytes = size_bytes;

    entries.emplace(resource_id, std::move(entry));
    path_to_resource.emplace(local_path.string(), resource_id);

    Logger::debug(LogCategory::CACHE, "Cached {} -> {}", resource_id, local_path.string());
    publishSize();
}

bool ContentCache::remove(const std::string &resource_id)
{
    auto it = entries.find(resource_id);
    if (it == entries.end())
    {
        return false;
    }

    eraseEntry(it);
    publishSize();
    return true;
}

bool ContentCache::removeByPath(const std::filesystem::path &local_path)
{
    auto owner = path_to_resource.find(local_path.string());
    if (owner == path_to_resource.end())
    {
        return false;
    }

    return remove(std::string(owner->second));
}

size_t ContentCache::cleanStaleEntries()
{
    std::vector<std::string> stale;
    for (const auto &[resource_id, entry] : entries)
    {
        if (!file_exists(entry.local_path))
        {
            stale.push_back(resource_id);
        }
    }

    for (const auto &resource_id : stale)
    {
        remove(resource_id);
    }

    if (!stale.empty())
    {
        Logger::info(LogCategory::CACHE, "Cleaned {} stale entries", stale.size());
    }
    return stale.size();
}

bool ContentCache::contains(const std::string &resource_id) const
{
    return entries.find(resource_id) != entries.end();
}

bool ContentCache::containsPath(const std::filesystem::path &local_path) const
{
    return path_to_resource.find(local_path.string()) != path_to_resource.end();
}

std::optional<std::filesystem::path> ContentCache::pathFor(const std::string &resource_id) const
{
    auto it = entries.find(resource_id);
    if (it == entries.end())
    {
        return std::nullopt;
    }
    return it->second.local_path;
}

std::optional<std::string> ContentCache::resourceForPath(const std::filesystem::path &local_path) const
{
    auto it = path_to_resource.find(local_path.string());
    if (it == path_to_resource.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void ContentCache::clear()
{
    entries.clear();
    path_to_resource.clear();
    publishSize();
}

size_t ContentCache::size() const
{
    return entries.size();
}

CacheStats ContentCache::stats() const
{
    return CacheStats{ entries.size(), config.max_entries, path_to_resource.size() };
}

size_t ContentCache::evictionBatchSize() const
{
    return static_cast<size_t>(std::ceil(static_cast<double>(config.max_entries) * config.eviction_ratio));
}

void ContentCache::enforceLimit()
{
    if (entries.size() < config.max_entries)
    {
        return;
    }

    // Collect candidates for eviction (sorted by last access time, oldest first)
    std::vector<std::pair<std::chrono::system_clock::time_point, std::string>> candidates;
    candidates.reserve(entries.size());
    for (const auto &[resource_id, entry] : entries)
    {
        candidates.emplace_back(entry.last_accessed_at, resource_id);
    }

    size_t remove_count = std::min(evictionBatchSize(), candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(remove_count),
                      candidates.end());

    for (size_t i = 0; i < remove_count; ++i)
    {
        auto it = entries.find(candidates[i].second);
        if (it != entries.end())
        {
            eraseEntry(it);
        }
    }

    Logger::info(LogCategory::CACHE, "Cache full at {} entries, evicted {} least recently used", config.max_entries,
                 remove_count);
    GlobalMetrics::instance().recordCacheEviction(remove_count);
}

void ContentCache::eraseEntry(std::unordered_map<std::string, CacheEntry>::iterator it)
{
    path_to_resource.erase(it->second.local_path.string());
    entries.erase(it);
}

void ContentCache::publishSize() const
{
    GlobalMetrics::instance().updateCacheEntryCount(entries.size());
}

} // namespace TransferHub
