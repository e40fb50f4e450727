#include <catch2/catch_test_macros.hpp>
#include <transfer-hub/content_cache.hpp>
#include <memory>
#include <set>
#include <string>

using namespace TransferHub;

namespace
{
// Strictly increasing clock so access order is unambiguous
ContentCache::TimeSource tickingClock()
{
    auto ticks = std::make_shared<int64_t>(0);
    return [ticks] { return std::chrono::system_clock::time_point(std::chrono::seconds(++*ticks)); };
}

ContentCache::ExistsCheck alwaysExists()
{
    return [](const std::filesystem::path &) { return true; };
}
} // namespace

TEST_CASE("ContentCache lookup outcomes", "[cache]")
{
    auto on_disk = std::make_shared<std::set<std::string>>();
    ContentCache cache(CacheConfig{}, [on_disk](const std::filesystem::path &p) { return on_disk->count(p.string()) > 0; },
                       tickingClock());

    SECTION("Unknown resource is a miss")
    {
        CacheLookup result = cache.lookup("https://host/a.zip");
        REQUIRE(result.outcome == LookupOutcome::MISS);
        REQUIRE_FALSE(result.entry.has_value());
    }

    SECTION("Present file is a hit and refreshes last access")
    {
        on_disk->insert("/files/a.zip");
        cache.put("https://host/a.zip", "/files/a.zip", 1234);
        auto before = cache.lookup("https://host/a.zip").entry->last_accessed_at;

        CacheLookup result = cache.lookup("https://host/a.zip");
        REQUIRE(result.outcome == LookupOutcome::HIT);
        REQUIRE(result.entry->local_path == "/files/a.zip");
        REQUIRE(result.entry->size_bytes == 1234u);
        REQUIRE(result.entry->last_accessed_at > before);
        REQUIRE(cache.get("https://host/a.zip") == std::filesystem::path("/files/a.zip"));
    }

    SECTION("Deleted file is stale until cleaned")
    {
        on_disk->insert("/files/a.zip");
        cache.put("https://host/a.zip", "/files/a.zip");
        on_disk->erase("/files/a.zip");

        CacheLookup result = cache.lookup("https://host/a.zip");
        REQUIRE(result.outcome == LookupOutcome::STALE);
        REQUIRE(result.entry->local_path == "/files/a.zip");
        REQUIRE_FALSE(cache.get("https://host/a.zip").has_value());

        // lookup leaves the decision to the caller
        REQUIRE(cache.contains("https://host/a.zip"));

        REQUIRE(cache.cleanStaleEntries() == 1);
        REQUIRE(cache.lookup("https://host/a.zip").outcome == LookupOutcome::MISS);
        REQUIRE_FALSE(cache.containsPath("/files/a.zip"));
        REQUIRE(cache.cleanStaleEntries() == 0);
    }

    SECTION("Verification can be switched off")
    {
        CacheConfig config;
        config.verify_on_lookup = false;
        ContentCache trusting(config, [](const std::filesystem::path &) { return false; });

        trusting.put("r", "/gone");
        REQUIRE(trusting.lookup("r").outcome == LookupOutcome::HIT);
        REQUIRE(trusting.cleanStaleEntries() == 1);
    }
}

TEST_CASE("ContentCache evicts the least recently used tenth when full", "[cache][eviction]")
{
    ContentCache cache(CacheConfig{}, alwaysExists(), tickingClock());
    REQUIRE(cache.evictionBatchSize() == 100);

    for (int i = 0; i < 1000; ++i)
    {
        cache.put("res-" + std::to_string(i), "/files/" + std::to_string(i));
    }
    REQUIRE(cache.size() == 1000);

    // Touch the first 50 so they become the most recently used
    for (int i = 0; i < 50; ++i)
    {
        REQUIRE(cache.lookup("res-" + std::to_string(i)).outcome == LookupOutcome::HIT);
    }

    cache.put("res-1000", "/files/1000");

    REQUIRE(cache.size() == 901);
    REQUIRE(cache.stats().path_mappings == 901);

    for (int i = 0; i < 50; ++i)
    {
        REQUIRE(cache.contains("res-" + std::to_string(i)));
    }
    for (int i = 50; i < 150; ++i)
    {
        REQUIRE_FALSE(cache.contains("res-" + std::to_string(i)));
        REQUIRE_FALSE(cache.containsPath("/files/" + std::to_string(i)));
    }
    for (int i = 150; i <= 1000; ++i)
    {
        REQUIRE(cache.contains("res-" + std::to_string(i)));
    }
}

TEST_CASE("ContentCache eviction respects configuration", "[cache][eviction]")
{
    CacheConfig config;
    config.max_entries = 15;
    config.eviction_ratio = 0.1;
    ContentCache cache(config, alwaysExists(), tickingClock());

    SECTION("Batch size rounds up")
    {
        REQUIRE(cache.evictionBatchSize() == 2);
    }

    SECTION("Overwriting an existing key at capacity evicts nothing")
    {
        for (int i = 0; i < 15; ++i)
        {
            cache.put("res-" + std::to_string(i), "/files/" + std::to_string(i));
        }
        cache.put("res-0", "/files/moved-0");

        REQUIRE(cache.size() == 15);
        REQUIRE(cache.pathFor("res-0") == std::filesystem::path("/files/moved-0"));
        REQUIRE_FALSE(cache.containsPath("/files/0"));
    }
}

TEST_CASE("ContentCache keeps both indices in lock-step", "[cache]")
{
    ContentCache cache(CacheConfig{}, alwaysExists(), tickingClock());

    SECTION("A path taken over by another resource drops the old owner")
    {
        cache.put("a", "/p/shared");
        cache.put("b", "/p/shared");

        REQUIRE(cache.size() == 1);
        REQUIRE_FALSE(cache.contains("a"));
        REQUIRE(cache.resourceForPath("/p/shared") == std::string("b"));
        REQUIRE(cache.stats().path_mappings == 1);
    }

    SECTION("Overwrite moves the reverse mapping")
    {
        cache.put("b", "/p/1");
        cache.put("b", "/p/2");

        REQUIRE_FALSE(cache.resourceForPath("/p/1").has_value());
        REQUIRE(cache.resourceForPath("/p/2") == std::string("b"));
        REQUIRE(cache.stats().entries == cache.stats().path_mappings);
    }

    SECTION("Removal by either key clears both")
    {
        cache.put("a", "/p/a");
        cache.put("b", "/p/b");

        REQUIRE(cache.removeByPath("/p/a"));
        REQUIRE_FALSE(cache.contains("a"));

        REQUIRE(cache.remove("b"));
        REQUIRE_FALSE(cache.containsPath("/p/b"));

        REQUIRE_FALSE(cache.remove("b"));
        REQUIRE_FALSE(cache.removeByPath("/p/b"));
        REQUIRE(cache.size() == 0);
    }

    SECTION("Clear empties everything")
    {
        cache.put("a", "/p/a");
        cache.clear();
        REQUIRE(cache.stats().entries == 0);
        REQUIRE(cache.stats().path_mappings == 0);
    }
}
