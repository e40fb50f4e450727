#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace TransferHub
{

struct CacheConfig
{
    size_t max_entries = 1000;
    double eviction_ratio = 0.1; // Share of max_entries dropped per eviction batch
    bool verify_on_lookup = true;
};

struct TransfersConfig
{
    std::string base_directory = "./transfers";
    uint32_t max_retries = 3;
    bool allow_pause = true;
    bool check_available_space = true;
};

struct EngineConfig
{
    size_t worker_threads = 4;
    size_t chunk_size_bytes = 64 * 1024;
    uint64_t max_bytes_per_second = 0; // Per copy; 0 means unthrottled
    std::string journal_path; // Empty disables the journal
};

struct LoggingConfig
{
    std::string level = "info";
    std::string output = "console";
    std::string file = "transfer-hub.log";
    std::string categories = "all";
};

struct MetricsConfig
{
    bool enabled = false;
    std::string bind_address = "127.0.0.1";
    int port = 9464;
    std::string endpoint_path = "/metrics";
};

struct Config
{
    CacheConfig cache;
    TransfersConfig transfers;
    EngineConfig engine;
    LoggingConfig logging;
    MetricsConfig metrics;
};

} // namespace TransferHub
