#pragma once

#include <types/config.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace TransferHub
{

class PrometheusMetricsImpl;

/**
 * Front for the metrics exporter. Without HAVE_PROMETHEUS, or with
 * metrics disabled in the config, there is no exporter and every
 * call returns immediately.
 */
class MetricsCollector
{
    public:
    explicit MetricsCollector(const MetricsConfig &config);
    ~MetricsCollector();

    MetricsCollector(const MetricsCollector &) = delete;
    MetricsCollector &operator=(const MetricsCollector &) = delete;
    MetricsCollector(MetricsCollector &&) = delete;
    MetricsCollector &operator=(MetricsCollector &&) = delete;

    // Cache metrics
    void recordCacheHit();
    void recordCacheMiss();
    void recordCacheStale();
    void recordCacheEviction(size_t count);
    void updateCacheEntryCount(size_t count);

    // Transfer metrics
    void recordTransferRequested(std::string_view kind);
    void recordTransferAttached();
    void recordTransferCompleted(double durationSeconds);
    void recordTransferFailed(std::string_view reason);
    void recordTransferCanceled();
    void updateActiveTransfers(size_t count);

    // Transport engine metrics
    void updateQueuedCopies(size_t count);
    void updateRunningCopies(size_t count);

    bool isExporting() const;
    std::string getMetricsUrl() const;

    private:
    std::unique_ptr<PrometheusMetricsImpl> implementation;
};

class GlobalMetrics
{
    public:
    static void initialize(const MetricsConfig &config);
    static void shutdown();
    static MetricsCollector &instance();

    private:
    static std::unique_ptr<MetricsCollector> metrics_instance;
};

} // namespace TransferHub
