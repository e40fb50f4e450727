#pragma once

#ifdef HAVE_PROMETHEUS

#include <types/config.hpp>
#include <memory>
#include <string>
#include <string_view>

// Forward declarations
namespace prometheus
{
class Registry;
class Exposer;
template <typename T>
class Family;
class Counter;
class Gauge;
class Histogram;
} // namespace prometheus

namespace TransferHub
{

class PrometheusMetricsImpl
{
    public:
    explicit PrometheusMetricsImpl(const MetricsConfig &config);
    ~PrometheusMetricsImpl();

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

    std::string getMetricsUrl() const;

    private:
    MetricsConfig config;
    std::unique_ptr<prometheus::Exposer> exposer;
    std::shared_ptr<prometheus::Registry> registry;

    // Cache metrics
    prometheus::Family<prometheus::Counter> *cacheLookupsFamily;
    prometheus::Counter *cacheEvictionsTotal;
    prometheus::Gauge *cacheEntries;

    // Transfer metrics
    prometheus::Family<prometheus::Counter> *transfersRequestedFamily;
    prometheus::Counter *transfersAttachedTotal;
    prometheus::Counter *transfersCompletedTotal;
    prometheus::Family<prometheus::Counter> *transfersFailedFamily;
    prometheus::Counter *transfersCanceledTotal;
    prometheus::Gauge *activeTransfers;
    prometheus::Histogram *transferDurationSeconds;

    // Transport engine metrics
    prometheus::Gauge *queuedCopies;
    prometheus::Gauge *runningCopies;
};

} // namespace TransferHub

#endif // HAVE_PROMETHEUS
