#include <transfer-hub/metrics_collector.hpp>
#include <transfer-hub/logger.hpp>

#ifdef HAVE_PROMETHEUS
#include <transfer-hub/prometheus_metrics_impl.hpp>
#endif

namespace TransferHub
{

#ifndef HAVE_PROMETHEUS
// Complete type for the unique_ptr deleter; never instantiated
class PrometheusMetricsImpl
{
};
#endif

std::unique_ptr<MetricsCollector> GlobalMetrics::metrics_instance = nullptr;

MetricsCollector::MetricsCollector(const MetricsConfig &config)
{
    if (!config.enabled)
    {
        return;
    }

#ifdef HAVE_PROMETHEUS
    try
    {
        implementation = std::make_unique<PrometheusMetricsImpl>(config);
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::METRICS, "Failed to start metrics exporter: {}", e.what());
        implementation.reset();
    }
#else
    Logger::warn(LogCategory::METRICS, "Metrics requested but this build has no Prometheus support");
#endif
}

MetricsCollector::~MetricsCollector() = default;

#ifdef HAVE_PROMETHEUS
#define WITH_EXPORTER(call)                                                                                            \
    if (implementation)                                                                                                \
    {                                                                                                                  \
        implementation->call;                                                                                          \
    }
#else
#define WITH_EXPORTER(call)
#endif

void MetricsCollector::recordCacheHit()
{
    WITH_EXPORTER(recordCacheHit())
}

void MetricsCollector::recordCacheMiss()
{
    WITH_EXPORTER(recordCacheMiss())
}

void MetricsCollector::recordCacheStale()
{
    WITH_EXPORTER(recordCacheStale())
}

void MetricsCollector::recordCacheEviction(size_t count)
{
    WITH_EXPORTER(recordCacheEviction(count))
    (void)count;
}

void MetricsCollector::updateCacheEntryCount(size_t count)
{
    WITH_EXPORTER(updateCacheEntryCount(count))
    (void)count;
}

void MetricsCollector::recordTransferRequested(std::string_view kind)
{
    WITH_EXPORTER(recordTransferRequested(kind))
    (void)kind;
}

void MetricsCollector::recordTransferAttached()
{
    WITH_EXPORTER(recordTransferAttached())
}

void MetricsCollector::recordTransferCompleted(double durationSeconds)
{
    WITH_EXPORTER(recordTransferCompleted(durationSeconds))
    (void)durationSeconds;
}

void MetricsCollector::recordTransferFailed(std::string_view reason)
{
    WITH_EXPORTER(recordTransferFailed(reason))
    (void)reason;
}

void MetricsCollector::recordTransferCanceled()
{
    WITH_EXPORTER(recordTransferCanceled())
}

void MetricsCollector::updateActiveTransfers(size_t count)
{
    WITH_EXPORTER(updateActiveTransfers(count))
    (void)count;
}

void MetricsCollector::updateQueuedCopies(size_t count)
{
    WITH_EXPORTER(updateQueuedCopies(count))
    (void)count;
}

void MetricsCollector::updateRunningCopies(size_t count)
{
    WITH_EXPORTER(updateRunningCopies(count))
    (void)count;
}

#undef WITH_EXPORTER

bool MetricsCollector::isExporting() const
{
    return implementation != nullptr;
}

std::string MetricsCollector::getMetricsUrl() const
{
#ifdef HAVE_PROMETHEUS
    if (implementation)
    {
        return implementation->getMetricsUrl();
    }
#endif
    return "metrics disabled";
}

void GlobalMetrics::initialize(const MetricsConfig &config)
{
    metrics_instance = std::make_unique<MetricsCollector>(config);
    if (metrics_instance->isExporting())
    {
        Logger::info(LogCategory::METRICS, "Metrics exporter listening at {}", metrics_instance->getMetricsUrl());
    }
}

void GlobalMetrics::shutdown()
{
    metrics_instance.reset();
}

MetricsCollector &GlobalMetrics::instance()
{
    if (!metrics_instance)
    {
        // Default instance does not export
        metrics_instance = std::make_unique<MetricsCollector>(MetricsConfig{});
    }
    return *metrics_instance;
}

} // namespace TransferHub
