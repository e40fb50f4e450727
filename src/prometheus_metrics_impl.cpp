#include <transfer-hub/prometheus_metrics_impl.hpp>

#ifdef HAVE_PROMETHEUS

#include <transfer-hub/logger.hpp>
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace TransferHub
{

PrometheusMetricsImpl::PrometheusMetricsImpl(const MetricsConfig &config) : config(config)
{
    std::string bindAddr = config.bind_address + ":" + std::to_string(config.port);
    exposer = std::make_unique<prometheus::Exposer>(bindAddr, 2);

    registry = std::make_shared<prometheus::Registry>();
    exposer->RegisterCollectable(registry, config.endpoint_path);

    cacheLookupsFamily = &prometheus::BuildCounter()
                          .Name("transfer_hub_cache_lookups_total")
                          .Help("Content cache lookups by outcome")
                          .Register(*registry);

    cacheEvictionsTotal = &prometheus::BuildCounter()
                           .Name("transfer_hub_cache_evictions_total")
                           .Help("Entries removed by LRU batch eviction")
                           .Register(*registry)
                           .Add({});

    cacheEntries = &prometheus::BuildGauge()
                    .Name("transfer_hub_cache_entries")
                    .Help("Current number of content cache entries")
                    .Register(*registry)
                    .Add({});

    transfersRequestedFamily = &prometheus::BuildCounter()
                                .Name("transfer_hub_transfers_requested_total")
                                .Help("Transfers handed to the transport engine")
                                .Register(*registry);

    transfersAttachedTotal = &prometheus::BuildCounter()
                              .Name("transfer_hub_transfers_attached_total")
                              .Help("Requests that joined an in-flight transfer")
                              .Register(*registry)
                              .Add({});

    transfersCompletedTotal = &prometheus::BuildCounter()
                               .Name("transfer_hub_transfers_completed_total")
                               .Help("Transfers that completed successfully")
                               .Register(*registry)
                               .Add({});

    transfersFailedFamily = &prometheus::BuildCounter()
                             .Name("transfer_hub_transfers_failed_total")
                             .Help("Transfers that ended in failure")
                             .Register(*registry);

    transfersCanceledTotal = &prometheus::BuildCounter()
                              .Name("transfer_hub_transfers_canceled_total")
                              .Help("Transfers canceled on request")
                              .Register(*registry)
                              .Add({});

    activeTransfers = &prometheus::BuildGauge()
                       .Name("transfer_hub_active_transfers")
                       .Help("Transfers currently registered as in flight")
                       .Register(*registry)
                       .Add({});

    auto durationBuckets =
    prometheus::Histogram::BucketBoundaries{ 0.1, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0, 300.0, 900.0 };
    transferDurationSeconds = &prometheus::BuildHistogram()
                               .Name("transfer_hub_transfer_duration_seconds")
                               .Help("Time from first running update to completion")
                               .Register(*registry)
                               .Add({}, durationBuckets);

    queuedCopies = &prometheus::BuildGauge()
                    .Name("transfer_hub_engine_queued_copies")
                    .Help("Copies waiting for a transport engine worker")
                    .Register(*registry)
                    .Add({});

    runningCopies = &prometheus::BuildGauge()
                     .Name("transfer_hub_engine_running_copies")
                     .Help("Copies currently held by a transport engine worker")
                     .Register(*registry)
                     .Add({});
}

PrometheusMetricsImpl::~PrometheusMetricsImpl() = default;

void PrometheusMetricsImpl::recordCacheHit()
{
    cacheLookupsFamily->Add({ { "result", "hit" } }).Increment();
}

void PrometheusMetricsImpl::recordCacheMiss()
{
    cacheLookupsFamily->Add({ { "result", "miss" } }).Increment();
}

void PrometheusMetricsImpl::recordCacheStale()
{
    cacheLookupsFamily->Add({ { "result", "stale" } }).Increment();
}

void PrometheusMetricsImpl::recordCacheEviction(size_t count)
{
    cacheEvictionsTotal->Increment(static_cast<double>(count));
}

void PrometheusMetricsImpl::updateCacheEntryCount(size_t count)
{
    cacheEntries->Set(static_cast<double>(count));
}

void PrometheusMetricsImpl::recordTransferRequested(std::string_view kind)
{
    transfersRequestedFamily->Add({ { "kind", std::string(kind) } }).Increment();
}

void PrometheusMetricsImpl::recordTransferAttached()
{
    transfersAttachedTotal->Increment();
}

void PrometheusMetricsImpl::recordTransferCompleted(double durationSeconds)
{
    transfersCompletedTotal->Increment();
    transferDurationSeconds->Observe(durationSeconds);
}

void PrometheusMetricsImpl::recordTransferFailed(std::string_view reason)
{
    transfersFailedFamily->Add({ { "reason", std::string(reason) } }).Increment();
}

void PrometheusMetricsImpl::recordTransferCanceled()
{
    transfersCanceledTotal->Increment();
}

void PrometheusMetricsImpl::updateActiveTransfers(size_t count)
{
    activeTransfers->Set(static_cast<double>(count));
}

void PrometheusMetricsImpl::updateQueuedCopies(size_t count)
{
    queuedCopies->Set(static_cast<double>(count));
}

void PrometheusMetricsImpl::updateRunningCopies(size_t count)
{
    runningCopies->Set(static_cast<double>(count));
}

std::string PrometheusMetricsImpl::getMetricsUrl() const
{
    return "http://" + config.bind_address + ":" + std::to_string(config.port) + config.endpoint_path;
}

} // namespace TransferHub

#endif // HAVE_PROMETHEUS
