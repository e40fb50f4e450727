#include <transfer-hub/logger.hpp>
#include <transfer-hub/string_utils.hpp>
#include <transfer-hub/time_utils.hpp>
#include <transfer-hub/transfer_service.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <system_error>

namespace TransferHub
{

namespace
{
// space() needs a path that exists; walk up until one does
std::filesystem::path nearestExistingAncestor(std::filesystem::path path)
{
    std::error_code ec;
    if (path.empty())
    {
        path = std::filesystem::current_path();
    }
    path = std::filesystem::absolute(path, ec);
    while (!path.empty() && !std::filesystem::exists(path, ec))
    {
        if (path == path.parent_path())
        {
            break;
        }
        path = path.parent_path();
    }
    return path;
}
} // namespace

TransferService::TransferService(const Config &config, TransportEngine &engine)
: config(config), engine(engine), cache(config.cache), registry(engine), translator(registry, cache)
{
}

TransferService::~TransferService()
{
    try
    {
        dispose();
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::SERVICE, "Error while disposing transfer service: {}", e.what());
    }
}

template <typename T, typename Operation>
Result<T> TransferService::guarded(const char *operation, Operation &&body)
{
    if (auto failure = requireInitialized())
    {
        return Result<T>::fail(*failure);
    }

    try
    {
        return body();
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::SERVICE, "{} failed: {}", operation, e.what());
        return Result<T>::fail(UnknownFailure{ fmt::format("{} failed", operation), "UNEXPECTED_ERROR", e.what() });
    }
}

Result<void> TransferService::initialize()
{
    if (initialized)
    {
        return Result<void>::success();
    }

    try
    {
        engine.setUpdateHandler([this](const TransportUpdate &update) { translator.handle(update); });
        rebuildFromEngine();
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::SERVICE, "Failed to initialize transfer service: {}", e.what());
        engine.setUpdateHandler({});
        registry.clear();
        cache.clear();
        return Result<void>::fail(UnknownFailure{ "Failed to initialize transfer service", "INIT_FAILED", e.what() });
    }

    initialized = true;
    Logger::info(LogCategory::SERVICE, "Transfer service ready: {} active transfers, {} cached resources",
                 registry.activeCount(), cache.size());
    return Result<void>::success();
}

void TransferService::dispose()
{
    if (!initialized)
    {
        return;
    }

    initialized = false;
    engine.setUpdateHandler({});
    registry.clear();
    cache.clear();
    Logger::info(LogCategory::SERVICE, "Transfer service disposed");
}

bool TransferService::isInitialized() const
{
    return initialized;
}

Result<TransferChannelPtr> TransferService::enqueueFetch(const std::string &resource_id, const TransferOptions &options)
{
    return guarded<TransferChannelPtr>("enqueueFetch", [&]() -> Result<TransferChannelPtr> {
        if (resource_id.empty())
        {
            return Result<TransferChannelPtr>::fail(ValidationFailure{ "resourceId", "Resource identifier is empty" });
        }

        CacheLookup cached = cache.lookup(resource_id);
        if (cached.outcome == LookupOutcome::HIT)
        {
            const CacheEntry &entry = *cached.entry;
            Logger::debug(LogCategory::SERVICE, "Cache hit for {} at {}", resource_id, entry.local_path.string());

            TransferRecord record;
            record.task_id = resource_id;
            record.resource_id = resource_id;
            record.kind = TransferKind::FETCH;
            record.status = TransferStatus::COMPLETED;
            record.progress = 1.0;
            record.expected_size_bytes = entry.size_bytes.value_or(0);
            record.local_path = entry.local_path;
            record.created_at = entry.created_at;
            record.started_at = entry.created_at;
            record.completed_at = entry.created_at;
            return Result<TransferChannelPtr>::success(TransferChannel::sealed(resource_id, std::move(record)));
        }
        if (cached.outcome == LookupOutcome::STALE)
        {
            Logger::info(LogCategory::SERVICE, "Cached copy of {} is gone, fetching again", resource_id);
            cache.remove(resource_id);
        }

        if (registry.isActive(resource_id))
        {
            return registry.requestTransfer(resource_id, TransferSpec{});
        }

        TransferOptions effective = withDefaults(options);
        TransferSpec spec;
        spec.resource_id = resource_id;
        spec.kind = TransferKind::FETCH;
        spec.local_path = resolveFetchPath(resource_id, effective);
        spec.options = effective;
        spec.created_at = Clock::now();

        if (effective.expected_size_bytes && config.transfers.check_available_space)
        {
            if (auto failure = checkSpace(spec.local_path.parent_path(), *effective.expected_size_bytes))
            {
                return Result<TransferChannelPtr>::fail(*failure);
            }
        }

        return registry.requestTransfer(resource_id, std::move(spec));
    });
}

Result<TransferChannelPtr> TransferService::enqueuePush(const std::string &resource_id,
                                                        const std::filesystem::path &local_path,
                                                        const TransferOptions &options)
{
    return guarded<TransferChannelPtr>("enqueuePush", [&]() -> Result<TransferChannelPtr> {
        if (resource_id.empty())
        {
            return Result<TransferChannelPtr>::fail(ValidationFailure{ "resourceId", "Resource identifier is empty" });
        }
        if (local_path.empty())
        {
            return Result<TransferChannelPtr>::fail(ValidationFailure{ "localPath", "Local path is empty" });
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_path, ec))
        {
            return Result<TransferChannelPtr>::fail(FileNotFoundFailure{ local_path.string() });
        }

        if (registry.isActive(resource_id))
        {
            return registry.requestTransfer(resource_id, TransferSpec{});
        }

        TransferOptions effective = withDefaults(options);
        if (!effective.file_name)
        {
            effective.file_name = local_path.filename().string();
        }
        if (!effective.expected_size_bytes)
        {
            uint64_t size = std::filesystem::file_size(local_path, ec);
            if (!ec)
            {
                effective.expected_size_bytes = size;
            }
        }

        TransferSpec spec;
        spec.resource_id = resource_id;
        spec.kind = TransferKind::PUSH;
        spec.local_path = local_path;
        spec.options = effective;
        spec.created_at = Clock::now();
        return registry.requestTransfer(resource_id, std::move(spec));
    });
}

Result<bool> TransferService::pause(const std::string &id)
{
    return guarded<bool>("pause", [&]() -> Result<bool> {
        std::string task_id = resolveTaskId(id);
        const TransferRecord *record = registry.findByTask(task_id);
        if (record != nullptr && record->kind == TransferKind::PUSH)
        {
            Logger::debug(LogCategory::SERVICE, "Push {} cannot be paused", task_id);
            return Result<bool>::success(false);
        }
        return Result<bool>::success(engine.pause(task_id));
    });
}

Result<bool> TransferService::resume(const std::string &id)
{
    return guarded<bool>("resume", [&]() -> Result<bool> { return Result<bool>::success(engine.resume(resolveTaskId(id))); });
}

Result<bool> TransferService::cancel(const std::string &id)
{
    return guarded<bool>("cancel", [&]() -> Result<bool> {
        std::optional<std::string> resource_id = resolveResourceId(id);
        if (resource_id && registry.isActive(*resource_id))
        {
            return registry.cancel(*resource_id);
        }
        return Result<bool>::success(engine.cancelById(resolveTaskId(id)));
    });
}

Result<TransferChannelPtr> TransferService::retry(const std::string &id)
{
    return guarded<TransferChannelPtr>("retry", [&]() -> Result<TransferChannelPtr> {
        std::optional<std::string> resource_id = resolveResourceId(id);
        if (!resource_id)
        {
            return Result<TransferChannelPtr>::fail(FileNotFoundFailure{ id, "NOT_FOUND", "Transfer not found" });
        }
        return registry.retry(*resource_id);
    });
}

Result<TransferChannelPtr> TransferService::resumeFailed(const std::string &id)
{
    return guarded<TransferChannelPtr>("resumeFailed", [&]() -> Result<TransferChannelPtr> {
        std::optional<std::string> resource_id = resolveResourceId(id);
        if (!resource_id)
        {
            return Result<TransferChannelPtr>::fail(FileNotFoundFailure{ id, "NOT_FOUND", "Transfer not found" });
        }
        return registry.resumeFailed(*resource_id);
    });
}

Result<std::vector<bool>> TransferService::pauseAll(const std::vector<std::string> &ids)
{
    return guarded<std::vector<bool>>("pauseAll", [&]() -> Result<std::vector<bool>> {
        std::vector<bool> results;
        results.reserve(ids.size());
        for (const auto &id : ids)
        {
            results.push_back(pause(id).valueOr(false));
        }
        return Result<std::vector<bool>>::success(std::move(results));
    });
}

Result<std::vector<bool>> TransferService::resumeAll(const std::vector<std::string> &ids)
{
    return guarded<std::vector<bool>>("resumeAll", [&]() -> Result<std::vector<bool>> {
        std::vector<bool> results;
        results.reserve(ids.size());
        for (const auto &id : ids)
        {
            results.push_back(resume(id).valueOr(false));
        }
        return Result<std::vector<bool>>::success(std::move(results));
    });
}

Result<bool> TransferService::cancelAll(const std::vector<std::string> &ids)
{
    return guarded<bool>("cancelAll", [&]() -> Result<bool> {
        std::vector<std::string> task_ids;
        task_ids.reserve(ids.size());
        for (const auto &id : ids)
        {
            task_ids.push_back(resolveTaskId(id));
        }
        return Result<bool>::success(engine.cancelByIds(task_ids));
    });
}

Result<std::optional<TransferRecord>> TransferService::get(const std::string &id)
{
    using R = Result<std::optional<TransferRecord>>;
    return guarded<std::optional<TransferRecord>>("get", [&]() -> R {
        std::string task_id = resolveTaskId(id);
        if (std::optional<TransferRecord> record = engine.recordForId(task_id))
        {
            return R::success(overlay(*record));
        }
        if (const TransferRecord *known = registry.findByTask(task_id))
        {
            return R::success(*known);
        }
        return R::success(std::nullopt);
    });
}

Result<std::vector<TransferRecord>> TransferService::getAll()
{
    using R = Result<std::vector<TransferRecord>>;
    return guarded<std::vector<TransferRecord>>("getAll", [&]() -> R { return R::success(overlayAll(engine.allRecords())); });
}

Result<std::vector<TransferRecord>> TransferService::getByStatus(TransferStatus status)
{
    using R = Result<std::vector<TransferRecord>>;
    return guarded<std::vector<TransferRecord>>("getByStatus", [&]() -> R {
        std::vector<TransferRecord> records = overlayAll(engine.allRecordsWithStatus(status));
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [status](const TransferRecord &record) { return record.status != status; }),
                      records.end());
        return R::success(std::move(records));
    });
}

Result<std::vector<TransferRecord>> TransferService::getByKind(TransferKind kind)
{
    using R = Result<std::vector<TransferRecord>>;
    return guarded<std::vector<TransferRecord>>("getByKind", [&]() -> R {
        std::vector<TransferRecord> records = overlayAll(engine.allRecords());
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [kind](const TransferRecord &record) { return record.kind != kind; }),
                      records.end());
        return R::success(std::move(records));
    });
}

Result<std::vector<TransferRecord>> TransferService::getByGroup(const std::string &group)
{
    using R = Result<std::vector<TransferRecord>>;
    return guarded<std::vector<TransferRecord>>("getByGroup", [&]() -> R {
        std::vector<TransferRecord> records = overlayAll(engine.allRecords());
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&group](const TransferRecord &record) { return record.group != group; }),
                      records.end());
        return R::success(std::move(records));
    });
}

Result<TransferChannelPtr> TransferService::channelFor(const std::string &id)
{
    return guarded<TransferChannelPtr>("channelFor", [&]() -> Result<TransferChannelPtr> {
        std::optional<std::string> resource_id = resolveResourceId(id);
        TransferChannelPtr channel = resource_id ? registry.channelFor(*resource_id) : nullptr;
        if (!channel)
        {
            return Result<TransferChannelPtr>::fail(FileNotFoundFailure{ id, "NOT_FOUND", "Transfer not found" });
        }
        return Result<TransferChannelPtr>::success(channel);
    });
}

Result<void> TransferService::deleteRecord(const std::string &id)
{
    return guarded<void>("deleteRecord", [&]() -> Result<void> {
        dropRecord(resolveTaskId(id));
        return Result<void>::success();
    });
}

Result<void> TransferService::deleteAll()
{
    return guarded<void>("deleteAll", [&]() -> Result<void> {
        size_t withdrawn = 0;
        for (const auto &record : registry.records())
        {
            if (registry.isActive(record.resource_id) && registry.withdraw(record.resource_id))
            {
                withdrawn++;
            }
        }
        engine.deleteAllRecords();
        size_t forgotten = registry.forgetRetired();
        Logger::info(LogCategory::SERVICE, "Deleted all transfer records ({} in flight, {} retired in memory)", withdrawn,
                     forgotten);
        return Result<void>::success();
    });
}

Result<void> TransferService::deleteByStatus(TransferStatus status)
{
    return guarded<void>("deleteByStatus", [&]() -> Result<void> {
        for (const auto &record : engine.allRecordsWithStatus(status))
        {
            dropRecord(record.task_id);
        }
        return Result<void>::success();
    });
}

void TransferService::dropRecord(const std::string &task_id)
{
    std::optional<std::string> resource_id = registry.resourceForTask(task_id);
    if (resource_id && registry.isActive(*resource_id))
    {
        // The engine cancels it; observers should not wait for that update
        Logger::info(LogCategory::SERVICE, "Deleting in-flight transfer {} ({})", task_id, *resource_id);
        registry.withdraw(*resource_id);
    }
    engine.deleteRecordWithId(task_id);
    if (resource_id)
    {
        registry.forget(*resource_id);
    }
}

Result<std::optional<std::filesystem::path>> TransferService::getCachedPath(const std::string &resource_id)
{
    using R = Result<std::optional<std::filesystem::path>>;
    return guarded<std::optional<std::filesystem::path>>("getCachedPath", [&]() -> R {
        CacheLookup cached = cache.lookup(resource_id);
        switch (cached.outcome)
        {
        case LookupOutcome::HIT:
            return R::success(cached.entry->local_path);
        case LookupOutcome::STALE:
            cache.remove(resource_id);
            return R::success(std::nullopt);
        case LookupOutcome::MISS:
        default:
            return R::success(std::nullopt);
        }
    });
}

Result<std::optional<std::string>> TransferService::resourceForPath(const std::filesystem::path &local_path)
{
    using R = Result<std::optional<std::string>>;
    return guarded<std::optional<std::string>>("resourceForPath",
                                               [&]() -> R { return R::success(cache.resourceForPath(local_path)); });
}

Result<size_t> TransferService::cleanStaleCacheEntries()
{
    return guarded<size_t>("cleanStaleCacheEntries",
                           [&]() -> Result<size_t> { return Result<size_t>::success(cache.cleanStaleEntries()); });
}

Result<bool> TransferService::invalidateCache(const std::string &resource_id)
{
    return guarded<bool>("invalidateCache",
                         [&]() -> Result<bool> { return Result<bool>::success(cache.remove(resource_id)); });
}

CacheStats TransferService::cacheStats() const
{
    return cache.stats();
}

Result<ReconcileOutcome> TransferService::reconcileAbandoned()
{
    return guarded<ReconcileOutcome>("reconcileAbandoned", [&]() -> Result<ReconcileOutcome> {
        ReconcileOutcome outcome = engine.reconcileAbandoned();

        // Re-driven tasks get channels so callers can observe them
        for (const auto &record : outcome.succeeded)
        {
            const TransferRecord *known = registry.find(record.resource_id);
            if (known == nullptr || known->task_id != record.task_id || !registry.isActive(record.resource_id))
            {
                registry.adopt(record);
            }
        }

        Logger::info(LogCategory::SERVICE, "Reconciled abandoned transfers: {} resumed, {} failed",
                     outcome.succeeded.size(), outcome.failed.size());
        return Result<ReconcileOutcome>::success(std::move(outcome));
    });
}

Result<uint64_t> TransferService::availableSpace(const std::optional<std::filesystem::path> &directory)
{
    return guarded<uint64_t>("availableSpace", [&]() -> Result<uint64_t> {
        std::filesystem::path target = nearestExistingAncestor(directory.value_or(config.transfers.base_directory));

        std::error_code ec;
        std::filesystem::space_info info = std::filesystem::space(target, ec);
        if (ec)
        {
            return Result<uint64_t>::fail(
            StorageFailure{ fmt::format("Cannot query free space of {}: {}", target.string(), ec.message()),
                            "SPACE_QUERY_FAILED" });
        }
        return Result<uint64_t>::success(static_cast<uint64_t>(info.available));
    });
}

size_t TransferService::activeTransferCount() const
{
    return registry.activeCount();
}

std::filesystem::path TransferService::resolveFetchPath(const std::string &resource_id, const TransferOptions &options) const
{
    std::filesystem::path path = config.transfers.base_directory;
    if (options.directory && !options.directory->empty())
    {
        path /= *options.directory;
    }
    path /= options.file_name.value_or(StringUtils::hashName(resource_id));
    return path;
}

std::optional<Failure> TransferService::requireInitialized() const
{
    if (!initialized)
    {
        return Failure(ValidationFailure{ "service", "Transfer service is not initialized" });
    }
    return std::nullopt;
}

std::string TransferService::resolveTaskId(const std::string &id) const
{
    if (registry.findByTask(id) != nullptr)
    {
        return id;
    }
    if (const TransferRecord *record = registry.find(id))
    {
        return record->task_id;
    }
    return id;
}

std::optional<std::string> TransferService::resolveResourceId(const std::string &id) const
{
    if (std::optional<std::string> resource_id = registry.resourceForTask(id))
    {
        return resource_id;
    }
    if (registry.find(id) != nullptr)
    {
        return id;
    }
    return std::nullopt;
}

TransferRecord TransferService::overlay(const TransferRecord &engine_record) const
{
    // The registry holds the translated view of anything it has seen
    const TransferRecord *observed = registry.findByTask(engine_record.task_id);
    return observed != nullptr ? *observed : engine_record;
}

std::vector<TransferRecord> TransferService::overlayAll(const std::vector<TransferRecord> &engine_records) const
{
    std::vector<TransferRecord> records;
    records.reserve(engine_records.size());
    for (const auto &record : engine_records)
    {
        records.push_back(overlay(record));
    }
    return records;
}

TransferOptions TransferService::withDefaults(const TransferOptions &options) const
{
    TransferOptions effective = options;
    if (!effective.max_retries)
    {
        effective.max_retries = config.transfers.max_retries;
    }
    effective.allow_pause = options.allow_pause && config.transfers.allow_pause;
    if (effective.group.empty())
    {
        effective.group = "default";
    }
    return effective;
}

std::optional<Failure> TransferService::checkSpace(const std::filesystem::path &target, uint64_t required) const
{
    std::filesystem::path existing = nearestExistingAncestor(target);

    std::error_code ec;
    std::filesystem::space_info info = std::filesystem::space(existing, ec);
    if (ec)
    {
        Logger::warn(LogCategory::SERVICE, "Skipping space check for {}: {}", existing.string(), ec.message());
        return std::nullopt;
    }

    uint64_t available = static_cast<uint64_t>(info.available);
    if (available < required)
    {
        Logger::warn(LogCategory::SERVICE, "Not enough space in {}: need {}, have {}", existing.string(),
                     TimeUtils::formatBytes(required), TimeUtils::formatBytes(available));
        return Failure(StorageFailure::insufficientSpace(required, available));
    }
    return std::nullopt;
}

void TransferService::rebuildFromEngine()
{
    size_t adopted = 0;
    size_t cached = 0;
    for (const auto &record : engine.allRecords())
    {
        if (!record.isTerminal())
        {
            registry.adopt(record);
            ++adopted;
        }
        else if (record.status == TransferStatus::FAILED && !registry.isActive(record.resource_id))
        {
            // Kept retired so the failure can be retried after a restart
            registry.adopt(record);
        }
        else if (record.status == TransferStatus::COMPLETED)
        {
            std::error_code ec;
            if (std::filesystem::exists(record.local_path, ec))
            {
                std::optional<uint64_t> size;
                if (record.expected_size_bytes > 0)
                {
                    size = record.expected_size_bytes;
                }
                cache.put(record.resource_id, record.local_path, size);
                ++cached;
            }
        }
    }

    Logger::debug(LogCategory::SERVICE, "Rebuilt state from engine: {} in flight, {} cached", adopted, cached);
}

} // namespace TransferHub
