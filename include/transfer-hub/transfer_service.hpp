#pragma once

#include <types/config.hpp>
#include <types/result.hpp>
#include <transfer-hub/content_cache.hpp>
#include <transfer-hub/transfer_registry.hpp>
#include <transfer-hub/transport_engine.hpp>
#include <transfer-hub/update_translator.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TransferHub
{

/**
 * Entry point for callers: composes the content cache, the transfer registry
 * and the update translator around one transport engine.
 *
 * Lifecycle: construct, initialize() once before any other call, dispose()
 * when done (the destructor disposes too). Every operation returns a Result;
 * exceptions from the engine or the filesystem come back as UnknownFailure.
 *
 * Ids accepted by control and query operations are task ids; a resource
 * identifier is accepted too and resolves to the resource's current task.
 */
class TransferService
{
    public:
    TransferService(const Config &config, TransportEngine &engine);
    ~TransferService();

    TransferService(const TransferService &) = delete;
    TransferService &operator=(const TransferService &) = delete;

    Result<void> initialize();
    void dispose();
    bool isInitialized() const;

    // Requests
    Result<TransferChannelPtr> enqueueFetch(const std::string &resource_id, const TransferOptions &options = {});
    Result<TransferChannelPtr> enqueuePush(const std::string &resource_id, const std::filesystem::path &local_path,
                                           const TransferOptions &options = {});

    // Control
    Result<bool> pause(const std::string &id);
    Result<bool> resume(const std::string &id);
    Result<bool> cancel(const std::string &id);
    Result<TransferChannelPtr> retry(const std::string &id);
    // Fetches only; continues from the bytes the failed attempt wrote
    Result<TransferChannelPtr> resumeFailed(const std::string &id);
    Result<std::vector<bool>> pauseAll(const std::vector<std::string> &ids);
    Result<std::vector<bool>> resumeAll(const std::vector<std::string> &ids);
    Result<bool> cancelAll(const std::vector<std::string> &ids);

    // Queries
    Result<std::optional<TransferRecord>> get(const std::string &id);
    Result<std::vector<TransferRecord>> getAll();
    Result<std::vector<TransferRecord>> getByStatus(TransferStatus status);
    Result<std::vector<TransferRecord>> getByKind(TransferKind kind);
    Result<std::vector<TransferRecord>> getByGroup(const std::string &group);
    Result<TransferChannelPtr> channelFor(const std::string &id);

    // Record deletion. Deleting a transfer that is still in flight cancels it.
    Result<void> deleteRecord(const std::string &id);
    Result<void> deleteAll();
    Result<void> deleteByStatus(TransferStatus status);

    // Cache
    Result<std::optional<std::filesystem::path>> getCachedPath(const std::string &resource_id);
    Result<std::optional<std::string>> resourceForPath(const std::filesystem::path &local_path);
    Result<size_t> cleanStaleCacheEntries();
    Result<bool> invalidateCache(const std::string &resource_id);
    CacheStats cacheStats() const;

    Result<ReconcileOutcome> reconcileAbandoned();
    Result<uint64_t> availableSpace(const std::optional<std::filesystem::path> &directory = std::nullopt);

    size_t activeTransferCount() const;

    // Local path a fetch of resource_id would be written to
    std::filesystem::path resolveFetchPath(const std::string &resource_id, const TransferOptions &options) const;

    private:
    template <typename T, typename Operation>
    Result<T> guarded(const char *operation, Operation &&body);

    std::optional<Failure> requireInitialized() const;
    std::string resolveTaskId(const std::string &id) const;
    std::optional<std::string> resolveResourceId(const std::string &id) const;
    TransferRecord overlay(const TransferRecord &engine_record) const;
    std::vector<TransferRecord> overlayAll(const std::vector<TransferRecord> &engine_records) const;
    TransferOptions withDefaults(const TransferOptions &options) const;
    std::optional<Failure> checkSpace(const std::filesystem::path &target, uint64_t required) const;
    void rebuildFromEngine();
    void dropRecord(const std::string &task_id);

    Config config;
    TransportEngine &engine;
    ContentCache cache;
    TransferRegistry registry;
    UpdateTranslator translator;
    bool initialized = false;
};

} // namespace TransferHub
