#pragma once

#include <types/config.hpp>
#include <transfer-hub/transport_engine.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace TransferHub
{

struct CopyTask
{
    TransferSpec spec{};
    TransferRecord record{};
    std::filesystem::path source{};
    std::filesystem::path destination{};
    uint32_t attempts = 0;
    bool continue_partial = false; // Append to an existing .part file instead of starting over
    bool abandoned = false; // Loaded from the journal with no worker behind it
    std::atomic<bool> pause_requested{ false };
    std::atomic<bool> cancel_requested{ false };

    explicit CopyTask(const TransferSpec &spec) : spec(spec)
    {
    }
};

struct QueuedCopy
{
    std::shared_ptr<CopyTask> task;
    TransferPriority priority = TransferPriority::NORMAL;
    uint64_t sequence = 0;
};

// Higher priority first, then first come first served
struct QueuedCopyOrder
{
    bool operator()(const QueuedCopy &a, const QueuedCopy &b) const
    {
        if (a.priority != b.priority)
        {
            return a.priority < b.priority;
        }
        return a.sequence > b.sequence;
    }
};

/**
 * In-process transport engine that copies local files.
 *
 * Fetch copies the file named by the resource identifier (plain path or
 * file:// URL) to the TransferSpec local path; push copies its local file to
 * the path named by the resource identifier. Copies run in chunks on a pool
 * of worker threads and land in "<destination>.part" until complete.
 *
 * Queued copies start in priority order; worker_threads bounds how many
 * run at once.
 *
 * Workers never call the update handler. Updates are queued and delivered on
 * the thread that calls dispatchPendingUpdates(), which keeps every consumer
 * on a single event loop.
 */
class FileCopyTransportEngine : public TransportEngine
{
    public:
    explicit FileCopyTransportEngine(const EngineConfig &config);
    ~FileCopyTransportEngine() override;

    FileCopyTransportEngine(const FileCopyTransportEngine &) = delete;
    FileCopyTransportEngine &operator=(const FileCopyTransportEngine &) = delete;

    void setUpdateHandler(UpdateHandler handler) override;
    bool enqueue(const TransferSpec &spec) override;

    bool pause(const std::string &task_id) override;
    bool resume(const std::string &task_id) override;
    bool cancelById(const std::string &task_id) override;
    bool cancelByIds(const std::vector<std::string> &task_ids) override;

    std::optional<TransferRecord> recordForId(const std::string &task_id) override;
    std::vector<TransferRecord> allRecords() override;
    std::vector<TransferRecord> allRecordsWithStatus(TransferStatus status) override;

    void deleteRecordWithId(const std::string &task_id) override;
    void deleteAllRecords() override;

    ReconcileOutcome reconcileAbandoned() override;

    // Delivers queued updates to the handler on the calling thread
    size_t dispatchPendingUpdates();

    // Blocks until an update is queued or the timeout passes
    bool waitForUpdates(std::chrono::milliseconds timeout);

    void shutdown();

    // Copies waiting for a worker, and copies a worker currently holds
    size_t getPendingCount() const;
    size_t getActiveCount() const;

    private:
    enum class CopyResult
    {
        DONE,
        PAUSED,
        CANCELED,
        FAILED,
        INTERRUPTED // Shutdown mid-copy; the record stays non-terminal
    };

    void workerThread();
    void processTask(const std::shared_ptr<CopyTask> &task);
    CopyResult copyFile(CopyTask &task, TransportError &error);

    void post(TransportUpdate update);
    void queueLocked(const std::shared_ptr<CopyTask> &task);
    void stopLocked(CopyTask &task);
    void markCanceledLocked(CopyTask &task);
    void publishQueueDepth() const;
    void loadJournal();
    void saveJournalLocked() const;

    static std::filesystem::path partPath(const std::filesystem::path &destination);

    EngineConfig config;

    std::vector<std::thread> worker_threads{};
    std::priority_queue<QueuedCopy, std::vector<QueuedCopy>, QueuedCopyOrder> work_queue;
    uint64_t queue_sequence = 0;
    std::unordered_map<std::string, std::shared_ptr<CopyTask>> tasks;

    mutable std::mutex tasks_mutex{};
    std::condition_variable queue_condition{};
    std::atomic<bool> shutdown_requested{};

    std::deque<TransportUpdate> pending_updates;
    std::mutex updates_mutex{};
    std::condition_variable updates_condition{};

    std::mutex handler_mutex{};
    UpdateHandler update_handler{};

    std::atomic<size_t> pending_count{};
    std::atomic<size_t> active_count{};
};

} // namespace TransferHub
