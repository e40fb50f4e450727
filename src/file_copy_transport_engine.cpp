#include <transfer-hub/file_copy_transport_engine.hpp>
#include <transfer-hub/logger.hpp>
#include <transfer-hub/metrics_collector.hpp>
#include <transfer-hub/string_utils.hpp>
#include <transfer-hub/time_utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <system_error>
#include <thread>

namespace TransferHub
{

namespace
{

const char *errorKindToString(TransportErrorKind kind)
{
    switch (kind)
    {
    case TransportErrorKind::CONNECTION:
        return "connection";
    case TransportErrorKind::RESOURCE:
        return "resource";
    case TransportErrorKind::FILE_SYSTEM:
        return "fileSystem";
    case TransportErrorKind::URL:
        return "url";
    case TransportErrorKind::HTTP:
        return "http";
    case TransportErrorKind::GENERAL:
    default:
        return "general";
    }
}

TransportErrorKind errorKindFromString(const std::string &text)
{
    if (text == "connection")
        return TransportErrorKind::CONNECTION;
    if (text == "resource")
        return TransportErrorKind::RESOURCE;
    if (text == "fileSystem")
        return TransportErrorKind::FILE_SYSTEM;
    if (text == "url")
        return TransportErrorKind::URL;
    if (text == "http")
        return TransportErrorKind::HTTP;
    return TransportErrorKind::GENERAL;
}

// Tasks in these states had a worker behind them when the journal was written
bool wasInFlight(TransferStatus status)
{
    return status == TransferStatus::PENDING || status == TransferStatus::RUNNING ||
           status == TransferStatus::WAITING_TO_RETRY;
}

// Fills source and destination; leaves them empty when the identifier is not a local file
void resolveEndpoints(CopyTask &task)
{
    std::string remote = StringUtils::localPathFromUrl(task.spec.resource_id);
    if (remote.empty())
    {
        return;
    }

    if (task.spec.kind == TransferKind::FETCH)
    {
        task.source = remote;
        task.destination = task.spec.local_path;
        return;
    }

    task.source = task.spec.local_path;
    task.destination = remote;
    std::error_code ec;
    if (std::filesystem::is_directory(task.destination, ec))
    {
        task.destination /= task.spec.options.file_name.value_or(task.spec.local_path.filename().string());
    }
}

nlohmann::json taskToJson(const CopyTask &task)
{
    const TransferRecord &record = task.record;

    nlohmann::json j;
    j["task_id"] = record.task_id;
    j["resource_id"] = record.resource_id;
    j["kind"] = kindToString(record.kind);
    j["status"] = statusToString(record.status);
    j["priority"] = priorityToString(record.priority);
    j["group"] = record.group;
    j["progress"] = record.progress;
    j["expected_size_bytes"] = record.expected_size_bytes;
    j["local_path"] = task.spec.local_path.string();
    j["created_at"] = TimeUtils::toEpochMillis(record.created_at);
    j["attempts"] = task.attempts;
    j["max_retries"] = task.spec.options.max_retries.value_or(0);
    j["allow_pause"] = task.spec.options.allow_pause;

    if (task.spec.options.file_name)
    {
        j["file_name"] = *task.spec.options.file_name;
    }
    if (record.started_at)
    {
        j["started_at"] = TimeUtils::toEpochMillis(*record.started_at);
    }
    if (record.completed_at)
    {
        j["completed_at"] = TimeUtils::toEpochMillis(*record.completed_at);
    }
    if (record.last_error)
    {
        nlohmann::json error;
        error["kind"] = errorKindToString(record.last_error->kind);
        error["description"] = record.last_error->description;
        if (record.last_error->http_status)
        {
            error["http_status"] = *record.last_error->http_status;
        }
        j["error"] = error;
    }
    return j;
}

std::shared_ptr<CopyTask> taskFromJson(const nlohmann::json &j)
{
    std::optional<TransferKind> kind = kindFromString(j.at("kind").get<std::string>());
    std::optional<TransferStatus> status = statusFromString(j.at("status").get<std::string>());
    if (!kind || !status)
    {
        return nullptr;
    }

    TransferSpec spec;
    spec.task_id = j.at("task_id").get<std::string>();
    spec.resource_id = j.at("resource_id").get<std::string>();
    spec.kind = *kind;
    spec.local_path = j.at("local_path").get<std::string>();
    spec.created_at = TimeUtils::fromEpochMillis(j.value("created_at", int64_t{ 0 }));
    spec.options.max_retries = j.value("max_retries", uint32_t{ 0 });
    spec.options.allow_pause = j.value("allow_pause", true);
    spec.options.priority =
    priorityFromString(j.value("priority", std::string("normal"))).value_or(TransferPriority::NORMAL);
    spec.options.group = j.value("group", std::string("default"));
    if (j.contains("file_name"))
    {
        spec.options.file_name = j["file_name"].get<std::string>();
    }

    auto task = std::make_shared<CopyTask>(spec);
    task->attempts = j.value("attempts", uint32_t{ 0 });

    TransferRecord &record = task->record;
    record.task_id = spec.task_id;
    record.resource_id = spec.resource_id;
    record.kind = spec.kind;
    record.status = *status;
    record.priority = spec.options.priority;
    record.group = spec.options.group;
    record.progress = j.value("progress", 0.0);
    record.expected_size_bytes = j.value("expected_size_bytes", uint64_t{ 0 });
    record.local_path = spec.local_path;
    record.created_at = spec.created_at;
    if (j.contains("started_at"))
    {
        record.started_at = TimeUtils::fromEpochMillis(j["started_at"].get<int64_t>());
    }
    if (j.contains("completed_at"))
    {
        record.completed_at = TimeUtils::fromEpochMillis(j["completed_at"].get<int64_t>());
    }
    if (j.contains("error"))
    {
        const auto &error = j["error"];
        TransportError last_error;
        last_error.kind = errorKindFromString(error.value("kind", std::string("general")));
        last_error.description = error.value("description", std::string());
        if (error.contains("http_status"))
        {
            last_error.http_status = error["http_status"].get<int>();
        }
        record.last_error = last_error;
    }

    resolveEndpoints(*task);
    task->abandoned = wasInFlight(record.status);
    return task;
}

} // namespace

FileCopyTransportEngine::FileCopyTransportEngine(const EngineConfig &config)
: config(config), shutdown_requested(false), pending_count(0), active_count(0)
{
    loadJournal();
    publishQueueDepth();

    size_t thread_count = std::max<size_t>(1, config.worker_threads);
    for (size_t i = 0; i < thread_count; ++i)
    {
        worker_threads.emplace_back(&FileCopyTransportEngine::workerThread, this);
    }
    Logger::debug(LogCategory::TRANSPORT, "File copy engine started with {} workers", thread_count);
}

FileCopyTransportEngine::~FileCopyTransportEngine()
{
    shutdown();
}

void FileCopyTransportEngine::setUpdateHandler(UpdateHandler handler)
{
    std::lock_guard<std::mutex> lock(handler_mutex);
    update_handler = std::move(handler);
}

bool FileCopyTransportEngine::enqueue(const TransferSpec &spec)
{
    std::lock_guard<std::mutex> lock(tasks_mutex);

    if (shutdown_requested)
    {
        Logger::warn(LogCategory::TRANSPORT, "Rejecting {}: engine is shutting down", spec.task_id);
        return false;
    }
    if (spec.task_id.empty())
    {
        return false;
    }

    auto existing = tasks.find(spec.task_id);
    if (existing != tasks.end() && !existing->second->record.isTerminal())
    {
        Logger::warn(LogCategory::TRANSPORT, "Rejecting {}: task is already in flight", spec.task_id);
        return false;
    }

    auto task = std::make_shared<CopyTask>(spec);
    TransferRecord &record = task->record;
    record.task_id = spec.task_id;
    record.resource_id = spec.resource_id;
    record.kind = spec.kind;
    record.status = TransferStatus::PENDING;
    record.priority = spec.options.priority;
    record.group = spec.options.group;
    record.expected_size_bytes = spec.options.expected_size_bytes.value_or(0);
    record.local_path = spec.local_path;
    record.created_at = spec.created_at;
    task->continue_partial = spec.continue_partial;
    resolveEndpoints(*task);

    tasks[spec.task_id] = task;
    queueLocked(task);
    saveJournalLocked();

    Logger::debug(LogCategory::TRANSPORT, "Queued {} {} -> {} ({} priority)", spec.task_id, task->source.string(),
                  task->destination.string(), priorityToString(spec.options.priority));
    return true;
}

bool FileCopyTransportEngine::pause(const std::string &task_id)
{
    std::lock_guard<std::mutex> lock(tasks_mutex);

    auto it = tasks.find(task_id);
    if (it == tasks.end())
    {
        return false;
    }

    CopyTask &task = *it->second;
    if (task.record.status != TransferStatus::RUNNING || task.abandoned || !task.spec.options.allow_pause)
    {
        return false;
    }

    task.pause_requested = true;
    return true;
}

bool FileCopyTransportEngine::resume(const std::string &task_id)
{
    std::lock_guard<std::mutex> lock(tasks_mutex);

    auto it = tasks.find(task_id);
    if (it == tasks.end() || it->second->record.status != TransferStatus::PAUSED)
    {
        return false;
    }

    CopyTask &task = *it->second;
    task.pause_requested = false;
    task.continue_partial = true;
    task.record.status = TransferStatus::PENDING;
    queueLocked(it->second);
    saveJournalLocked();
    return true;
}

bool FileCopyTransportEngine::cancelById(const std::string &task_id)
{
    std::lock_guard<std::mutex> lock(tasks_mutex);

    auto it = tasks.find(task_id);
    if (it == tasks.end() || it->second->record.isTerminal())
    {
        return false;
    }

    stopLocked(*it->second);
    return true;
}

bool FileCopyTransportEngine::cancelByIds(const std::vector<std::string> &task_ids)
{
    bool all_canceled = true;
    for (const auto &task_id : task_ids)
    {
        all_canceled = cancelById(task_id) && all_canceled;
    }
    return all_canceled;
}

std::optional<TransferRecord> FileCopyTransportEngine::recordForId(const std::string &task_id)
{
    std::lock_guard<std::mutex> lock(tasks_mutex);

    auto it = tasks.find(task_id);
    if (it == tasks.end())
    {
        return std::nullopt;
    }
    return it->second->record;
}

std::vector<TransferRecord> FileCopyTransportEngine::allRecords()
{
    std::vector<TransferRecord> records;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex);
        records.reserve(tasks.size());
        for (const auto &[task_id, task] : tasks)
        {
            records.push_back(task->record);
        }
    }

    std::sort(records.begin(), records.end(), [](const TransferRecord &a, const TransferRecord &b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.task_id < b.task_id;
    });
    return records;
}

std::vector<TransferRecord> FileCopyTransportEngine::allRecordsWithStatus(TransferStatus status)
{
    std::vector<TransferRecord> records = allRecords();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [status](const TransferRecord &record) { return record.status != status; }),
                  records.end());
    return records;
}

void FileCopyTransportEngine::deleteRecordWithId(const std::string &task_id)
{
    std::lock_guard<std::mutex> lock(tasks_mutex);

    auto it = tasks.find(task_id);
    if (it == tasks.end())
    {
        return;
    }

    // Live tasks still report CANCELED so their consumers see an end
    stopLocked(*it->second);
    tasks.erase(it);
    saveJournalLocked();
}

void FileCopyTransportEngine::deleteAllRecords()
{
    std::lock_guard<std::mutex> lock(tasks_mutex);

    for (auto &[task_id, task] : tasks)
    {
        stopLocked(*task);
    }
    tasks.clear();
    saveJournalLocked();
}

ReconcileOutcome FileCopyTransportEngine::reconcileAbandoned()
{
    ReconcileOutcome outcome;
    std::lock_guard<std::mutex> lock(tasks_mutex);

    for (auto &[task_id, task] : tasks)
    {
        if (!task->abandoned)
        {
            continue;
        }
        task->abandoned = false;

        std::error_code ec;
        if (!task->source.empty() && std::filesystem::is_regular_file(task->source, ec))
        {
            task->continue_partial = true;
            task->record.status = TransferStatus::PENDING;
            queueLocked(task);
            outcome.succeeded.push_back(task->record);
            continue;
        }

        TransportError error{ TransportErrorKind::RESOURCE,
                              fmt::format("Source of abandoned task is gone: {}", task->spec.resource_id),
                              std::nullopt };
        task->record.status = TransferStatus::FAILED;
        task->record.last_error = error;

        TransportUpdate update;
        update.task_id = task_id;
        update.status = TransferStatus::FAILED;
        update.error = error;
        post(std::move(update));
        outcome.failed.push_back(task->record);
    }

    saveJournalLocked();
    Logger::info(LogCategory::TRANSPORT, "Reconciled abandoned tasks: {} re-queued, {} failed", outcome.succeeded.size(),
                 outcome.failed.size());
    return outcome;
}

size_t FileCopyTransportEngine::dispatchPendingUpdates()
{
    std::deque<TransportUpdate> batch;
    {
        std::lock_guard<std::mutex> lock(updates_mutex);
        batch.swap(pending_updates);
    }

    UpdateHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex);
        handler = update_handler;
    }

    if (!handler)
    {
        if (!batch.empty())
        {
            Logger::debug(LogCategory::TRANSPORT, "Dropping {} updates, no handler attached", batch.size());
        }
        return 0;
    }

    for (const auto &update : batch)
    {
        handler(update);
    }
    return batch.size();
}

bool FileCopyTransportEngine::waitForUpdates(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(updates_mutex);
    return updates_condition.wait_for(lock, timeout, [this] { return !pending_updates.empty(); });
}

void FileCopyTransportEngine::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(tasks_mutex);
        if (shutdown_requested && worker_threads.empty())
        {
            return;
        }
        shutdown_requested = true;
    }

    queue_condition.notify_all();

    for (auto &thread : worker_threads)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }

    worker_threads.clear();

    std::lock_guard<std::mutex> lock(tasks_mutex);
    saveJournalLocked();
}

size_t FileCopyTransportEngine::getPendingCount() const
{
    return pending_count.load();
}

size_t FileCopyTransportEngine::getActiveCount() const
{
    return active_count.load();
}

void FileCopyTransportEngine::workerThread()
{
    while (!shutdown_requested)
    {
        std::shared_ptr<CopyTask> task;

        {
            std::unique_lock<std::mutex> lock(tasks_mutex);
            queue_condition.wait(lock, [this] { return !work_queue.empty() || shutdown_requested; });

            if (shutdown_requested)
            {
                break;
            }

            task = work_queue.top().task;
            work_queue.pop();
            pending_count--;

            // Canceled or deleted while queued
            if (task->cancel_requested || task->record.isTerminal())
            {
                publishQueueDepth();
                continue;
            }

            task->record.status = TransferStatus::RUNNING;
            if (!task->record.started_at)
            {
                task->record.started_at = Clock::now();
            }
            active_count++;
            publishQueueDepth();
            saveJournalLocked();

            TransportUpdate running;
            running.task_id = task->record.task_id;
            running.status = TransferStatus::RUNNING;
            post(std::move(running));
        }

        processTask(task);
        active_count--;
        publishQueueDepth();
    }
}

void FileCopyTransportEngine::processTask(const std::shared_ptr<CopyTask> &task)
{
    TransportError error;
    CopyResult result = CopyResult::FAILED;

    try
    {
        result = copyFile(*task, error);
    }
    catch (const std::exception &e)
    {
        error = TransportError{ TransportErrorKind::FILE_SYSTEM, e.what(), std::nullopt };
        result = CopyResult::FAILED;
    }

    std::lock_guard<std::mutex> lock(tasks_mutex);
    TransferRecord &record = task->record;

    TransportUpdate update;
    update.task_id = record.task_id;

    switch (result)
    {
    case CopyResult::DONE:
        record.status = TransferStatus::COMPLETED;
        record.progress = 1.0;
        record.completed_at = Clock::now();
        update.status = TransferStatus::COMPLETED;
        update.progress = 1.0;
        update.expected_size_bytes = record.expected_size_bytes;
        Logger::info(LogCategory::TRANSPORT, "Completed {} ({})", record.task_id,
                     TimeUtils::formatBytes(record.expected_size_bytes));
        break;

    case CopyResult::PAUSED:
        record.status = TransferStatus::PAUSED;
        task->continue_partial = true;
        update.status = TransferStatus::PAUSED;
        Logger::debug(LogCategory::TRANSPORT, "Paused {} at {:.0f}%", record.task_id, record.progress * 100.0);
        break;

    case CopyResult::CANCELED:
        markCanceledLocked(*task);
        return;

    case CopyResult::FAILED:
        if (error.kind != TransportErrorKind::URL && task->attempts < task->spec.options.max_retries.value_or(0) &&
            !shutdown_requested)
        {
            task->attempts++;
            task->continue_partial = true;
            record.status = TransferStatus::WAITING_TO_RETRY;
            update.status = TransferStatus::WAITING_TO_RETRY;
            Logger::warn(LogCategory::TRANSPORT, "Attempt {} for {} failed: {}, retrying", task->attempts, record.task_id,
                         error.description);
            post(std::move(update));
            queueLocked(task);
            saveJournalLocked();
            return;
        }

        record.status = TransferStatus::FAILED;
        record.last_error = error;
        update.status = TransferStatus::FAILED;
        update.error = error;
        Logger::error(LogCategory::TRANSPORT, "Transfer {} failed: {}", record.task_id, error.description);
        break;

    case CopyResult::INTERRUPTED:
        saveJournalLocked();
        return;
    }

    post(std::move(update));
    saveJournalLocked();
}

FileCopyTransportEngine::CopyResult FileCopyTransportEngine::copyFile(CopyTask &task, TransportError &error)
{
    if (task.source.empty())
    {
        error = TransportError{ TransportErrorKind::URL,
                                fmt::format("Unsupported resource identifier: {}", task.spec.resource_id), std::nullopt };
        return CopyResult::FAILED;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(task.source, ec))
    {
        error = TransportError{ TransportErrorKind::RESOURCE, fmt::format("Source not found: {}", task.source.string()),
                                std::nullopt };
        return CopyResult::FAILED;
    }

    uint64_t total = std::filesystem::file_size(task.source, ec);
    if (ec)
    {
        error = TransportError{ TransportErrorKind::FILE_SYSTEM,
                                fmt::format("Cannot stat {}: {}", task.source.string(), ec.message()), std::nullopt };
        return CopyResult::FAILED;
    }

    if (task.destination.has_parent_path())
    {
        std::filesystem::create_directories(task.destination.parent_path(), ec);
        if (ec)
        {
            error = TransportError{ TransportErrorKind::FILE_SYSTEM,
                                    fmt::format("Cannot create {}: {}", task.destination.parent_path().string(),
                                                ec.message()),
                                    std::nullopt };
            return CopyResult::FAILED;
        }
    }

    std::filesystem::path part = partPath(task.destination);
    uint64_t offset = 0;
    if (task.continue_partial)
    {
        uint64_t existing = std::filesystem::file_size(part, ec);
        if (!ec && existing <= total)
        {
            offset = existing;
        }
    }

    std::ifstream in(task.source, std::ios::binary);
    if (!in.is_open())
    {
        error = TransportError{ TransportErrorKind::RESOURCE, fmt::format("Cannot open {}", task.source.string()),
                                std::nullopt };
        return CopyResult::FAILED;
    }

    std::ofstream out(part, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!out.is_open())
    {
        error = TransportError{ TransportErrorKind::FILE_SYSTEM, fmt::format("Cannot write {}", part.string()),
                                std::nullopt };
        return CopyResult::FAILED;
    }

    in.seekg(static_cast<std::streamoff>(offset));
    {
        std::lock_guard<std::mutex> lock(tasks_mutex);
        task.record.expected_size_bytes = total;
    }

    std::vector<char> buffer(std::max<size_t>(1, config.chunk_size_bytes));
    auto run_start = std::chrono::steady_clock::now();
    uint64_t copied = 0;

    while (offset < total)
    {
        if (task.cancel_requested)
        {
            return CopyResult::CANCELED;
        }
        if (task.pause_requested.exchange(false))
        {
            return CopyResult::PAUSED;
        }
        if (shutdown_requested)
        {
            return CopyResult::INTERRUPTED;
        }

        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), total - offset));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        std::streamsize got = in.gcount();
        if (got <= 0)
        {
            error = TransportError{ TransportErrorKind::FILE_SYSTEM,
                                    fmt::format("Unexpected end of {} at byte {}", task.source.string(), offset),
                                    std::nullopt };
            return CopyResult::FAILED;
        }

        out.write(buffer.data(), got);
        if (!out)
        {
            error = TransportError{ TransportErrorKind::FILE_SYSTEM, fmt::format("Write to {} failed", part.string()),
                                    std::nullopt };
            return CopyResult::FAILED;
        }

        offset += static_cast<uint64_t>(got);
        copied += static_cast<uint64_t>(got);

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - run_start).count();
        double speed = elapsed > 0.0 ? static_cast<double>(copied) / elapsed : 0.0;

        TransportUpdate progress;
        progress.task_id = task.record.task_id;
        progress.progress = static_cast<double>(offset) / static_cast<double>(total);
        progress.speed_bytes_per_sec = speed;
        progress.expected_size_bytes = total;
        if (speed > 0.0)
        {
            progress.eta = std::chrono::seconds(static_cast<int64_t>(static_cast<double>(total - offset) / speed));
        }

        {
            std::lock_guard<std::mutex> lock(tasks_mutex);
            task.record.progress = *progress.progress;
            task.record.speed_bytes_per_sec = speed;
            task.record.estimated_time_remaining = progress.eta.value_or(std::chrono::seconds(0));
        }
        post(std::move(progress));

        if (config.max_bytes_per_second > 0)
        {
            auto budget = std::chrono::duration<double>(static_cast<double>(copied) /
                                                        static_cast<double>(config.max_bytes_per_second));
            std::this_thread::sleep_until(run_start +
                                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(budget));
        }
    }

    out.close();
    if (out.fail())
    {
        error = TransportError{ TransportErrorKind::FILE_SYSTEM, fmt::format("Cannot finish {}", part.string()),
                                std::nullopt };
        return CopyResult::FAILED;
    }
    in.close();

    std::filesystem::rename(part, task.destination, ec);
    if (ec)
    {
        error = TransportError{ TransportErrorKind::FILE_SYSTEM,
                                fmt::format("Cannot move {} into place: {}", part.string(), ec.message()),
                                std::nullopt };
        return CopyResult::FAILED;
    }
    return CopyResult::DONE;
}

void FileCopyTransportEngine::post(TransportUpdate update)
{
    {
        std::lock_guard<std::mutex> lock(updates_mutex);
        pending_updates.push_back(std::move(update));
    }
    updates_condition.notify_all();
}

void FileCopyTransportEngine::queueLocked(const std::shared_ptr<CopyTask> &task)
{
    work_queue.push(QueuedCopy{ task, task->spec.options.priority, ++queue_sequence });
    pending_count++;
    publishQueueDepth();
    queue_condition.notify_one();
}

void FileCopyTransportEngine::stopLocked(CopyTask &task)
{
    if (task.record.isTerminal())
    {
        return;
    }
    if (task.record.status == TransferStatus::RUNNING && !task.abandoned)
    {
        // The worker stops at the next chunk boundary and reports the cancel
        task.cancel_requested = true;
        return;
    }
    markCanceledLocked(task);
}

void FileCopyTransportEngine::markCanceledLocked(CopyTask &task)
{
    task.record.status = TransferStatus::CANCELED;

    std::error_code ec;
    if (!task.destination.empty())
    {
        std::filesystem::remove(partPath(task.destination), ec);
    }

    TransportUpdate update;
    update.task_id = task.record.task_id;
    update.status = TransferStatus::CANCELED;
    post(std::move(update));
    saveJournalLocked();

    Logger::info(LogCategory::TRANSPORT, "Canceled {}", task.record.task_id);
}

void FileCopyTransportEngine::publishQueueDepth() const
{
    auto &metrics = GlobalMetrics::instance();
    metrics.updateQueuedCopies(pending_count.load());
    metrics.updateRunningCopies(active_count.load());
}

void FileCopyTransportEngine::loadJournal()
{
    if (config.journal_path.empty())
    {
        return;
    }

    std::ifstream in(config.journal_path);
    if (!in.is_open())
    {
        Logger::debug(LogCategory::TRANSPORT, "No journal at {}, starting empty", config.journal_path);
        return;
    }

    try
    {
        nlohmann::json doc = nlohmann::json::parse(in);
        std::lock_guard<std::mutex> lock(tasks_mutex);
        for (const auto &item : doc.value("tasks", nlohmann::json::array()))
        {
            std::shared_ptr<CopyTask> task = taskFromJson(item);
            if (!task)
            {
                Logger::warn(LogCategory::TRANSPORT, "Skipping unreadable journal entry");
                continue;
            }
            tasks[task->record.task_id] = task;
        }
        Logger::info(LogCategory::TRANSPORT, "Loaded {} task records from {}", tasks.size(), config.journal_path);
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error(LogCategory::TRANSPORT, "Ignoring corrupt journal {}: {}", config.journal_path, e.what());
    }
}

void FileCopyTransportEngine::saveJournalLocked() const
{
    if (config.journal_path.empty())
    {
        return;
    }

    nlohmann::json doc;
    doc["version"] = 1;
    doc["tasks"] = nlohmann::json::array();
    for (const auto &[task_id, task] : tasks)
    {
        doc["tasks"].push_back(taskToJson(*task));
    }

    std::filesystem::path target = config.journal_path;
    std::filesystem::path temp = target;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open())
        {
            Logger::warn(LogCategory::TRANSPORT, "Cannot write journal {}", temp.string());
            return;
        }
        out << doc.dump(2);
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec)
    {
        Logger::warn(LogCategory::TRANSPORT, "Cannot replace journal {}: {}", target.string(), ec.message());
    }
}

std::filesystem::path FileCopyTransportEngine::partPath(const std::filesystem::path &destination)
{
    std::filesystem::path part = destination;
    part += ".part";
    return part;
}

} // namespace TransferHub
