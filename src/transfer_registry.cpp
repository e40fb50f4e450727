#include <transfer-hub/logger.hpp>
#include <transfer-hub/metrics_collector.hpp>
#include <transfer-hub/string_utils.hpp>
#include <transfer-hub/transfer_registry.hpp>
#include <fmt/format.h>
#include <chrono>
#include <exception>

namespace TransferHub
{

TransferRegistry::TransferRegistry(TransportEngine &engine) : engine(engine)
{
}

TransferRegistry::~TransferRegistry()
{
    clear();
}

Result<TransferChannelPtr> TransferRegistry::requestTransfer(const std::string &resource_id, TransferSpec spec)
{
    if (resource_id.empty())
    {
        return Result<TransferChannelPtr>::fail(ValidationFailure{ "resourceId", "Resource identifier is empty" });
    }
    if (!spec.resource_id.empty() && spec.resource_id != resource_id)
    {
        return Result<TransferChannelPtr>::fail(
        ValidationFailure{ "resourceId", fmt::format("Spec is for {}, not {}", spec.resource_id, resource_id) });
    }

    auto existing = entries.find(resource_id);
    if (existing != entries.end() && existing->second.active)
    {
        Logger::debug(LogCategory::REGISTRY, "Attaching to in-flight transfer {} for {}",
                      existing->second.record.task_id, resource_id);
        GlobalMetrics::instance().recordTransferAttached();
        return Result<TransferChannelPtr>::success(existing->second.channel);
    }

    // A retired record is superseded by the new request, and comes back if the engine refuses it
    std::optional<Entry> superseded;
    if (existing != entries.end())
    {
        superseded = existing->second;
        erase(resource_id);
    }

    spec.resource_id = resource_id;
    if (spec.task_id.empty())
    {
        spec.task_id = nextTaskId(resource_id);
    }
    if (task_to_resource.count(spec.task_id) > 0)
    {
        reinstate(resource_id, superseded);
        return Result<TransferChannelPtr>::fail(
        ValidationFailure{ "taskId", fmt::format("Task id {} is already in use", spec.task_id) });
    }

    Entry entry;
    entry.spec = spec;
    entry.record.task_id = spec.task_id;
    entry.record.resource_id = resource_id;
    entry.record.kind = spec.kind;
    entry.record.local_path = spec.local_path;
    entry.record.created_at = spec.created_at;
    entry.record.expected_size_bytes = spec.options.expected_size_bytes.value_or(0);
    entry.record.priority = spec.options.priority;
    entry.record.group = spec.options.group;
    entry.channel = TransferChannel::create(resource_id);
    entry.active = true;

    // Registered before the engine sees it, so updates emitted during enqueue find the entry
    TransferChannelPtr channel = entry.channel;
    entries.emplace(resource_id, std::move(entry));
    task_to_resource.emplace(spec.task_id, resource_id);

    bool accepted = false;
    try
    {
        accepted = engine.enqueue(spec);
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::REGISTRY, "Engine threw while enqueuing {}: {}", resource_id, e.what());
        erase(resource_id);
        reinstate(resource_id, superseded);
        channel->close();
        return Result<TransferChannelPtr>::fail(UnknownFailure{ "Failed to enqueue transfer", "ENQUEUE_FAILED", e.what() });
    }

    if (!accepted)
    {
        Logger::warn(LogCategory::REGISTRY, "Engine rejected {} ({})", resource_id, spec.task_id);
        erase(resource_id);
        reinstate(resource_id, superseded);
        channel->close();
        return Result<TransferChannelPtr>::fail(
        UnknownFailure{ fmt::format("Transport engine rejected {}", resource_id), "ENQUEUE_REJECTED" });
    }

    Logger::info(LogCategory::REGISTRY, "Started {} of {} as {}", kindToString(spec.kind), resource_id, spec.task_id);
    GlobalMetrics::instance().recordTransferRequested(kindToString(spec.kind));
    publishActiveCount();
    return Result<TransferChannelPtr>::success(channel);
}

Result<bool> TransferRegistry::cancel(const std::string &resource_id)
{
    auto it = entries.find(resource_id);
    if (it == entries.end() || !it->second.active)
    {
        return Result<bool>::success(false);
    }

    // Retirement follows the engine's canceled update
    bool accepted = engine.cancelById(it->second.record.task_id);
    Logger::debug(LogCategory::REGISTRY, "Cancel of {} {}", resource_id, accepted ? "accepted" : "refused");
    return Result<bool>::success(accepted);
}

Result<TransferChannelPtr> TransferRegistry::retry(const std::string &resource_id)
{
    return restart(resource_id, false);
}

Result<TransferChannelPtr> TransferRegistry::resumeFailed(const std::string &resource_id)
{
    return restart(resource_id, true);
}

Result<TransferChannelPtr> TransferRegistry::restart(const std::string &resource_id, bool continue_partial)
{
    auto it = entries.find(resource_id);
    if (it == entries.end())
    {
        return Result<TransferChannelPtr>::fail(FileNotFoundFailure{ resource_id, "NOT_FOUND", "Transfer not found" });
    }

    const Entry &entry = it->second;
    if (entry.active || entry.record.status != TransferStatus::FAILED)
    {
        return Result<TransferChannelPtr>::fail(ValidationFailure{
        "status", fmt::format("Only failed transfers can be retried, {} is {}", resource_id,
                              statusToString(entry.record.status)) });
    }

    if (continue_partial && entry.record.kind != TransferKind::FETCH)
    {
        return Result<TransferChannelPtr>::fail(
        ValidationFailure{ "kind", fmt::format("Only fetches resume from partial data, {} is a push", resource_id) });
    }

    TransferSpec spec = entry.spec;
    spec.task_id.clear();
    spec.created_at = Clock::now();
    spec.continue_partial = continue_partial;

    Logger::info(LogCategory::REGISTRY, "{} {} (was {})", continue_partial ? "Resuming" : "Retrying", resource_id,
                 entry.record.task_id);
    return requestTransfer(resource_id, std::move(spec));
}

TransferChannelPtr TransferRegistry::adopt(const TransferRecord &record)
{
    if (entries.count(record.resource_id) > 0)
    {
        erase(record.resource_id);
    }

    Entry entry;
    entry.spec.task_id = record.task_id;
    entry.spec.resource_id = record.resource_id;
    entry.spec.kind = record.kind;
    entry.spec.local_path = record.local_path;
    entry.spec.created_at = record.created_at;
    entry.spec.options.priority = record.priority;
    entry.spec.options.group = record.group;
    if (record.expected_size_bytes > 0)
    {
        entry.spec.options.expected_size_bytes = record.expected_size_bytes;
    }
    entry.record = record;
    entry.channel = TransferChannel::create(record.resource_id);
    entry.active = !record.isTerminal();
    if (!entry.active)
    {
        entry.channel->close();
    }

    TransferChannelPtr channel = entry.channel;
    task_to_resource[record.task_id] = record.resource_id;
    entries.emplace(record.resource_id, std::move(entry));
    publishActiveCount();
    return channel;
}

void TransferRegistry::applyRecord(const TransferRecord &record)
{
    auto it = entries.find(record.resource_id);
    if (it == entries.end() || !it->second.active || it->second.record.task_id != record.task_id)
    {
        Logger::debug(LogCategory::REGISTRY, "Dropping record for {} ({}), no active transfer", record.resource_id,
                      record.task_id);
        return;
    }

    it->second.record = record;
    TransferChannelPtr channel = it->second.channel;
    channel->publish(record);

    if (record.isTerminal())
    {
        retireIfCurrent(record.resource_id, record.task_id);
    }
}

void TransferRegistry::failInternally(const std::string &resource_id, const std::string &reason)
{
    auto it = entries.find(resource_id);
    if (it == entries.end() || !it->second.active)
    {
        return;
    }

    TransferRecord &record = it->second.record;
    record.status = TransferStatus::FAILED;
    record.last_error = TransportError{ TransportErrorKind::GENERAL, reason, std::nullopt };

    TransferRecord failed = record;
    TransferChannelPtr channel = it->second.channel;
    channel->publish(failed);
    retireIfCurrent(failed.resource_id, failed.task_id);
}

bool TransferRegistry::withdraw(const std::string &resource_id)
{
    auto it = entries.find(resource_id);
    if (it == entries.end() || !it->second.active)
    {
        return false;
    }

    TransferRecord &record = it->second.record;
    record.status = TransferStatus::CANCELED;

    TransferRecord canceled = record;
    TransferChannelPtr channel = it->second.channel;
    channel->publish(canceled);
    retireIfCurrent(canceled.resource_id, canceled.task_id);
    return true;
}

const TransferRecord *TransferRegistry::find(const std::string &resource_id) const
{
    auto it = entries.find(resource_id);
    return it == entries.end() ? nullptr : &it->second.record;
}

const TransferRecord *TransferRegistry::findByTask(const std::string &task_id) const
{
    auto resource = task_to_resource.find(task_id);
    if (resource == task_to_resource.end())
    {
        return nullptr;
    }
    return find(resource->second);
}

std::optional<std::string> TransferRegistry::resourceForTask(const std::string &task_id) const
{
    auto it = task_to_resource.find(task_id);
    if (it == task_to_resource.end())
    {
        return std::nullopt;
    }
    return it->second;
}

TransferChannelPtr TransferRegistry::channelFor(const std::string &resource_id) const
{
    auto it = entries.find(resource_id);
    return it == entries.end() ? nullptr : it->second.channel;
}

bool TransferRegistry::isActive(const std::string &resource_id) const
{
    auto it = entries.find(resource_id);
    return it != entries.end() && it->second.active;
}

size_t TransferRegistry::activeCount() const
{
    size_t count = 0;
    for (const auto &[resource_id, entry] : entries)
    {
        if (entry.active)
        {
            ++count;
        }
    }
    return count;
}

std::vector<TransferRecord> TransferRegistry::records() const
{
    std::vector<TransferRecord> result;
    result.reserve(entries.size());
    for (const auto &[resource_id, entry] : entries)
    {
        result.push_back(entry.record);
    }
    return result;
}

bool TransferRegistry::forget(const std::string &resource_id)
{
    auto it = entries.find(resource_id);
    if (it == entries.end() || it->second.active)
    {
        return false;
    }
    erase(resource_id);
    return true;
}

size_t TransferRegistry::forgetRetired()
{
    std::vector<std::string> retired;
    for (const auto &[resource_id, entry] : entries)
    {
        if (!entry.active)
        {
            retired.push_back(resource_id);
        }
    }
    for (const auto &resource_id : retired)
    {
        erase(resource_id);
    }
    return retired.size();
}

void TransferRegistry::clear()
{
    // Detach first so close handlers see an empty registry
    std::unordered_map<std::string, Entry> closing;
    closing.swap(entries);
    task_to_resource.clear();

    for (auto &[resource_id, entry] : closing)
    {
        if (entry.channel)
        {
            entry.channel->close();
        }
    }
    publishActiveCount();
}

void TransferRegistry::reinstate(const std::string &resource_id, std::optional<Entry> &superseded)
{
    if (!superseded)
    {
        return;
    }
    task_to_resource[superseded->record.task_id] = resource_id;
    entries.emplace(resource_id, std::move(*superseded));
    superseded.reset();
}

std::string TransferRegistry::nextTaskId(const std::string &resource_id)
{
    std::string stem = StringUtils::hashName(resource_id);
    auto dot = stem.find('.');
    if (dot != std::string::npos)
    {
        stem.erase(dot);
    }

    std::string task_id;
    do
    {
        task_id = fmt::format("{}-{}", stem, ++task_sequence);
    } while (task_to_resource.count(task_id) > 0);
    return task_id;
}

void TransferRegistry::retireIfCurrent(const std::string &resource_id, const std::string &task_id)
{
    // Subscribers run during publish and may already have replaced or retired the entry
    auto it = entries.find(resource_id);
    if (it == entries.end() || !it->second.active || it->second.record.task_id != task_id)
    {
        return;
    }
    retire(it->second);
}

void TransferRegistry::retire(Entry &entry)
{
    entry.active = false;

    auto &metrics = GlobalMetrics::instance();
    switch (entry.record.status)
    {
    case TransferStatus::COMPLETED:
        if (entry.record.started_at && entry.record.completed_at)
        {
            std::chrono::duration<double> elapsed = *entry.record.completed_at - *entry.record.started_at;
            metrics.recordTransferCompleted(elapsed.count());
        }
        else
        {
            metrics.recordTransferCompleted(0.0);
        }
        break;
    case TransferStatus::CANCELED:
        metrics.recordTransferCanceled();
        break;
    default:
        metrics.recordTransferFailed(statusToString(entry.record.status));
        break;
    }

    Logger::info(LogCategory::REGISTRY, "Retired {} ({}) as {}", entry.record.resource_id, entry.record.task_id,
                 statusToString(entry.record.status));
    publishActiveCount();

    // Last: close handlers may re-enter the registry
    TransferChannelPtr channel = entry.channel;
    channel->close();
}

void TransferRegistry::erase(const std::string &resource_id)
{
    auto it = entries.find(resource_id);
    if (it == entries.end())
    {
        return;
    }
    task_to_resource.erase(it->second.record.task_id);
    entries.erase(it);
}

void TransferRegistry::publishActiveCount() const
{
    GlobalMetrics::instance().updateActiveTransfers(activeCount());
}

} // namespace TransferHub
