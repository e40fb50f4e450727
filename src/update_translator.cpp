#include <transfer-hub/logger.hpp>
#include <transfer-hub/update_translator.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>

namespace TransferHub
{

Failure failureFromTransportError(const TransportError &error)
{
    switch (error.kind)
    {
    case TransportErrorKind::HTTP:
        return NetworkFailure{ error.description, "HTTP_ERROR", error.http_status };
    case TransportErrorKind::CONNECTION:
        return NetworkFailure{ error.description, "CONNECTION_ERROR", std::nullopt };
    case TransportErrorKind::FILE_SYSTEM:
        return StorageFailure{ error.description, "FILE_SYSTEM_ERROR" };
    case TransportErrorKind::RESOURCE:
        return FileNotFoundFailure{ error.description, "RESOURCE_NOT_FOUND" };
    case TransportErrorKind::URL:
        return ValidationFailure{ "url", error.description };
    case TransportErrorKind::GENERAL:
    default:
        return UnknownFailure{ error.description, "TRANSPORT_ERROR" };
    }
}

UpdateTranslator::UpdateTranslator(TransferRegistry &registry, ContentCache &cache) : registry(registry), cache(cache)
{
}

TransferRecord UpdateTranslator::applyUpdate(const TransferRecord &current, const TransportUpdate &update,
                                             Clock::time_point now)
{
    TransferRecord next = current;

    if (update.status)
    {
        next.status = *update.status;
    }
    if (update.error)
    {
        next.status = TransferStatus::FAILED;
        next.last_error = update.error;
    }

    // Monotonic: late, duplicated or negative progress values are ignored
    if (update.progress && *update.progress > current.progress)
    {
        next.progress = std::min(*update.progress, 1.0);
    }

    if (update.speed_bytes_per_sec)
    {
        next.speed_bytes_per_sec = std::max(*update.speed_bytes_per_sec, 0.0);
    }
    if (update.eta)
    {
        next.estimated_time_remaining = *update.eta;
    }
    if (update.expected_size_bytes && *update.expected_size_bytes > 0)
    {
        next.expected_size_bytes = *update.expected_size_bytes;
    }

    if (next.status == TransferStatus::RUNNING && !next.started_at)
    {
        next.started_at = now;
    }
    if (next.status == TransferStatus::COMPLETED)
    {
        next.progress = 1.0;
        next.speed_bytes_per_sec = 0.0;
        next.estimated_time_remaining = std::chrono::seconds(0);
        if (!next.completed_at)
        {
            next.completed_at = now;
        }
    }

    return next;
}

bool UpdateTranslator::isExpectedTransition(TransferStatus from, TransferStatus to)
{
    if (from == to)
    {
        return true;
    }

    switch (from)
    {
    case TransferStatus::PENDING:
        return to == TransferStatus::RUNNING || to == TransferStatus::CANCELED || to == TransferStatus::FAILED ||
               to == TransferStatus::NOT_FOUND || to == TransferStatus::COMPLETED;
    case TransferStatus::RUNNING:
        return to != TransferStatus::PENDING;
    case TransferStatus::PAUSED:
        return to == TransferStatus::RUNNING || to == TransferStatus::CANCELED || to == TransferStatus::FAILED;
    case TransferStatus::WAITING_TO_RETRY:
        return to == TransferStatus::RUNNING || to == TransferStatus::CANCELED || to == TransferStatus::FAILED ||
               to == TransferStatus::PENDING;
    default:
        return false;
    }
}

void UpdateTranslator::handle(const TransportUpdate &update)
{
    std::optional<std::string> resource_id = registry.resourceForTask(update.task_id);
    if (!resource_id || !registry.isActive(*resource_id))
    {
        Logger::debug(LogCategory::TRANSLATOR, "Ignoring update for task {} with no active transfer", update.task_id);
        return;
    }

    const TransferRecord *current = registry.find(*resource_id);
    if (current == nullptr || current->task_id != update.task_id)
    {
        Logger::debug(LogCategory::TRANSLATOR, "Ignoring update for superseded task {}", update.task_id);
        return;
    }

    try
    {
        TransferRecord next = applyUpdate(*current, update, Clock::now());

        if (next.status != current->status)
        {
            if (!isExpectedTransition(current->status, next.status))
            {
                Logger::warn(LogCategory::TRANSLATOR, "Unexpected transition {} -> {} for {}",
                             statusToString(current->status), statusToString(next.status), next.resource_id);
            }
            Logger::debug(LogCategory::TRANSLATOR, "{} {} -> {}", next.task_id, statusToString(current->status),
                          statusToString(next.status));
        }

        if (next.last_error && next.status == TransferStatus::FAILED && next.status != current->status)
        {
            Failure failure = failureFromTransportError(*next.last_error);
            Logger::warn(LogCategory::TRANSLATOR, "Transfer {} failed ({}): {}", next.resource_id,
                         failureKindToString(failureKind(failure)), failureMessage(failure));
        }

        if (next.status == TransferStatus::COMPLETED)
        {
            cacheCompleted(next);
        }

        registry.applyRecord(next);
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::TRANSLATOR, "Failed to apply update for {}: {}", *resource_id, e.what());
        registry.failInternally(*resource_id, e.what());
    }
}

void UpdateTranslator::cacheCompleted(const TransferRecord &record)
{
    std::optional<uint64_t> size;
    if (record.expected_size_bytes > 0)
    {
        size = record.expected_size_bytes;
    }
    cache.put(record.resource_id, record.local_path, size);
}

} // namespace TransferHub
