#include <types/failure.hpp>
#include <types/transfer_status.hpp>

namespace TransferHub
{

std::string statusToString(TransferStatus status)
{
    switch (status)
    {
    case TransferStatus::PENDING:
        return "pending";
    case TransferStatus::RUNNING:
        return "running";
    case TransferStatus::PAUSED:
        return "paused";
    case TransferStatus::COMPLETED:
        return "completed";
    case TransferStatus::FAILED:
        return "failed";
    case TransferStatus::CANCELED:
        return "canceled";
    case TransferStatus::WAITING_TO_RETRY:
        return "waitingToRetry";
    case TransferStatus::NOT_FOUND:
        return "notFound";
    }
    return "unknown";
}

std::optional<TransferStatus> statusFromString(std::string_view text)
{
    if (text == "pending")
        return TransferStatus::PENDING;
    if (text == "running")
        return TransferStatus::RUNNING;
    if (text == "paused")
        return TransferStatus::PAUSED;
    if (text == "completed")
        return TransferStatus::COMPLETED;
    if (text == "failed")
        return TransferStatus::FAILED;
    if (text == "canceled")
        return TransferStatus::CANCELED;
    if (text == "waitingToRetry")
        return TransferStatus::WAITING_TO_RETRY;
    if (text == "notFound")
        return TransferStatus::NOT_FOUND;
    return std::nullopt;
}

std::string kindToString(TransferKind kind)
{
    return kind == TransferKind::FETCH ? "fetch" : "push";
}

std::optional<TransferKind> kindFromString(std::string_view text)
{
    if (text == "fetch")
        return TransferKind::FETCH;
    if (text == "push")
        return TransferKind::PUSH;
    return std::nullopt;
}

std::string priorityToString(TransferPriority priority)
{
    switch (priority)
    {
    case TransferPriority::LOW:
        return "low";
    case TransferPriority::NORMAL:
        return "normal";
    case TransferPriority::HIGH:
        return "high";
    case TransferPriority::URGENT:
        return "urgent";
    }
    return "normal";
}

std::optional<TransferPriority> priorityFromString(std::string_view text)
{
    if (text == "low")
        return TransferPriority::LOW;
    if (text == "normal")
        return TransferPriority::NORMAL;
    if (text == "high")
        return TransferPriority::HIGH;
    if (text == "urgent")
        return TransferPriority::URGENT;
    return std::nullopt;
}

std::string failureKindToString(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::NETWORK:
        return "network";
    case FailureKind::FILE_NOT_FOUND:
        return "fileNotFound";
    case FailureKind::PERMISSION:
        return "permission";
    case FailureKind::STORAGE:
        return "storage";
    case FailureKind::CANCELLED:
        return "cancelled";
    case FailureKind::TIMEOUT:
        return "timeout";
    case FailureKind::VALIDATION:
        return "validation";
    case FailureKind::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}

} // namespace TransferHub
