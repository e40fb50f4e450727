#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace TransferHub
{

enum class TransferStatus : std::uint8_t
{
    PENDING, // Accepted, not yet started by the engine
    RUNNING, // Bytes are moving
    PAUSED, // Suspended, resumable
    COMPLETED, // Finished successfully
    FAILED, // Finished with an error
    CANCELED, // Stopped on request
    WAITING_TO_RETRY, // Engine will restart it on its own
    NOT_FOUND // Engine lost track of the underlying task
};

enum class TransferKind : std::uint8_t
{
    FETCH,
    PUSH
};

// Order in which queued transfers are started; equal priorities run first come first served
enum class TransferPriority : std::uint8_t
{
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

inline bool isTerminal(TransferStatus status)
{
    return status == TransferStatus::COMPLETED || status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELED || status == TransferStatus::NOT_FOUND;
}

std::string statusToString(TransferStatus status);
std::optional<TransferStatus> statusFromString(std::string_view text);

std::string kindToString(TransferKind kind);
std::optional<TransferKind> kindFromString(std::string_view text);

std::string priorityToString(TransferPriority priority);
std::optional<TransferPriority> priorityFromString(std::string_view text);

} // namespace TransferHub
