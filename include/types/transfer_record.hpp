#pragma once

#include <types/transfer_status.hpp>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace TransferHub
{

using Clock = std::chrono::system_clock;

enum class TransportErrorKind : std::uint8_t
{
    GENERAL,
    CONNECTION,
    RESOURCE,
    FILE_SYSTEM,
    URL,
    HTTP
};

struct TransportError
{
    TransportErrorKind kind = TransportErrorKind::GENERAL;
    std::string description;
    std::optional<int> http_status{};
};

// Caller supplied knobs for a single transfer
struct TransferOptions
{
    std::optional<std::string> file_name{};
    std::optional<std::string> directory{};
    std::map<std::string, std::string> headers{};
    std::optional<std::chrono::seconds> timeout{};
    std::optional<uint32_t> max_retries{};
    bool allow_pause = true;
    std::optional<uint64_t> expected_size_bytes{};
    TransferPriority priority = TransferPriority::NORMAL;
    std::string group = "default";
    std::map<std::string, std::string> fields{};
    std::map<std::string, std::string> metadata{};
};

// What the transport engine is asked to execute
struct TransferSpec
{
    std::string task_id;
    std::string resource_id;
    TransferKind kind = TransferKind::FETCH;
    std::filesystem::path local_path;
    TransferOptions options{};
    Clock::time_point created_at = Clock::now();
    bool continue_partial = false; // Keep bytes an earlier attempt already wrote
};

struct TransferRecord
{
    std::string task_id;
    std::string resource_id;
    TransferKind kind = TransferKind::FETCH;
    TransferStatus status = TransferStatus::PENDING;
    TransferPriority priority = TransferPriority::NORMAL;
    std::string group = "default";
    double progress = 0.0; // [0, 1]
    uint64_t expected_size_bytes = 0;
    double speed_bytes_per_sec = 0.0;
    std::chrono::seconds estimated_time_remaining{ 0 };
    std::filesystem::path local_path;
    Clock::time_point created_at = Clock::now();
    std::optional<Clock::time_point> started_at{};
    std::optional<Clock::time_point> completed_at{};
    std::optional<TransportError> last_error{};

    uint64_t transferredBytes() const
    {
        return static_cast<uint64_t>(std::llround(static_cast<double>(expected_size_bytes) * progress));
    }

    bool isTerminal() const
    {
        return TransferHub::isTerminal(status);
    }
};

/**
 * One event on the engine's update stream. Status-only and progress-only
 * updates are both allowed; absent fields leave the record untouched.
 */
struct TransportUpdate
{
    std::string task_id;
    std::optional<TransferStatus> status{};
    std::optional<double> progress{};
    std::optional<double> speed_bytes_per_sec{};
    std::optional<std::chrono::seconds> eta{};
    std::optional<uint64_t> expected_size_bytes{};
    std::optional<TransportError> error{};
};

} // namespace TransferHub
