#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace TransferHub
{

struct NetworkFailure
{
    std::string message;
    std::optional<std::string> code{};
    std::optional<int> status_code{};
};

struct FileNotFoundFailure
{
    std::string file_path;
    std::optional<std::string> code{};
    std::string message = "File not found: " + file_path;
};

struct PermissionFailure
{
    std::string permission;
    std::optional<std::string> code{};
    std::string message = "Permission denied: " + permission;
};

struct StorageFailure
{
    std::string message;
    std::optional<std::string> code{};
    std::optional<uint64_t> required_bytes{};
    std::optional<uint64_t> available_bytes{};

    static StorageFailure insufficientSpace(uint64_t required, uint64_t available)
    {
        return StorageFailure{ "Insufficient storage space", "INSUFFICIENT_SPACE", required, available };
    }
};

struct CancelledFailure
{
    std::optional<uint64_t> bytes_transferred{};
    std::string message = "Transfer cancelled";
    std::optional<std::string> code = "CANCELLED";
};

struct TimeoutFailure
{
    std::chrono::seconds timeout{};
    std::string message = "Transfer timed out after " + std::to_string(timeout.count()) + "s";
    std::optional<std::string> code = "TIMEOUT";
};

struct ValidationFailure
{
    std::string field;
    std::string message;
    std::optional<std::string> code = "VALIDATION_ERROR";
};

// Wraps anything that has no more specific mapping; cause holds the
// underlying exception text when there was one.
struct UnknownFailure
{
    std::string message;
    std::optional<std::string> code{};
    std::optional<std::string> cause{};
};

using Failure = std::variant<NetworkFailure,
                             FileNotFoundFailure,
                             PermissionFailure,
                             StorageFailure,
                             CancelledFailure,
                             TimeoutFailure,
                             ValidationFailure,
                             UnknownFailure>;

enum class FailureKind : std::uint8_t
{
    NETWORK,
    FILE_NOT_FOUND,
    PERMISSION,
    STORAGE,
    CANCELLED,
    TIMEOUT,
    VALIDATION,
    UNKNOWN
};

inline FailureKind failureKind(const Failure &failure)
{
    return static_cast<FailureKind>(failure.index());
}

inline const std::string &failureMessage(const Failure &failure)
{
    return std::visit([](const auto &f) -> const std::string & { return f.message; }, failure);
}

inline std::optional<std::string> failureCode(const Failure &failure)
{
    return std::visit([](const auto &f) { return f.code; }, failure);
}

std::string failureKindToString(FailureKind kind);

} // namespace TransferHub
