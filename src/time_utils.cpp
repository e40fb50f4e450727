#include <transfer-hub/time_utils.hpp>
#include <ctime>
#include <fmt/format.h>
#include <iomanip>
#include <sstream>

namespace TransferHub
{

std::string TimeUtils::formatDuration(std::chrono::seconds duration)
{
    auto seconds = duration.count();

    if (seconds < 60)
        return std::to_string(seconds) + "s";
    else if (seconds < 3600)
        return fmt::format("{}m{:02}s", seconds / 60, seconds % 60);
    else if (seconds < 86400)
        return fmt::format("{}h{:02}m", seconds / 3600, (seconds % 3600) / 60);
    else
        return std::to_string(seconds / 86400) + "d";
}

std::string TimeUtils::formatTimestamp(std::chrono::system_clock::time_point tp, const char *format)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::string TimeUtils::formatBytes(uint64_t bytes)
{
    if (bytes >= 1024ULL * 1024 * 1024)
        return fmt::format("{:.1f} GB", static_cast<double>(bytes) / (1024.0 * 1024 * 1024));
    if (bytes >= 1024ULL * 1024)
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / (1024.0 * 1024));
    if (bytes >= 1024)
        return fmt::format("{:.1f} KB", static_cast<double>(bytes) / 1024.0);
    return fmt::format("{} bytes", bytes);
}

int64_t TimeUtils::toEpochMillis(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::fromEpochMillis(int64_t millis)
{
    return std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

} // namespace TransferHub
