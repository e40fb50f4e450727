#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace TransferHub
{

const char *const TIME_FORMAT_DEFAULT = "%Y-%m-%d %H:%M:%S";

class TimeUtils
{
   public:
      static std::string formatDuration(std::chrono::seconds duration);
      static std::string formatTimestamp(std::chrono::system_clock::time_point tp, const char *format = TIME_FORMAT_DEFAULT);
      static std::string formatBytes(uint64_t bytes);

      // Millisecond ticks since the epoch, the journal's on-disk time format
      static int64_t toEpochMillis(std::chrono::system_clock::time_point tp);
      static std::chrono::system_clock::time_point fromEpochMillis(int64_t millis);
};

}
