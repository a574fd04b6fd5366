#pragma once

#include <chrono>
#include <format>
#include <string>

namespace adminq {

// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
inline auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  return std::format("{:%FT%TZ}",
                     std::chrono::floor<std::chrono::milliseconds>(tp));
}

inline auto format_timestamp() -> std::string {
  return format_timestamp(std::chrono::system_clock::now());
}

}  // namespace adminq
