#pragma once

#include <chrono>
#include <cstddef>

namespace adminq {

namespace io {
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
inline constexpr std::size_t kMaxOutputSize = 10 * 1024 * 1024;
}  // namespace io

namespace limits {
inline constexpr std::size_t kMaxTaskLogLines = 200;
inline constexpr std::size_t kMaxLogLineLength = 512;
inline constexpr int kMaxBackoffShift = 30;
}  // namespace limits

namespace timing {
inline constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);
inline constexpr auto kEvictInterval = std::chrono::seconds(30);
inline constexpr auto kProcessKillGrace = std::chrono::milliseconds(10);
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
}  // namespace timing

}  // namespace adminq
