#pragma once

namespace parafetch {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitInterrupted = 3;
// 128 + SIGINT, what a shell reports for a process killed by Ctrl-C.
inline constexpr int kExitForced = 130;

} // namespace parafetch
