#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace parafetch {

enum class TerminalState {
    Completed,
    Interrupted,
    Failed,
};

enum class ErrorKind {
    None,
    TransportError,
    IoError,
    InternalError,
};

// Immutable once produced; the reporter takes it by value.
struct TaskOutcome {
    using Clock = std::chrono::system_clock;

    std::size_t task_id{0};
    std::string url;
    std::string destination;
    TerminalState state{TerminalState::Failed};
    std::uint64_t bytes{0};
    ErrorKind cause{ErrorKind::None};
    std::string detail;
    Clock::time_point started_at{};
    Clock::time_point finished_at{};

    static TaskOutcome completed(std::uint64_t bytes);
    static TaskOutcome interrupted(std::uint64_t bytes_so_far);
    static TaskOutcome failed(ErrorKind cause, std::string detail, std::uint64_t bytes_so_far = 0);
};

[[nodiscard]] std::string_view toString(TerminalState state) noexcept;
[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

} // namespace parafetch
