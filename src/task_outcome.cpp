#include "parafetch/task_outcome.hpp"

#include <utility>

namespace parafetch {

TaskOutcome TaskOutcome::completed(std::uint64_t bytes) {
    TaskOutcome outcome;
    outcome.state = TerminalState::Completed;
    outcome.bytes = bytes;
    return outcome;
}

TaskOutcome TaskOutcome::interrupted(std::uint64_t bytes_so_far) {
    TaskOutcome outcome;
    outcome.state = TerminalState::Interrupted;
    outcome.bytes = bytes_so_far;
    return outcome;
}

TaskOutcome TaskOutcome::failed(ErrorKind cause, std::string detail, std::uint64_t bytes_so_far) {
    TaskOutcome outcome;
    outcome.state = TerminalState::Failed;
    outcome.cause = cause;
    outcome.detail = std::move(detail);
    outcome.bytes = bytes_so_far;
    return outcome;
}

std::string_view toString(TerminalState state) noexcept {
    switch (state) {
    case TerminalState::Completed:
        return "COMPLETED";
    case TerminalState::Interrupted:
        return "INTERRUPTED";
    case TerminalState::Failed:
        return "FAILED";
    }
    return "UNKNOWN";
}

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::TransportError:
        return "TransportError";
    case ErrorKind::IoError:
        return "IoError";
    case ErrorKind::InternalError:
        return "InternalError";
    }
    return "Unknown";
}

} // namespace parafetch
