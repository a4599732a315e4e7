#include "parafetch/state_reporter.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace parafetch {

StateReporter::StateReporter(std::FILE* out) : out_(out) {
    if (!out_) {
        throw std::invalid_argument("StateReporter requires an output stream");
    }
}

StateReporter::StateReporter(const std::string& path) {
    owned_.reset(std::fopen(path.c_str(), "a"));
    if (!owned_) {
        throw std::runtime_error(
            fmt::format("Cannot open report file {}: {}", path, std::strerror(errno)));
    }
    out_ = owned_.get();
}

StateReporter::~StateReporter() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(out_);
}

bool StateReporter::record(TaskOutcome outcome) {
    const std::string line = formatRecord(outcome);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sealed_) {
            return false;
        }
        if (!recorded_.insert(outcome.task_id).second) {
            spdlog::error("Duplicate terminal record for task {} ({}) rejected", outcome.task_id,
                          outcome.destination);
            return false;
        }
        if (std::fwrite(line.data(), 1, line.size(), out_) != line.size() || std::fflush(out_) != 0) {
            spdlog::error("Failed to write state record for {}: {}", outcome.destination,
                          std::strerror(errno));
        }
    }

    switch (outcome.state) {
    case TerminalState::Completed:
        spdlog::info("{}: completed, {} bytes", outcome.destination, outcome.bytes);
        break;
    case TerminalState::Interrupted:
        spdlog::warn("{}: interrupted after {} bytes", outcome.destination, outcome.bytes);
        break;
    case TerminalState::Failed:
        spdlog::error("{}: failed ({}): {}", outcome.destination, toString(outcome.cause),
                      outcome.detail);
        break;
    }
    return true;
}

void StateReporter::seal() {
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
    std::fflush(out_);
}

std::size_t StateReporter::recordCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorded_.size();
}

bool StateReporter::isSealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

std::string StateReporter::formatRecord(const TaskOutcome& outcome) {
    if (outcome.state == TerminalState::Failed) {
        return fmt::format("{} {}:{} {}\n", outcome.destination, toString(outcome.state),
                           toString(outcome.cause), outcome.bytes);
    }
    return fmt::format("{} {} {}\n", outcome.destination, toString(outcome.state), outcome.bytes);
}

} // namespace parafetch
