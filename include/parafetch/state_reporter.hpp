#pragma once

#include "task_outcome.hpp"

#include <cstddef>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace parafetch {

// Writes one terminal line per task: "<destination> <STATE> <bytes>".
// Each line is formatted first and written in a single call under the lock,
// so concurrent writers never produce torn or interleaved lines.
class StateReporter {
public:
    // Does not take ownership of `out`.
    explicit StateReporter(std::FILE* out = stdout);
    // Opens `path` for appending; throws std::runtime_error on failure.
    explicit StateReporter(const std::string& path);
    ~StateReporter();

    StateReporter(const StateReporter&) = delete;
    StateReporter& operator=(const StateReporter&) = delete;

    // Returns false if the task already has a record or the reporter is sealed.
    bool record(TaskOutcome outcome);

    // Waits for any in-flight record, flushes, and drops every later record.
    void seal();

    [[nodiscard]] std::size_t recordCount() const;
    [[nodiscard]] bool isSealed() const;

    [[nodiscard]] static std::string formatRecord(const TaskOutcome& outcome);

private:
    struct FileCloser {
        void operator()(std::FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::unique_ptr<std::FILE, FileCloser> owned_{};
    std::FILE* out_{nullptr};

    mutable std::mutex mutex_;
    std::unordered_set<std::size_t> recorded_;
    bool sealed_{false};
};

} // namespace parafetch
