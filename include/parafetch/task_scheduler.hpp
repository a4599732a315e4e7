#pragma once

#include "cancellation_token.hpp"
#include "download_spec.hpp"
#include "download_task.hpp"
#include "state_reporter.hpp"
#include "task_outcome.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace parafetch {

// Pre-flight rejection of the whole run; nothing has been started.
class SchedulingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RunSummary {
    std::vector<TaskOutcome> outcomes;
    std::size_t completed{0};
    std::size_t interrupted{0};
    std::size_t failed{0};

    [[nodiscard]] bool allCompleted() const noexcept;
    // Failure outranks interruption.
    [[nodiscard]] int exitCode() const noexcept;
};

class TaskScheduler {
public:
    using TaskFactory = std::function<DownloadTaskPtr(std::size_t task_id, const DownloadSpec& spec,
                                                      const CancellationToken& token)>;

    struct Options {
        // Zero runs every task at once.
        std::size_t max_concurrency{0};
        std::chrono::milliseconds progress_interval{1000};
        // Runs on the worker that finishes the last task, right after its
        // record is written and before run() returns.
        std::function<void()> on_drained;
    };

    TaskScheduler(CancellationToken& token, StateReporter& reporter, TaskFactory factory,
                  Options options);

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Throws SchedulingError describing the first problem found.
    static void validate(const DownloadSpecs& specs);

    static TaskFactory streamingFactory(TransportPtr transport);

    // Validates, runs every task to a terminal state and reports each one.
    RunSummary run(const DownloadSpecs& specs);

private:
    void spawnWorkers(std::size_t worker_count);
    void workerLoop();
    void executeTask(std::size_t index);
    void recordInternalError(std::size_t index, const std::string& what);
    void progressLoop();
    void logProgress(std::chrono::steady_clock::time_point started) const;
    static std::string formatSize(std::uint64_t bytes);

    CancellationToken& token_;
    StateReporter& reporter_;
    TaskFactory factory_;
    Options options_;

    std::vector<std::thread> threads_;
    std::vector<DownloadTaskPtr> tasks_;
    std::vector<TaskOutcome> outcomes_;
    std::atomic<std::size_t> next_task_{0};
    std::atomic<std::size_t> finished_tasks_{0};
};

} // namespace parafetch
