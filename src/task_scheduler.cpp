#include "parafetch/task_scheduler.hpp"
#include "parafetch/exit_codes.hpp"
#include "parafetch/streaming_download.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <system_error>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace parafetch {

bool RunSummary::allCompleted() const noexcept {
    return interrupted == 0 && failed == 0;
}

int RunSummary::exitCode() const noexcept {
    if (failed > 0) {
        return kExitFailed;
    }
    if (interrupted > 0) {
        return kExitInterrupted;
    }
    return kExitSuccess;
}

TaskScheduler::TaskScheduler(CancellationToken& token, StateReporter& reporter, TaskFactory factory,
                             Options options)
    : token_(token),
    reporter_(reporter),
    factory_(std::move(factory)),
    options_(options) {
    if (!factory_) {
        throw std::invalid_argument("TaskScheduler requires a task factory");
    }
    if (options_.progress_interval <= std::chrono::milliseconds::zero()) {
        options_.progress_interval = std::chrono::milliseconds(1000);
    }
}

void TaskScheduler::validate(const DownloadSpecs& specs) {
    if (specs.empty()) {
        throw SchedulingError("no downloads requested");
    }

    std::unordered_map<std::string, std::size_t> destinations;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        if (spec.url.empty()) {
            throw SchedulingError(fmt::format("download #{} has an empty URL", i + 1));
        }
        const auto scheme_end = spec.url.find("://");
        if (scheme_end == std::string::npos || scheme_end == 0) {
            throw SchedulingError(fmt::format("download #{} has no URL scheme: {}", i + 1, spec.url));
        }
        if (spec.destination.empty()) {
            throw SchedulingError(fmt::format("download #{} has an empty destination", i + 1));
        }
        // Report lines are space separated.
        if (std::any_of(spec.destination.begin(), spec.destination.end(),
                        [](unsigned char c) { return std::isspace(c) != 0; })) {
            throw SchedulingError(
                fmt::format("download #{} destination contains whitespace: '{}'", i + 1, spec.destination));
        }

        const auto normalized = std::filesystem::path{spec.destination}.lexically_normal().string();
        const auto [it, inserted] = destinations.emplace(normalized, i);
        if (!inserted) {
            throw SchedulingError(fmt::format("downloads #{} and #{} share destination {}",
                                              it->second + 1, i + 1, spec.destination));
        }
    }
}

TaskScheduler::TaskFactory TaskScheduler::streamingFactory(TransportPtr transport) {
    if (!transport) {
        throw std::invalid_argument("streamingFactory requires a transport");
    }
    return [transport = std::move(transport)](std::size_t task_id, const DownloadSpec& spec,
                                              const CancellationToken& token) -> DownloadTaskPtr {
        return std::make_shared<StreamingDownload>(task_id, spec, transport, token);
    };
}

RunSummary TaskScheduler::run(const DownloadSpecs& specs) {
    if (!threads_.empty()) {
        throw std::logic_error("TaskScheduler::run is already in progress");
    }
    validate(specs);

    tasks_.clear();
    tasks_.reserve(specs.size());
    for (std::size_t i = 0; i < specs.size(); ++i) {
        auto task = factory_(i, specs[i], token_);
        if (!task) {
            throw std::logic_error(fmt::format("task factory returned no task for {}", specs[i].destination));
        }
        tasks_.push_back(std::move(task));
    }

    outcomes_.assign(specs.size(), TaskOutcome{});
    next_task_.store(0);
    finished_tasks_.store(0);

    const std::size_t worker_count = options_.max_concurrency == 0
        ? tasks_.size()
        : std::min(options_.max_concurrency, tasks_.size());

    spdlog::info("Downloading {} files ({} at a time)", tasks_.size(), worker_count);
    spawnWorkers(worker_count);

    progressLoop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    RunSummary summary;
    summary.outcomes = std::move(outcomes_);
    outcomes_.clear();
    for (const auto& outcome : summary.outcomes) {
        switch (outcome.state) {
        case TerminalState::Completed:
            ++summary.completed;
            break;
        case TerminalState::Interrupted:
            ++summary.interrupted;
            break;
        case TerminalState::Failed:
            ++summary.failed;
            break;
        }
    }
    tasks_.clear();

    spdlog::info("Finished: {} completed, {} interrupted, {} failed", summary.completed,
                 summary.interrupted, summary.failed);
    return summary;
}

void TaskScheduler::spawnWorkers(std::size_t worker_count) {
    threads_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        try {
            threads_.emplace_back([this]() { workerLoop(); });
        } catch (const std::system_error& ex) {
            // Workers pull from a shared queue, so fewer of them still drain every task.
            if (threads_.empty()) {
                throw;
            }
            spdlog::warn("Could only start {} of {} workers: {}", threads_.size(), worker_count,
                         ex.what());
            break;
        }
    }
}

void TaskScheduler::workerLoop() {
    while (true) {
        const std::size_t index = next_task_.fetch_add(1);
        if (index >= tasks_.size()) {
            return;
        }
        executeTask(index);
        if (finished_tasks_.fetch_add(1, std::memory_order_acq_rel) + 1 == tasks_.size() &&
            options_.on_drained) {
            options_.on_drained();
        }
    }
}

void TaskScheduler::executeTask(std::size_t index) {
    try {
        outcomes_[index] = tasks_[index]->run();
    } catch (const std::exception& ex) {
        recordInternalError(index, ex.what());
    } catch (...) {
        recordInternalError(index, "unknown exception");
    }

    if (!reporter_.record(outcomes_[index])) {
        spdlog::debug("No state record written for task {}", index);
    }
}

void TaskScheduler::recordInternalError(std::size_t index, const std::string& what) {
    const auto progress = tasks_[index]->getProgress();
    auto outcome = TaskOutcome::failed(ErrorKind::InternalError, what, progress.downloaded_bytes);
    outcome.task_id = index;
    outcome.url = progress.url;
    outcome.destination = progress.destination;
    outcome.finished_at = TaskOutcome::Clock::now();
    outcomes_[index] = std::move(outcome);

    spdlog::critical("Download task for {} threw: {}", progress.destination, what);
    token_.requestForce();
}

void TaskScheduler::progressLoop() {
    const auto started = std::chrono::steady_clock::now();
    auto last_log = started;
    const auto tick = std::min<std::chrono::milliseconds>(options_.progress_interval,
                                                          std::chrono::milliseconds(100));

    while (finished_tasks_.load(std::memory_order_acquire) < tasks_.size()) {
        std::this_thread::sleep_for(tick);

        const auto now = std::chrono::steady_clock::now();
        if (now - last_log >= options_.progress_interval) {
            logProgress(started);
            last_log = now;
        }
    }
}

void TaskScheduler::logProgress(std::chrono::steady_clock::time_point started) const {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;

    std::uint64_t downloaded_all = 0;
    std::size_t running = 0;
    for (const auto& task : tasks_) {
        const auto progress = task->getProgress();
        downloaded_all += progress.downloaded_bytes;
        if (!progress.is_running) {
            continue;
        }
        ++running;

        if (progress.expected_bytes > 0) {
            const double ratio = static_cast<double>(progress.downloaded_bytes) /
                                 static_cast<double>(progress.expected_bytes);
            spdlog::info("{}: {:.1f}s elapsed, {} of {} ({:>3}%)", progress.destination, elapsed.count(),
                         formatSize(progress.downloaded_bytes), formatSize(progress.expected_bytes),
                         static_cast<int>(ratio * 100.0));
        } else {
            spdlog::info("{}: {:.1f}s elapsed, {} downloaded", progress.destination, elapsed.count(),
                         formatSize(progress.downloaded_bytes));
        }
    }

    spdlog::debug("{} running, {} finished, {} total", running,
                  finished_tasks_.load(std::memory_order_acquire), formatSize(downloaded_all));
}

std::string TaskScheduler::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace parafetch
