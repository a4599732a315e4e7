#include "parafetch/exit_codes.hpp"
#include "parafetch/signal_coordinator.hpp"
#include "parafetch/state_reporter.hpp"
#include "parafetch/task_scheduler.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include <gtest/gtest.h>

namespace {

using namespace std::chrono_literals;
using parafetch::CancellationToken;
using parafetch::CancelLevel;
using parafetch::DownloadSpec;
using parafetch::DownloadSpecs;
using parafetch::RunSummary;
using parafetch::SignalCoordinator;
using parafetch::StateReporter;
using parafetch::TaskOutcome;
using parafetch::TaskScheduler;
using parafetch::TerminalState;
using parafetch::test::ScriptedTransport;
using parafetch::test::TempDir;

// Raises SIGINT itself, then takes `unwind` to wind down once cancellation arrives.
class SlowUnwindTask final : public parafetch::DownloadTask {
public:
    SlowUnwindTask(std::size_t task_id, DownloadSpec spec, const CancellationToken& token,
                   std::chrono::milliseconds unwind)
        : task_id_(task_id), spec_(std::move(spec)), token_(token), unwind_(unwind) {}

    TaskOutcome run() override {
        running_ = true;
        std::raise(SIGINT);
        while (!token_.isCancellationRequested()) {
            std::this_thread::sleep_for(1ms);
        }
        std::this_thread::sleep_for(unwind_);

        auto outcome = TaskOutcome::interrupted(0);
        outcome.task_id = task_id_;
        outcome.url = spec_.url;
        outcome.destination = spec_.destination;
        running_ = false;
        finished_ = true;
        return outcome;
    }

    [[nodiscard]] parafetch::Progress getProgress() const override {
        return {spec_.url, spec_.destination, 0, 0, running_.load(), finished_.load()};
    }
    [[nodiscard]] bool isRunning() const override { return running_; }
    [[nodiscard]] bool isFinished() const override { return finished_; }

private:
    std::size_t task_id_;
    DownloadSpec spec_;
    const CancellationToken& token_;
    std::chrono::milliseconds unwind_;
    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
};

// Every line of the output is a complete "<dest> <STATE> <bytes>" record.
class WholeRecordLines : public ::testing::MatcherInterface<const std::string&> {
public:
    bool MatchAndExplain(const std::string& output, ::testing::MatchResultListener* listener) const override {
        if (!output.empty() && output.back() != '\n') {
            *listener << "output ends in a partial line";
            return false;
        }
        const std::regex record(R"([^ \n]+ (COMPLETED|INTERRUPTED|FAILED:[A-Za-z]+) [0-9]+)");
        std::istringstream in(output);
        for (std::string line; std::getline(in, line);) {
            if (!std::regex_match(line, record)) {
                *listener << "malformed line '" << line << "'";
                return false;
            }
        }
        return true;
    }

    void DescribeTo(std::ostream* os) const override { *os << "consists of whole state records"; }
};

class ShutdownTest : public ::testing::Test {
protected:
    static SignalCoordinator::Options signalOptions(std::chrono::milliseconds grace) {
        SignalCoordinator::Options options;
        options.grace_period = grace;
        options.poll_interval = 5ms;
        return options;
    }

    DownloadSpecs specs(std::size_t count) const {
        DownloadSpecs result;
        for (std::size_t i = 0; i < count; ++i) {
            const auto name = "file" + std::to_string(i) + ".bin";
            result.push_back({"https://example.test/" + name, dir_.file(name), std::nullopt});
        }
        return result;
    }

    TempDir dir_;
    CancellationToken token_;
    std::atomic<int> force_exits_{0};
};

TEST_F(ShutdownTest, LastTaskEndingInsideGracePeriodIsNotForced) {
    StateReporter reporter(dir_.file("report.log"));
    SignalCoordinator coordinator(token_, signalOptions(80ms), [this](int) { ++force_exits_; });
    coordinator.install();
    coordinator.start();

    TaskScheduler::Options options;
    options.on_drained = [&coordinator] { coordinator.notifyDrained(); };
    TaskScheduler scheduler(token_, reporter,
                            [](std::size_t id, const DownloadSpec& spec, const CancellationToken& token) {
                                return std::make_shared<SlowUnwindTask>(id, spec, token, 30ms);
                            },
                            options);

    const RunSummary summary = scheduler.run(specs(1));
    std::this_thread::sleep_for(150ms);

    EXPECT_EQ(force_exits_.load(), 0);
    EXPECT_FALSE(coordinator.hasEscalated());
    EXPECT_EQ(token_.level(), CancelLevel::Graceful);
    EXPECT_EQ(summary.exitCode(), parafetch::kExitInterrupted);
}

TEST_F(ShutdownTest, OneInterruptStopsEveryTransferWithInterruptedStatus) {
    StateReporter reporter(dir_.file("report.log"));
    SignalCoordinator coordinator(token_, signalOptions(10s), [this](int) { ++force_exits_; });
    coordinator.install();
    coordinator.start();

    auto transport = std::make_shared<ScriptedTransport>(200, 100, 5ms);
    std::mutex mutex;
    std::map<std::string, std::size_t> delivered;
    bool raised = false;
    transport->onChunkDelivered([&](const std::string& url, std::size_t) {
        std::lock_guard<std::mutex> lock(mutex);
        ++delivered[url];
        if (!raised && delivered.size() == 2 && delivered.begin()->second >= 2 &&
            delivered.rbegin()->second >= 2) {
            raised = true;
            std::raise(SIGINT);
        }
    });

    TaskScheduler::Options options;
    options.on_drained = [&coordinator] { coordinator.notifyDrained(); };
    TaskScheduler scheduler(token_, reporter, TaskScheduler::streamingFactory(transport), options);

    const RunSummary summary = scheduler.run(specs(2));
    coordinator.stop();

    EXPECT_EQ(summary.interrupted, 2u);
    EXPECT_EQ(summary.exitCode(), parafetch::kExitInterrupted);
    for (const auto& outcome : summary.outcomes) {
        EXPECT_EQ(outcome.state, TerminalState::Interrupted);
        EXPECT_GT(outcome.bytes, 0u);
        EXPECT_LT(outcome.bytes, transport->totalSize());
    }
    EXPECT_EQ(coordinator.signalsReceived(), 1);
    EXPECT_EQ(force_exits_.load(), 0);
    EXPECT_EQ(reporter.recordCount(), 2u);
}

// Records go to stderr so the exit matcher sees exactly what was reported
// before the process died.
void interruptTwiceDuringTransfers(const DownloadSpecs& input) {
    CancellationToken token;
    StateReporter reporter(stderr);
    SignalCoordinator::Options signal_options;
    signal_options.poll_interval = 5ms;
    SignalCoordinator coordinator(token, signal_options, SignalCoordinator::exitAfterSealing(reporter));
    coordinator.install();
    coordinator.start();

    auto transport = std::make_shared<ScriptedTransport>(100, 64, 2ms);
    std::atomic<bool> raised{false};
    transport->onChunkDelivered([&raised](const std::string&, std::size_t index) {
        if (index == 3 && !raised.exchange(true)) {
            std::raise(SIGINT);
            std::raise(SIGINT);
        }
    });

    TaskScheduler::Options options;
    options.on_drained = [&coordinator] { coordinator.notifyDrained(); };
    TaskScheduler scheduler(token, reporter, TaskScheduler::streamingFactory(transport), options);
    scheduler.run(input);

    // The forced exit is expected to land well before this.
    std::this_thread::sleep_for(5s);
}

TEST_F(ShutdownTest, SecondInterruptExitsWith130AndLeavesOnlyWholeLines) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    const DownloadSpecs input = specs(8);

    EXPECT_EXIT(interruptTwiceDuringTransfers(input), ::testing::ExitedWithCode(parafetch::kExitForced),
                ::testing::MakeMatcher(new WholeRecordLines));
}

} // namespace
