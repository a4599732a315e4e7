#include "parafetch/signal_coordinator.hpp"
#include "parafetch/exit_codes.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace parafetch {

namespace {

static_assert(std::atomic<int>::is_always_lock_free, "signal counter must be lock-free");

std::atomic<int> g_signal_count{0};
std::atomic<bool> g_handler_installed{false};

// Runs in signal context: one lock-free atomic increment and nothing else.
void handleSignal(int) {
    g_signal_count.fetch_add(1, std::memory_order_relaxed);
}

void installHandler(int signo, struct sigaction* previous) {
    struct sigaction action {};
    action.sa_handler = &handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (::sigaction(signo, &action, previous) != 0) {
        throw std::runtime_error(
            fmt::format("sigaction({}) failed: {}", signo, std::strerror(errno)));
    }
}

} // namespace

SignalCoordinator::SignalCoordinator(CancellationToken& token, Options options,
                                     ForceExitAction force_exit)
    : token_(token),
    options_(options),
    force_exit_(std::move(force_exit)) {
    if (!force_exit_) {
        throw std::invalid_argument("SignalCoordinator requires a force-exit action");
    }
    if (options_.poll_interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("SignalCoordinator poll interval must be positive");
    }
}

SignalCoordinator::ForceExitAction SignalCoordinator::exitAfterSealing(StateReporter& reporter) {
    return [&reporter](int exit_code) {
        reporter.seal();
        spdlog::default_logger()->flush();
        std::_Exit(exit_code);
    };
}

SignalCoordinator::~SignalCoordinator() {
    stop();
    uninstall();
}

void SignalCoordinator::install() {
    if (installed_) {
        return;
    }
    bool expected = false;
    if (!g_handler_installed.compare_exchange_strong(expected, true)) {
        throw std::logic_error("another SignalCoordinator is already installed");
    }

    g_signal_count.store(0, std::memory_order_relaxed);
    try {
        installHandler(SIGINT, &previous_int_);
        installHandler(SIGTERM, &previous_term_);
    } catch (...) {
        ::sigaction(SIGINT, &previous_int_, nullptr);
        g_handler_installed.store(false);
        throw;
    }
    installed_ = true;
    spdlog::debug("Signal handlers installed for SIGINT and SIGTERM");
}

void SignalCoordinator::uninstall() {
    if (!installed_) {
        return;
    }
    ::sigaction(SIGINT, &previous_int_, nullptr);
    ::sigaction(SIGTERM, &previous_term_, nullptr);
    installed_ = false;
    g_handler_installed.store(false);
}

void SignalCoordinator::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (observer_.joinable()) {
        throw std::logic_error("SignalCoordinator already started");
    }
    stopping_ = false;
    observer_ = std::thread([this] { observe(); });
}

void SignalCoordinator::notifyDrained() {
    std::lock_guard<std::mutex> lock(mutex_);
    drained_ = true;
}

void SignalCoordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (observer_.joinable()) {
        observer_.join();
    }
}

int SignalCoordinator::signalsReceived() const noexcept {
    return g_signal_count.load(std::memory_order_acquire);
}

bool SignalCoordinator::hasEscalated() const noexcept {
    return escalated_.load(std::memory_order_acquire);
}

void SignalCoordinator::observe() {
    using Clock = std::chrono::steady_clock;

    bool graceful = false;
    Clock::time_point deadline{};

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        const int count = g_signal_count.load(std::memory_order_acquire);

        if (count >= 1 && !graceful) {
            graceful = true;
            token_.requestGraceful();
            if (options_.grace_period > std::chrono::milliseconds::zero()) {
                deadline = Clock::now() + options_.grace_period;
                spdlog::warn("Interrupt received, stopping downloads (grace period {} ms, "
                             "interrupt again to force exit)",
                             options_.grace_period.count());
            } else {
                spdlog::warn("Interrupt received, stopping downloads (interrupt again to force exit)");
            }
        }

        if (count >= 2) {
            escalate(lock, "second interrupt received");
            return;
        }
        if (graceful && !drained_ && options_.grace_period > std::chrono::milliseconds::zero() &&
            Clock::now() >= deadline) {
            escalate(lock, "grace period expired with downloads still running");
            return;
        }
        if (token_.isForceRequested()) {
            escalate(lock, "forced shutdown requested");
            return;
        }

        cv_.wait_for(lock, options_.poll_interval, [this] { return stopping_; });
    }
}

void SignalCoordinator::escalate(std::unique_lock<std::mutex>& lock, const char* reason) {
    token_.requestForce();
    escalated_.store(true, std::memory_order_release);
    lock.unlock();

    spdlog::error("Forcing exit: {}", reason);
    force_exit_(kExitForced);
}

} // namespace parafetch
