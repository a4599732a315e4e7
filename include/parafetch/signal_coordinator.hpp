#pragma once

#include "cancellation_token.hpp"
#include "state_reporter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include <signal.h>

namespace parafetch {

// The only component that touches SIGINT/SIGTERM.
//
// The installed handler does nothing but bump a lock-free counter. An
// observer thread polls that counter and turns it into cancellation levels:
// the first signal requests a graceful stop and arms the grace timer; a
// second signal, an expired grace period, or a force request raised on the
// token by anyone else escalates to force and runs the force-exit action.
// Counting instead of flagging means two signals delivered before the
// observer wakes up still escalate.
class SignalCoordinator {
public:
    using ForceExitAction = std::function<void(int exit_code)>;

    struct Options {
        // Zero disables the timer; only a second signal escalates then.
        std::chrono::milliseconds grace_period{std::chrono::seconds(10)};
        std::chrono::milliseconds poll_interval{50};
    };

    SignalCoordinator(CancellationToken& token, Options options, ForceExitAction force_exit);

    // Seals `reporter`, flushes the default logger and leaves through
    // std::_Exit. No destructors or atexit handlers run.
    static ForceExitAction exitAfterSealing(StateReporter& reporter);
    ~SignalCoordinator();

    SignalCoordinator(const SignalCoordinator&) = delete;
    SignalCoordinator& operator=(const SignalCoordinator&) = delete;

    // Registers the handler for SIGINT and SIGTERM. Only one coordinator may
    // be installed per process at a time.
    void install();
    void uninstall();

    void start();
    // All tasks reached a terminal state; the grace timer no longer applies.
    void notifyDrained();
    void stop();

    [[nodiscard]] int signalsReceived() const noexcept;
    [[nodiscard]] bool hasEscalated() const noexcept;

private:
    void observe();
    void escalate(std::unique_lock<std::mutex>& lock, const char* reason);

    CancellationToken& token_;
    Options options_;
    ForceExitAction force_exit_;

    bool installed_{false};
    struct sigaction previous_int_{};
    struct sigaction previous_term_{};

    std::thread observer_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
    bool drained_{false};
    std::atomic<bool> escalated_{false};
};

} // namespace parafetch
