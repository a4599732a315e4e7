#pragma once

#include "progress.hpp"
#include "task_outcome.hpp"

#include <memory>

namespace parafetch {

class DownloadTask {
public:
    virtual ~DownloadTask() = default;

    // Drives the transfer to exactly one terminal state. Call once.
    virtual TaskOutcome run() = 0;

    [[nodiscard]] virtual Progress getProgress() const = 0;
    [[nodiscard]] virtual bool isRunning() const = 0;
    [[nodiscard]] virtual bool isFinished() const = 0;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace parafetch
