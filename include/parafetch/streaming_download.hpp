#pragma once

#include "cancellation_token.hpp"
#include "download_spec.hpp"
#include "download_task.hpp"
#include "transport.hpp"

#include <cstddef>
#include <memory>

namespace parafetch {

// Streams one source into its destination chunk by chunk, checking the
// cancellation token before every write. Partial output is left on disk.
class StreamingDownload final : public DownloadTask {
public:
    StreamingDownload(std::size_t task_id, DownloadSpec spec, TransportPtr transport,
                      const CancellationToken& token);
    ~StreamingDownload() override;

    TaskOutcome run() override;
    [[nodiscard]] Progress getProgress() const override;
    [[nodiscard]] bool isRunning() const override;
    [[nodiscard]] bool isFinished() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parafetch
