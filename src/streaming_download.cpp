#include "parafetch/streaming_download.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace parafetch {

class StreamingDownload::Impl final : public StreamSink {
public:
    Impl(std::size_t task_id, DownloadSpec spec, TransportPtr transport,
         const CancellationToken& token)
        : task_id_(task_id),
        spec_(std::move(spec)),
        transport_(std::move(transport)),
        token_(token) {
        if (!transport_) {
            throw std::invalid_argument("StreamingDownload requires a transport");
        }
    }

    TaskOutcome run() {
        State expected = State::Pending;
        if (!state_.compare_exchange_strong(expected, State::Running)) {
            throw std::logic_error("download task already started: " + spec_.destination);
        }

        const auto started_at = TaskOutcome::Clock::now();
        TaskOutcome outcome = transfer();
        outcome.task_id = task_id_;
        outcome.url = spec_.url;
        outcome.destination = spec_.destination;
        outcome.started_at = started_at;
        outcome.finished_at = TaskOutcome::Clock::now();

        state_.store(State::Finished, std::memory_order_release);
        return outcome;
    }

    [[nodiscard]] Progress getProgress() const {
        const State state = state_.load(std::memory_order_acquire);
        return {
            spec_.url,
            spec_.destination,
            spec_.expected_size.value_or(0),
            bytes_written_.load(std::memory_order_relaxed),
            state == State::Running,
            state == State::Finished
        };
    }

    [[nodiscard]] bool isRunning() const {
        return state_.load(std::memory_order_acquire) == State::Running;
    }

    [[nodiscard]] bool isFinished() const {
        return state_.load(std::memory_order_acquire) == State::Finished;
    }

    bool onChunk(const char* data, std::size_t size) override {
        if (token_.isCancellationRequested()) {
            cancelled_ = true;
            return false;
        }

        FILE* file = file_.get();
        if (!file) {
            io_error_ = "destination file is not open";
            return false;
        }

        const std::size_t written = std::fwrite(data, 1, size, file);
        bytes_written_.fetch_add(written, std::memory_order_relaxed);
        if (written != size) {
            io_error_ = fmt::format("Failed to write {}: {}", spec_.destination, std::strerror(errno));
            return false;
        }
        return true;
    }

    [[nodiscard]] bool shouldAbort() const override { return token_.isCancellationRequested(); }

private:
    enum class State {
        Pending,
        Running,
        Finished,
    };

    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    TaskOutcome transfer() {
        if (token_.isCancellationRequested()) {
            spdlog::debug("{}: cancelled before start", spec_.destination);
            return TaskOutcome::interrupted(0);
        }

        if (auto error = openDestination(); !error.empty()) {
            return TaskOutcome::failed(ErrorKind::IoError, std::move(error));
        }

        spdlog::debug("{}: fetching {}", spec_.destination, spec_.url);
        const FetchResult fetched = transport_->fetch(spec_.url, *this);

        // Whatever happened, the bytes written so far are made durable first.
        const std::string close_error = closeFile();
        const std::uint64_t bytes = bytes_written_.load(std::memory_order_relaxed);

        if (!io_error_.empty()) {
            return TaskOutcome::failed(ErrorKind::IoError, io_error_, bytes);
        }
        if (!close_error.empty()) {
            return TaskOutcome::failed(ErrorKind::IoError, close_error, bytes);
        }

        // Cancellation wins over a transfer that happened to finish in the same chunk.
        if (cancelled_ || token_.isCancellationRequested()) {
            return TaskOutcome::interrupted(bytes);
        }

        switch (fetched.status) {
        case FetchStatus::Failed:
            return TaskOutcome::failed(ErrorKind::TransportError, fetched.message, bytes);
        case FetchStatus::Aborted:
            return TaskOutcome::failed(ErrorKind::TransportError,
                                       "transfer aborted without cause: " + fetched.message, bytes);
        case FetchStatus::Finished:
            break;
        }

        if (spec_.expected_size && *spec_.expected_size != bytes) {
            return TaskOutcome::failed(
                ErrorKind::TransportError,
                fmt::format("size mismatch: expected {} bytes, received {}", *spec_.expected_size, bytes),
                bytes);
        }

        return TaskOutcome::completed(bytes);
    }

    std::string openDestination() {
        const std::filesystem::path path{spec_.destination};
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return fmt::format("Cannot create directory {}: {}", path.parent_path().string(),
                                   ec.message());
            }
        }

        file_.reset(std::fopen(spec_.destination.c_str(), "wb"));
        if (!file_) {
            return fmt::format("Cannot create destination file {}: {}", spec_.destination,
                               std::strerror(errno));
        }
        return {};
    }

    // Flushes, syncs and closes; returns an error description or empty.
    std::string closeFile() {
        if (!file_) {
            return {};
        }

        std::string error;
        if (std::fflush(file_.get()) != 0 || ::fsync(::fileno(file_.get())) != 0) {
            error = fmt::format("Failed to flush {}: {}", spec_.destination, std::strerror(errno));
        }

        FILE* raw = file_.release();
        if (std::fclose(raw) != 0 && error.empty()) {
            error = fmt::format("Failed to close {}: {}", spec_.destination, std::strerror(errno));
        }
        return error;
    }

    const std::size_t task_id_;
    const DownloadSpec spec_;
    TransportPtr transport_;
    const CancellationToken& token_;

    std::unique_ptr<FILE, FileDeleter> file_{};

    std::atomic<State> state_{State::Pending};
    std::atomic<std::uint64_t> bytes_written_{0};

    // Touched only on the thread executing run().
    bool cancelled_{false};
    std::string io_error_;
};

StreamingDownload::StreamingDownload(std::size_t task_id, DownloadSpec spec, TransportPtr transport,
                                     const CancellationToken& token)
    : impl_(std::make_unique<Impl>(task_id, std::move(spec), std::move(transport), token)) {}

StreamingDownload::~StreamingDownload() = default;

TaskOutcome StreamingDownload::run() { return impl_->run(); }

Progress StreamingDownload::getProgress() const { return impl_->getProgress(); }

bool StreamingDownload::isRunning() const { return impl_->isRunning(); }

bool StreamingDownload::isFinished() const { return impl_->isFinished(); }

} // namespace parafetch
