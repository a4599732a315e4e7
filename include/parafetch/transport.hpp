#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace parafetch {

// Receives the body of a transfer as it arrives.
class StreamSink {
public:
    virtual ~StreamSink() = default;

    // Returning false aborts the transfer.
    virtual bool onChunk(const char* data, std::size_t size) = 0;

    // Polled while the transfer waits for data.
    [[nodiscard]] virtual bool shouldAbort() const = 0;
};

enum class FetchStatus {
    Finished,
    Aborted,
    Failed,
};

struct FetchResult {
    FetchStatus status{FetchStatus::Failed};
    long http_code{0};
    std::string message;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual FetchResult fetch(const std::string& url, StreamSink& sink) = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace parafetch
