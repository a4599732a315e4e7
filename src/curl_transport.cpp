#include "parafetch/curl_transport.hpp"
#include "parafetch/version.hpp"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace parafetch {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

struct TransferContext {
    StreamSink* sink{nullptr};
    bool aborted_by_sink{false};
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nmemb;
    if (!ctx || !ctx->sink) {
        return 0;
    }
    if (total == 0) {
        return 0;
    }

    // Anything other than `total` makes libcurl stop with CURLE_WRITE_ERROR.
    if (!ctx->sink->onChunk(ptr, total)) {
        ctx->aborted_by_sink = true;
        return 0;
    }
    return total;
}

int xferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(clientp);
    if (ctx && ctx->sink && ctx->sink->shouldAbort()) {
        ctx->aborted_by_sink = true;
        return 1;
    }
    return 0;
}

} // namespace

CurlTransport::CurlTransport() : CurlTransport(Options{}) {}

CurlTransport::CurlTransport(Options options) : options_(std::move(options)) {
    if (options_.user_agent.empty()) {
        options_.user_agent = fmt::format("parafetch/{}", PARAFETCH_VERSION);
    }
    ensureCurlInitialized();
}

FetchResult CurlTransport::fetch(const std::string& url, StreamSink& sink) {
    FetchResult result;

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        result.message = "Failed to allocate curl handle";
        return result;
    }

    TransferContext ctx{&sink, false};
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &xferInfoCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    // Signals belong to the coordinator; libcurl must not install its own handlers.
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    const CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_code);

    if (ctx.aborted_by_sink) {
        result.status = FetchStatus::Aborted;
        result.message = "transfer aborted by receiver";
        return result;
    }

    if (res != CURLE_OK) {
        result.status = FetchStatus::Failed;
        result.message = error_buffer[0] != '\0' ? std::string{error_buffer}
                                                 : std::string{curl_easy_strerror(res)};
        spdlog::debug("GET {} failed: {} (curl code {}, HTTP {})", url, result.message,
                      static_cast<int>(res), result.http_code);
        return result;
    }

    result.status = FetchStatus::Finished;
    spdlog::debug("GET {} finished, HTTP {}", url, result.http_code);
    return result;
}

} // namespace parafetch
