#pragma once

#include "transport.hpp"

#include <chrono>
#include <string>

namespace parafetch {

class CurlTransport final : public Transport {
public:
    struct Options {
        std::chrono::seconds connect_timeout{30};
        std::string user_agent;
    };

    CurlTransport();
    explicit CurlTransport(Options options);

    FetchResult fetch(const std::string& url, StreamSink& sink) override;

private:
    Options options_;
};

} // namespace parafetch
