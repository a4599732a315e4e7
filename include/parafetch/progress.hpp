#pragma once

#include <cstdint>
#include <string>

namespace parafetch {

struct Progress {
    std::string url;
    std::string destination;
    std::uint64_t expected_bytes{0};
    std::uint64_t downloaded_bytes{0};
    bool is_running{false};
    bool is_finished{false};
};

} // namespace parafetch
