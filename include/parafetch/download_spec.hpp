#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parafetch {

struct DownloadSpec {
    std::string url;
    std::string destination;
    std::optional<std::uint64_t> expected_size;
};

using DownloadSpecs = std::vector<DownloadSpec>;

} // namespace parafetch
