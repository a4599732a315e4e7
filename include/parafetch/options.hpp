#pragma once

#include "download_spec.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/common.h>

namespace parafetch {

struct CliOptions {
    std::optional<std::filesystem::path> manifest;
    std::filesystem::path out_dir{"out"};
    // Positional "<url> <file>" pairs, file relative to out_dir.
    std::vector<std::pair<std::string, std::string>> downloads;

    std::size_t max_concurrency{0};
    std::chrono::seconds grace_period{10};
    std::chrono::seconds connect_timeout{30};
    std::chrono::milliseconds progress_interval{1000};
    std::optional<std::string> report_path;
    spdlog::level::level_enum log_level{spdlog::level::info};

    bool show_help{false};
};

// Throws std::runtime_error on malformed input.
CliOptions parseOptions(int argc, const char* const* argv);

void printUsage(std::ostream& out, const char* program_name);

// Manifest entries first, then positional pairs, all under out_dir.
DownloadSpecs collectSpecs(const CliOptions& options);

} // namespace parafetch
