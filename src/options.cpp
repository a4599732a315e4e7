#include "parafetch/options.hpp"
#include "parafetch/manifest.hpp"
#include "parafetch/version.hpp"

#include <cstdint>
#include <stdexcept>

#include <fmt/format.h>

namespace parafetch {

namespace {

std::uint64_t parseNumber(const std::string& option, const std::string& value, std::uint64_t max) {
    std::size_t consumed = 0;
    std::uint64_t number = 0;
    try {
        if (value.empty() || value.front() == '-') {
            throw std::invalid_argument(value);
        }
        number = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid value for {}: {}", option, value));
    }
    if (consumed != value.size() || number > max) {
        throw std::runtime_error(fmt::format("Invalid value for {}: {}", option, value));
    }
    return number;
}

spdlog::level::level_enum parseLevel(const std::string& value) {
    const auto level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && value != "off") {
        throw std::runtime_error(fmt::format("Unknown log level: {}", value));
    }
    return level;
}

} // namespace

CliOptions parseOptions(int argc, const char* const* argv) {
    CliOptions options;
    std::vector<std::string> positional;

    int arg_index = 1;
    auto requireValue = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw std::runtime_error(fmt::format("Missing value for {}", option));
        }
        arg_index += 2;
        return argv[arg_index - 1];
    };

    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            options.show_help = true;
            return options;
        } else if (option == "-m" || option == "--manifest") {
            options.manifest = requireValue(option);
        } else if (option == "-d" || option == "--out-dir") {
            options.out_dir = requireValue(option);
        } else if (option == "-j" || option == "--jobs") {
            options.max_concurrency = static_cast<std::size_t>(
                parseNumber(option, requireValue(option), 4096));
        } else if (option == "-g" || option == "--grace") {
            options.grace_period = std::chrono::seconds(parseNumber(option, requireValue(option), 86400));
        } else if (option == "-r" || option == "--report") {
            options.report_path = requireValue(option);
        } else if (option == "--connect-timeout") {
            options.connect_timeout =
                std::chrono::seconds(parseNumber(option, requireValue(option), 3600));
        } else if (option == "--progress") {
            const auto ms = parseNumber(option, requireValue(option), 3600 * 1000);
            if (ms == 0) {
                throw std::runtime_error("Progress interval must be positive");
            }
            options.progress_interval = std::chrono::milliseconds(ms);
        } else if (option == "-l" || option == "--log-level") {
            options.log_level = parseLevel(requireValue(option));
        } else if (option == "--") {
            for (++arg_index; arg_index < argc; ++arg_index) {
                positional.emplace_back(argv[arg_index]);
            }
        } else if (option.size() > 1 && option.front() == '-') {
            throw std::runtime_error(fmt::format("Unknown option: {}", option));
        } else {
            positional.push_back(option);
            ++arg_index;
        }
    }

    if (positional.size() % 2 != 0) {
        throw std::runtime_error("Downloads must be given as <url> <file> pairs");
    }
    for (std::size_t i = 0; i < positional.size(); i += 2) {
        options.downloads.emplace_back(positional[i], positional[i + 1]);
    }

    if (!options.manifest && options.downloads.empty()) {
        throw std::runtime_error("Nothing to download: pass -m <manifest> or <url> <file> pairs");
    }
    return options;
}

void printUsage(std::ostream& out, const char* program_name) {
    out << "parafetch " << PARAFETCH_VERSION << "\n"
        << "Usage: " << program_name << " [options] [-m <manifest>] [<url> <file> ...]\n"
        << "Options:\n"
        << "  -m, --manifest <path>     TOML manifest with [[downloads]] url / file_name /\n"
        << "                            expected_size entries\n"
        << "  -d, --out-dir <dir>       Output directory (default: out)\n"
        << "  -j, --jobs <n>            Maximum concurrent downloads, 0 = unlimited (default: 0)\n"
        << "  -g, --grace <seconds>     Grace period after an interrupt before forcing exit,\n"
        << "                            0 = wait for a second interrupt (default: 10)\n"
        << "  -r, --report <path>       Append state records to <path> instead of stdout\n"
        << "      --connect-timeout <s> Connection timeout in seconds (default: 30)\n"
        << "      --progress <ms>       Progress log interval (default: 1000)\n"
        << "  -l, --log-level <level>   trace, debug, info, warn, error, critical, off\n"
        << "  -h, --help                Show this message\n"
        << "Exit status: 0 all completed, 1 failures, 2 usage error, 3 interrupted,\n"
        << "             130 forced exit\n";
}

DownloadSpecs collectSpecs(const CliOptions& options) {
    DownloadSpecs specs;
    if (options.manifest) {
        specs = toSpecs(loadManifest(*options.manifest), options.out_dir);
    }
    for (const auto& [url, file] : options.downloads) {
        specs.push_back({url, (options.out_dir / file).string(), std::nullopt});
    }
    return specs;
}

} // namespace parafetch
