#include "parafetch/cancellation_token.hpp"
#include "parafetch/curl_transport.hpp"
#include "parafetch/exit_codes.hpp"
#include "parafetch/logging.hpp"
#include "parafetch/manifest.hpp"
#include "parafetch/options.hpp"
#include "parafetch/signal_coordinator.hpp"
#include "parafetch/state_reporter.hpp"
#include "parafetch/task_scheduler.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

namespace {

int runDownloads(const parafetch::CliOptions& options) {
    using namespace parafetch;

    const DownloadSpecs specs = collectSpecs(options);
    TaskScheduler::validate(specs);

    std::error_code ec;
    std::filesystem::create_directories(options.out_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create download directory: "
            + options.out_dir.string() + " - " + ec.message());
    }

    auto reporter = options.report_path ? std::make_unique<StateReporter>(*options.report_path)
                                        : std::make_unique<StateReporter>(stdout);

    CancellationToken token;

    SignalCoordinator::Options signal_options;
    signal_options.grace_period = options.grace_period;
    SignalCoordinator coordinator(token, signal_options, SignalCoordinator::exitAfterSealing(*reporter));
    coordinator.install();
    coordinator.start();

    CurlTransport::Options transport_options;
    transport_options.connect_timeout = options.connect_timeout;
    auto transport = std::make_shared<CurlTransport>(transport_options);

    TaskScheduler::Options scheduler_options;
    scheduler_options.max_concurrency = options.max_concurrency;
    scheduler_options.progress_interval = options.progress_interval;
    scheduler_options.on_drained = [&coordinator] { coordinator.notifyDrained(); };
    TaskScheduler scheduler(token, *reporter, TaskScheduler::streamingFactory(transport),
                            scheduler_options);

    const RunSummary summary = scheduler.run(specs);
    coordinator.stop();
    coordinator.uninstall();

    return summary.exitCode();
}

} // namespace

int main(int argc, char** argv) {
    parafetch::CliOptions options;
    try {
        options = parafetch::parseOptions(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        parafetch::printUsage(std::cerr, argv[0]);
        return parafetch::kExitUsage;
    }

    if (options.show_help) {
        parafetch::printUsage(std::cout, argv[0]);
        return parafetch::kExitSuccess;
    }

    try {
        parafetch::initLogging(options.log_level);
        return runDownloads(options);
    } catch (const parafetch::ManifestError& ex) {
        spdlog::error("Failed to load manifest: {}", ex.what());
        return parafetch::kExitUsage;
    } catch (const parafetch::SchedulingError& ex) {
        spdlog::error("Refusing to start: {}", ex.what());
        return parafetch::kExitUsage;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return parafetch::kExitFailed;
    }
}
