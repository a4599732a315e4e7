#include "parafetch/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace parafetch {

void initLogging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("parafetch");
    if (!logger) {
        logger = spdlog::stderr_color_mt("parafetch");
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace parafetch
