#pragma once

#include <spdlog/common.h>

namespace parafetch {

// Installs the "parafetch" stderr logger as spdlog's default logger.
// Report records go elsewhere (stdout or a file), never through it.
void initLogging(spdlog::level::level_enum level);

} // namespace parafetch
