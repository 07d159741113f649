#pragma once

#include <string_view>

namespace warden::common {

/// Install the process-wide asynchronous "warden" logger.
///
/// Logs go to a colored stdout sink and, when `file` is non-empty, to an
/// appending file sink. `level` uses spdlog level names ("debug", "info", ...).
void configure_logging(std::string_view level, std::string_view file);

}  // namespace warden::common
