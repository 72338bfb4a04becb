#include "core/logging.h"
#include <spdlog/spdlog.h>

namespace mobilitykit {

void configure_logging(const Config& config) {
    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to "off"; only honour "off" when asked for.
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("Unknown log level '{}', using info", config.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

}  // namespace mobilitykit
