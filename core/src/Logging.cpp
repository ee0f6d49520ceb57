#include "posescope/Logging.h"

#include <spdlog/spdlog.h>

namespace posescope {

void configure_logging(const std::string& level) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; only honour "off" when asked for it.
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("[Config] Unknown log level '{}', using info", level);
        return;
    }
    spdlog::set_level(parsed);
}

}  // namespace posescope
