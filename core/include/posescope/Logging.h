#pragma once

#include <string>

namespace posescope {

// Sets the global spdlog level ("trace" .. "off") and the console pattern.
// Unknown level names fall back to "info" with a warning.
void configure_logging(const std::string& level);

}  // namespace posescope
