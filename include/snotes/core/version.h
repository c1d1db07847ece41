#pragma once

namespace snotes::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.1.0";

}  // namespace snotes::core
