#pragma once

namespace chronoid::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.4.0";

}  // namespace chronoid::core
