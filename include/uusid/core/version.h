#pragma once

namespace uusid::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "3.0.1";

// kFormatVersion is the version nibble stamped into every time-based id.
constexpr unsigned kFormatVersion = 1;

}  // namespace uusid::core
