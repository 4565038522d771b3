#pragma once

namespace uidkit::core {

// kBuildVersion is the current software version string.
// Updated once per release.
constexpr const char* kBuildVersion = "0.3";

}  // namespace uidkit::core
