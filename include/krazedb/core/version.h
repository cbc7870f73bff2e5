#pragma once

namespace krazedb::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "1.0";

}  // namespace krazedb::core
