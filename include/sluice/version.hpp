#pragma once

/// @file version.hpp
/// @brief Sluice version information and root namespace definition.

#define SLUICE_VERSION_MAJOR 0
#define SLUICE_VERSION_MINOR 3
#define SLUICE_VERSION_PATCH 0
#define SLUICE_VERSION_STRING "0.3.0"

namespace sluice {

/// Library version information at compile time.
struct Version {
    static constexpr int major = SLUICE_VERSION_MAJOR;
    static constexpr int minor = SLUICE_VERSION_MINOR;
    static constexpr int patch = SLUICE_VERSION_PATCH;
    static constexpr const char* string = SLUICE_VERSION_STRING;
};

} // namespace sluice
