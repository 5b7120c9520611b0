#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define TSIM_VERSION_MAJOR 0
#define TSIM_VERSION_MINOR 3
#define TSIM_VERSION_PATCH 0
#define TSIM_VERSION_STRING "0.3.0"

namespace tsim {

/// Project version information at compile time.
struct Version {
    static constexpr int major = TSIM_VERSION_MAJOR;
    static constexpr int minor = TSIM_VERSION_MINOR;
    static constexpr int patch = TSIM_VERSION_PATCH;
    static constexpr const char* string = TSIM_VERSION_STRING;
};

} // namespace tsim
