#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define EDEXT_VERSION_MAJOR 0
#define EDEXT_VERSION_MINOR 3
#define EDEXT_VERSION_PATCH 0
#define EDEXT_VERSION_STRING "0.3.0"

namespace edext {

/// Library version information at compile time.
struct Version {
    static constexpr int major = EDEXT_VERSION_MAJOR;
    static constexpr int minor = EDEXT_VERSION_MINOR;
    static constexpr int patch = EDEXT_VERSION_PATCH;
    static constexpr const char* string = EDEXT_VERSION_STRING;
};

} // namespace edext
