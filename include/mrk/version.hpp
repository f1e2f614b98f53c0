#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define MRK_VERSION_MAJOR 0
#define MRK_VERSION_MINOR 1
#define MRK_VERSION_PATCH 0
#define MRK_VERSION_STRING "0.1.0"

namespace mrk {

/// Project version information at compile time.
struct Version {
    static constexpr int major = MRK_VERSION_MAJOR;
    static constexpr int minor = MRK_VERSION_MINOR;
    static constexpr int patch = MRK_VERSION_PATCH;
    static constexpr const char* string = MRK_VERSION_STRING;
};

} // namespace mrk
