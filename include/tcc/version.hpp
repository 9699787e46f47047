#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define TCC_VERSION_MAJOR 0
#define TCC_VERSION_MINOR 3
#define TCC_VERSION_PATCH 0
#define TCC_VERSION_STRING "0.3.0"

namespace tcc {

/// Project version information at compile time.
struct Version {
    static constexpr int major = TCC_VERSION_MAJOR;
    static constexpr int minor = TCC_VERSION_MINOR;
    static constexpr int patch = TCC_VERSION_PATCH;
    static constexpr const char* string = TCC_VERSION_STRING;
};

} // namespace tcc
