#pragma once

/// @file version.hpp
/// @brief Project version information.

#define TMAUTH_VERSION_MAJOR 0
#define TMAUTH_VERSION_MINOR 3
#define TMAUTH_VERSION_PATCH 0
#define TMAUTH_VERSION_STRING "0.3.0"

namespace tmauth {

/// Compile-time project version.
struct Version {
    static constexpr int major = TMAUTH_VERSION_MAJOR;
    static constexpr int minor = TMAUTH_VERSION_MINOR;
    static constexpr int patch = TMAUTH_VERSION_PATCH;
    static constexpr const char* string = TMAUTH_VERSION_STRING;
};

} // namespace tmauth
