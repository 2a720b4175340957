#pragma once

/// @file version.hpp
/// @brief Project version information.

#define FTR_VERSION_MAJOR 1
#define FTR_VERSION_MINOR 2
#define FTR_VERSION_PATCH 0
#define FTR_VERSION_STRING "1.2.0"

namespace ftr {

struct Version {
    static constexpr int major = FTR_VERSION_MAJOR;
    static constexpr int minor = FTR_VERSION_MINOR;
    static constexpr int patch = FTR_VERSION_PATCH;
    static constexpr const char* string = FTR_VERSION_STRING;
};

} // namespace ftr
