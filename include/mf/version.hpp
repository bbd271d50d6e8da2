#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define MF_VERSION_MAJOR 0
#define MF_VERSION_MINOR 3
#define MF_VERSION_PATCH 0
#define MF_VERSION_STRING "0.3.0"

namespace mf {

/// Engine version information at compile time.
struct Version {
    static constexpr int major = MF_VERSION_MAJOR;
    static constexpr int minor = MF_VERSION_MINOR;
    static constexpr int patch = MF_VERSION_PATCH;
    static constexpr const char* string = MF_VERSION_STRING;
};

/// Schema version stamped into every serialized fusion signature.
inline constexpr int kSignatureSchemaVersion = 1;

} // namespace mf
