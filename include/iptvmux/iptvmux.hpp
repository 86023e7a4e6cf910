// IptvMux - IPTV Stream Multiplexing Proxy
// Main header file

#ifndef IPTVMUX_IPTVMUX_HPP
#define IPTVMUX_IPTVMUX_HPP

/**
 * @file iptvmux.hpp
 * @brief Main header file for the IptvMux library
 *
 * IptvMux sits between IPTV players and upstream providers. It shares one
 * upstream connection among every client watching the same stream and
 * admits new upstream connections only while a provider credential has a
 * free slot.
 */

// Version information
#define IPTVMUX_VERSION_MAJOR 0
#define IPTVMUX_VERSION_MINOR 1
#define IPTVMUX_VERSION_PATCH 0
#define IPTVMUX_VERSION_STRING "0.1.0"

// Core types
#include "iptvmux/core/result.hpp"
#include "iptvmux/core/error_codes.hpp"
#include "iptvmux/core/types.hpp"

namespace iptvmux {

/**
 * @brief Get the library version as a string.
 * @return Version string in format "major.minor.patch"
 */
inline const char* version() {
    return IPTVMUX_VERSION_STRING;
}

inline int versionMajor() {
    return IPTVMUX_VERSION_MAJOR;
}

inline int versionMinor() {
    return IPTVMUX_VERSION_MINOR;
}

inline int versionPatch() {
    return IPTVMUX_VERSION_PATCH;
}

} // namespace iptvmux

#endif // IPTVMUX_IPTVMUX_HPP
