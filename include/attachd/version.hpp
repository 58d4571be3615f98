/*
 * Version header for attachd
 *
 * The build system passes ATTACHD_VERSION_* definitions from project(); the
 * fallbacks below keep the header usable when compiled outside CMake.
 */

#pragma once

#ifndef ATTACHD_VERSION_MAJOR
#define ATTACHD_VERSION_MAJOR 0
#endif

#ifndef ATTACHD_VERSION_MINOR
#define ATTACHD_VERSION_MINOR 1
#endif

#ifndef ATTACHD_VERSION_PATCH
#define ATTACHD_VERSION_PATCH 0
#endif

#ifndef ATTACHD_VERSION_STRING
#define ATTACHD_VERSION_STRING "0.1.0+dev"
#endif

#if defined(__cplusplus)
namespace attachd {
namespace version {
constexpr int major_v = ATTACHD_VERSION_MAJOR;
constexpr int minor_v = ATTACHD_VERSION_MINOR;
constexpr int patch_v = ATTACHD_VERSION_PATCH;
constexpr const char* string_v = ATTACHD_VERSION_STRING;
} // namespace version
} // namespace attachd
#endif
