/**
 * @file version.h
 * @brief secpfield version macros
 *
 * secpfield_version() and the CMake project version are kept in step with
 * SECPFIELD_VERSION_STRING.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SECPFIELD_VERSION_H
#define SECPFIELD_VERSION_H

#define SECPFIELD_VERSION_MAJOR 1
#define SECPFIELD_VERSION_MINOR 0
#define SECPFIELD_VERSION_PATCH 0

#define SECPFIELD_VERSION_STRING "1.0.0"

#define SECPFIELD_LIBRARY_NAME "secpfield"

#ifdef NDEBUG
#define SECPFIELD_BUILD_TYPE "Release"
#else
#define SECPFIELD_BUILD_TYPE "Debug"
#endif

/** True when the headers are version major.minor.patch or newer */
#define SECPFIELD_VERSION_AT_LEAST(major, minor, patch) \
    ((SECPFIELD_VERSION_MAJOR * 10000 + SECPFIELD_VERSION_MINOR * 100 + SECPFIELD_VERSION_PATCH) >= \
     ((major) * 10000 + (minor) * 100 + (patch)))

#endif /* SECPFIELD_VERSION_H */
