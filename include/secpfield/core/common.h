/**
 * @file common.h
 * @brief Common definitions and utility macros for secpfield library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef SECPFIELD_CORE_COMMON_H
#define SECPFIELD_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define SECPFIELD_PLATFORM_WINDOWS 1
    #define SECPFIELD_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define SECPFIELD_PLATFORM_LINUX 1
    #define SECPFIELD_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define SECPFIELD_PLATFORM_MACOS 1
    #define SECPFIELD_PLATFORM_NAME "macOS"
#else
    #define SECPFIELD_PLATFORM_UNKNOWN 1
    #define SECPFIELD_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef SECPFIELD_PLATFORM_WINDOWS
    #ifdef SECPFIELD_SHARED_LIBRARY
        #ifdef SECPFIELD_BUILDING
            #define SECPFIELD_API __declspec(dllexport)
        #else
            #define SECPFIELD_API __declspec(dllimport)
        #endif
    #else
        #define SECPFIELD_API
    #endif
#else
    #ifdef SECPFIELD_SHARED_LIBRARY
        #define SECPFIELD_API __attribute__((visibility("default")))
    #else
        #define SECPFIELD_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    SECPFIELD_SUCCESS = 0,
    SECPFIELD_ERROR_INVALID_PARAM = -1,
    SECPFIELD_ERROR_BUFFER_TOO_SMALL = -2,
    SECPFIELD_ERROR_INTERNAL = -3,
    SECPFIELD_ERROR_RANDOM_FAILED = -4,     // CSPRNG failure
    SECPFIELD_ERROR_NO_INVERSE = -5,        // inverse of zero requested
    SECPFIELD_ERROR_DIVISION_BY_ZERO = -6
} secpfield_error_t;

// Field element sizes
#define SECPFIELD_FE_LIMBS        8
#define SECPFIELD_FE_BYTES        32
#define SECPFIELD_FE_DECIMAL_MAX  78   // digits of the largest canonical value

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
SECPFIELD_API const char* secpfield_error_string(secpfield_error_t error);

#ifdef __cplusplus
}
#endif

#endif // SECPFIELD_CORE_COMMON_H
