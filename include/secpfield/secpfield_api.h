/**
 * @file secpfield_api.h
 * @brief secpfield Public C API Header
 *
 * Plain-C access to the secp256k1 base field, for callers that cannot
 * link against the C++ classes. Elements travel as 8 little-endian
 * 32-bit limbs, the same layout as the 32-byte wire form.
 *
 * Usage:
 * @code
 *   #include <secpfield/secpfield_api.h>
 *
 *   secpfield_fe_t a, b, c;
 *   secpfield_fe_from_u64(&a, 3);
 *   secpfield_fe_from_u64(&b, 5);
 *   secpfield_fe_div(&c, &a, &b);   // SECPFIELD_ERROR_DIVISION_BY_ZERO if b == 0
 * @endcode
 *
 * All outputs are canonical. Inputs may hold any 256-bit pattern.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SECPFIELD_API_H
#define SECPFIELD_API_H

#include <stdint.h>
#include <stddef.h>

#include "secpfield/version.h"
#include "secpfield/core/common.h"
#include "secpfield/core/security.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Types
 * ============================================================================ */

/**
 * @brief Field element, limbs[0] least significant
 */
typedef struct {
    uint32_t limbs[SECPFIELD_FE_LIMBS];
} secpfield_fe_t;

/* ============================================================================
 * Library
 * ============================================================================ */

/**
 * @brief Library version string, e.g. "1.0.0"
 */
SECPFIELD_API const char* secpfield_version(void);

/**
 * @brief Name of the platform the library was built for
 */
SECPFIELD_API const char* secpfield_platform(void);

/**
 * @brief Check that the OS entropy source is usable
 * @return SECPFIELD_SUCCESS or SECPFIELD_ERROR_RANDOM_FAILED
 */
SECPFIELD_API secpfield_error_t secpfield_init(void);

SECPFIELD_API void secpfield_cleanup(void);

/* ============================================================================
 * Conversion
 * ============================================================================ */

SECPFIELD_API secpfield_error_t secpfield_fe_from_u64(secpfield_fe_t* out, uint64_t n);

/**
 * @brief Load 32 little-endian bytes as raw limbs (no reduction)
 */
SECPFIELD_API secpfield_error_t secpfield_fe_from_bytes_le(secpfield_fe_t* out,
                                                           const uint8_t* in, size_t in_len);

/**
 * @brief Write the stored limbs as 32 little-endian bytes (not reduced)
 *
 * Inverse of secpfield_fe_from_bytes_le, so non-canonical patterns survive.
 */
SECPFIELD_API secpfield_error_t secpfield_fe_to_bytes_le(const secpfield_fe_t* a,
                                                         uint8_t* out, size_t out_len);

/**
 * @brief Write the canonical value as 32 little-endian bytes
 */
SECPFIELD_API secpfield_error_t secpfield_fe_to_canonical_bytes_le(const secpfield_fe_t* a,
                                                                   uint8_t* out, size_t out_len);

/**
 * @brief Canonical value as NUL-terminated decimal text
 *
 * out_len must be at least SECPFIELD_FE_DECIMAL_MAX + 1.
 */
SECPFIELD_API secpfield_error_t secpfield_fe_to_decimal(const secpfield_fe_t* a,
                                                        char* out, size_t out_len);

/* ============================================================================
 * Arithmetic
 * ============================================================================ */

SECPFIELD_API secpfield_error_t secpfield_fe_add(secpfield_fe_t* r, const secpfield_fe_t* a,
                                                 const secpfield_fe_t* b);
SECPFIELD_API secpfield_error_t secpfield_fe_sub(secpfield_fe_t* r, const secpfield_fe_t* a,
                                                 const secpfield_fe_t* b);
SECPFIELD_API secpfield_error_t secpfield_fe_mul(secpfield_fe_t* r, const secpfield_fe_t* a,
                                                 const secpfield_fe_t* b);
SECPFIELD_API secpfield_error_t secpfield_fe_neg(secpfield_fe_t* r, const secpfield_fe_t* a);

/**
 * @brief r = a^(-1)
 * @return SECPFIELD_ERROR_NO_INVERSE when a is zero, r untouched
 */
SECPFIELD_API secpfield_error_t secpfield_fe_inv(secpfield_fe_t* r, const secpfield_fe_t* a);

/**
 * @brief r = a / b
 * @return SECPFIELD_ERROR_DIVISION_BY_ZERO when b is zero, r untouched
 */
SECPFIELD_API secpfield_error_t secpfield_fe_div(secpfield_fe_t* r, const secpfield_fe_t* a,
                                                 const secpfield_fe_t* b);

/* ============================================================================
 * Predicates and Sampling
 * ============================================================================ */

/**
 * @brief 1 when a and b are the same residue, 0 otherwise (or on NULL input)
 */
SECPFIELD_API int secpfield_fe_equal(const secpfield_fe_t* a, const secpfield_fe_t* b);

/**
 * @brief 1 when the stored limbs are already below the modulus
 */
SECPFIELD_API int secpfield_fe_is_canonical(const secpfield_fe_t* a);

/**
 * @brief Uniform element from the OS CSPRNG
 * @return SECPFIELD_ERROR_RANDOM_FAILED when the entropy source fails
 */
SECPFIELD_API secpfield_error_t secpfield_fe_random(secpfield_fe_t* out);

#ifdef __cplusplus
}
#endif

#endif // SECPFIELD_API_H
