/**
 * @file security.h
 * @brief Platform CSPRNG and secure memory helpers for secpfield
 *
 * The random source behind Secp256K1Base::rand() and the C ABI sampling
 * entry point:
 * - Windows: BCryptGenRandom
 * - Linux: getrandom() syscall or /dev/urandom
 * - macOS: SecRandomCopyBytes
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SECPFIELD_CORE_SECURITY_H
#define SECPFIELD_CORE_SECURITY_H

#include "secpfield/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Cryptographically secure random bytes
 *
 * @param buf Buffer to fill with random bytes
 * @param len Number of random bytes to generate
 * @return SECPFIELD_SUCCESS on success, SECPFIELD_ERROR_RANDOM_FAILED on error
 */
SECPFIELD_API int secpfield_random_bytes(void* buf, size_t len);

/**
 * @brief Secure memory zeroing
 *
 * Guaranteed not to be optimized away by the compiler.
 *
 * @param ptr Pointer to memory to zero
 * @param len Number of bytes to zero
 */
SECPFIELD_API void secpfield_secure_zero(void* ptr, size_t len);

#ifdef __cplusplus
} // extern "C"

namespace secpfield {
namespace internal {

int random_bytes(void* buf, size_t len);
void secure_zero(void* ptr, size_t len);

} // namespace internal
} // namespace secpfield

#endif // __cplusplus

#endif // SECPFIELD_CORE_SECURITY_H
