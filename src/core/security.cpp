/**
 * @file security.cpp
 * @brief Platform CSPRNG and Secure Zeroing
 *
 * Entropy for field element sampling:
 * - Linux: getrandom syscall, /dev/urandom fallback
 * - Windows: BCryptGenRandom
 * - macOS: SecRandomCopyBytes
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "secpfield/core/security.h"
#include "secpfield/core/common.h"
#include <cstring>
#include <cstdint>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <bcrypt.h>
#ifndef STATUS_SUCCESS
constexpr NTSTATUS SECPFIELD_STATUS_SUCCESS = 0x00000000L;
#define STATUS_SUCCESS SECPFIELD_STATUS_SUCCESS
#endif
#else
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#if defined(__linux__)
// sys/random.h needs glibc 2.25+, go through syscall() instead
#include <sys/syscall.h>
#ifdef SYS_getrandom
#define SECPFIELD_HAS_GETRANDOM_SYSCALL 1
static inline ssize_t secpfield_getrandom(void* buf, size_t len, unsigned int flags) {
    return syscall(SYS_getrandom, buf, len, flags);
}
#endif
#elif defined(__APPLE__)
#include <Security/SecRandom.h>
#endif
#endif

namespace secpfield {
namespace internal {

#if defined(__GNUC__) || defined(__clang__)
#define SECPFIELD_COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#elif defined(_MSC_VER)
#include <intrin.h>
#define SECPFIELD_COMPILER_BARRIER() _ReadWriteBarrier()
#else
#define SECPFIELD_COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Zeroing
// ============================================================================

// Called through a volatile pointer so the stores survive dead-store elimination
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;

#ifdef _WIN32
    SecureZeroMemory(ptr, len);
#else
    secure_zero_ptr(ptr, len);
#endif

    SECPFIELD_COMPILER_BARRIER();
}

// ============================================================================
// CSPRNG
// ============================================================================

#ifdef _WIN32

int random_bytes(void* buf, size_t len) {
    if (!buf) return SECPFIELD_ERROR_INVALID_PARAM;
    if (len == 0) return SECPFIELD_SUCCESS;

    NTSTATUS status = BCryptGenRandom(
        nullptr,
        static_cast<PUCHAR>(buf),
        static_cast<ULONG>(len),
        BCRYPT_USE_SYSTEM_PREFERRED_RNG
    );

    return (status == STATUS_SUCCESS) ? SECPFIELD_SUCCESS : SECPFIELD_ERROR_RANDOM_FAILED;
}

#elif defined(__APPLE__)

int random_bytes(void* buf, size_t len) {
    if (!buf) return SECPFIELD_ERROR_INVALID_PARAM;
    if (len == 0) return SECPFIELD_SUCCESS;

    if (SecRandomCopyBytes(kSecRandomDefault, len, buf) == errSecSuccess) {
        return SECPFIELD_SUCCESS;
    }
    return SECPFIELD_ERROR_RANDOM_FAILED;
}

#else

static int read_urandom(unsigned char* p, size_t remaining) {
    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return SECPFIELD_ERROR_RANDOM_FAILED;
    }

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return SECPFIELD_ERROR_RANDOM_FAILED;
        }
        if (ret == 0) {
            close(fd);
            return SECPFIELD_ERROR_RANDOM_FAILED;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    close(fd);
    return SECPFIELD_SUCCESS;
}

int random_bytes(void* buf, size_t len) {
    if (!buf) return SECPFIELD_ERROR_INVALID_PARAM;
    if (len == 0) return SECPFIELD_SUCCESS;

    unsigned char* p = static_cast<unsigned char*>(buf);
    size_t remaining = len;

#ifdef SECPFIELD_HAS_GETRANDOM_SYSCALL
    while (remaining > 0) {
        ssize_t ret = secpfield_getrandom(p, remaining, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            // ENOSYS and friends: use /dev/urandom for the rest
            break;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }
    if (remaining == 0) return SECPFIELD_SUCCESS;
#endif

    return read_urandom(p, remaining);
}

#endif

}  // namespace internal
}  // namespace secpfield

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

void secpfield_secure_zero(void* ptr, size_t len) {
    secpfield::internal::secure_zero(ptr, len);
}

int secpfield_random_bytes(void* buf, size_t len) {
    return secpfield::internal::random_bytes(buf, len);
}

}  // extern "C"
