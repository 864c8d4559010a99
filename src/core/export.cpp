/**
 * @file export.cpp
 * @brief Library export and initialization functions
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "secpfield/secpfield_api.h"

#include <atomic>

// Global initialization state, safe to query from several threads
static std::atomic<int> g_secpfield_initialized{0};

extern "C" {

const char* secpfield_version(void) {
    return SECPFIELD_VERSION_STRING;
}

const char* secpfield_platform(void) {
    return SECPFIELD_PLATFORM_NAME;
}

secpfield_error_t secpfield_init(void) {
    if (g_secpfield_initialized.load(std::memory_order_acquire)) {
        return SECPFIELD_SUCCESS;
    }

    // Probe the entropy source once so sampling failures surface early
    uint8_t probe[16];
    if (secpfield_random_bytes(probe, sizeof(probe)) != SECPFIELD_SUCCESS) {
        return SECPFIELD_ERROR_RANDOM_FAILED;
    }
    secpfield_secure_zero(probe, sizeof(probe));

    g_secpfield_initialized.store(1, std::memory_order_release);
    return SECPFIELD_SUCCESS;
}

void secpfield_cleanup(void) {
    g_secpfield_initialized.store(0, std::memory_order_release);
}

const char* secpfield_error_string(secpfield_error_t error) {
    switch (error) {
        case SECPFIELD_SUCCESS:
            return "Success";
        case SECPFIELD_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case SECPFIELD_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case SECPFIELD_ERROR_INTERNAL:
            return "Internal error";
        case SECPFIELD_ERROR_RANDOM_FAILED:
            return "Random source failed";
        case SECPFIELD_ERROR_NO_INVERSE:
            return "Zero has no multiplicative inverse";
        case SECPFIELD_ERROR_DIVISION_BY_ZERO:
            return "Division by zero";
        default:
            return "Unknown error";
    }
}

} // extern "C"
