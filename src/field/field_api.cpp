/**
 * @file field_api.cpp
 * @brief C ABI Wrappers for Secp256K1Base
 *
 * Every entry point validates its pointers and returns a
 * secpfield_error_t; no C++ exception crosses this boundary.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "secpfield/secpfield_api.h"
#include "secpfield/field/secp256k1_base.h"

#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>

using secpfield::Secp256K1Base;

namespace {

Secp256K1Base load(const secpfield_fe_t* in) {
    Secp256K1Base::Limbs limbs;
    std::memcpy(limbs.data(), in->limbs, sizeof(in->limbs));
    return Secp256K1Base::from_limbs(limbs);
}

void store(secpfield_fe_t* out, const Secp256K1Base& x) {
    const Secp256K1Base::Limbs limbs = x.to_canonical_limbs();
    std::memcpy(out->limbs, limbs.data(), sizeof(out->limbs));
}

} // namespace

extern "C" {

// ============================================================================
// Conversion
// ============================================================================

secpfield_error_t secpfield_fe_from_u64(secpfield_fe_t* out, uint64_t n) {
    if (!out) return SECPFIELD_ERROR_INVALID_PARAM;
    store(out, Secp256K1Base::from_canonical_u64(n));
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_from_bytes_le(secpfield_fe_t* out,
                                             const uint8_t* in, size_t in_len) {
    if (!out || !in) return SECPFIELD_ERROR_INVALID_PARAM;
    if (in_len != SECPFIELD_FE_BYTES) return SECPFIELD_ERROR_INVALID_PARAM;

    // Raw limbs, kept as given
    const Secp256K1Base x = Secp256K1Base::from_bytes_le(in, in_len);
    std::memcpy(out->limbs, x.limbs().data(), sizeof(out->limbs));
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_to_bytes_le(const secpfield_fe_t* a,
                                           uint8_t* out, size_t out_len) {
    if (!a || !out) return SECPFIELD_ERROR_INVALID_PARAM;
    if (out_len < SECPFIELD_FE_BYTES) return SECPFIELD_ERROR_BUFFER_TOO_SMALL;

    const auto bytes = load(a).to_bytes_le();
    std::memcpy(out, bytes.data(), bytes.size());
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_to_canonical_bytes_le(const secpfield_fe_t* a,
                                                     uint8_t* out, size_t out_len) {
    if (!a || !out) return SECPFIELD_ERROR_INVALID_PARAM;
    if (out_len < SECPFIELD_FE_BYTES) return SECPFIELD_ERROR_BUFFER_TOO_SMALL;

    const auto bytes = load(a).to_canonical_bytes_le();
    std::memcpy(out, bytes.data(), bytes.size());
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_to_decimal(const secpfield_fe_t* a, char* out, size_t out_len) {
    if (!a || !out) return SECPFIELD_ERROR_INVALID_PARAM;

    try {
        const std::string text = load(a).to_string();
        if (out_len < text.size() + 1) return SECPFIELD_ERROR_BUFFER_TOO_SMALL;
        std::memcpy(out, text.c_str(), text.size() + 1);
    } catch (const std::exception&) {
        return SECPFIELD_ERROR_INTERNAL;
    }
    return SECPFIELD_SUCCESS;
}

// ============================================================================
// Arithmetic
// ============================================================================

secpfield_error_t secpfield_fe_add(secpfield_fe_t* r, const secpfield_fe_t* a,
                                   const secpfield_fe_t* b) {
    if (!r || !a || !b) return SECPFIELD_ERROR_INVALID_PARAM;
    store(r, load(a) + load(b));
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_sub(secpfield_fe_t* r, const secpfield_fe_t* a,
                                   const secpfield_fe_t* b) {
    if (!r || !a || !b) return SECPFIELD_ERROR_INVALID_PARAM;
    store(r, load(a) - load(b));
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_mul(secpfield_fe_t* r, const secpfield_fe_t* a,
                                   const secpfield_fe_t* b) {
    if (!r || !a || !b) return SECPFIELD_ERROR_INVALID_PARAM;
    store(r, load(a) * load(b));
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_neg(secpfield_fe_t* r, const secpfield_fe_t* a) {
    if (!r || !a) return SECPFIELD_ERROR_INVALID_PARAM;
    store(r, -load(a));
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_inv(secpfield_fe_t* r, const secpfield_fe_t* a) {
    if (!r || !a) return SECPFIELD_ERROR_INVALID_PARAM;
    const auto inv = load(a).try_inverse();
    if (!inv) return SECPFIELD_ERROR_NO_INVERSE;
    store(r, *inv);
    return SECPFIELD_SUCCESS;
}

secpfield_error_t secpfield_fe_div(secpfield_fe_t* r, const secpfield_fe_t* a,
                                   const secpfield_fe_t* b) {
    if (!r || !a || !b) return SECPFIELD_ERROR_INVALID_PARAM;
    const auto q = load(a).try_div(load(b));
    if (!q) return SECPFIELD_ERROR_DIVISION_BY_ZERO;
    store(r, *q);
    return SECPFIELD_SUCCESS;
}

// ============================================================================
// Predicates and Sampling
// ============================================================================

int secpfield_fe_equal(const secpfield_fe_t* a, const secpfield_fe_t* b) {
    if (!a || !b) return 0;
    return load(a) == load(b) ? 1 : 0;
}

int secpfield_fe_is_canonical(const secpfield_fe_t* a) {
    if (!a) return 0;
    return load(a).is_canonical() ? 1 : 0;
}

secpfield_error_t secpfield_fe_random(secpfield_fe_t* out) {
    if (!out) return SECPFIELD_ERROR_INVALID_PARAM;
    try {
        store(out, Secp256K1Base::rand());
    } catch (const std::runtime_error&) {
        return SECPFIELD_ERROR_RANDOM_FAILED;
    }
    return SECPFIELD_SUCCESS;
}

} // extern "C"
