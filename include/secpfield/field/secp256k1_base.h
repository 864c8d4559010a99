/**
 * @file secp256k1_base.h
 * @brief secp256k1 Base Field Element for non-native circuit arithmetic
 *
 * Field of order
 *   P = 2^256 - 2^32 - 2^9 - 2^8 - 2^7 - 2^6 - 2^4 - 1
 *
 * Features:
 * - 8 x 32-bit little-endian limb storage (the wire form)
 * - Storage may hold any 256-bit representative of a residue class;
 *   equality, hashing and text output always go through the canonical form
 * - Every arithmetic result is stored canonical (< P)
 * - Fermat inversion, rejection sampling, verified group generators
 *
 * Instances are plain values: no shared state, safe to use from many
 * threads as long as each thread works on its own copies.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SECPFIELD_FIELD_SECP256K1_BASE_H
#define SECPFIELD_FIELD_SECP256K1_BASE_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <functional>
#include <optional>
#include <ostream>
#include <random>
#include <string>
#include <vector>

#include "secpfield/core/common.h"
#include "secpfield/core/bigint.h"
#include "secpfield/internal/trace.h"

namespace secpfield {

// ============================================================================
// Modulus
// ============================================================================

/**
 * @brief secp256k1 prime: p = 2^256 - 2^32 - 977
 */
SECPFIELD_API const BigInt256& secp256k1_p();

namespace secp256k1_reduce {

/**
 * @brief Reduce a full 512-bit product: r = a mod p
 *
 * Uses identity: 2^256 = 2^32 + 977 (mod p)
 * c = 0x1000003D1 = 2^32 + 977
 * The result is always fully reduced (r < p).
 */
SECPFIELD_API void reduce_wide(BigInt256& r, const BigInt512& a) noexcept;

/**
 * @brief Reduce any 256-bit value: r = a mod p
 *
 * 2^256 < 2p, so at most one subtraction is needed.
 */
SECPFIELD_API void reduce(BigInt256& r, const BigInt256& a) noexcept;

} // namespace secp256k1_reduce

// ============================================================================
// Secp256K1Base
// ============================================================================

class SECPFIELD_API Secp256K1Base {
public:
    static constexpr size_t NUM_LIMBS = SECPFIELD_FE_LIMBS;
    static constexpr size_t BYTE_SIZE = SECPFIELD_FE_BYTES;
    static constexpr size_t BITS = 256;

    /// Largest n such that 2^n divides p - 1
    static constexpr size_t TWO_ADICITY = 1;

    using Limbs = std::array<uint32_t, NUM_LIMBS>;

    static const Secp256K1Base ZERO;
    static const Secp256K1Base ONE;
    static const Secp256K1Base TWO;
    static const Secp256K1Base NEG_ONE;

    /// Smallest generator of the multiplicative group (3)
    static const Secp256K1Base MULTIPLICATIVE_GROUP_GENERATOR;

    /// Generator of the order-2^TWO_ADICITY subgroup, g^((p-1)/2) = -1
    static const Secp256K1Base POWER_OF_TWO_GENERATOR;

    // ========================================================================
    // Construction
    // ========================================================================

    /** @brief Zero */
    constexpr Secp256K1Base() noexcept : limbs_{} {}

    /** @brief Raw limbs, stored as given (may be non-canonical) */
    constexpr explicit Secp256K1Base(const Limbs& limbs) noexcept : limbs_(limbs) {}

    static Secp256K1Base from_limbs(const Limbs& limbs) noexcept {
        return Secp256K1Base(limbs);
    }

    /**
     * @brief Store the 256-bit value as limbs, without reduction
     *
     * The caller must pass v < P to get a canonical instance. Larger
     * values are still valid representatives and compare correctly,
     * they are just not in canonical storage.
     */
    static Secp256K1Base from_value(const BigInt256& v) noexcept;

    /** @brief Reduce v modulo P and store the canonical result */
    static Secp256K1Base from_biguint(const BigInt256& v) noexcept;

    static Secp256K1Base from_bool(bool b) noexcept {
        return from_canonical_u64(b ? 1 : 0);
    }

    static Secp256K1Base from_canonical_u8(uint8_t n) noexcept { return from_canonical_u64(n); }
    static Secp256K1Base from_canonical_u16(uint16_t n) noexcept { return from_canonical_u64(n); }
    static Secp256K1Base from_canonical_u32(uint32_t n) noexcept { return from_canonical_u64(n); }

    /** @brief Limbs 0-1 hold n, always exactly n on canonicalization */
    static Secp256K1Base from_canonical_u64(uint64_t n) noexcept {
        return Secp256K1Base(Limbs{{static_cast<uint32_t>(n), static_cast<uint32_t>(n >> 32),
                                    0, 0, 0, 0, 0, 0}});
    }

    /** @brief Any u64 is already below P */
    static Secp256K1Base from_noncanonical_u64(uint64_t n) noexcept {
        return from_canonical_u64(n);
    }

    /**
     * @brief 96-bit value lo + hi * 2^64
     *
     * lo fills limbs 0-1, hi fills limb 2.
     */
    static Secp256K1Base from_noncanonical_u96(uint64_t lo, uint32_t hi) noexcept {
        return Secp256K1Base(Limbs{{static_cast<uint32_t>(lo), static_cast<uint32_t>(lo >> 32),
                                    hi, 0, 0, 0, 0, 0}});
    }

    /** @brief 128-bit value lo + hi * 2^64 in limbs 0-3 */
    static Secp256K1Base from_noncanonical_u128(uint64_t lo, uint64_t hi) noexcept {
        return Secp256K1Base(Limbs{{static_cast<uint32_t>(lo), static_cast<uint32_t>(lo >> 32),
                                    static_cast<uint32_t>(hi), static_cast<uint32_t>(hi >> 32),
                                    0, 0, 0, 0}});
    }

#ifdef SECPFIELD_HAS_INT128
    static Secp256K1Base from_noncanonical_u128(uint128_t n) noexcept {
        return from_noncanonical_u128(static_cast<uint64_t>(n), static_cast<uint64_t>(n >> 64));
    }
#endif

    /** @brief Parse decimal text, reducing modulo P; throws std::invalid_argument */
    static Secp256K1Base from_decimal(const std::string& dec);

    /** @brief Parse hex text, reducing modulo P; throws std::invalid_argument */
    static Secp256K1Base from_hex(const std::string& hex);

    // ========================================================================
    // Wire Form
    // ========================================================================

    /** @brief Stored limbs, not necessarily canonical */
    const Limbs& limbs() const noexcept { return limbs_; }

    /** @brief Raw limbs as 32 little-endian bytes */
    std::array<uint8_t, BYTE_SIZE> to_bytes_le() const noexcept;

    /** @brief Canonical value as 32 little-endian bytes */
    std::array<uint8_t, BYTE_SIZE> to_canonical_bytes_le() const noexcept;

    /**
     * @brief Rebuild from the raw wire form
     *
     * Accepts any 256-bit pattern; len must be exactly 32, otherwise
     * std::invalid_argument is thrown.
     */
    static Secp256K1Base from_bytes_le(const uint8_t* data, size_t len);

    // ========================================================================
    // Canonical Form
    // ========================================================================

    /** @brief Residue in [0, P) */
    BigInt256 to_canonical() const noexcept;

    Limbs to_canonical_limbs() const noexcept;

    /** @brief Same value with canonical storage */
    Secp256K1Base canonicalized() const noexcept {
        return Secp256K1Base(to_canonical_limbs());
    }

    /** @brief True when the stored limbs are already < P */
    bool is_canonical() const noexcept;

    /** @brief Canonical value in decimal */
    std::string to_string() const;

    /** @brief Hash of the canonical 64-bit digits */
    size_t hash() const noexcept;

    bool is_zero() const noexcept;
    bool is_one() const noexcept;

    // ========================================================================
    // Field Parameters
    // ========================================================================

    static const BigInt256& order() noexcept { return secp256k1_p(); }

    /// Size of the additive group generated by ONE, i.e. P itself
    static BigInt256 characteristic() noexcept { return secp256k1_p(); }

    /**
     * @brief Prime factors of P - 1: 2, 3, 7, 13441 and a 237-bit cofactor
     */
    static const std::vector<BigInt256>& multiplicative_group_factors();

    /**
     * @brief g generates F_p^* iff g^((p-1)/q) != 1 for every prime q | p-1
     */
    static bool is_multiplicative_generator(const Secp256K1Base& g);

    /** @brief Smallest integer generator, found by the check above */
    static Secp256K1Base find_multiplicative_generator();

    /**
     * @brief Generator of the subgroup of order 2^n_log
     *
     * Throws std::invalid_argument when n_log > TWO_ADICITY.
     */
    static Secp256K1Base primitive_root_of_unity(size_t n_log);

    /** @brief All 2^n_log powers of primitive_root_of_unity(n_log) */
    static std::vector<Secp256K1Base> two_adic_subgroup(size_t n_log);

    // ========================================================================
    // Arithmetic
    // ========================================================================

    Secp256K1Base operator-() const noexcept;

    Secp256K1Base operator+(const Secp256K1Base& rhs) const noexcept;
    Secp256K1Base operator-(const Secp256K1Base& rhs) const noexcept;
    Secp256K1Base operator*(const Secp256K1Base& rhs) const noexcept;

    /** @brief Throws std::domain_error when rhs is zero */
    Secp256K1Base operator/(const Secp256K1Base& rhs) const;

    Secp256K1Base& operator+=(const Secp256K1Base& rhs) noexcept { return *this = *this + rhs; }
    Secp256K1Base& operator-=(const Secp256K1Base& rhs) noexcept { return *this = *this - rhs; }
    Secp256K1Base& operator*=(const Secp256K1Base& rhs) noexcept { return *this = *this * rhs; }
    Secp256K1Base& operator/=(const Secp256K1Base& rhs) { return *this = *this / rhs; }

    Secp256K1Base doubled() const noexcept { return *this + *this; }
    Secp256K1Base square() const noexcept { return *this * *this; }
    Secp256K1Base cube() const noexcept { return square() * *this; }

    /** @brief this^e by left-to-right square-and-multiply */
    Secp256K1Base exp(const BigInt256& e) const noexcept;

    Secp256K1Base exp_u64(uint64_t e) const noexcept { return exp(BigInt256(e)); }

    /** @brief this^(P-2), empty for zero */
    std::optional<Secp256K1Base> try_inverse() const noexcept;

    /** @brief Throws std::domain_error for zero */
    Secp256K1Base inverse() const;

    /** @brief this / rhs, empty when rhs is zero */
    std::optional<Secp256K1Base> try_div(const Secp256K1Base& rhs) const noexcept;

    // ========================================================================
    // Random Sampling
    // ========================================================================

    /**
     * @brief Uniform element from an injected generator
     *
     * Draws 8 words and rejects any value >= P, so every result is
     * canonical and the single pattern equal to P is never returned.
     *
     * @tparam RNG UniformRandomBitGenerator
     */
    template<typename RNG>
    static Secp256K1Base rand_from_rng(RNG& rng) {
        std::uniform_int_distribution<uint32_t> dist;
        Limbs words;
        size_t rejected = 0;
        for (;;) {
            for (size_t i = 0; i < NUM_LIMBS; ++i) {
                words[i] = dist(rng);
            }
            if (is_below_order(words)) {
                break;
            }
            ++rejected;
        }
        if (rejected != 0) {
            SECPFIELD_FIELD_TRACE("rand_from_rng: rejected " << rejected << " draw(s) >= p");
        }
        return Secp256K1Base(words);
    }

    /** @brief Sample from the OS CSPRNG */
    static Secp256K1Base rand();

    static std::vector<Secp256K1Base> rand_vec(size_t n);

    // ========================================================================
    // Comparison (canonical)
    // ========================================================================

    bool operator==(const Secp256K1Base& other) const noexcept;
    bool operator!=(const Secp256K1Base& other) const noexcept { return !(*this == other); }

private:
    Limbs limbs_;

    static bool is_below_order(const Limbs& words) noexcept;
};

// ============================================================================
// Constants
// ============================================================================

inline const Secp256K1Base Secp256K1Base::ZERO{Secp256K1Base::Limbs{{0, 0, 0, 0, 0, 0, 0, 0}}};
inline const Secp256K1Base Secp256K1Base::ONE{Secp256K1Base::Limbs{{1, 0, 0, 0, 0, 0, 0, 0}}};
inline const Secp256K1Base Secp256K1Base::TWO{Secp256K1Base::Limbs{{2, 0, 0, 0, 0, 0, 0, 0}}};
inline const Secp256K1Base Secp256K1Base::NEG_ONE{Secp256K1Base::Limbs{{
    0xFFFFFC2E, 0xFFFFFFFE, 0xFFFFFFFF, 0xFFFFFFFF,
    0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF}}};
inline const Secp256K1Base Secp256K1Base::MULTIPLICATIVE_GROUP_GENERATOR{
    Secp256K1Base::Limbs{{3, 0, 0, 0, 0, 0, 0, 0}}};
inline const Secp256K1Base Secp256K1Base::POWER_OF_TWO_GENERATOR{Secp256K1Base::Limbs{{
    0xFFFFFC2E, 0xFFFFFFFE, 0xFFFFFFFF, 0xFFFFFFFF,
    0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF}}};

SECPFIELD_API std::ostream& operator<<(std::ostream& os, const Secp256K1Base& x);

} // namespace secpfield

namespace std {

template<>
struct hash<secpfield::Secp256K1Base> {
    size_t operator()(const secpfield::Secp256K1Base& x) const noexcept {
        return x.hash();
    }
};

} // namespace std

#endif // SECPFIELD_FIELD_SECP256K1_BASE_H
