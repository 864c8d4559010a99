/**
 * @file bigint.h
 * @brief Fixed-size Big Integer helper for secpfield
 *
 * Word-array integer arithmetic backing the secp256k1 base field:
 * - BigInt<256> holds field values, BigInt<512> holds full products
 * - Carry-propagating add/sub, widening multiply, long division
 * - Hex and decimal text conversion
 * - Little-endian 64-bit limbs, with 32-bit word import/export
 *
 * Design Principles:
 * - Single header + single implementation file
 * - Compile-time size selection via template parameter
 * - No allocation on the arithmetic paths
 *
 * @author knightc
 * @version 1.0.0
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SECPFIELD_CORE_BIGINT_H
#define SECPFIELD_CORE_BIGINT_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <ostream>
#include <stdexcept>
#include <algorithm>

#include "secpfield/core/common.h"

// Platform detection
#if defined(__x86_64__) || defined(_M_X64)
    #define SECPFIELD_BIGINT_X86_64 1
    #ifdef _MSC_VER
        #include <intrin.h>
    #else
        #include <x86intrin.h>
    #endif
#endif

#if defined(__SIZEOF_INT128__)
    #define SECPFIELD_HAS_INT128 1
#endif

namespace secpfield {

/**
 * @brief Word type for big integer limbs (64-bit)
 */
using limb_t = uint64_t;

#ifdef SECPFIELD_HAS_INT128
using uint128_t = unsigned __int128;
#endif

/**
 * @brief Fixed-size unsigned big integer
 * @tparam BITS Number of bits (must be multiple of 64)
 *
 * Arithmetic wraps modulo 2^BITS; add() and sub() report the carry or
 * borrow so callers can detect it.
 */
template<size_t BITS>
class SECPFIELD_API BigInt {
    static_assert(BITS >= 64 && BITS % 64 == 0, "BITS must be a positive multiple of 64");

public:
    static constexpr size_t NUM_LIMBS = BITS / 64;
    static constexpr size_t NUM_WORDS = BITS / 32;
    static constexpr size_t BYTE_SIZE = BITS / 8;

private:
    std::array<limb_t, NUM_LIMBS> limbs_;

public:
    // ========================================================================
    // Constructors
    // ========================================================================

    /** @brief Default constructor - initializes to zero */
    BigInt() noexcept : limbs_{} {}

    /** @brief Construct from uint64_t */
    explicit BigInt(uint64_t value) noexcept : limbs_{} {
        limbs_[0] = value;
    }

    /** @brief Construct from little-endian 64-bit limbs */
    explicit BigInt(const std::array<limb_t, NUM_LIMBS>& limbs) noexcept : limbs_(limbs) {}

    /** @brief Construct from hex string (optional 0x prefix) */
    explicit BigInt(const std::string& hex) : limbs_{} {
        from_hex(hex);
    }

    /**
     * @brief Build from little-endian 32-bit words
     *
     * Missing high words are zero. Words past the capacity must be zero,
     * otherwise std::invalid_argument is thrown.
     */
    static BigInt from_words(const uint32_t* words, size_t count) {
        BigInt result;
        for (size_t i = 0; i < count; ++i) {
            if (i >= NUM_WORDS) {
                if (words[i] != 0) {
                    throw std::invalid_argument("BigInt: word sequence exceeds capacity");
                }
                continue;
            }
            result.limbs_[i / 2] |= static_cast<limb_t>(words[i]) << ((i % 2) * 32);
        }
        return result;
    }

    /** @brief Parse a decimal string; throws std::invalid_argument */
    static BigInt from_decimal(const std::string& dec);

    // ========================================================================
    // Accessors
    // ========================================================================

    /** @brief Access limb (read-only) */
    limb_t operator[](size_t i) const noexcept { return limbs_[i]; }

    /** @brief Access limb (read-write) */
    limb_t& operator[](size_t i) noexcept { return limbs_[i]; }

    const limb_t* data() const noexcept { return limbs_.data(); }
    limb_t* data() noexcept { return limbs_.data(); }

    static constexpr size_t size() noexcept { return NUM_LIMBS; }

    /** @brief Little-endian 32-bit word view */
    std::array<uint32_t, NUM_WORDS> to_words() const noexcept {
        std::array<uint32_t, NUM_WORDS> words{};
        for (size_t i = 0; i < NUM_LIMBS; ++i) {
            words[2 * i] = static_cast<uint32_t>(limbs_[i]);
            words[2 * i + 1] = static_cast<uint32_t>(limbs_[i] >> 32);
        }
        return words;
    }

    bool is_zero() const noexcept {
        limb_t acc = 0;
        for (size_t i = 0; i < NUM_LIMBS; ++i) {
            acc |= limbs_[i];
        }
        return acc == 0;
    }

    bool is_odd() const noexcept { return (limbs_[0] & 1) != 0; }

    /** @brief Get bit at position */
    bool get_bit(size_t pos) const noexcept {
        if (pos >= BITS) return false;
        return ((limbs_[pos / 64] >> (pos % 64)) & 1) != 0;
    }

    /** @brief Set bit at position */
    void set_bit(size_t pos, bool value = true) noexcept {
        if (pos >= BITS) return;
        const limb_t mask = static_cast<limb_t>(1) << (pos % 64);
        if (value) {
            limbs_[pos / 64] |= mask;
        } else {
            limbs_[pos / 64] &= ~mask;
        }
    }

    /** @brief Number of significant bits */
    size_t num_bits() const noexcept {
        for (size_t i = NUM_LIMBS; i > 0; --i) {
            limb_t v = limbs_[i - 1];
            if (v != 0) {
                size_t n = 0;
                while (v != 0) {
                    v >>= 1;
                    ++n;
                }
                return (i - 1) * 64 + n;
            }
        }
        return 0;
    }

    /**
     * @brief Copy into another width
     *
     * Widening zero-extends; narrowing drops the high limbs.
     */
    template<size_t OUT_BITS>
    BigInt<OUT_BITS> resize() const noexcept {
        BigInt<OUT_BITS> out;
        const size_t n = std::min(NUM_LIMBS, BigInt<OUT_BITS>::NUM_LIMBS);
        for (size_t i = 0; i < n; ++i) {
            out[i] = limbs_[i];
        }
        return out;
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /** @brief Convert to lowercase hex string without prefix */
    std::string to_hex() const {
        static const char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.reserve(BITS / 4);

        bool started = false;
        for (size_t i = NUM_LIMBS; i > 0; --i) {
            limb_t v = limbs_[i - 1];
            for (int j = 60; j >= 0; j -= 4) {
                int digit = static_cast<int>((v >> j) & 0xF);
                if (digit != 0 || started) {
                    result += hex_chars[digit];
                    started = true;
                }
            }
        }
        return result.empty() ? "0" : result;
    }

    /** @brief Parse from hex string; throws std::invalid_argument */
    void from_hex(const std::string& hex) {
        std::fill(limbs_.begin(), limbs_.end(), 0);

        size_t start = 0;
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            start = 2;
        }
        if (hex.size() == start) {
            throw std::invalid_argument("BigInt: empty hex string");
        }

        size_t bit_pos = 0;
        for (size_t i = hex.size(); i > start; --i) {
            char c = hex[i - 1];
            int digit;
            if (c >= '0' && c <= '9') digit = c - '0';
            else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
            else throw std::invalid_argument("BigInt: invalid hex digit");

            if (bit_pos >= BITS) {
                if (digit != 0) {
                    throw std::invalid_argument("BigInt: hex value exceeds capacity");
                }
                continue;
            }
            limbs_[bit_pos / 64] |= static_cast<limb_t>(digit) << (bit_pos % 64);
            bit_pos += 4;
        }
    }

    /** @brief Convert to decimal string */
    std::string to_decimal() const;

    // ========================================================================
    // Arithmetic Operations
    // ========================================================================

    /** @brief Addition with carry, returns carry out */
    static limb_t add_with_carry(limb_t a, limb_t b, limb_t carry_in, limb_t& result) noexcept {
#ifdef SECPFIELD_BIGINT_X86_64
        unsigned long long out;
        unsigned char carry = _addcarry_u64(static_cast<unsigned char>(carry_in), a, b, &out);
        result = static_cast<limb_t>(out);
        return carry;
#else
        limb_t sum = a + b;
        limb_t c1 = sum < a ? 1 : 0;
        result = sum + carry_in;
        limb_t c2 = result < sum ? 1 : 0;
        return c1 | c2;
#endif
    }

    /** @brief Subtraction with borrow, returns borrow out */
    static limb_t sub_with_borrow(limb_t a, limb_t b, limb_t borrow_in, limb_t& result) noexcept {
#ifdef SECPFIELD_BIGINT_X86_64
        unsigned long long out;
        unsigned char borrow = _subborrow_u64(static_cast<unsigned char>(borrow_in), a, b, &out);
        result = static_cast<limb_t>(out);
        return borrow;
#else
        limb_t diff = a - b;
        limb_t b1 = a < b ? 1 : 0;
        result = diff - borrow_in;
        limb_t b2 = diff < borrow_in ? 1 : 0;
        return b1 | b2;
#endif
    }

    /** @brief 64x64 -> 128 multiplication */
    static void mul64(limb_t a, limb_t b, limb_t& lo, limb_t& hi) noexcept {
#ifdef SECPFIELD_HAS_INT128
        uint128_t product = static_cast<uint128_t>(a) * b;
        lo = static_cast<limb_t>(product);
        hi = static_cast<limb_t>(product >> 64);
#else
        // Fallback: split into 32-bit parts
        uint64_t a_lo = a & 0xFFFFFFFF, a_hi = a >> 32;
        uint64_t b_lo = b & 0xFFFFFFFF, b_hi = b >> 32;

        uint64_t p0 = a_lo * b_lo;
        uint64_t p1 = a_lo * b_hi;
        uint64_t p2 = a_hi * b_lo;
        uint64_t p3 = a_hi * b_hi;

        uint64_t carry = (p0 >> 32) + (p1 & 0xFFFFFFFF) + (p2 & 0xFFFFFFFF);
        lo = (p0 & 0xFFFFFFFF) | (carry << 32);
        hi = p3 + (p1 >> 32) + (p2 >> 32) + (carry >> 32);
#endif
    }

    /** @brief Addition: this += other, returns carry */
    limb_t add(const BigInt& other) noexcept {
        limb_t carry = 0;
        for (size_t i = 0; i < NUM_LIMBS; ++i) {
            carry = add_with_carry(limbs_[i], other.limbs_[i], carry, limbs_[i]);
        }
        return carry;
    }

    /** @brief Subtraction: this -= other, returns borrow */
    limb_t sub(const BigInt& other) noexcept {
        limb_t borrow = 0;
        for (size_t i = 0; i < NUM_LIMBS; ++i) {
            borrow = sub_with_borrow(limbs_[i], other.limbs_[i], borrow, limbs_[i]);
        }
        return borrow;
    }

    /** @brief this += v, returns carry */
    limb_t add_small(limb_t v) noexcept {
        limb_t carry = v;
        for (size_t i = 0; i < NUM_LIMBS && carry != 0; ++i) {
            carry = add_with_carry(limbs_[i], carry, 0, limbs_[i]);
        }
        return carry;
    }

    /** @brief this *= m, returns the limb shifted out of the top */
    limb_t mul_small(limb_t m) noexcept {
        limb_t carry = 0;
        for (size_t i = 0; i < NUM_LIMBS; ++i) {
            limb_t lo, hi;
            mul64(limbs_[i], m, lo, hi);
            limb_t c = add_with_carry(lo, carry, 0, limbs_[i]);
            carry = hi + c;
        }
        return carry;
    }

    /**
     * @brief this /= d for a non-zero 32-bit divisor, returns remainder
     */
    uint32_t div_small(uint32_t d) noexcept {
        uint64_t rem = 0;
        for (size_t i = NUM_LIMBS; i > 0; --i) {
            uint64_t hi = (rem << 32) | (limbs_[i - 1] >> 32);
            uint64_t qh = hi / d;
            rem = hi % d;
            uint64_t lo = (rem << 32) | (limbs_[i - 1] & 0xFFFFFFFF);
            uint64_t ql = lo / d;
            rem = lo % d;
            limbs_[i - 1] = (qh << 32) | ql;
        }
        return static_cast<uint32_t>(rem);
    }

    /**
     * @brief Long division: a = q * d + r with r < d
     *
     * Shift-and-subtract over the bits of a. Throws std::domain_error when
     * d is zero. Outputs may alias the inputs.
     */
    static void divmod(const BigInt& a, const BigInt& d, BigInt& q, BigInt& r) {
        if (d.is_zero()) {
            throw std::domain_error("BigInt: division by zero");
        }
        const BigInt num = a;
        const BigInt den = d;
        BigInt quot;
        BigInt rem;

        for (size_t i = num.num_bits(); i > 0; --i) {
            // rem < den < 2^BITS, so one extra bit of headroom is enough
            bool overflow = rem.get_bit(BITS - 1);
            rem <<= 1;
            if (num.get_bit(i - 1)) {
                rem.limbs_[0] |= 1;
            }
            if (overflow || rem >= den) {
                rem.sub(den);
                quot.set_bit(i - 1);
            }
        }
        q = quot;
        r = rem;
    }

    /** @brief Remainder of this divided by d */
    BigInt mod(const BigInt& d) const {
        BigInt q, r;
        divmod(*this, d, q, r);
        return r;
    }

    /** @brief Operator overloads (wrapping) */
    BigInt operator+(const BigInt& other) const {
        BigInt result = *this;
        result.add(other);
        return result;
    }

    BigInt operator-(const BigInt& other) const {
        BigInt result = *this;
        result.sub(other);
        return result;
    }

    BigInt& operator+=(const BigInt& other) {
        add(other);
        return *this;
    }

    BigInt& operator-=(const BigInt& other) {
        sub(other);
        return *this;
    }

    /** @brief Comparison */
    int compare(const BigInt& other) const noexcept {
        for (size_t i = NUM_LIMBS; i > 0; --i) {
            if (limbs_[i - 1] > other.limbs_[i - 1]) return 1;
            if (limbs_[i - 1] < other.limbs_[i - 1]) return -1;
        }
        return 0;
    }

    bool operator==(const BigInt& other) const noexcept { return compare(other) == 0; }
    bool operator!=(const BigInt& other) const noexcept { return compare(other) != 0; }
    bool operator<(const BigInt& other) const noexcept { return compare(other) < 0; }
    bool operator<=(const BigInt& other) const noexcept { return compare(other) <= 0; }
    bool operator>(const BigInt& other) const noexcept { return compare(other) > 0; }
    bool operator>=(const BigInt& other) const noexcept { return compare(other) >= 0; }

    /** @brief Left shift by bits */
    BigInt& operator<<=(size_t bits) noexcept {
        if (bits == 0) return *this;
        if (bits >= BITS) {
            std::fill(limbs_.begin(), limbs_.end(), 0);
            return *this;
        }

        const size_t limb_shift = bits / 64;
        const size_t bit_shift = bits % 64;

        for (size_t i = NUM_LIMBS; i > limb_shift; --i) {
            const size_t dst = i - 1;
            const size_t src = dst - limb_shift;
            limb_t v = limbs_[src] << bit_shift;
            if (bit_shift != 0 && src > 0) {
                v |= limbs_[src - 1] >> (64 - bit_shift);
            }
            limbs_[dst] = v;
        }
        for (size_t i = 0; i < limb_shift; ++i) {
            limbs_[i] = 0;
        }
        return *this;
    }

    /** @brief Right shift by bits */
    BigInt& operator>>=(size_t bits) noexcept {
        if (bits == 0) return *this;
        if (bits >= BITS) {
            std::fill(limbs_.begin(), limbs_.end(), 0);
            return *this;
        }

        const size_t limb_shift = bits / 64;
        const size_t bit_shift = bits % 64;

        for (size_t dst = 0; dst < NUM_LIMBS - limb_shift; ++dst) {
            const size_t src = dst + limb_shift;
            limb_t v = limbs_[src] >> bit_shift;
            if (bit_shift != 0 && src + 1 < NUM_LIMBS) {
                v |= limbs_[src + 1] << (64 - bit_shift);
            }
            limbs_[dst] = v;
        }
        for (size_t i = NUM_LIMBS - limb_shift; i < NUM_LIMBS; ++i) {
            limbs_[i] = 0;
        }
        return *this;
    }

    BigInt operator<<(size_t bits) const {
        BigInt result = *this;
        result <<= bits;
        return result;
    }

    BigInt operator>>(size_t bits) const {
        BigInt result = *this;
        result >>= bits;
        return result;
    }
};

// ============================================================================
// Type Aliases for Common Sizes
// ============================================================================

using BigInt256 = BigInt<256>;    // Field values
using BigInt512 = BigInt<512>;    // Intermediate products

// Defined in bigint.cpp
extern template class BigInt<256>;
extern template class BigInt<512>;

// ============================================================================
// Wide Multiplication
// ============================================================================

/**
 * @brief Schoolbook product: BITS x BITS -> 2*BITS, never overflows
 */
template<size_t BITS>
BigInt<BITS * 2> mul_wide(const BigInt<BITS>& a, const BigInt<BITS>& b) noexcept {
    using Int = BigInt<BITS>;
    BigInt<BITS * 2> product;

    for (size_t i = 0; i < Int::NUM_LIMBS; ++i) {
        limb_t carry = 0;
        for (size_t j = 0; j < Int::NUM_LIMBS; ++j) {
            limb_t hi, lo;
            Int::mul64(a[i], b[j], lo, hi);

            limb_t c1 = Int::add_with_carry(product[i + j], lo, 0, product[i + j]);
            limb_t c2 = Int::add_with_carry(product[i + j], carry, 0, product[i + j]);
            carry = hi + c1 + c2;
        }
        product[i + Int::NUM_LIMBS] = carry;
    }
    return product;
}

/**
 * @brief Stream output as 0x-prefixed hex
 */
template<size_t BITS>
SECPFIELD_API std::ostream& operator<<(std::ostream& os, const BigInt<BITS>& n);

} // namespace secpfield

#endif // SECPFIELD_CORE_BIGINT_H
