/**
 * @file secp256k1_base.cpp
 * @brief secp256k1 Base Field Element Implementation
 *
 * Canonicalization, modular reduction and field arithmetic over
 * p = 2^256 - 2^32 - 977.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "secpfield/field/secp256k1_base.h"
#include "secpfield/field/random_source.h"
#include "secpfield/internal/trace.h"

#include <stdexcept>

namespace secpfield {

namespace {

const Secp256K1Base::Limbs P_WORDS = {{
    0xFFFFFC2F, 0xFFFFFFFE, 0xFFFFFFFF, 0xFFFFFFFF,
    0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF
}};

// Candidates tried by find_multiplicative_generator()
constexpr uint64_t GENERATOR_SEARCH_LIMIT = 1000;

inline BigInt256 to_bigint(const Secp256K1Base::Limbs& words) {
    return BigInt256::from_words(words.data(), words.size());
}

} // namespace

// ============================================================================
// Modulus
// ============================================================================

const BigInt256& secp256k1_p() {
    static const BigInt256 p(std::array<limb_t, 4>{{
        0xFFFFFFFEFFFFFC2FULL, 0xFFFFFFFFFFFFFFFFULL,
        0xFFFFFFFFFFFFFFFFULL, 0xFFFFFFFFFFFFFFFFULL
    }});
    return p;
}

// ============================================================================
// secp256k1 Reduction
// ============================================================================
// p = 2^256 - 2^32 - 977
// c = 2^32 + 977 = 0x1000003D1
// Reduction: a mod p = (a_lo + a_hi * c) mod p

namespace secp256k1_reduce {

void reduce_wide(BigInt256& r, const BigInt512& a) noexcept {
    constexpr limb_t C = 0x1000003D1ULL;

    // First pass: t = a[0..3] + a[4..7] * c, at most 290 bits
    limb_t t[5];
    limb_t carry = 0;
    for (size_t i = 0; i < 4; ++i) {
        limb_t lo, hi;
        BigInt256::mul64(a[i + 4], C, lo, hi);
        limb_t c1 = BigInt256::add_with_carry(a[i], lo, 0, t[i]);
        limb_t c2 = BigInt256::add_with_carry(t[i], carry, 0, t[i]);
        carry = hi + c1 + c2;
    }
    t[4] = carry;

    // Second pass: fold t[4] * c (< 2^67)
    limb_t lo, hi;
    BigInt256::mul64(t[4], C, lo, hi);
    carry = BigInt256::add_with_carry(t[0], lo, 0, r[0]);
    carry = BigInt256::add_with_carry(t[1], hi, carry, r[1]);
    carry = BigInt256::add_with_carry(t[2], 0, carry, r[2]);
    carry = BigInt256::add_with_carry(t[3], 0, carry, r[3]);

    if (carry != 0) {
        // r wrapped past 2^256 and is now tiny; 2^256 = c (mod p)
        r.add_small(C);
    }

    // r < 2^256 < 2p
    if (r >= secp256k1_p()) {
        r.sub(secp256k1_p());
    }
}

void reduce(BigInt256& r, const BigInt256& a) noexcept {
    r = a;
    if (r >= secp256k1_p()) {
        r.sub(secp256k1_p());
    }
}

} // namespace secp256k1_reduce

// ============================================================================
// Construction and Wire Form
// ============================================================================

Secp256K1Base Secp256K1Base::from_value(const BigInt256& v) noexcept {
    return Secp256K1Base(v.to_words());
}

Secp256K1Base Secp256K1Base::from_biguint(const BigInt256& v) noexcept {
    BigInt256 r;
    secp256k1_reduce::reduce(r, v);
    return from_value(r);
}

Secp256K1Base Secp256K1Base::from_decimal(const std::string& dec) {
    BigInt256 r;
    secp256k1_reduce::reduce_wide(r, BigInt512::from_decimal(dec));
    return from_value(r);
}

Secp256K1Base Secp256K1Base::from_hex(const std::string& hex) {
    BigInt256 r;
    secp256k1_reduce::reduce_wide(r, BigInt512(hex));
    return from_value(r);
}

std::array<uint8_t, Secp256K1Base::BYTE_SIZE> Secp256K1Base::to_bytes_le() const noexcept {
    std::array<uint8_t, BYTE_SIZE> out{};
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        for (size_t j = 0; j < 4; ++j) {
            out[4 * i + j] = static_cast<uint8_t>(limbs_[i] >> (8 * j));
        }
    }
    return out;
}

std::array<uint8_t, Secp256K1Base::BYTE_SIZE> Secp256K1Base::to_canonical_bytes_le() const noexcept {
    return canonicalized().to_bytes_le();
}

Secp256K1Base Secp256K1Base::from_bytes_le(const uint8_t* data, size_t len) {
    if (data == nullptr || len != BYTE_SIZE) {
        throw std::invalid_argument("Secp256K1Base: wire form must be exactly 32 bytes");
    }
    Limbs words{};
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        for (size_t j = 0; j < 4; ++j) {
            words[i] |= static_cast<uint32_t>(data[4 * i + j]) << (8 * j);
        }
    }
    return Secp256K1Base(words);
}

// ============================================================================
// Canonical Form
// ============================================================================

bool Secp256K1Base::is_below_order(const Limbs& words) noexcept {
    for (size_t i = NUM_LIMBS; i > 0; --i) {
        if (words[i - 1] != P_WORDS[i - 1]) {
            return words[i - 1] < P_WORDS[i - 1];
        }
    }
    return false;  // equal to P
}

BigInt256 Secp256K1Base::to_canonical() const noexcept {
    BigInt256 r;
    secp256k1_reduce::reduce(r, to_bigint(limbs_));
    return r;
}

Secp256K1Base::Limbs Secp256K1Base::to_canonical_limbs() const noexcept {
    return to_canonical().to_words();
}

bool Secp256K1Base::is_canonical() const noexcept {
    return is_below_order(limbs_);
}

std::string Secp256K1Base::to_string() const {
    return to_canonical().to_decimal();
}

size_t Secp256K1Base::hash() const noexcept {
    const BigInt256 c = to_canonical();
    std::hash<uint64_t> hasher;
    size_t seed = 0;
    for (size_t i = 0; i < BigInt256::NUM_LIMBS; ++i) {
        seed ^= hasher(c[i]) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

bool Secp256K1Base::is_zero() const noexcept {
    return to_canonical().is_zero();
}

bool Secp256K1Base::is_one() const noexcept {
    return to_canonical() == BigInt256(1);
}

bool Secp256K1Base::operator==(const Secp256K1Base& other) const noexcept {
    return to_canonical() == other.to_canonical();
}

// ============================================================================
// Arithmetic
// ============================================================================

Secp256K1Base Secp256K1Base::operator-() const noexcept {
    const BigInt256 a = to_canonical();
    if (a.is_zero()) {
        return ZERO;
    }
    return from_value(secp256k1_p() - a);
}

Secp256K1Base Secp256K1Base::operator+(const Secp256K1Base& rhs) const noexcept {
    BigInt256 s = to_canonical();
    // s <= 2p - 2, the carry is the 257th bit
    limb_t carry = s.add(rhs.to_canonical());
    if (carry != 0 || s >= secp256k1_p()) {
        s.sub(secp256k1_p());
    }
    return from_value(s);
}

Secp256K1Base Secp256K1Base::operator-(const Secp256K1Base& rhs) const noexcept {
    // a + p - b, reduced the same way as addition
    BigInt256 d = to_canonical();
    limb_t borrow = d.sub(rhs.to_canonical());
    if (borrow != 0) {
        d.add(secp256k1_p());
    }
    return from_value(d);
}

Secp256K1Base Secp256K1Base::operator*(const Secp256K1Base& rhs) const noexcept {
    BigInt256 r;
    secp256k1_reduce::reduce_wide(r, mul_wide(to_canonical(), rhs.to_canonical()));
    return from_value(r);
}

Secp256K1Base Secp256K1Base::operator/(const Secp256K1Base& rhs) const {
    if (rhs.is_zero()) {
        throw std::domain_error("Secp256K1Base: division by zero");
    }
    return *this * rhs.inverse();
}

Secp256K1Base Secp256K1Base::exp(const BigInt256& e) const noexcept {
    const Secp256K1Base base = canonicalized();
    Secp256K1Base result = ONE;
    for (size_t i = e.num_bits(); i > 0; --i) {
        result = result.square();
        if (e.get_bit(i - 1)) {
            result *= base;
        }
    }
    return result;
}

std::optional<Secp256K1Base> Secp256K1Base::try_inverse() const noexcept {
    if (is_zero()) {
        return std::nullopt;
    }
    // Fermat's little theorem: a^(p-2) = a^(-1)
    BigInt256 e = secp256k1_p();
    e.sub(BigInt256(2));
    return exp(e);
}

Secp256K1Base Secp256K1Base::inverse() const {
    std::optional<Secp256K1Base> inv = try_inverse();
    if (!inv) {
        throw std::domain_error("Secp256K1Base: zero has no multiplicative inverse");
    }
    return *inv;
}

std::optional<Secp256K1Base> Secp256K1Base::try_div(const Secp256K1Base& rhs) const noexcept {
    std::optional<Secp256K1Base> inv = rhs.try_inverse();
    if (!inv) {
        return std::nullopt;
    }
    return *this * *inv;
}

// ============================================================================
// Group Structure
// ============================================================================

const std::vector<BigInt256>& Secp256K1Base::multiplicative_group_factors() {
    static const std::vector<BigInt256> factors = [] {
        std::vector<BigInt256> f = {BigInt256(2), BigInt256(3), BigInt256(7), BigInt256(13441)};

        BigInt256 p_minus_1 = secp256k1_p() - BigInt256(1);
        BigInt256 cofactor, rem;
        BigInt256::divmod(p_minus_1, BigInt256(2ULL * 3 * 7 * 13441), cofactor, rem);
        if (!rem.is_zero()) {
            throw std::logic_error("Secp256K1Base: small factors do not divide p - 1");
        }
        f.push_back(cofactor);
        return f;
    }();
    return factors;
}

bool Secp256K1Base::is_multiplicative_generator(const Secp256K1Base& g) {
    if (g.is_zero()) {
        return false;
    }
    const BigInt256 p_minus_1 = secp256k1_p() - BigInt256(1);
    for (const BigInt256& q : multiplicative_group_factors()) {
        BigInt256 e, rem;
        BigInt256::divmod(p_minus_1, q, e, rem);
        if (g.exp(e).is_one()) {
            SECPFIELD_FIELD_TRACE("g=" << g << " has order dividing (p-1)/" << q.to_decimal());
            return false;
        }
    }
    return true;
}

Secp256K1Base Secp256K1Base::find_multiplicative_generator() {
    for (uint64_t n = 2; n < GENERATOR_SEARCH_LIMIT; ++n) {
        Secp256K1Base g = from_canonical_u64(n);
        if (is_multiplicative_generator(g)) {
            SECPFIELD_FIELD_TRACE("multiplicative generator: " << n);
            return g;
        }
    }
    throw std::runtime_error("Secp256K1Base: no multiplicative generator below search limit");
}

Secp256K1Base Secp256K1Base::primitive_root_of_unity(size_t n_log) {
    if (n_log > TWO_ADICITY) {
        throw std::invalid_argument("Secp256K1Base: n_log exceeds two-adicity");
    }
    Secp256K1Base base = POWER_OF_TWO_GENERATOR;
    for (size_t i = n_log; i < TWO_ADICITY; ++i) {
        base = base.square();
    }
    return base;
}

std::vector<Secp256K1Base> Secp256K1Base::two_adic_subgroup(size_t n_log) {
    const Secp256K1Base generator = primitive_root_of_unity(n_log);
    const size_t order = static_cast<size_t>(1) << n_log;

    std::vector<Secp256K1Base> subgroup;
    subgroup.reserve(order);
    Secp256K1Base current = ONE;
    for (size_t i = 0; i < order; ++i) {
        subgroup.push_back(current);
        current *= generator;
    }
    return subgroup;
}

// ============================================================================
// Random Sampling
// ============================================================================

Secp256K1Base Secp256K1Base::rand() {
    OsRandomSource source;
    return rand_from_rng(source);
}

std::vector<Secp256K1Base> Secp256K1Base::rand_vec(size_t n) {
    OsRandomSource source;
    std::vector<Secp256K1Base> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(rand_from_rng(source));
    }
    return out;
}

// ============================================================================
// Stream I/O
// ============================================================================

std::ostream& operator<<(std::ostream& os, const Secp256K1Base& x) {
    os << x.to_string();
    return os;
}

} // namespace secpfield
