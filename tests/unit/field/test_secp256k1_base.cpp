/**
 * @file test_secp256k1_base.cpp
 * @brief Secp256K1Base unit tests
 *
 * Tests for the secp256k1 base field element:
 * - Constants and modulus boundary behaviour
 * - Non-canonical representations (equality, hashing, text output)
 * - Arithmetic against GMP on random and boundary inputs
 * - Division by zero, inversion, rejection sampling
 * - Multiplicative generator and two-adic structure
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <gmp.h>
#include <array>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "secpfield/secpfield.h"

using secpfield::BigInt256;
using secpfield::Secp256K1Base;
using Limbs = Secp256K1Base::Limbs;

namespace {

const char* const P_DEC =
    "115792089237316195423570985008687907853269984665640564039457584007908834671663";
const char* const NEG_ONE_DEC =
    "115792089237316195423570985008687907853269984665640564039457584007908834671662";

// secp256k1 generator point coordinates, used as arbitrary field values
const char* const GX_HEX = "79BE667EF9DCBBAC55A06295CE870B07029BFCDB2DCE28D959F2815B16F81798";
const char* const GY_HEX = "483ADA7726A3C4655DA4FBFC0E1108A8FD17B448A68554199C47D08FFB10D4B8";

const Limbs P_LIMBS = {{0xFFFFFC2F, 0xFFFFFFFE, 0xFFFFFFFF, 0xFFFFFFFF,
                        0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF}};

std::string mpz_to_dec(const mpz_t v) {
    char* s = mpz_get_str(nullptr, 10, v);
    std::string out(s);
    void (*freefunc)(void*, size_t);
    mp_get_memory_functions(nullptr, nullptr, &freefunc);
    freefunc(s, out.size() + 1);
    return out;
}

// Raw limbs (not reduced) into GMP
void limbs_to_mpz(mpz_t out, const Secp256K1Base& x) {
    mpz_import(out, Secp256K1Base::NUM_LIMBS, -1, sizeof(uint32_t), 0, 0, x.limbs().data());
}

/**
 * @brief Engine that replays a fixed word sequence
 */
class ScriptedRng {
public:
    using result_type = uint32_t;
    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return UINT32_MAX; }

    explicit ScriptedRng(std::vector<uint32_t> words) : words_(std::move(words)) {}

    result_type operator()() {
        if (pos_ >= words_.size()) {
            throw std::out_of_range("ScriptedRng exhausted");
        }
        return words_[pos_++];
    }

    size_t consumed() const { return pos_; }

private:
    std::vector<uint32_t> words_;
    size_t pos_ = 0;
};

} // namespace

class Secp256K1BaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        secpfield_init();
        mpz_inits(p_, ga_, gb_, gr_, nullptr);
        mpz_set_str(p_, P_DEC, 10);
    }

    void TearDown() override {
        mpz_clears(p_, ga_, gb_, gr_, nullptr);
    }

    // Random representative, canonical or in [P, 2^256)
    Secp256K1Base random_representative() {
        Secp256K1Base x = Secp256K1Base::rand_from_rng(rng_);
        if (rng_() % 4 == 0) {
            // P + k with k < 2^32 + 977 still fits in 256 bits
            BigInt256 v = Secp256K1Base::order();
            v.add_small(rng_() % 0x1000003D1ULL);
            x = Secp256K1Base::from_value(v);
        }
        return x;
    }

    mpz_t p_, ga_, gb_, gr_;
    std::mt19937_64 rng_{20240517};
};

// ============================================================================
// Constants
// ============================================================================

TEST_F(Secp256K1BaseTest, Constants) {
    EXPECT_EQ(Secp256K1Base::ZERO.to_string(), "0");
    EXPECT_EQ(Secp256K1Base::ONE.to_string(), "1");
    EXPECT_EQ(Secp256K1Base::TWO.to_string(), "2");
    EXPECT_EQ(Secp256K1Base::NEG_ONE.to_string(), NEG_ONE_DEC);
    EXPECT_EQ(Secp256K1Base::order().to_decimal(), P_DEC);
    EXPECT_EQ(Secp256K1Base::characteristic(), Secp256K1Base::order());

    EXPECT_TRUE(Secp256K1Base::NEG_ONE.is_canonical());
    EXPECT_EQ(Secp256K1Base::NEG_ONE + Secp256K1Base::ONE, Secp256K1Base::ZERO);
    EXPECT_EQ(Secp256K1Base::ONE + Secp256K1Base::ONE, Secp256K1Base::TWO);
}

TEST_F(Secp256K1BaseTest, ModulusLimbLayout) {
    EXPECT_EQ(Secp256K1Base::order().to_words(), P_LIMBS);
    EXPECT_EQ(Secp256K1Base::order().to_hex(),
              "fffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f");
}

// ============================================================================
// Non-canonical Representations
// ============================================================================

TEST_F(Secp256K1BaseTest, ModulusLimbsActAsZero) {
    Secp256K1Base z = Secp256K1Base::from_limbs(P_LIMBS);

    EXPECT_FALSE(z.is_canonical());
    EXPECT_TRUE(z.is_zero());
    EXPECT_EQ(z, Secp256K1Base::ZERO);
    EXPECT_EQ(z.to_string(), "0");
    EXPECT_EQ(z.hash(), Secp256K1Base::ZERO.hash());
    EXPECT_TRUE(z.canonicalized().is_canonical());
    EXPECT_EQ(z.to_canonical_limbs(), Secp256K1Base::ZERO.limbs());
}

TEST_F(Secp256K1BaseTest, AboveModulusRepresentatives) {
    Limbs p_plus_1 = P_LIMBS;
    p_plus_1[0] += 1;
    Secp256K1Base one = Secp256K1Base::from_limbs(p_plus_1);
    EXPECT_EQ(one, Secp256K1Base::ONE);
    EXPECT_TRUE(one.is_one());

    // 2^256 - 1 = 2^32 + 976 (mod p)
    Limbs all_ones;
    all_ones.fill(0xFFFFFFFF);
    Secp256K1Base x = Secp256K1Base::from_limbs(all_ones);
    EXPECT_EQ(x.to_string(), "4294968272");
    EXPECT_EQ(x, Secp256K1Base::from_canonical_u64(4294968272ULL));
}

TEST_F(Secp256K1BaseTest, HashFollowsEquality) {
    std::unordered_set<Secp256K1Base> set;
    set.insert(Secp256K1Base::ZERO);
    set.insert(Secp256K1Base::from_limbs(P_LIMBS));
    set.insert(Secp256K1Base::ONE);
    Limbs p_plus_1 = P_LIMBS;
    p_plus_1[0] += 1;
    set.insert(Secp256K1Base::from_limbs(p_plus_1));

    EXPECT_EQ(set.size(), 2u);
}

TEST_F(Secp256K1BaseTest, StreamOutputIsCanonicalDecimal) {
    std::ostringstream oss;
    oss << Secp256K1Base::from_limbs(P_LIMBS) << " " << Secp256K1Base::NEG_ONE;
    EXPECT_EQ(oss.str(), std::string("0 ") + NEG_ONE_DEC);
}

// ============================================================================
// Construction
// ============================================================================

TEST_F(Secp256K1BaseTest, SmallIntegerConstructors) {
    EXPECT_EQ(Secp256K1Base::from_bool(true), Secp256K1Base::ONE);
    EXPECT_EQ(Secp256K1Base::from_bool(false), Secp256K1Base::ZERO);
    EXPECT_EQ(Secp256K1Base::from_canonical_u8(255).to_string(), "255");
    EXPECT_EQ(Secp256K1Base::from_canonical_u16(65535).to_string(), "65535");
    EXPECT_EQ(Secp256K1Base::from_canonical_u32(0xFFFFFFFFu).to_string(), "4294967295");
    EXPECT_EQ(Secp256K1Base::from_canonical_u64(~0ULL).to_string(), "18446744073709551615");
    EXPECT_EQ(Secp256K1Base::from_noncanonical_u64(~0ULL).to_string(), "18446744073709551615");
}

TEST_F(Secp256K1BaseTest, WideIntegerConstructors) {
    // 2^64
    EXPECT_EQ(Secp256K1Base::from_noncanonical_u96(0, 1).to_string(), "18446744073709551616");
    Secp256K1Base x = Secp256K1Base::from_noncanonical_u96(0x0123456789ABCDEFULL, 0xDEADBEEF);
    EXPECT_EQ(x.limbs()[0], 0x89ABCDEFu);
    EXPECT_EQ(x.limbs()[1], 0x01234567u);
    EXPECT_EQ(x.limbs()[2], 0xDEADBEEFu);

    // 2^128 - 1
    EXPECT_EQ(Secp256K1Base::from_noncanonical_u128(~0ULL, ~0ULL).to_string(),
              "340282366920938463463374607431768211455");
}

TEST_F(Secp256K1BaseTest, FromValueAndBiguint) {
    BigInt256 p_plus_5 = Secp256K1Base::order() + BigInt256(5);

    Secp256K1Base raw = Secp256K1Base::from_value(p_plus_5);
    EXPECT_FALSE(raw.is_canonical());
    EXPECT_EQ(raw.to_string(), "5");

    Secp256K1Base reduced = Secp256K1Base::from_biguint(p_plus_5);
    EXPECT_TRUE(reduced.is_canonical());
    EXPECT_EQ(reduced.limbs(), Secp256K1Base::from_canonical_u64(5).limbs());
}

TEST_F(Secp256K1BaseTest, TextParsingReduces) {
    EXPECT_EQ(Secp256K1Base::from_decimal(P_DEC), Secp256K1Base::ZERO);
    EXPECT_EQ(Secp256K1Base::from_decimal(
        "115792089237316195423570985008687907853269984665640564039457584007908834671668"),
        Secp256K1Base::from_canonical_u64(5));
    EXPECT_TRUE(Secp256K1Base::from_decimal(P_DEC).is_canonical());

    // 2^256 = 2^32 + 977
    EXPECT_EQ(Secp256K1Base::from_hex("0x1" + std::string(64, '0')).to_string(), "4294968273");
    EXPECT_EQ(Secp256K1Base::from_hex(GX_HEX).to_canonical(), BigInt256(GX_HEX));

    EXPECT_THROW(Secp256K1Base::from_decimal("12x"), std::invalid_argument);
    EXPECT_THROW(Secp256K1Base::from_decimal(""), std::invalid_argument);
    EXPECT_THROW(Secp256K1Base::from_hex("zz"), std::invalid_argument);
}

// ============================================================================
// Wire Form
// ============================================================================

TEST_F(Secp256K1BaseTest, BytesPreserveRawLimbs) {
    Secp256K1Base z = Secp256K1Base::from_limbs(P_LIMBS);
    auto bytes = z.to_bytes_le();
    EXPECT_EQ(bytes[0], 0x2F);
    EXPECT_EQ(bytes[1], 0xFC);
    EXPECT_EQ(bytes[4], 0xFE);
    EXPECT_EQ(bytes[31], 0xFF);

    Secp256K1Base back = Secp256K1Base::from_bytes_le(bytes.data(), bytes.size());
    EXPECT_EQ(back.limbs(), P_LIMBS);

    auto canonical = z.to_canonical_bytes_le();
    for (uint8_t b : canonical) {
        EXPECT_EQ(b, 0);
    }
}

TEST_F(Secp256K1BaseTest, BytesRejectWrongLength) {
    std::array<uint8_t, 33> buf{};
    EXPECT_THROW(Secp256K1Base::from_bytes_le(buf.data(), 31), std::invalid_argument);
    EXPECT_THROW(Secp256K1Base::from_bytes_le(buf.data(), 33), std::invalid_argument);
    EXPECT_THROW(Secp256K1Base::from_bytes_le(nullptr, 32), std::invalid_argument);
    EXPECT_NO_THROW(Secp256K1Base::from_bytes_le(buf.data(), 32));
}

// ============================================================================
// Arithmetic: Pinned Vectors
// ============================================================================

TEST_F(Secp256K1BaseTest, PinnedArithmetic) {
    Secp256K1Base a = Secp256K1Base::from_hex(GX_HEX);
    Secp256K1Base b = Secp256K1Base::from_hex(GY_HEX);

    EXPECT_EQ((a + b).to_string(),
              "87736773043036160647661804025675577510721876834436837451439091696146454211664");
    EXPECT_EQ((a - b).to_string(),
              "22395753001518526691495633764661491141779330073118350899561283024631779246816");
    EXPECT_EQ((b - a).to_string(),
              "93396336235797668732075351244026416711490654592522213139896300983277055424847");
    EXPECT_EQ((a * b).to_string(),
              "114544289132854671785371450145272078301207510924172161292488302719104112524699");
    EXPECT_EQ(a.inverse().to_string(),
              "16048257703666452242803569546805946138055448571451565585555302070354637922038");
    EXPECT_EQ(Secp256K1Base::TWO.inverse().to_string(),
              "57896044618658097711785492504343953926634992332820282019728792003954417335832");
}

TEST_F(Secp256K1BaseTest, BoundaryArithmetic) {
    const Secp256K1Base& m1 = Secp256K1Base::NEG_ONE;

    EXPECT_EQ(Secp256K1Base::ZERO - Secp256K1Base::ONE, m1);
    EXPECT_EQ((m1 + Secp256K1Base::TWO).to_string(), "1");
    EXPECT_EQ(m1 * m1, Secp256K1Base::ONE);
    EXPECT_EQ(-Secp256K1Base::ZERO, Secp256K1Base::ZERO);
    EXPECT_EQ(-Secp256K1Base::ONE, m1);
    EXPECT_EQ(m1.doubled(), -Secp256K1Base::TWO);

    // Sum landing exactly on p must come back canonical zero
    Secp256K1Base sum = m1 + Secp256K1Base::ONE;
    EXPECT_TRUE(sum.is_canonical());
    EXPECT_EQ(sum.limbs(), Secp256K1Base::ZERO.limbs());
}

TEST_F(Secp256K1BaseTest, ResultsAreCanonical) {
    for (int i = 0; i < 100; ++i) {
        Secp256K1Base a = random_representative();
        Secp256K1Base b = random_representative();
        EXPECT_TRUE((a + b).is_canonical());
        EXPECT_TRUE((a - b).is_canonical());
        EXPECT_TRUE((a * b).is_canonical());
        EXPECT_TRUE((-a).is_canonical());
        EXPECT_TRUE(a.square().is_canonical());
    }
}

TEST_F(Secp256K1BaseTest, AlgebraicIdentities) {
    EXPECT_EQ(Secp256K1Base::from_canonical_u64(5) * Secp256K1Base::from_canonical_u64(3),
              Secp256K1Base::from_canonical_u64(15));

    for (int i = 0; i < 50; ++i) {
        Secp256K1Base a = random_representative();
        EXPECT_EQ(-(-a), a);

        Secp256K1Base c = a.canonicalized();
        EXPECT_TRUE(c.is_canonical());
        EXPECT_EQ(c.canonicalized().limbs(), c.limbs());
        EXPECT_EQ(c, a);

        if (!a.is_zero()) {
            EXPECT_EQ(a.inverse().inverse(), a);
        }

        uint64_t n = rng_();
        EXPECT_EQ(Secp256K1Base::from_canonical_u64(n).to_canonical(), BigInt256(n));
    }
}

// ============================================================================
// Arithmetic: GMP Oracle
// ============================================================================

TEST_F(Secp256K1BaseTest, AddSubMulMatchGmp) {
    for (int i = 0; i < 200; ++i) {
        Secp256K1Base a = random_representative();
        Secp256K1Base b = random_representative();
        limbs_to_mpz(ga_, a);
        limbs_to_mpz(gb_, b);

        mpz_add(gr_, ga_, gb_);
        mpz_mod(gr_, gr_, p_);
        EXPECT_EQ((a + b).to_string(), mpz_to_dec(gr_));

        mpz_sub(gr_, ga_, gb_);
        mpz_mod(gr_, gr_, p_);
        EXPECT_EQ((a - b).to_string(), mpz_to_dec(gr_));

        mpz_mul(gr_, ga_, gb_);
        mpz_mod(gr_, gr_, p_);
        EXPECT_EQ((a * b).to_string(), mpz_to_dec(gr_));

        mpz_neg(gr_, ga_);
        mpz_mod(gr_, gr_, p_);
        EXPECT_EQ((-a).to_string(), mpz_to_dec(gr_));
    }
}

TEST_F(Secp256K1BaseTest, InverseMatchesGmp) {
    for (int i = 0; i < 30; ++i) {
        Secp256K1Base a = random_representative();
        if (a.is_zero()) continue;
        limbs_to_mpz(ga_, a);
        ASSERT_NE(mpz_invert(gr_, ga_, p_), 0);
        EXPECT_EQ(a.inverse().to_string(), mpz_to_dec(gr_));
        EXPECT_EQ(a * a.inverse(), Secp256K1Base::ONE);
    }
}

TEST_F(Secp256K1BaseTest, ReduceWideOnExtremeProducts) {
    // (p-1)^2 and (2^256-1)^2 stress both folding passes
    Limbs all_ones;
    all_ones.fill(0xFFFFFFFF);
    const Secp256K1Base values[] = {
        Secp256K1Base::NEG_ONE,
        Secp256K1Base::from_limbs(all_ones),
        Secp256K1Base::from_canonical_u64(0x1000003D1ULL),
    };
    for (const auto& a : values) {
        for (const auto& b : values) {
            BigInt256 r;
            secpfield::secp256k1_reduce::reduce_wide(
                r, secpfield::mul_wide(BigInt256::from_words(a.limbs().data(), 8),
                                       BigInt256::from_words(b.limbs().data(), 8)));
            limbs_to_mpz(ga_, a);
            limbs_to_mpz(gb_, b);
            mpz_mul(gr_, ga_, gb_);
            mpz_mod(gr_, gr_, p_);
            EXPECT_EQ(r.to_decimal(), mpz_to_dec(gr_));
            EXPECT_LT(r, Secp256K1Base::order());
        }
    }
}

TEST_F(Secp256K1BaseTest, PowersAndExp) {
    Secp256K1Base a = Secp256K1Base::from_hex(GX_HEX);

    EXPECT_EQ(a.square(), a * a);
    EXPECT_EQ(a.cube(), a * a * a);
    EXPECT_EQ(a.exp_u64(0), Secp256K1Base::ONE);
    EXPECT_EQ(Secp256K1Base::ZERO.exp_u64(0), Secp256K1Base::ONE);
    EXPECT_EQ(Secp256K1Base::ZERO.exp_u64(5), Secp256K1Base::ZERO);
    EXPECT_EQ(a.exp_u64(1), a);
    EXPECT_EQ(a.exp_u64(5), a.square().square() * a);

    // Fermat: a^(p-1) = 1
    EXPECT_EQ(a.exp(Secp256K1Base::order() - BigInt256(1)), Secp256K1Base::ONE);

    limbs_to_mpz(ga_, a);
    mpz_set_ui(gb_, 123456789);
    mpz_powm(gr_, ga_, gb_, p_);
    EXPECT_EQ(a.exp_u64(123456789).to_string(), mpz_to_dec(gr_));
}

// ============================================================================
// Division by Zero
// ============================================================================

TEST_F(Secp256K1BaseTest, ZeroHasNoInverse) {
    EXPECT_FALSE(Secp256K1Base::ZERO.try_inverse().has_value());
    EXPECT_FALSE(Secp256K1Base::from_limbs(P_LIMBS).try_inverse().has_value());
    EXPECT_THROW(Secp256K1Base::ZERO.inverse(), std::domain_error);
    EXPECT_THROW(Secp256K1Base::from_limbs(P_LIMBS).inverse(), std::domain_error);
}

TEST_F(Secp256K1BaseTest, DivisionByZero) {
    Secp256K1Base a = Secp256K1Base::from_canonical_u64(7);
    EXPECT_THROW(a / Secp256K1Base::ZERO, std::domain_error);
    EXPECT_THROW(a / Secp256K1Base::from_limbs(P_LIMBS), std::domain_error);
    EXPECT_FALSE(a.try_div(Secp256K1Base::ZERO).has_value());

    Secp256K1Base b = a;
    EXPECT_THROW(b /= Secp256K1Base::ZERO, std::domain_error);
    EXPECT_EQ(b, a);
}

TEST_F(Secp256K1BaseTest, Division) {
    Secp256K1Base a = Secp256K1Base::from_hex(GX_HEX);
    Secp256K1Base b = Secp256K1Base::from_hex(GY_HEX);

    EXPECT_EQ((a / b) * b, a);
    EXPECT_EQ(*a.try_div(b), a / b);
    EXPECT_EQ(Secp256K1Base::ZERO / b, Secp256K1Base::ZERO);
    EXPECT_EQ(Secp256K1Base::ONE / Secp256K1Base::TWO, Secp256K1Base::TWO.inverse());
}

// ============================================================================
// Sampling
// ============================================================================

TEST_F(Secp256K1BaseTest, RejectionSkipsModulusPattern) {
    std::vector<uint32_t> script(P_LIMBS.begin(), P_LIMBS.end());
    script.insert(script.end(), {5, 0, 0, 0, 0, 0, 0, 0});
    ScriptedRng rng(script);

    Secp256K1Base x = Secp256K1Base::rand_from_rng(rng);
    EXPECT_EQ(rng.consumed(), 16u);
    EXPECT_TRUE(x.is_canonical());
    EXPECT_EQ(x, Secp256K1Base::from_canonical_u64(5));
}

TEST_F(Secp256K1BaseTest, RejectionSkipsAllOnes) {
    std::vector<uint32_t> script(8, 0xFFFFFFFF);
    Limbs neg_one = Secp256K1Base::NEG_ONE.limbs();
    script.insert(script.end(), neg_one.begin(), neg_one.end());
    ScriptedRng rng(script);

    EXPECT_EQ(Secp256K1Base::rand_from_rng(rng).limbs(), neg_one);
}

TEST_F(Secp256K1BaseTest, SeededSamplingIsDeterministic) {
    std::mt19937_64 r1(42), r2(42);
    for (int i = 0; i < 10; ++i) {
        Secp256K1Base a = Secp256K1Base::rand_from_rng(r1);
        EXPECT_EQ(a.limbs(), Secp256K1Base::rand_from_rng(r2).limbs());
        EXPECT_TRUE(a.is_canonical());
    }
}

TEST_F(Secp256K1BaseTest, OsSampling) {
    std::vector<Secp256K1Base> v = Secp256K1Base::rand_vec(16);
    ASSERT_EQ(v.size(), 16u);
    std::unordered_set<Secp256K1Base> distinct(v.begin(), v.end());
    EXPECT_EQ(distinct.size(), 16u);
    for (const auto& x : v) {
        EXPECT_TRUE(x.is_canonical());
    }
    EXPECT_TRUE(Secp256K1Base::rand().is_canonical());
    EXPECT_TRUE(Secp256K1Base::rand_vec(0).empty());
}

// ============================================================================
// Group Structure
// ============================================================================

TEST_F(Secp256K1BaseTest, GroupOrderFactorization) {
    const auto& factors = Secp256K1Base::multiplicative_group_factors();
    ASSERT_EQ(factors.size(), 5u);

    mpz_set_ui(gr_, 1);
    for (const BigInt256& q : factors) {
        mpz_set_str(ga_, q.to_decimal().c_str(), 10);
        EXPECT_GT(mpz_probab_prime_p(ga_, 30), 0) << q.to_decimal();
        mpz_mul(gr_, gr_, ga_);
    }
    mpz_add_ui(gr_, gr_, 1);
    EXPECT_EQ(mpz_cmp(gr_, p_), 0);
    EXPECT_EQ(factors.back().num_bits(), 237u);
}

TEST_F(Secp256K1BaseTest, MultiplicativeGenerator) {
    EXPECT_TRUE(Secp256K1Base::is_multiplicative_generator(
        Secp256K1Base::MULTIPLICATIVE_GROUP_GENERATOR));
    EXPECT_FALSE(Secp256K1Base::is_multiplicative_generator(Secp256K1Base::TWO));
    EXPECT_FALSE(Secp256K1Base::is_multiplicative_generator(Secp256K1Base::ONE));
    EXPECT_FALSE(Secp256K1Base::is_multiplicative_generator(Secp256K1Base::NEG_ONE));
    EXPECT_FALSE(Secp256K1Base::is_multiplicative_generator(Secp256K1Base::ZERO));

    EXPECT_EQ(Secp256K1Base::find_multiplicative_generator(),
              Secp256K1Base::MULTIPLICATIVE_GROUP_GENERATOR);
}

TEST_F(Secp256K1BaseTest, TwoAdicStructure) {
    BigInt256 half = Secp256K1Base::order() - BigInt256(1);
    half >>= 1;
    EXPECT_EQ(Secp256K1Base::MULTIPLICATIVE_GROUP_GENERATOR.exp(half),
              Secp256K1Base::POWER_OF_TWO_GENERATOR);
    EXPECT_EQ(Secp256K1Base::POWER_OF_TWO_GENERATOR, Secp256K1Base::NEG_ONE);

    EXPECT_EQ(Secp256K1Base::primitive_root_of_unity(0), Secp256K1Base::ONE);
    EXPECT_EQ(Secp256K1Base::primitive_root_of_unity(1), Secp256K1Base::NEG_ONE);
    EXPECT_THROW(Secp256K1Base::primitive_root_of_unity(2), std::invalid_argument);

    auto subgroup = Secp256K1Base::two_adic_subgroup(1);
    ASSERT_EQ(subgroup.size(), 2u);
    EXPECT_EQ(subgroup[0], Secp256K1Base::ONE);
    EXPECT_EQ(subgroup[1], Secp256K1Base::NEG_ONE);
    EXPECT_EQ(Secp256K1Base::two_adic_subgroup(0).size(), 1u);
}
