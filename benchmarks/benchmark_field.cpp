/**
 * @file benchmark_field.cpp
 * @brief secp256k1 Base Field Benchmark: secpfield vs OpenSSL BN vs GMP
 *
 * Benchmarks single field operations on p = 2^256 - 2^32 - 977:
 * - Addition, multiplication, squaring
 * - Inversion (Fermat in secpfield, extended Euclid in OpenSSL/GMP)
 *
 * All three implementations run the same chained computation on the same
 * operands, so results are also cross-checked once before timing.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "benchmark_common.hpp"

#include <gmp.h>
#include <openssl/bn.h>
#include <openssl/rand.h>

#include "secpfield/secpfield.h"

using secpfield::Secp256K1Base;
using namespace secpfield_bench;

// Benchmark configuration
constexpr size_t WARMUP_ITERATIONS = 3;
constexpr size_t BENCHMARK_ITERATIONS = 20;
constexpr size_t FAST_OPS_PER_BATCH = 100000;
constexpr size_t INV_OPS_PER_BATCH = 500;

namespace {

const char* const P_HEX = "FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F";

/**
 * @brief Random canonical operand from OpenSSL's generator
 */
Secp256K1Base random_operand() {
    for (;;) {
        uint8_t buf[32];
        if (RAND_bytes(buf, sizeof(buf)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        Secp256K1Base x = Secp256K1Base::from_bytes_le(buf, sizeof(buf));
        if (x.is_canonical() && !x.is_zero()) {
            return x;
        }
    }
}

// ============================================================================
// OpenSSL
// ============================================================================

struct OpenSSLState {
    BN_CTX* ctx = nullptr;
    BIGNUM* p = nullptr;
    BIGNUM* a = nullptr;
    BIGNUM* b = nullptr;
    BIGNUM* r = nullptr;

    OpenSSLState(const Secp256K1Base& x, const Secp256K1Base& y) {
        ctx = BN_CTX_new();
        p = BN_new();
        a = BN_new();
        b = BN_new();
        r = BN_new();
        BN_hex2bn(&p, P_HEX);
        BN_hex2bn(&a, x.to_canonical().to_hex().c_str());
        BN_hex2bn(&b, y.to_canonical().to_hex().c_str());
    }

    ~OpenSSLState() {
        BN_free(r);
        BN_free(b);
        BN_free(a);
        BN_free(p);
        BN_CTX_free(ctx);
    }

    OpenSSLState(const OpenSSLState&) = delete;
    OpenSSLState& operator=(const OpenSSLState&) = delete;
};

std::string bn_to_dec(const BIGNUM* v) {
    char* s = BN_bn2dec(v);
    std::string out(s);
    OPENSSL_free(s);
    return out;
}

// ============================================================================
// GMP
// ============================================================================

struct GmpState {
    mpz_t p, a, b, r;

    GmpState(const Secp256K1Base& x, const Secp256K1Base& y) {
        mpz_inits(p, a, b, r, nullptr);
        mpz_set_str(p, P_HEX, 16);
        mpz_set_str(a, x.to_string().c_str(), 10);
        mpz_set_str(b, y.to_string().c_str(), 10);
    }

    ~GmpState() {
        mpz_clears(p, a, b, r, nullptr);
    }

    GmpState(const GmpState&) = delete;
    GmpState& operator=(const GmpState&) = delete;
};

std::string mpz_to_dec(const mpz_t v) {
    std::vector<char> buf(mpz_sizeinbase(v, 10) + 2);
    mpz_get_str(buf.data(), 10, v);
    return std::string(buf.data());
}

// ============================================================================
// Timed Batches
// ============================================================================

template<typename Fn>
double time_batch(Fn&& fn) {
    auto start = Clock::now();
    fn();
    Duration elapsed = Clock::now() - start;
    return elapsed.count();
}

/**
 * @brief Chained r = r * y + x, compared across libraries
 */
bool cross_check(const Secp256K1Base& x, const Secp256K1Base& y) {
    constexpr size_t STEPS = 1000;

    Secp256K1Base r = x;
    for (size_t i = 0; i < STEPS; ++i) {
        r = r * y + x;
    }

    OpenSSLState ossl(x, y);
    BN_copy(ossl.r, ossl.a);
    for (size_t i = 0; i < STEPS; ++i) {
        BN_mod_mul(ossl.r, ossl.r, ossl.b, ossl.p, ossl.ctx);
        BN_mod_add(ossl.r, ossl.r, ossl.a, ossl.p, ossl.ctx);
    }

    GmpState gmp(x, y);
    mpz_set(gmp.r, gmp.a);
    for (size_t i = 0; i < STEPS; ++i) {
        mpz_mul(gmp.r, gmp.r, gmp.b);
        mpz_add(gmp.r, gmp.r, gmp.a);
        mpz_mod(gmp.r, gmp.r, gmp.p);
    }

    const std::string ours = r.to_string();
    return ours == bn_to_dec(ossl.r) && ours == mpz_to_dec(gmp.r);
}

void bench_op(const std::string& name, size_t ops,
              const std::function<void()>& ours,
              const std::function<void()>& openssl,
              const std::function<void()>& gmp) {
    auto r_ours = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, ops,
                                   [&] { return time_batch(ours); });
    auto r_ossl = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, ops,
                                   [&] { return time_batch(openssl); });
    auto r_gmp = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, ops,
                                  [&] { return time_batch(gmp); });

    print_result(name, "secpfield", r_ours);
    print_result(name, "OpenSSL", r_ossl);
    print_result(name, "GMP", r_gmp);
    print_time_ratio(r_ours.avg_ms, r_ossl.avg_ms, "OpenSSL");
    print_time_ratio(r_ours.avg_ms, r_gmp.avg_ms, "GMP");
    std::cout << std::endl;
}

} // namespace

int main() {
    if (secpfield_init() != SECPFIELD_SUCCESS) {
        std::cerr << "secpfield_init failed" << std::endl;
        return 1;
    }

    std::cout << SECPFIELD_LIBRARY_NAME << " " << secpfield_version()
              << " (" << SECPFIELD_BUILD_TYPE << ", " << secpfield_platform() << ")" << std::endl;

    const Secp256K1Base x = random_operand();
    const Secp256K1Base y = random_operand();

    if (!cross_check(x, y)) {
        std::cerr << "cross-check against OpenSSL/GMP failed" << std::endl;
        return 1;
    }

    OpenSSLState ossl(x, y);
    GmpState gmp(x, y);
    Secp256K1Base acc = x;

    print_header("secp256k1 base field (p = 2^256 - 2^32 - 977)");

    bench_op("Addition", FAST_OPS_PER_BATCH,
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i) acc = acc + y; },
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i)
                  BN_mod_add(ossl.r, ossl.a, ossl.b, ossl.p, ossl.ctx); },
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i) {
                  mpz_add(gmp.r, gmp.a, gmp.b);
                  if (mpz_cmp(gmp.r, gmp.p) >= 0) mpz_sub(gmp.r, gmp.r, gmp.p);
              } });

    bench_op("Multiplication", FAST_OPS_PER_BATCH,
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i) acc = acc * y; },
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i)
                  BN_mod_mul(ossl.r, ossl.a, ossl.b, ossl.p, ossl.ctx); },
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i) {
                  mpz_mul(gmp.r, gmp.a, gmp.b);
                  mpz_mod(gmp.r, gmp.r, gmp.p);
              } });

    bench_op("Squaring", FAST_OPS_PER_BATCH,
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i) acc = acc.square(); },
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i)
                  BN_mod_sqr(ossl.r, ossl.a, ossl.p, ossl.ctx); },
        [&] { for (size_t i = 0; i < FAST_OPS_PER_BATCH; ++i) {
                  mpz_mul(gmp.r, gmp.a, gmp.a);
                  mpz_mod(gmp.r, gmp.r, gmp.p);
              } });

    bench_op("Inversion", INV_OPS_PER_BATCH,
        [&] { for (size_t i = 0; i < INV_OPS_PER_BATCH; ++i) acc = (acc + x).inverse(); },
        [&] { for (size_t i = 0; i < INV_OPS_PER_BATCH; ++i)
                  BN_mod_inverse(ossl.r, ossl.a, ossl.p, ossl.ctx); },
        [&] { for (size_t i = 0; i < INV_OPS_PER_BATCH; ++i)
                  mpz_invert(gmp.r, gmp.a, gmp.p); });

    // Keep the chained result observable
    std::cout << "checksum: " << acc.hash() << std::endl;
    return 0;
}
