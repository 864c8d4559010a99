/**
 * @file random_source.h
 * @brief OS CSPRNG exposed as a UniformRandomBitGenerator
 *
 * Lets Secp256K1Base::rand_from_rng() run on system entropy or on any
 * standard engine (std::mt19937_64 in tests) through the same template.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SECPFIELD_FIELD_RANDOM_SOURCE_H
#define SECPFIELD_FIELD_RANDOM_SOURCE_H

#include <array>
#include <cstddef>
#include <cstdint>

#include "secpfield/core/common.h"

namespace secpfield {

/**
 * @brief Buffered 32-bit words from secpfield_random_bytes()
 *
 * operator() throws std::runtime_error when the entropy source fails.
 * Not thread-safe; use one instance per thread.
 */
class SECPFIELD_API OsRandomSource {
public:
    using result_type = uint32_t;

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return UINT32_MAX; }

    OsRandomSource() noexcept : buffer_{}, pos_(BUFFER_WORDS) {}
    ~OsRandomSource();

    OsRandomSource(const OsRandomSource&) = delete;
    OsRandomSource& operator=(const OsRandomSource&) = delete;

    result_type operator()();

private:
    static constexpr size_t BUFFER_WORDS = 64;

    void refill();

    std::array<uint32_t, BUFFER_WORDS> buffer_;
    size_t pos_;
};

} // namespace secpfield

#endif // SECPFIELD_FIELD_RANDOM_SOURCE_H
