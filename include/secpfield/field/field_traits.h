/**
 * @file field_traits.h
 * @brief Generic algorithms over the prime-field contract
 *
 * Any type F offering ZERO, ONE, +, -, *, square() and try_inverse()
 * gets sums, products, exponentiation and batch inversion from here,
 * so circuit code can be written once for every field it hosts.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SECPFIELD_FIELD_FIELD_TRAITS_H
#define SECPFIELD_FIELD_FIELD_TRAITS_H

#include <cstdint>
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace secpfield {
namespace field {

// ============================================================================
// Contract Detection
// ============================================================================

template<typename F, typename = void>
struct is_field : std::false_type {};

template<typename F>
struct is_field<F, std::void_t<
    decltype(F::ZERO),
    decltype(F::ONE),
    decltype(F::NEG_ONE),
    decltype(std::declval<const F&>() + std::declval<const F&>()),
    decltype(std::declval<const F&>() - std::declval<const F&>()),
    decltype(std::declval<const F&>() * std::declval<const F&>()),
    decltype(-std::declval<const F&>()),
    decltype(std::declval<const F&>().square()),
    decltype(std::declval<const F&>().is_zero()),
    decltype(std::declval<const F&>().try_inverse())>> : std::true_type {};

template<typename F>
inline constexpr bool is_field_v = is_field<F>::value;

// ============================================================================
// Folds
// ============================================================================

/** @brief Sum of [first, last), ZERO when empty */
template<typename It>
auto sum(It first, It last) {
    using F = typename std::iterator_traits<It>::value_type;
    static_assert(is_field_v<F>, "field::sum requires a field element type");
    F acc = F::ZERO;
    for (; first != last; ++first) {
        acc = acc + *first;
    }
    return acc;
}

template<typename F>
F sum(const std::vector<F>& xs) {
    return sum(xs.begin(), xs.end());
}

/** @brief Product of [first, last), ONE when empty */
template<typename It>
auto product(It first, It last) {
    using F = typename std::iterator_traits<It>::value_type;
    static_assert(is_field_v<F>, "field::product requires a field element type");
    F acc = F::ONE;
    for (; first != last; ++first) {
        acc = acc * *first;
    }
    return acc;
}

template<typename F>
F product(const std::vector<F>& xs) {
    return product(xs.begin(), xs.end());
}

// ============================================================================
// Exponentiation
// ============================================================================

/**
 * @brief base^e, right-to-left binary method
 *
 * exp_u64(x, 0) == ONE for every x, zero included.
 */
template<typename F>
F exp_u64(const F& base, uint64_t e) {
    static_assert(is_field_v<F>, "field::exp_u64 requires a field element type");
    F result = F::ONE;
    F current = base;
    while (e != 0) {
        if (e & 1) {
            result = result * current;
        }
        e >>= 1;
        if (e != 0) {
            current = current.square();
        }
    }
    return result;
}

/** @brief base^0, base^1, ..., base^(n-1) */
template<typename F>
std::vector<F> powers(const F& base, size_t n) {
    static_assert(is_field_v<F>, "field::powers requires a field element type");
    std::vector<F> out;
    out.reserve(n);
    F current = F::ONE;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(current);
        current = current * base;
    }
    return out;
}

// ============================================================================
// Batch Inversion
// ============================================================================

/**
 * @brief Invert every element with a single field inversion
 *
 * Montgomery's trick: prefix products, one inverse of the total, then a
 * backward sweep. Costs 3(n-1) multiplications plus one inversion.
 *
 * @throws std::domain_error if any element is zero
 */
template<typename F>
std::vector<F> batch_multiplicative_inverse(const std::vector<F>& xs) {
    static_assert(is_field_v<F>, "field::batch_multiplicative_inverse requires a field element type");
    const size_t n = xs.size();
    if (n == 0) {
        return {};
    }

    // prefix[i] = xs[0] * ... * xs[i]
    std::vector<F> prefix;
    prefix.reserve(n);
    prefix.push_back(xs[0]);
    for (size_t i = 1; i < n; ++i) {
        prefix.push_back(prefix[i - 1] * xs[i]);
    }

    std::optional<F> inv_total = prefix[n - 1].try_inverse();
    if (!inv_total) {
        throw std::domain_error("batch_multiplicative_inverse: zero element in batch");
    }

    std::vector<F> out(n);
    F acc = *inv_total;  // (xs[0] * ... * xs[i])^(-1)
    for (size_t i = n; i > 1; --i) {
        out[i - 1] = acc * prefix[i - 2];
        acc = acc * xs[i - 1];
    }
    out[0] = acc;
    return out;
}

} // namespace field
} // namespace secpfield

#endif // SECPFIELD_FIELD_FIELD_TRAITS_H
