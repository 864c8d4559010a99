/**
 * @file bigint.cpp
 * @brief Fixed-size Big Integer Implementation for secpfield
 *
 * Decimal conversion, stream I/O and explicit instantiations for the
 * sizes the field code uses.
 *
 * @author knightc
 * @version 1.0.0
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "secpfield/core/bigint.h"
#include <vector>

namespace secpfield {

namespace {

// Largest power of ten below 2^32
constexpr uint32_t DEC_CHUNK = 1000000000U;
constexpr int DEC_CHUNK_DIGITS = 9;

} // namespace

// ============================================================================
// Decimal Conversion
// ============================================================================

template<size_t BITS>
std::string BigInt<BITS>::to_decimal() const {
    if (is_zero()) {
        return "0";
    }

    BigInt tmp = *this;
    std::vector<uint32_t> chunks;
    chunks.reserve(BITS / 29 + 1);
    while (!tmp.is_zero()) {
        chunks.push_back(tmp.div_small(DEC_CHUNK));
    }

    std::string result = std::to_string(chunks.back());
    for (size_t i = chunks.size() - 1; i > 0; --i) {
        std::string part = std::to_string(chunks[i - 1]);
        result.append(DEC_CHUNK_DIGITS - part.size(), '0');
        result += part;
    }
    return result;
}

template<size_t BITS>
BigInt<BITS> BigInt<BITS>::from_decimal(const std::string& dec) {
    if (dec.empty()) {
        throw std::invalid_argument("BigInt: empty decimal string");
    }

    BigInt result;
    for (char c : dec) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("BigInt: invalid decimal digit");
        }
        limb_t overflow = result.mul_small(10);
        overflow |= result.add_small(static_cast<limb_t>(c - '0'));
        if (overflow != 0) {
            throw std::invalid_argument("BigInt: decimal value exceeds capacity");
        }
    }
    return result;
}

// ============================================================================
// Explicit Template Instantiations
// ============================================================================

template class BigInt<256>;
template class BigInt<512>;

// ============================================================================
// Stream I/O
// ============================================================================

template<size_t BITS>
std::ostream& operator<<(std::ostream& os, const BigInt<BITS>& n) {
    os << "0x" << n.to_hex();
    return os;
}

template std::ostream& operator<<(std::ostream&, const BigInt<256>&);
template std::ostream& operator<<(std::ostream&, const BigInt<512>&);

} // namespace secpfield
