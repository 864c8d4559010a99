/**
 * @file random_source.cpp
 * @brief OsRandomSource Implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "secpfield/field/random_source.h"
#include "secpfield/core/security.h"

#include <stdexcept>
#include <string>

namespace secpfield {

OsRandomSource::~OsRandomSource() {
    internal::secure_zero(buffer_.data(), sizeof(buffer_));
}

void OsRandomSource::refill() {
    int rc = internal::random_bytes(buffer_.data(), sizeof(buffer_));
    if (rc != SECPFIELD_SUCCESS) {
        throw std::runtime_error(std::string("OsRandomSource: ") +
                                 secpfield_error_string(static_cast<secpfield_error_t>(rc)));
    }
    pos_ = 0;
}

OsRandomSource::result_type OsRandomSource::operator()() {
    if (pos_ == BUFFER_WORDS) {
        refill();
    }
    uint32_t word = buffer_[pos_];
    buffer_[pos_++] = 0;
    return word;
}

} // namespace secpfield
