/**
 * @file secpfield.h
 * @brief secpfield - secp256k1 base field for non-native circuit arithmetic
 *
 * Unified C++ header.
 *
 * Architecture:
 * - BigInt<BITS>: fixed-width integers for modulus-sized values
 * - Secp256K1Base: element of GF(p), p = 2^256 - 2^32 - 977
 * - field:: generic algorithms over the field contract
 * - OsRandomSource: platform CSPRNG as a standard random engine
 *
 * C callers include secpfield_api.h instead.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef SECPFIELD_H
#define SECPFIELD_H

#include "secpfield/version.h"
#include "secpfield/core/common.h"
#include "secpfield/core/security.h"
#include "secpfield/core/bigint.h"           // BigInt<BITS>, mul_wide

#include "secpfield/field/secp256k1_base.h"  // Secp256K1Base, secp256k1_reduce
#include "secpfield/field/field_traits.h"    // field::sum, product, batch inverse
#include "secpfield/field/random_source.h"   // OsRandomSource

#include "secpfield/secpfield_api.h"

#endif // SECPFIELD_H
