/**
 * @file types.h
 * @brief Type definitions for pqkem library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_CORE_TYPES_H
#define PQKEM_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus

#include <array>
#include <vector>

namespace pqkem {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// 32-byte seeds (d, z, rho, sigma, m, r)
using Seed32 = ByteArray<32>;

// Hash digests
using SHA3_256Digest = ByteArray<32>;
using SHA3_512Digest = ByteArray<64>;

} // namespace pqkem

#endif // __cplusplus

#endif // PQKEM_CORE_TYPES_H
