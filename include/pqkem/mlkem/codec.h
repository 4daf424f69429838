/**
 * @file codec.h
 * @brief ML-KEM byte encoding and lossy coefficient compression
 *
 * - ByteEncode_d / ByteDecode_d: 256 d-bit values <-> 32*d bytes, LSB first
 * - Compress_d / Decompress_d: Z_q <-> Z_{2^d}, round to nearest, ties up
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_MLKEM_CODEC_H
#define PQKEM_MLKEM_CODEC_H

#include "pqkem/mlkem/field.h"
#include "pqkem/core/types.h"
#include <stdexcept>
#include <string>

namespace pqkem {
namespace mlkem {

/**
 * @brief Structural validation failure (wrong-length key or ciphertext)
 *
 * The only error ML-KEM operations raise for externally supplied data.
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Throw EncodingError unless actual == expected
 * @param what Name of the checked object, used in the message
 */
void check_length(const char* what, size_t actual, size_t expected);

// ============================================================================
// Compression
// ============================================================================

/**
 * @brief Compress_d(x) = round(x * 2^d / q) mod 2^d, constant time
 * @param d Bit width, 1 <= d <= 11
 * @param x Canonical residue in [0, q)
 */
uint16_t compress(unsigned d, uint16_t x) noexcept;

/**
 * @brief Decompress_d(y) = round(y * q / 2^d)
 */
uint16_t decompress(unsigned d, uint16_t y) noexcept;

void compress_poly(unsigned d, Poly& f) noexcept;
void decompress_poly(unsigned d, Poly& f) noexcept;

// ============================================================================
// Byte Encoding
// ============================================================================

/**
 * @brief ByteEncode_d: pack 256 d-bit values into 32*d bytes
 *
 * Values are masked to d bits before packing.
 */
void byte_encode(unsigned d, const std::array<uint16_t, MLKEM_N>& coeffs,
                 uint8_t* out) noexcept;

/**
 * @brief ByteDecode_d: unpack 32*d bytes into 256 values
 *
 * For d = 12 each value is reduced mod q, otherwise it is taken mod 2^d.
 */
void byte_decode(unsigned d, const uint8_t* in,
                 std::array<uint16_t, MLKEM_N>& coeffs) noexcept;

// ============================================================================
// Vector Serialization
// ============================================================================

/**
 * @brief ByteEncode_12 of each entry, concatenated (384k bytes)
 */
ByteVec encode_ntt_vector(const NttVector& v);

/**
 * @brief Inverse of encode_ntt_vector
 * @throws EncodingError if len != 384k
 */
NttVector decode_ntt_vector(const uint8_t* in, size_t len, size_t k);

/**
 * @brief Compress_d then ByteEncode_d of each entry (32*d*k bytes)
 */
ByteVec compress_encode_vector(unsigned d, const PolyVec& v);

/**
 * @brief ByteDecode_d then Decompress_d of k consecutive entries
 */
PolyVec decode_decompress_vector(unsigned d, const uint8_t* in, size_t k);

} // namespace mlkem
} // namespace pqkem

#endif // PQKEM_MLKEM_CODEC_H
