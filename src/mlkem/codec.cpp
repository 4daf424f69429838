/**
 * @file codec.cpp
 * @brief ByteEncode/ByteDecode and Compress/Decompress for ML-KEM
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "pqkem/mlkem/codec.h"

namespace pqkem {
namespace mlkem {

namespace {

// 1 if a < b, else 0; both operands below 2^31
inline uint32_t ct_lt(uint32_t a, uint32_t b) noexcept {
    return (a - b) >> 31;
}

} // anonymous namespace

void check_length(const char* what, size_t actual, size_t expected) {
    if (actual != expected) {
        throw EncodingError(std::string(what) + ": expected " +
                            std::to_string(expected) + " bytes, got " +
                            std::to_string(actual));
    }
}

// ============================================================================
// Compression
// ============================================================================

uint16_t compress(unsigned d, uint16_t x) noexcept {
    const uint32_t shifted = static_cast<uint32_t>(x) << d;
    const uint64_t product = static_cast<uint64_t>(shifted) * kBarrettMultiplier;
    uint32_t quotient = static_cast<uint32_t>(product >> kBarrettShift);
    const uint32_t remainder = shifted - quotient * MLKEM_Q;

    // remainder is in [0, 2q): round up past q/2 and past 3q/2
    quotient += ct_lt(kHalfQ, remainder);
    quotient += ct_lt(MLKEM_Q + kHalfQ, remainder);
    return static_cast<uint16_t>(quotient & ((1u << d) - 1));
}

uint16_t decompress(unsigned d, uint16_t y) noexcept {
    const uint32_t product = static_cast<uint32_t>(y) * MLKEM_Q;
    return static_cast<uint16_t>((product + (1u << (d - 1))) >> d);
}

void compress_poly(unsigned d, Poly& f) noexcept {
    for (auto& c : f.coeffs) {
        c = compress(d, c);
    }
}

void decompress_poly(unsigned d, Poly& f) noexcept {
    for (auto& c : f.coeffs) {
        c = decompress(d, c);
    }
}

// ============================================================================
// Byte Encoding
// ============================================================================

void byte_encode(unsigned d, const std::array<uint16_t, MLKEM_N>& coeffs,
                 uint8_t* out) noexcept {
    const uint32_t mask = (1u << d) - 1;
    uint32_t acc = 0;
    unsigned acc_bits = 0;
    size_t pos = 0;

    for (size_t i = 0; i < MLKEM_N; ++i) {
        acc |= (coeffs[i] & mask) << acc_bits;
        acc_bits += d;
        while (acc_bits >= 8) {
            out[pos++] = static_cast<uint8_t>(acc);
            acc >>= 8;
            acc_bits -= 8;
        }
    }
}

void byte_decode(unsigned d, const uint8_t* in,
                 std::array<uint16_t, MLKEM_N>& coeffs) noexcept {
    const uint32_t mask = (1u << d) - 1;
    uint32_t acc = 0;
    unsigned acc_bits = 0;
    size_t pos = 0;

    for (size_t i = 0; i < MLKEM_N; ++i) {
        while (acc_bits < d) {
            acc |= static_cast<uint32_t>(in[pos++]) << acc_bits;
            acc_bits += 8;
        }
        coeffs[i] = static_cast<uint16_t>(acc & mask);
        acc >>= d;
        acc_bits -= d;
    }

    if (d == 12) {
        // 12-bit values are < 2q
        for (auto& c : coeffs) {
            c = reduce_once(c);
        }
    }
}

// ============================================================================
// Vector Serialization
// ============================================================================

ByteVec encode_ntt_vector(const NttVector& v) {
    ByteVec out(MLKEM_POLY_BYTES * v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        byte_encode(12, v[i].coeffs, out.data() + i * MLKEM_POLY_BYTES);
    }
    return out;
}

NttVector decode_ntt_vector(const uint8_t* in, size_t len, size_t k) {
    check_length("encoded NTT vector", len, MLKEM_POLY_BYTES * k);

    NttVector v(k);
    for (size_t i = 0; i < k; ++i) {
        byte_decode(12, in + i * MLKEM_POLY_BYTES, v[i].coeffs);
    }
    return v;
}

ByteVec compress_encode_vector(unsigned d, const PolyVec& v) {
    ByteVec out(32 * d * v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        Poly tmp = v[i];
        compress_poly(d, tmp);
        byte_encode(d, tmp.coeffs, out.data() + i * 32 * d);
    }
    return out;
}

PolyVec decode_decompress_vector(unsigned d, const uint8_t* in, size_t k) {
    PolyVec v(k);
    for (size_t i = 0; i < k; ++i) {
        byte_decode(d, in + i * 32 * d, v[i].coeffs);
        decompress_poly(d, v[i]);
    }
    return v;
}

} // namespace mlkem
} // namespace pqkem
