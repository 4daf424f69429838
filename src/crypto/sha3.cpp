/**
 * @file sha3.cpp
 * @brief Keccak-f[1600] sponge behind G, H, J, PRF and the matrix XOF
 *
 * One sponge implementation serves all four FIPS 202 instances ML-KEM
 * needs. SHA3-256/512 finish with a fixed-length squeeze; SHAKE128/256
 * contexts can keep squeezing, which the rejection sampler relies on.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "pqkem/crypto/sha3.h"
#include "pqkem/core/common.h"
#include "pqkem/core/security.h"
#include <array>
#include <cstring>
#include <cstdint>

namespace pqkem::internal {

namespace {

constexpr std::array<uint64_t, 24> kRoundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

// rho offsets, listed in the order the pi step visits lanes starting from lane 1
constexpr std::array<unsigned, 24> kRhoOffsets = {
    1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
    27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44,
};

constexpr std::array<unsigned, 24> kPiLanes = {
    10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1,
};

inline uint64_t rotl64(uint64_t x, unsigned n) noexcept {
    return (x << n) | (x >> (64 - n));
}

} // anonymous namespace

/**
 * @brief 25-lane Keccak state, laid out to overlay pqkem_sha3_ctx_t::state
 */
class KeccakState {
public:
    std::array<uint64_t, 25> lanes{};

    void permute() noexcept {
        uint64_t* a = lanes.data();
        uint64_t col[5];

        for (uint64_t rc : kRoundConstants) {
            // theta
            for (int x = 0; x < 5; ++x) {
                col[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
            }
            for (int x = 0; x < 5; ++x) {
                const uint64_t d = col[(x + 4) % 5] ^ rotl64(col[(x + 1) % 5], 1);
                for (int y = 0; y < 25; y += 5) {
                    a[y + x] ^= d;
                }
            }

            // rho and pi
            uint64_t carry = a[1];
            for (size_t i = 0; i < kPiLanes.size(); ++i) {
                const unsigned dst = kPiLanes[i];
                const uint64_t next = a[dst];
                a[dst] = rotl64(carry, kRhoOffsets[i]);
                carry = next;
            }

            // chi
            for (int y = 0; y < 25; y += 5) {
                for (int x = 0; x < 5; ++x) {
                    col[x] = a[y + x];
                }
                for (int x = 0; x < 5; ++x) {
                    a[y + x] = col[x] ^ (~col[(x + 1) % 5] & col[(x + 2) % 5]);
                }
            }

            // iota
            a[0] ^= rc;
        }
    }
};

static_assert(sizeof(KeccakState) == PQKEM_KECCAK_STATE_SIZE,
              "KeccakState must overlay pqkem_sha3_ctx_t::state");

} // namespace pqkem::internal

namespace {

constexpr uint8_t kSha3Suffix = 0x06;
constexpr uint8_t kShakeSuffix = 0x1F;

void permute(pqkem_sha3_ctx_t* ctx) noexcept {
    reinterpret_cast<pqkem::internal::KeccakState*>(&ctx->state)->permute();
}

uint8_t* sponge_bytes(pqkem_sha3_ctx_t* ctx) noexcept {
    return reinterpret_cast<uint8_t*>(ctx->state);
}

void sponge_init(pqkem_sha3_ctx_t* ctx, size_t rate, uint8_t suffix,
                 size_t digest_size) noexcept {
    std::memset(ctx, 0, sizeof(*ctx));
    ctx->rate = rate;
    ctx->capacity = PQKEM_KECCAK_STATE_SIZE - rate;
    ctx->suffix = suffix;
    ctx->digest_size = digest_size;
}

void sponge_absorb(pqkem_sha3_ctx_t* ctx, const uint8_t* in, size_t len) noexcept {
    uint8_t* bytes = sponge_bytes(ctx);

    // Lane-wise XOR while the block is aligned with the rate boundary
    const size_t lanes_per_block = ctx->rate / 8;
    while (ctx->absorbed == 0 && len >= ctx->rate) {
        for (size_t i = 0; i < lanes_per_block; ++i) {
            uint64_t lane;
            std::memcpy(&lane, in + 8 * i, sizeof(lane));
            ctx->state[i] ^= lane;
        }
        permute(ctx);
        in += ctx->rate;
        len -= ctx->rate;
    }

    for (; len > 0; --len) {
        bytes[ctx->absorbed++] ^= *in++;
        if (ctx->absorbed == ctx->rate) {
            permute(ctx);
            ctx->absorbed = 0;
        }
    }
}

void sponge_squeeze(pqkem_sha3_ctx_t* ctx, uint8_t* out, size_t len) noexcept {
    uint8_t* bytes = sponge_bytes(ctx);

    if (!ctx->finalized) {
        // Domain bits followed by pad10*1
        bytes[ctx->absorbed] ^= ctx->suffix;
        bytes[ctx->rate - 1] ^= 0x80;
        permute(ctx);
        ctx->finalized = 1;
        ctx->squeezed = 0;
    }

    while (len > 0) {
        if (ctx->squeezed == ctx->rate) {
            permute(ctx);
            ctx->squeezed = 0;
        }
        const size_t chunk = PQKEM_MIN(len, ctx->rate - ctx->squeezed);
        std::memcpy(out, bytes + ctx->squeezed, chunk);
        ctx->squeezed += chunk;
        out += chunk;
        len -= chunk;
    }
}

bool bad_input(const uint8_t* data, size_t len) noexcept {
    return data == nullptr && len > 0;
}

pqkem_error_t digest_init(pqkem_sha3_ctx_t* ctx, size_t digest_size) noexcept {
    if (ctx == nullptr) return PQKEM_ERROR_INVALID_PARAM;
    // rate = 200 - 2 * digest_size
    sponge_init(ctx, PQKEM_KECCAK_STATE_SIZE - 2 * digest_size, kSha3Suffix, digest_size);
    return PQKEM_SUCCESS;
}

pqkem_error_t digest_update(pqkem_sha3_ctx_t* ctx, const uint8_t* data, size_t len) noexcept {
    if (ctx == nullptr || bad_input(data, len) || ctx->finalized) {
        return PQKEM_ERROR_INVALID_PARAM;
    }
    sponge_absorb(ctx, data, len);
    return PQKEM_SUCCESS;
}

pqkem_error_t digest_final(pqkem_sha3_ctx_t* ctx, uint8_t* digest) noexcept {
    if (ctx == nullptr || digest == nullptr || ctx->finalized) {
        return PQKEM_ERROR_INVALID_PARAM;
    }
    sponge_squeeze(ctx, digest, ctx->digest_size);
    pqkem_sha3_clear(ctx);
    return PQKEM_SUCCESS;
}

pqkem_error_t digest_oneshot(size_t digest_size, const uint8_t* data, size_t len,
                             uint8_t* digest) noexcept {
    if (digest == nullptr || bad_input(data, len)) {
        return PQKEM_ERROR_INVALID_PARAM;
    }
    pqkem_sha3_ctx_t ctx;
    digest_init(&ctx, digest_size);
    sponge_absorb(&ctx, data, len);
    return digest_final(&ctx, digest);
}

pqkem_error_t xof_init(pqkem_sha3_ctx_t* ctx, size_t rate) noexcept {
    if (ctx == nullptr) return PQKEM_ERROR_INVALID_PARAM;
    sponge_init(ctx, rate, kShakeSuffix, 0);
    return PQKEM_SUCCESS;
}

pqkem_error_t xof_oneshot(size_t rate, const uint8_t* data, size_t len,
                          uint8_t* out, size_t out_len) noexcept {
    if (out == nullptr || bad_input(data, len)) {
        return PQKEM_ERROR_INVALID_PARAM;
    }
    pqkem_sha3_ctx_t ctx;
    xof_init(&ctx, rate);
    sponge_absorb(&ctx, data, len);
    sponge_squeeze(&ctx, out, out_len);
    pqkem_sha3_clear(&ctx);
    return PQKEM_SUCCESS;
}

} // anonymous namespace

extern "C" {

pqkem_error_t pqkem_sha3_256_init(pqkem_sha3_ctx_t* ctx) {
    return digest_init(ctx, PQKEM_SHA3_256_DIGEST_SIZE);
}

pqkem_error_t pqkem_sha3_256_update(pqkem_sha3_ctx_t* ctx,
                                     const uint8_t* data, size_t len) {
    return digest_update(ctx, data, len);
}

pqkem_error_t pqkem_sha3_256_final(pqkem_sha3_ctx_t* ctx,
                                    uint8_t digest[PQKEM_SHA3_256_DIGEST_SIZE]) {
    return digest_final(ctx, digest);
}

pqkem_error_t pqkem_sha3_256(const uint8_t* data, size_t len,
                              uint8_t digest[PQKEM_SHA3_256_DIGEST_SIZE]) {
    return digest_oneshot(PQKEM_SHA3_256_DIGEST_SIZE, data, len, digest);
}

pqkem_error_t pqkem_sha3_512_init(pqkem_sha3_ctx_t* ctx) {
    return digest_init(ctx, PQKEM_SHA3_512_DIGEST_SIZE);
}

pqkem_error_t pqkem_sha3_512_update(pqkem_sha3_ctx_t* ctx,
                                     const uint8_t* data, size_t len) {
    return digest_update(ctx, data, len);
}

pqkem_error_t pqkem_sha3_512_final(pqkem_sha3_ctx_t* ctx,
                                    uint8_t digest[PQKEM_SHA3_512_DIGEST_SIZE]) {
    return digest_final(ctx, digest);
}

pqkem_error_t pqkem_sha3_512(const uint8_t* data, size_t len,
                              uint8_t digest[PQKEM_SHA3_512_DIGEST_SIZE]) {
    return digest_oneshot(PQKEM_SHA3_512_DIGEST_SIZE, data, len, digest);
}

pqkem_error_t pqkem_shake128(const uint8_t* data, size_t len,
                              uint8_t* output, size_t output_len) {
    return xof_oneshot(PQKEM_SHAKE128_RATE, data, len, output, output_len);
}

pqkem_error_t pqkem_shake256(const uint8_t* data, size_t len,
                              uint8_t* output, size_t output_len) {
    return xof_oneshot(PQKEM_SHAKE256_RATE, data, len, output, output_len);
}

pqkem_error_t pqkem_shake128_init(pqkem_sha3_ctx_t* ctx) {
    return xof_init(ctx, PQKEM_SHAKE128_RATE);
}

pqkem_error_t pqkem_shake256_init(pqkem_sha3_ctx_t* ctx) {
    return xof_init(ctx, PQKEM_SHAKE256_RATE);
}

pqkem_error_t pqkem_shake_absorb(pqkem_sha3_ctx_t* ctx,
                                  const uint8_t* data, size_t len) {
    return digest_update(ctx, data, len);
}

pqkem_error_t pqkem_shake_squeeze(pqkem_sha3_ctx_t* ctx,
                                   uint8_t* output, size_t output_len) {
    if (ctx == nullptr || (output == nullptr && output_len > 0)) {
        return PQKEM_ERROR_INVALID_PARAM;
    }
    sponge_squeeze(ctx, output, output_len);
    return PQKEM_SUCCESS;
}

void pqkem_sha3_clear(pqkem_sha3_ctx_t* ctx) {
    if (ctx != nullptr) {
        pqkem_secure_zero(ctx, sizeof(*ctx));
    }
}

} // extern "C"
