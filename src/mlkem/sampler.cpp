/**
 * @file sampler.cpp
 * @brief SampleNTT, SamplePolyCBD and the G/H/J/PRF hash wrappers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "pqkem/mlkem/sampler.h"
#include "pqkem/crypto/sha3.h"
#include "pqkem/core/security.h"
#include <cstring>
#include <stdexcept>

namespace pqkem {
namespace mlkem {

namespace {

void check_hash(pqkem_error_t rc) {
    if (rc != PQKEM_SUCCESS) {
        throw std::runtime_error("SHA3 failed");
    }
}

/**
 * @brief Incremental SHAKE128 stream, wiped on destruction
 */
class Shake128Stream {
public:
    Shake128Stream() { check_hash(pqkem_shake128_init(&ctx_)); }
    ~Shake128Stream() { pqkem_sha3_clear(&ctx_); }

    Shake128Stream(const Shake128Stream&) = delete;
    Shake128Stream& operator=(const Shake128Stream&) = delete;

    void absorb(const uint8_t* data, size_t len) {
        check_hash(pqkem_shake_absorb(&ctx_, data, len));
    }
    void squeeze(uint8_t* out, size_t len) {
        check_hash(pqkem_shake_squeeze(&ctx_, out, len));
    }

private:
    pqkem_sha3_ctx_t ctx_;
};

} // anonymous namespace

// ============================================================================
// Hash Primitives
// ============================================================================

void hash_g(const uint8_t* in, size_t len, Seed32& first, Seed32& second) {
    SHA3_512Digest digest;
    check_hash(pqkem_sha3_512(in, len, digest.data()));
    std::memcpy(first.data(), digest.data(), 32);
    std::memcpy(second.data(), digest.data() + 32, 32);
    secure_wipe(digest);
}

SHA3_256Digest hash_h(const uint8_t* in, size_t len) {
    SHA3_256Digest digest;
    check_hash(pqkem_sha3_256(in, len, digest.data()));
    return digest;
}

Seed32 hash_j(const Seed32& z, const uint8_t* c, size_t c_len) {
    pqkem_sha3_ctx_t ctx;
    Seed32 out;
    check_hash(pqkem_shake256_init(&ctx));
    check_hash(pqkem_shake_absorb(&ctx, z.data(), z.size()));
    check_hash(pqkem_shake_absorb(&ctx, c, c_len));
    check_hash(pqkem_shake_squeeze(&ctx, out.data(), out.size()));
    pqkem_sha3_clear(&ctx);
    return out;
}

ByteVec prf(unsigned eta, const Seed32& s, uint8_t b) {
    uint8_t input[33];
    std::memcpy(input, s.data(), 32);
    input[32] = b;

    ByteVec out(64 * eta);
    check_hash(pqkem_shake256(input, sizeof(input), out.data(), out.size()));
    internal::secure_zero(input, sizeof(input));
    return out;
}

void expand_seed(const Seed32& seed, Seed32& d, Seed32& z) {
    uint8_t buf[64];
    check_hash(pqkem_shake256(seed.data(), seed.size(), buf, sizeof(buf)));
    std::memcpy(d.data(), buf, 32);
    std::memcpy(z.data(), buf + 32, 32);
    internal::secure_zero(buf, sizeof(buf));
}

// ============================================================================
// Uniform Sampling
// ============================================================================

NttPoly sample_ntt(const Seed32& rho, uint8_t j, uint8_t i) {
    Shake128Stream xof;
    const uint8_t indices[2] = {j, i};
    xof.absorb(rho.data(), rho.size());
    xof.absorb(indices, sizeof(indices));

    // Two slack slots: each 3-byte group writes two candidates unconditionally
    std::array<uint16_t, MLKEM_N + 2> accepted{};
    uint8_t block[PQKEM_SHAKE128_RATE];
    size_t done = 0;

    while (done < MLKEM_N) {
        xof.squeeze(block, sizeof(block));
        for (size_t off = 0; off + 3 <= sizeof(block) && done < MLKEM_N; off += 3) {
            const uint16_t d1 = static_cast<uint16_t>(
                block[off] | ((block[off + 1] & 0x0F) << 8));
            const uint16_t d2 = static_cast<uint16_t>(
                (block[off + 1] >> 4) | (block[off + 2] << 4));

            accepted[done] = d1;
            done += (static_cast<uint32_t>(d1) - MLKEM_Q) >> 31;
            accepted[done] = d2;
            done += (static_cast<uint32_t>(d2) - MLKEM_Q) >> 31;
        }
    }

    NttPoly out;
    std::memcpy(out.coeffs.data(), accepted.data(), MLKEM_N * sizeof(uint16_t));
    return out;
}

NttMatrix sample_matrix(const Seed32& rho, size_t k) {
    NttMatrix a(k);
    for (size_t i = 0; i < k; ++i) {
        for (size_t j = 0; j < k; ++j) {
            a.at(i, j) = sample_ntt(rho, static_cast<uint8_t>(j), static_cast<uint8_t>(i));
        }
    }
    return a;
}

// ============================================================================
// Centered Binomial Sampling
// ============================================================================

Poly sample_poly_cbd(unsigned eta, const uint8_t* bytes) noexcept {
    Poly f;
    size_t bit = 0;

    for (size_t i = 0; i < MLKEM_N; ++i) {
        uint16_t x = 0;
        uint16_t y = 0;
        for (unsigned b = 0; b < eta; ++b, ++bit) {
            x = static_cast<uint16_t>(x + ((bytes[bit >> 3] >> (bit & 7)) & 1));
        }
        for (unsigned b = 0; b < eta; ++b, ++bit) {
            y = static_cast<uint16_t>(y + ((bytes[bit >> 3] >> (bit & 7)) & 1));
        }
        // x - y in [-eta, eta], shifted into [q - eta, q + eta]
        f.coeffs[i] = reduce_once(static_cast<uint16_t>(x + MLKEM_Q - y));
    }
    return f;
}

PolyVec sample_noise_vector(unsigned eta, const Seed32& seed, size_t k,
                            uint8_t& nonce) {
    PolyVec v(k);
    for (size_t i = 0; i < k; ++i) {
        ByteVec buf = prf(eta, seed, nonce++);
        v[i] = sample_poly_cbd(eta, buf.data());
        secure_wipe(buf);
    }
    return v;
}

} // namespace mlkem
} // namespace pqkem
