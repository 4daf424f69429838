/**
 * @file sampler.h
 * @brief ML-KEM sampling and hash primitives
 *
 * - SampleNTT: uniform rejection sampling from SHAKE128(rho || j || i)
 * - SamplePolyCBD: centered binomial noise from PRF output
 * - G = SHA3-512, H = SHA3-256, J = SHAKE256(z || c, 32),
 *   PRF_eta(s, b) = SHAKE256(s || b, 64*eta)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_MLKEM_SAMPLER_H
#define PQKEM_MLKEM_SAMPLER_H

#include "pqkem/mlkem/field.h"
#include "pqkem/core/types.h"

namespace pqkem {
namespace mlkem {

// ============================================================================
// Hash Primitives
// ============================================================================

/**
 * @brief G(in) = SHA3-512(in), split into two 32-byte halves
 */
void hash_g(const uint8_t* in, size_t len, Seed32& first, Seed32& second);

/**
 * @brief H(in) = SHA3-256(in)
 */
SHA3_256Digest hash_h(const uint8_t* in, size_t len);

/**
 * @brief J(z, c) = SHAKE256(z || c, 32), the implicit-rejection key
 */
Seed32 hash_j(const Seed32& z, const uint8_t* c, size_t c_len);

/**
 * @brief PRF_eta(s, b) = SHAKE256(s || b, 64*eta)
 */
ByteVec prf(unsigned eta, const Seed32& s, uint8_t b);

/**
 * @brief Master seed expansion: (d || z) = SHAKE256(seed, 64)
 */
void expand_seed(const Seed32& seed, Seed32& d, Seed32& z);

// ============================================================================
// Sampling
// ============================================================================

/**
 * @brief SampleNTT (FIPS 203 Algorithm 6), entry from XOF(rho || j || i)
 *
 * Acceptance is counted with mask arithmetic; candidates are always written
 * and only the write position advances conditionally.
 */
NttPoly sample_ntt(const Seed32& rho, uint8_t j, uint8_t i);

/**
 * @brief Generate Â with Â[i][j] = SampleNTT(rho, j, i)
 */
NttMatrix sample_matrix(const Seed32& rho, size_t k);

/**
 * @brief SamplePolyCBD_eta (FIPS 203 Algorithm 7)
 * @param bytes 64*eta input bytes
 */
Poly sample_poly_cbd(unsigned eta, const uint8_t* bytes) noexcept;

/**
 * @brief k CBD samples PRF_eta(seed, nonce), PRF_eta(seed, nonce+1), ...
 *
 * nonce is advanced past the last counter used.
 */
PolyVec sample_noise_vector(unsigned eta, const Seed32& seed, size_t k,
                            uint8_t& nonce);

} // namespace mlkem
} // namespace pqkem

#endif // PQKEM_MLKEM_SAMPLER_H
