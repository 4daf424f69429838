/**
 * @file mlkem.cpp
 * @brief ML-KEM key generation, encapsulation and decapsulation
 *
 * Seed-form decapsulation keys: the 32-byte seed is the whole private key
 * and is unpacked on every use. Classic-form keys are accepted for
 * compatibility with FIPS 203 test vectors.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "pqkem/mlkem/mlkem.h"
#include "pqkem/mlkem/kpke.h"
#include "pqkem/mlkem/sampler.h"
#include "pqkem/core/security.h"
#include <cstring>
#include <stdexcept>
#include <string>

namespace pqkem {
namespace mlkem {

namespace {

void fill_random(uint8_t* buf, size_t len) {
    if (internal::random_bytes(buf, len) != PQKEM_SUCCESS) {
        throw std::runtime_error("RNG failed");
    }
}

// ŝ || ek || H(ek) || z
ByteVec encode_classic(const KPKE& pke, const ExpandedPrivateKey& key) {
    ByteVec dk = pke.encode_secret(key.s_hat);
    dk.insert(dk.end(), key.ek.data.begin(), key.ek.data.end());
    dk.insert(dk.end(), key.h.begin(), key.h.end());
    dk.insert(dk.end(), key.z.begin(), key.z.end());
    return dk;
}

} // anonymous namespace

// ============================================================================
// Key Structures
// ============================================================================

void MLKEMSecretKey::clear() {
    secure_wipe(data);
    data.clear();
}

void ExpandedPrivateKey::clear() {
    s_hat.clear();
    secure_wipe(z);
}

// ============================================================================
// MLKEM Implementation
// ============================================================================

MLKEM::MLKEM(MLKEMLevel level) : level_(level), params_(MLKEMParams::get(level)) {}

ExpandedPrivateKey MLKEM::expand_from_d(const Seed32& d, const Seed32& z) const {
    KPKE pke(params_);

    Seed32 rho;
    Seed32 sigma;
    hash_g(d.data(), d.size(), rho, sigma);

    ExpandedPrivateKey key;
    pke.expand_private(rho, sigma, key.a_hat, key.t_hat, key.s_hat);
    key.ek.data = pke.encode_public(key.t_hat, rho);
    key.h = hash_h(key.ek.bytes(), key.ek.size());
    key.z = z;

    secure_wipe(sigma);
    return key;
}

ExpandedPrivateKey MLKEM::unpack_private(const Seed32& seed) const {
    Seed32 d;
    Seed32 z;
    expand_seed(seed, d, z);

    ExpandedPrivateKey key = expand_from_d(d, z);

    secure_wipe(d);
    secure_wipe(z);
    return key;
}

ExpandedPrivateKey MLKEM::unpack_classic(const MLKEMSecretKey& dk) const {
    KPKE pke(params_);
    const size_t s_len = MLKEM_POLY_BYTES * params_.k;
    const size_t ek_len = params_.public_key_size;
    const uint8_t* p = dk.bytes();

    ExpandedPrivateKey key;
    key.s_hat = pke.decode_secret(p, s_len);
    key.ek.data.assign(p + s_len, p + s_len + ek_len);
    pke.expand_public(key.ek.bytes(), ek_len, key.a_hat, key.t_hat);
    std::memcpy(key.h.data(), p + s_len + ek_len, key.h.size());
    std::memcpy(key.z.data(), p + s_len + ek_len + key.h.size(), key.z.size());
    return key;
}

ExpandedPrivateKey MLKEM::unpack_private(const MLKEMSecretKey& dk) const {
    if (dk.is_seed()) {
        Seed32 seed;
        std::memcpy(seed.data(), dk.bytes(), seed.size());
        ExpandedPrivateKey key = unpack_private(seed);
        secure_wipe(seed);
        return key;
    }
    if (dk.size() == params_.secret_key_size) {
        return unpack_classic(dk);
    }
    throw EncodingError("ML-KEM decapsulation key: expected " +
                        std::to_string(params_.seed_key_size) + " or " +
                        std::to_string(params_.secret_key_size) +
                        " bytes, got " + std::to_string(dk.size()));
}

MLKEMSecretKey MLKEM::expand_secret_key(const Seed32& seed) const {
    KPKE pke(params_);
    ExpandedPrivateKey key = unpack_private(seed);

    MLKEMSecretKey dk;
    dk.data = encode_classic(pke, key);
    key.clear();
    return dk;
}

// ============================================================================
// Key Generation
// ============================================================================

MLKEMKeyPair MLKEM::keygen() const {
    Seed32 seed;
    fill_random(seed.data(), seed.size());

    MLKEMKeyPair kp = keygen_derand(seed);
    secure_wipe(seed);
    return kp;
}

MLKEMKeyPair MLKEM::keygen_derand(const Seed32& seed) const {
    ExpandedPrivateKey key = unpack_private(seed);

    MLKEMKeyPair kp;
    kp.public_key = key.ek;
    kp.secret_key.data.assign(seed.begin(), seed.end());

    key.clear();
    return kp;
}

MLKEMKeyPair MLKEM::keygen_internal(const Seed32& d, const Seed32& z) const {
    KPKE pke(params_);
    ExpandedPrivateKey key = expand_from_d(d, z);

    MLKEMKeyPair kp;
    kp.public_key = key.ek;
    kp.secret_key.data = encode_classic(pke, key);

    key.clear();
    return kp;
}

// ============================================================================
// Encapsulation
// ============================================================================

MLKEMCiphertext MLKEM::encaps(const MLKEMPublicKey& public_key,
                              SharedSecret& shared_secret) const {
    check_length("ML-KEM encapsulation key", public_key.size(), params_.public_key_size);

    Seed32 m;
    fill_random(m.data(), m.size());

    MLKEMCiphertext ct = encaps_derand(public_key, m, shared_secret);
    secure_wipe(m);
    return ct;
}

MLKEMCiphertext MLKEM::encaps_derand(const MLKEMPublicKey& public_key,
                                     const Seed32& m,
                                     SharedSecret& shared_secret) const {
    KPKE pke(params_);

    NttMatrix a_hat;
    NttVector t_hat;
    pke.expand_public(public_key.bytes(), public_key.size(), a_hat, t_hat);

    // (K, r) = G(m || H(ek))
    const SHA3_256Digest h = hash_h(public_key.bytes(), public_key.size());
    uint8_t g_input[64];
    std::memcpy(g_input, m.data(), 32);
    std::memcpy(g_input + 32, h.data(), 32);

    Seed32 r;
    hash_g(g_input, sizeof(g_input), shared_secret, r);

    MLKEMCiphertext ct;
    ct.data = pke.encrypt(a_hat, t_hat, m.data(), r);

    internal::secure_zero(g_input, sizeof(g_input));
    secure_wipe(r);
    return ct;
}

// ============================================================================
// Decapsulation
// ============================================================================

SharedSecret MLKEM::decaps(const MLKEMSecretKey& secret_key,
                           const MLKEMCiphertext& ciphertext) const {
    check_length("ML-KEM ciphertext", ciphertext.size(), params_.ciphertext_size);

    ExpandedPrivateKey key = unpack_private(secret_key);
    SharedSecret ss = decaps(key, ciphertext);
    key.clear();
    return ss;
}

SharedSecret MLKEM::decaps(const ExpandedPrivateKey& key,
                           const MLKEMCiphertext& ciphertext) const {
    check_length("ML-KEM ciphertext", ciphertext.size(), params_.ciphertext_size);

    KPKE pke(params_);
    Seed32 m_prime = pke.decrypt(key.s_hat, ciphertext.bytes(), ciphertext.size());

    // (K', r') = G(m' || h)
    uint8_t g_input[64];
    std::memcpy(g_input, m_prime.data(), 32);
    std::memcpy(g_input + 32, key.h.data(), 32);

    Seed32 k_prime;
    Seed32 r_prime;
    hash_g(g_input, sizeof(g_input), k_prime, r_prime);

    const ByteVec c_prime = pke.encrypt(key.a_hat, key.t_hat, m_prime.data(), r_prime);
    Seed32 k_bar = hash_j(key.z, ciphertext.bytes(), ciphertext.size());

    // Both candidates are always computed; the choice is a mask, not a branch
    const uint8_t equal = internal::ct_equal_mask(c_prime.data(), ciphertext.bytes(),
                                                  ciphertext.size());
    SharedSecret ss;
    for (size_t i = 0; i < ss.size(); ++i) {
        ss[i] = internal::ct_select_u8(equal, k_bar[i], k_prime[i]);
    }

    secure_wipe(m_prime);
    internal::secure_zero(g_input, sizeof(g_input));
    secure_wipe(k_prime);
    secure_wipe(r_prime);
    secure_wipe(k_bar);
    return ss;
}

// ============================================================================
// High-Level API
// ============================================================================

MLKEMKeyPair mlkem_keygen(MLKEMLevel level) {
    MLKEM kem(level);
    return kem.keygen();
}

std::pair<MLKEMCiphertext, SharedSecret>
mlkem_encaps(const MLKEMPublicKey& pk, MLKEMLevel level) {
    MLKEM kem(level);
    SharedSecret ss;
    auto ct = kem.encaps(pk, ss);
    return {ct, ss};
}

SharedSecret mlkem_decaps(const MLKEMSecretKey& sk, const MLKEMCiphertext& ct,
                          MLKEMLevel level) {
    MLKEM kem(level);
    return kem.decaps(sk, ct);
}

} // namespace mlkem
} // namespace pqkem
