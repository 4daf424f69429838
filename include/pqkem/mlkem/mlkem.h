/**
 * @file mlkem.h
 * @brief ML-KEM Key Encapsulation Mechanism (FIPS 203) with seed-form keys
 *
 * The decapsulation key is the 32-byte master seed. Every private operation
 * re-derives (Â, t̂, ŝ, ek, H(ek), z) from it:
 *
 *   (d || z)       = SHAKE256(seed, 64)
 *   (rho || sigma) = SHA3-512(d)
 *
 * which is the FIPS 203 KeyGen(d, z) derivation, so the classic 768k+96 byte
 * key can always be produced from a seed (expand_secret_key) and is still
 * accepted by decaps.
 *
 * Usage:
 * @code
 *   pqkem::mlkem::MLKEM kem;                      // ML-KEM-768
 *   auto kp = kem.keygen();
 *   pqkem::mlkem::SharedSecret ss_sender;
 *   auto ct = kem.encaps(kp.public_key, ss_sender);
 *   auto ss_receiver = kem.decaps(kp.secret_key, ct);
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_MLKEM_MLKEM_H
#define PQKEM_MLKEM_MLKEM_H

#include "pqkem/mlkem/params.h"
#include "pqkem/mlkem/field.h"
#include "pqkem/mlkem/codec.h"
#include "pqkem/core/types.h"
#include <array>
#include <utility>
#include <vector>

namespace pqkem {
namespace mlkem {

// ============================================================================
// Data Structures
// ============================================================================

using SharedSecret = std::array<uint8_t, MLKEM_SHARED_SECRET_SIZE>;

/**
 * @brief ML-KEM encapsulation key, ByteEncode_12(t̂) || rho
 */
struct MLKEMPublicKey {
    std::vector<uint8_t> data;

    size_t size() const { return data.size(); }
    const uint8_t* bytes() const { return data.data(); }
};

/**
 * @brief ML-KEM decapsulation key
 *
 * Either the 32-byte seed or the classic ŝ || ek || H(ek) || z encoding.
 */
struct MLKEMSecretKey {
    std::vector<uint8_t> data;

    size_t size() const { return data.size(); }
    const uint8_t* bytes() const { return data.data(); }
    bool is_seed() const { return data.size() == MLKEM_SEED_SIZE; }

    void clear();  // Secure zeroing
};

/**
 * @brief ML-KEM key pair
 */
struct MLKEMKeyPair {
    MLKEMPublicKey public_key;
    MLKEMSecretKey secret_key;
};

/**
 * @brief ML-KEM ciphertext, Compress_du(u) || Compress_dv(v)
 */
struct MLKEMCiphertext {
    std::vector<uint8_t> data;

    size_t size() const { return data.size(); }
    const uint8_t* bytes() const { return data.data(); }
};

/**
 * @brief Everything decapsulation needs, as unpacked from a secret key
 *
 * Caller-owned. Holding one across decaps calls skips re-derivation and
 * gives the same results as unpacking each time.
 */
struct ExpandedPrivateKey {
    NttMatrix a_hat;
    NttVector t_hat;
    NttVector s_hat;
    MLKEMPublicKey ek;
    SHA3_256Digest h{};
    Seed32 z{};

    void clear();  // Secure zeroing of ŝ and z
};

// ============================================================================
// ML-KEM
// ============================================================================

/**
 * @brief ML-KEM bound to one parameter set
 *
 * Immutable after construction; one instance may be shared between threads.
 */
class MLKEM {
public:
    /**
     * @brief Construct with security level
     * @param level MLKEM512, MLKEM768 or MLKEM1024
     */
    explicit MLKEM(MLKEMLevel level = MLKEMLevel::MLKEM768);

    const MLKEMParams& get_params() const { return params_; }
    MLKEMLevel get_level() const { return level_; }

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate a key pair from 32 fresh random bytes
     * @return (ek, seed-form dk)
     * @throws std::runtime_error if the CSPRNG fails
     */
    MLKEMKeyPair keygen() const;

    /**
     * @brief Deterministic key generation from a master seed
     */
    MLKEMKeyPair keygen_derand(const Seed32& seed) const;

    /**
     * @brief FIPS 203 KeyGen from explicit (d, z), classic-form dk
     */
    MLKEMKeyPair keygen_internal(const Seed32& d, const Seed32& z) const;

    /**
     * @brief Re-derive the working key material from a master seed
     */
    ExpandedPrivateKey unpack_private(const Seed32& seed) const;

    /**
     * @brief Unpack a seed-form or classic-form secret key
     * @throws EncodingError if dk is neither 32 nor 768k+96 bytes
     */
    ExpandedPrivateKey unpack_private(const MLKEMSecretKey& dk) const;

    /**
     * @brief Classic-form encoding ŝ || ek || H(ek) || z of a seed key
     */
    MLKEMSecretKey expand_secret_key(const Seed32& seed) const;

    // ========================================================================
    // Encapsulation/Decapsulation
    // ========================================================================

    /**
     * @brief Encapsulate: generate shared secret and ciphertext
     * @param public_key Recipient's encapsulation key
     * @param shared_secret Output: shared secret (32 bytes)
     * @return Ciphertext
     * @throws EncodingError on a wrong-length key
     * @throws std::runtime_error if the CSPRNG fails
     */
    MLKEMCiphertext encaps(const MLKEMPublicKey& public_key,
                           SharedSecret& shared_secret) const;

    /**
     * @brief Deterministic encapsulation with message m
     */
    MLKEMCiphertext encaps_derand(const MLKEMPublicKey& public_key,
                                  const Seed32& m,
                                  SharedSecret& shared_secret) const;

    /**
     * @brief Decapsulate: recover shared secret from ciphertext
     *
     * A ciphertext that does not re-encrypt identically yields the
     * implicit-rejection key J(z || c); the two cases are not distinguishable
     * by return shape.
     *
     * @throws EncodingError on a wrong-length key or ciphertext
     */
    SharedSecret decaps(const MLKEMSecretKey& secret_key,
                        const MLKEMCiphertext& ciphertext) const;

    /**
     * @brief Decapsulate with already unpacked key material
     * @throws EncodingError on a wrong-length ciphertext
     */
    SharedSecret decaps(const ExpandedPrivateKey& key,
                        const MLKEMCiphertext& ciphertext) const;

private:
    MLKEMLevel level_;
    MLKEMParams params_;

    ExpandedPrivateKey expand_from_d(const Seed32& d, const Seed32& z) const;
    ExpandedPrivateKey unpack_classic(const MLKEMSecretKey& dk) const;
};

// ============================================================================
// High-Level API
// ============================================================================

/**
 * @brief Generate ML-KEM key pair
 */
MLKEMKeyPair mlkem_keygen(MLKEMLevel level = MLKEMLevel::MLKEM768);

/**
 * @brief ML-KEM encapsulation
 * @return (ciphertext, shared_secret)
 */
std::pair<MLKEMCiphertext, SharedSecret>
mlkem_encaps(const MLKEMPublicKey& pk, MLKEMLevel level = MLKEMLevel::MLKEM768);

/**
 * @brief ML-KEM decapsulation
 */
SharedSecret mlkem_decaps(const MLKEMSecretKey& sk, const MLKEMCiphertext& ct,
                          MLKEMLevel level = MLKEMLevel::MLKEM768);

} // namespace mlkem
} // namespace pqkem

#endif // PQKEM_MLKEM_MLKEM_H
