/**
 * @file kpke.h
 * @brief K-PKE, the CPA-secure module-LWE encryption scheme under ML-KEM
 *
 * Operates on expanded material (Â, t̂, ŝ) rather than on byte-encoded keys,
 * so the caller decides whether to recompute or reuse it. None of these
 * routines fail once input lengths are right: a malformed ciphertext
 * decrypts to some well-formed 32-byte message.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_MLKEM_KPKE_H
#define PQKEM_MLKEM_KPKE_H

#include "pqkem/mlkem/params.h"
#include "pqkem/mlkem/field.h"
#include "pqkem/core/types.h"

namespace pqkem {
namespace mlkem {

/**
 * @brief K-PKE bound to one parameter set
 */
class KPKE {
public:
    explicit KPKE(const MLKEMParams& params) : params_(params) {}

    const MLKEMParams& get_params() const { return params_; }

    /**
     * @brief Derive (Â, t̂, ŝ) from (rho, sigma)
     *
     * s and e use PRF counters 0..k-1 and k..2k-1 at eta1; t̂ = Â∘ŝ + ê.
     */
    void expand_private(const Seed32& rho, const Seed32& sigma,
                        NttMatrix& a_hat, NttVector& t_hat, NttVector& s_hat) const;

    /**
     * @brief Decode t̂ from ek and regenerate Â from its trailing rho
     * @throws EncodingError if ek_len != 384k + 32
     */
    void expand_public(const uint8_t* ek, size_t ek_len,
                       NttMatrix& a_hat, NttVector& t_hat) const;

    /**
     * @brief K-PKE.Encrypt with randomness r
     * @return c = Compress_du(u) || Compress_dv(v)
     */
    ByteVec encrypt(const NttMatrix& a_hat, const NttVector& t_hat,
                    const uint8_t m[MLKEM_MESSAGE_SIZE], const Seed32& r) const;

    /**
     * @brief K-PKE.Decrypt
     * @throws EncodingError if c_len != ciphertext size
     */
    Seed32 decrypt(const NttVector& s_hat, const uint8_t* c, size_t c_len) const;

    /**
     * @brief ek = ByteEncode_12(t̂) || rho
     */
    ByteVec encode_public(const NttVector& t_hat, const Seed32& rho) const;

    /**
     * @brief ByteEncode_12(ŝ)
     */
    ByteVec encode_secret(const NttVector& s_hat) const;

    /**
     * @brief Inverse of encode_secret
     * @throws EncodingError if len != 384k
     */
    NttVector decode_secret(const uint8_t* in, size_t len) const;

private:
    MLKEMParams params_;
};

} // namespace mlkem
} // namespace pqkem

#endif // PQKEM_MLKEM_KPKE_H
