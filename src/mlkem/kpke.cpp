/**
 * @file kpke.cpp
 * @brief K-PKE key expansion, encryption and decryption
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "pqkem/mlkem/kpke.h"
#include "pqkem/mlkem/codec.h"
#include "pqkem/mlkem/ntt.h"
#include "pqkem/mlkem/sampler.h"
#include "pqkem/core/security.h"
#include <cstring>

namespace pqkem {
namespace mlkem {

void KPKE::expand_private(const Seed32& rho, const Seed32& sigma,
                          NttMatrix& a_hat, NttVector& t_hat,
                          NttVector& s_hat) const {
    const size_t k = params_.k;
    const unsigned eta1 = static_cast<unsigned>(params_.eta1);

    a_hat = sample_matrix(rho, k);

    uint8_t nonce = 0;
    PolyVec s = sample_noise_vector(eta1, sigma, k, nonce);
    PolyVec e = sample_noise_vector(eta1, sigma, k, nonce);

    s_hat = ntt(s);
    NttVector e_hat = ntt(e);

    t_hat = matrix_multiply(a_hat, s_hat, false);
    t_hat += e_hat;

    s.clear();
    e.clear();
    e_hat.clear();
}

void KPKE::expand_public(const uint8_t* ek, size_t ek_len,
                         NttMatrix& a_hat, NttVector& t_hat) const {
    check_length("ML-KEM encapsulation key", ek_len, params_.public_key_size);

    const size_t t_len = MLKEM_POLY_BYTES * params_.k;
    t_hat = decode_ntt_vector(ek, t_len, params_.k);

    Seed32 rho;
    std::memcpy(rho.data(), ek + t_len, rho.size());
    a_hat = sample_matrix(rho, params_.k);
}

ByteVec KPKE::encrypt(const NttMatrix& a_hat, const NttVector& t_hat,
                      const uint8_t m[MLKEM_MESSAGE_SIZE], const Seed32& r) const {
    const size_t k = params_.k;
    const unsigned eta1 = static_cast<unsigned>(params_.eta1);
    const unsigned eta2 = static_cast<unsigned>(params_.eta2);
    const unsigned du = static_cast<unsigned>(params_.du);
    const unsigned dv = static_cast<unsigned>(params_.dv);

    uint8_t nonce = 0;
    PolyVec y = sample_noise_vector(eta1, r, k, nonce);
    PolyVec e1 = sample_noise_vector(eta2, r, k, nonce);
    PolyVec e2_vec = sample_noise_vector(eta2, r, 1, nonce);

    NttVector y_hat = ntt(y);

    // u = invNTT(Â^T∘ŷ) + e1
    PolyVec u = inv_ntt(matrix_multiply(a_hat, y_hat, true));
    u += e1;

    // mu = Decompress_1(ByteDecode_1(m))
    Poly mu;
    byte_decode(1, m, mu.coeffs);
    decompress_poly(1, mu);

    // v = invNTT(t̂∘ŷ) + e2 + mu
    Poly v = inv_ntt(inner_product(t_hat, y_hat));
    v += e2_vec[0];
    v += mu;

    ByteVec c = compress_encode_vector(du, u);
    Poly c2 = v;
    compress_poly(dv, c2);
    const size_t c1_len = c.size();
    c.resize(c1_len + 32 * dv);
    byte_encode(dv, c2.coeffs, c.data() + c1_len);

    y.clear();
    y_hat.clear();
    e1.clear();
    e2_vec.clear();
    mu.clear();
    u.clear();
    v.clear();
    c2.clear();
    return c;
}

Seed32 KPKE::decrypt(const NttVector& s_hat, const uint8_t* c, size_t c_len) const {
    check_length("ML-KEM ciphertext", c_len, params_.ciphertext_size);

    const size_t k = params_.k;
    const unsigned du = static_cast<unsigned>(params_.du);
    const unsigned dv = static_cast<unsigned>(params_.dv);

    PolyVec u = decode_decompress_vector(du, c, k);
    Poly v;
    byte_decode(dv, c + 32 * du * k, v.coeffs);
    decompress_poly(dv, v);

    // w = v - invNTT(ŝ∘NTT(u))
    Poly w = v - inv_ntt(inner_product(s_hat, ntt(u)));
    compress_poly(1, w);

    Seed32 m;
    byte_encode(1, w.coeffs, m.data());

    w.clear();
    return m;
}

ByteVec KPKE::encode_public(const NttVector& t_hat, const Seed32& rho) const {
    ByteVec ek = encode_ntt_vector(t_hat);
    ek.insert(ek.end(), rho.begin(), rho.end());
    return ek;
}

ByteVec KPKE::encode_secret(const NttVector& s_hat) const {
    return encode_ntt_vector(s_hat);
}

NttVector KPKE::decode_secret(const uint8_t* in, size_t len) const {
    return decode_ntt_vector(in, len, params_.k);
}

} // namespace mlkem
} // namespace pqkem
