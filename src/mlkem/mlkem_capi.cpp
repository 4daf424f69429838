/**
 * @file mlkem_capi.cpp
 * @brief ML-KEM-768 C ABI Export
 *
 * Thin extern "C" layer over pqkem::mlkem::MLKEM. Randomness is drawn here
 * so CSPRNG failure maps to its own error code; the C++ exceptions left
 * (EncodingError and the rest) are translated to pqkem_error_t.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "pqkem_api.h"
#include "pqkem/mlkem/mlkem.h"
#include "pqkem/core/security.h"
#include <cstring>
#include <exception>

using pqkem::Seed32;
using pqkem::mlkem::EncodingError;
using pqkem::mlkem::MLKEM;
using pqkem::mlkem::MLKEMCiphertext;
using pqkem::mlkem::MLKEMKeyPair;
using pqkem::mlkem::MLKEMLevel;
using pqkem::mlkem::MLKEMPublicKey;
using pqkem::mlkem::MLKEMSecretKey;
using pqkem::mlkem::SharedSecret;

namespace {

const MLKEM& mlkem768() {
    static const MLKEM kem(MLKEMLevel::MLKEM768);
    return kem;
}

} // anonymous namespace

extern "C" {

pqkem_error_t pqkem_mlkem768_keygen(uint8_t ek[PQKEM_MLKEM768_PUBLIC_KEY_SIZE],
                                    uint8_t dk[PQKEM_MLKEM768_SEED_SIZE]) {
    if (!ek || !dk) {
        return PQKEM_ERROR_INVALID_PARAM;
    }

    Seed32 seed;
    if (pqkem::internal::random_bytes(seed.data(), seed.size()) != PQKEM_SUCCESS) {
        return PQKEM_ERROR_RANDOM_FAILED;
    }

    pqkem_error_t rc = pqkem_mlkem768_keygen_derand(seed.data(), ek);
    if (rc == PQKEM_SUCCESS) {
        std::memcpy(dk, seed.data(), seed.size());
    }
    pqkem::secure_wipe(seed);
    return rc;
}

pqkem_error_t pqkem_mlkem768_keygen_derand(const uint8_t seed[PQKEM_MLKEM768_SEED_SIZE],
                                           uint8_t ek[PQKEM_MLKEM768_PUBLIC_KEY_SIZE]) {
    if (!seed || !ek) {
        return PQKEM_ERROR_INVALID_PARAM;
    }

    Seed32 s;
    std::memcpy(s.data(), seed, s.size());
    try {
        MLKEMKeyPair kp = mlkem768().keygen_derand(s);
        std::memcpy(ek, kp.public_key.bytes(), PQKEM_MLKEM768_PUBLIC_KEY_SIZE);
        kp.secret_key.clear();
    } catch (const std::exception&) {
        pqkem::secure_wipe(s);
        return PQKEM_ERROR_INTERNAL;
    }
    pqkem::secure_wipe(s);
    return PQKEM_SUCCESS;
}

pqkem_error_t pqkem_mlkem768_encaps(const uint8_t* ek, size_t ek_len,
                                    uint8_t ct[PQKEM_MLKEM768_CIPHERTEXT_SIZE],
                                    uint8_t ss[PQKEM_MLKEM768_SHARED_SECRET_SIZE]) {
    if (!ek || !ct || !ss) {
        return PQKEM_ERROR_INVALID_PARAM;
    }
    if (ek_len != PQKEM_MLKEM768_PUBLIC_KEY_SIZE) {
        return PQKEM_ERROR_INVALID_ENCODING;
    }

    Seed32 m;
    if (pqkem::internal::random_bytes(m.data(), m.size()) != PQKEM_SUCCESS) {
        return PQKEM_ERROR_RANDOM_FAILED;
    }

    pqkem_error_t rc = PQKEM_SUCCESS;
    try {
        MLKEMPublicKey pk;
        pk.data.assign(ek, ek + ek_len);

        SharedSecret secret;
        MLKEMCiphertext c = mlkem768().encaps_derand(pk, m, secret);
        std::memcpy(ct, c.bytes(), PQKEM_MLKEM768_CIPHERTEXT_SIZE);
        std::memcpy(ss, secret.data(), secret.size());
        pqkem::secure_wipe(secret);
    } catch (const EncodingError&) {
        rc = PQKEM_ERROR_INVALID_ENCODING;
    } catch (const std::exception&) {
        rc = PQKEM_ERROR_INTERNAL;
    }
    pqkem::secure_wipe(m);
    return rc;
}

pqkem_error_t pqkem_mlkem768_decaps(const uint8_t* dk, size_t dk_len,
                                    const uint8_t* ct, size_t ct_len,
                                    uint8_t ss[PQKEM_MLKEM768_SHARED_SECRET_SIZE]) {
    if (!dk || !ct || !ss) {
        return PQKEM_ERROR_INVALID_PARAM;
    }
    if (ct_len != PQKEM_MLKEM768_CIPHERTEXT_SIZE ||
        (dk_len != PQKEM_MLKEM768_SEED_SIZE && dk_len != PQKEM_MLKEM768_SECRET_KEY_SIZE)) {
        return PQKEM_ERROR_INVALID_ENCODING;
    }

    pqkem_error_t rc = PQKEM_SUCCESS;
    MLKEMSecretKey sk;
    try {
        sk.data.assign(dk, dk + dk_len);

        MLKEMCiphertext c;
        c.data.assign(ct, ct + ct_len);

        SharedSecret secret = mlkem768().decaps(sk, c);
        std::memcpy(ss, secret.data(), secret.size());
        pqkem::secure_wipe(secret);
    } catch (const EncodingError&) {
        rc = PQKEM_ERROR_INVALID_ENCODING;
    } catch (const std::exception&) {
        rc = PQKEM_ERROR_INTERNAL;
    }
    sk.clear();
    return rc;
}

pqkem_error_t pqkem_mlkem768_expand_secret_key(const uint8_t seed[PQKEM_MLKEM768_SEED_SIZE],
                                               uint8_t dk[PQKEM_MLKEM768_SECRET_KEY_SIZE]) {
    if (!seed || !dk) {
        return PQKEM_ERROR_INVALID_PARAM;
    }

    Seed32 s;
    std::memcpy(s.data(), seed, s.size());
    pqkem_error_t rc = PQKEM_SUCCESS;
    try {
        MLKEMSecretKey classic = mlkem768().expand_secret_key(s);
        std::memcpy(dk, classic.bytes(), PQKEM_MLKEM768_SECRET_KEY_SIZE);
        classic.clear();
    } catch (const std::exception&) {
        rc = PQKEM_ERROR_INTERNAL;
    }
    pqkem::secure_wipe(s);
    return rc;
}

} // extern "C"
