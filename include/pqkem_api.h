/**
 * @file pqkem_api.h
 * @brief pqkem Public C API Header
 *
 * The only header external C users need. Exposes ML-KEM-768 with
 * fixed-size buffers, plus library identity and error strings.
 *
 * Usage:
 * @code
 *   #include <pqkem_api.h>
 *
 *   uint8_t ek[PQKEM_MLKEM768_PUBLIC_KEY_SIZE];
 *   uint8_t dk[PQKEM_MLKEM768_SEED_SIZE];
 *   pqkem_mlkem768_keygen(ek, dk);
 *
 *   uint8_t ct[PQKEM_MLKEM768_CIPHERTEXT_SIZE], ss[PQKEM_MLKEM768_SHARED_SECRET_SIZE];
 *   pqkem_mlkem768_encaps(ek, sizeof(ek), ct, ss);
 * @endcode
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef PQKEM_API_H
#define PQKEM_API_H

#include "pqkem/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * ML-KEM-768 Sizes
 * ============================================================================ */

#define PQKEM_MLKEM768_PUBLIC_KEY_SIZE      1184
#define PQKEM_MLKEM768_SEED_SIZE            32
#define PQKEM_MLKEM768_SECRET_KEY_SIZE      2400
#define PQKEM_MLKEM768_CIPHERTEXT_SIZE      1088
#define PQKEM_MLKEM768_SHARED_SECRET_SIZE   32

/* ============================================================================
 * ML-KEM-768
 * ============================================================================ */

/**
 * @brief Generate a key pair; dk is the 32-byte seed
 * @return PQKEM_SUCCESS, PQKEM_ERROR_INVALID_PARAM or PQKEM_ERROR_RANDOM_FAILED
 */
PQKEM_API pqkem_error_t pqkem_mlkem768_keygen(
    uint8_t ek[PQKEM_MLKEM768_PUBLIC_KEY_SIZE],
    uint8_t dk[PQKEM_MLKEM768_SEED_SIZE]);

/**
 * @brief Derive the encapsulation key belonging to a seed
 */
PQKEM_API pqkem_error_t pqkem_mlkem768_keygen_derand(
    const uint8_t seed[PQKEM_MLKEM768_SEED_SIZE],
    uint8_t ek[PQKEM_MLKEM768_PUBLIC_KEY_SIZE]);

/**
 * @brief Encapsulate to ek
 * @return PQKEM_ERROR_INVALID_ENCODING if ek_len != 1184
 */
PQKEM_API pqkem_error_t pqkem_mlkem768_encaps(
    const uint8_t* ek, size_t ek_len,
    uint8_t ct[PQKEM_MLKEM768_CIPHERTEXT_SIZE],
    uint8_t ss[PQKEM_MLKEM768_SHARED_SECRET_SIZE]);

/**
 * @brief Decapsulate with a seed-form (32 bytes) or classic-form (2400 bytes) key
 *
 * Invalid ciphertexts of the right length still return PQKEM_SUCCESS with
 * the implicit-rejection secret.
 *
 * @return PQKEM_ERROR_INVALID_ENCODING on a wrong dk or ct length
 */
PQKEM_API pqkem_error_t pqkem_mlkem768_decaps(
    const uint8_t* dk, size_t dk_len,
    const uint8_t* ct, size_t ct_len,
    uint8_t ss[PQKEM_MLKEM768_SHARED_SECRET_SIZE]);

/**
 * @brief Classic-form secret key ŝ || ek || H(ek) || z of a seed
 */
PQKEM_API pqkem_error_t pqkem_mlkem768_expand_secret_key(
    const uint8_t seed[PQKEM_MLKEM768_SEED_SIZE],
    uint8_t dk[PQKEM_MLKEM768_SECRET_KEY_SIZE]);

#ifdef __cplusplus
}
#endif

#endif /* PQKEM_API_H */
