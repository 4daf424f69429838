/**
 * @file sha3.h
 * @brief FIPS 202 functions used by ML-KEM
 *
 * SHA3-256 is H, SHA3-512 is G. SHAKE256 backs J and the PRF, and an
 * incremental SHAKE128 context expands the public matrix.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef PQKEM_CRYPTO_SHA3_H
#define PQKEM_CRYPTO_SHA3_H

#include "pqkem/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define PQKEM_SHA3_256_DIGEST_SIZE 32
#define PQKEM_SHA3_512_DIGEST_SIZE 64

/* Sponge rates: 1600 bits minus twice the security level */
#define PQKEM_SHAKE128_RATE 168
#define PQKEM_SHAKE256_RATE 136

#define PQKEM_KECCAK_STATE_SIZE 200

/**
 * @brief Sponge context shared by the fixed-length and XOF instances
 *
 * absorbed and squeezed count bytes within the current rate block.
 * digest_size is 0 for SHAKE.
 */
typedef struct pqkem_sha3_ctx_s {
    alignas(32) uint64_t state[25];
    size_t rate;
    size_t capacity;
    size_t absorbed;
    size_t squeezed;
    uint8_t suffix;
    uint8_t finalized;
    size_t digest_size;
} pqkem_sha3_ctx_t;

/* ---- SHA3-256 (H) ---- */

PQKEM_API pqkem_error_t pqkem_sha3_256_init(pqkem_sha3_ctx_t* ctx);

/** @return PQKEM_ERROR_INVALID_PARAM after final, or for NULL data with len > 0 */
PQKEM_API pqkem_error_t pqkem_sha3_256_update(pqkem_sha3_ctx_t* ctx,
                                               const uint8_t* data, size_t len);

/** @brief Write the digest and wipe ctx */
PQKEM_API pqkem_error_t pqkem_sha3_256_final(pqkem_sha3_ctx_t* ctx,
                                              uint8_t digest[PQKEM_SHA3_256_DIGEST_SIZE]);

PQKEM_API pqkem_error_t pqkem_sha3_256(const uint8_t* data, size_t len,
                                        uint8_t digest[PQKEM_SHA3_256_DIGEST_SIZE]);

/* ---- SHA3-512 (G) ---- */

PQKEM_API pqkem_error_t pqkem_sha3_512_init(pqkem_sha3_ctx_t* ctx);

PQKEM_API pqkem_error_t pqkem_sha3_512_update(pqkem_sha3_ctx_t* ctx,
                                               const uint8_t* data, size_t len);

PQKEM_API pqkem_error_t pqkem_sha3_512_final(pqkem_sha3_ctx_t* ctx,
                                              uint8_t digest[PQKEM_SHA3_512_DIGEST_SIZE]);

PQKEM_API pqkem_error_t pqkem_sha3_512(const uint8_t* data, size_t len,
                                        uint8_t digest[PQKEM_SHA3_512_DIGEST_SIZE]);

/* ---- SHAKE ---- */

PQKEM_API pqkem_error_t pqkem_shake128(const uint8_t* data, size_t len,
                                        uint8_t* output, size_t output_len);

PQKEM_API pqkem_error_t pqkem_shake256(const uint8_t* data, size_t len,
                                        uint8_t* output, size_t output_len);

/** @brief Start an incremental SHAKE stream */
PQKEM_API pqkem_error_t pqkem_shake128_init(pqkem_sha3_ctx_t* ctx);

PQKEM_API pqkem_error_t pqkem_shake256_init(pqkem_sha3_ctx_t* ctx);

/** @return PQKEM_ERROR_INVALID_PARAM once squeezing has started */
PQKEM_API pqkem_error_t pqkem_shake_absorb(pqkem_sha3_ctx_t* ctx,
                                            const uint8_t* data, size_t len);

/**
 * @brief Read the next output_len bytes of the stream
 *
 * The first call pads the input. Later calls continue where the previous
 * one stopped: squeezing 10 then 20 bytes yields the same 30 bytes as one call.
 */
PQKEM_API pqkem_error_t pqkem_shake_squeeze(pqkem_sha3_ctx_t* ctx,
                                             uint8_t* output, size_t output_len);

/** @brief Wipe a context that still holds secret input */
PQKEM_API void pqkem_sha3_clear(pqkem_sha3_ctx_t* ctx);

#ifdef __cplusplus
}
#endif

#endif // PQKEM_CRYPTO_SHA3_H
