/**
 * @file security.h
 * @brief Side-channel hygiene for pqkem
 *
 * Secret-dependent comparisons and selections in ML-KEM decapsulation go
 * through these helpers. The entropy source feeds key generation and
 * encapsulation.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef PQKEM_CORE_SECURITY_H
#define PQKEM_CORE_SECURITY_H

#include "pqkem/core/common.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Compare len bytes without early exit
 * @return 1 when equal, 0 otherwise or when either pointer is NULL
 */
PQKEM_API int pqkem_secure_compare(const void* a, const void* b, size_t len);

/** @brief condition == 0 ? a : b, without a branch */
PQKEM_API uint64_t pqkem_ct_select(uint64_t condition, uint64_t a, uint64_t b);

/** @brief Exchange *a and *b when condition is non-zero, without a branch */
PQKEM_API void pqkem_ct_swap(uint64_t condition, uint64_t* a, uint64_t* b);

/**
 * @brief Zero a buffer holding secret material
 *
 * The stores are not removed by the optimizer even when the buffer is
 * about to go out of scope. NULL or zero length is a no-op.
 */
PQKEM_API void pqkem_secure_zero(void* ptr, size_t len);

/**
 * @brief Fill buf from the operating system entropy source
 *
 * BCryptGenRandom on Windows, SecRandomCopyBytes on macOS, getrandom(2)
 * on Linux. /dev/urandom backs up the last two. On failure buf is zeroed.
 *
 * @return PQKEM_SUCCESS, PQKEM_ERROR_INVALID_PARAM or PQKEM_ERROR_RANDOM_FAILED
 */
PQKEM_API int pqkem_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
} // extern "C"

namespace pqkem {

namespace internal {

void secure_zero(void* ptr, size_t len);
bool secure_compare(const void* a, const void* b, size_t len);
uint64_t ct_select(uint64_t condition, uint64_t a, uint64_t b);
void ct_swap(uint64_t condition, uint64_t* a, uint64_t* b);
int random_bytes(void* buf, size_t len);

/**
 * @brief Constant-time equality mask: 0xFF if the regions match, 0x00 otherwise
 */
uint8_t ct_equal_mask(const void* a, const void* b, size_t len);

/**
 * @brief Branch-free byte select: returns b when mask is 0xFF, a when 0x00
 */
inline uint8_t ct_select_u8(uint8_t mask, uint8_t a, uint8_t b) noexcept {
    return static_cast<uint8_t>((b & mask) | (a & static_cast<uint8_t>(~mask)));
}

} // namespace internal

/**
 * @brief Byte-wise constant-time equality of two contiguous containers
 *
 * Differing sizes compare unequal; the size itself is not secret.
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    return internal::secure_compare(a.data(), b.data(),
                                    a.size() * sizeof(typename Container::value_type));
}

/**
 * @brief Wipe a container's storage in place
 */
template<typename Container>
void secure_wipe(Container& c) {
    internal::secure_zero(c.data(), c.size() * sizeof(typename Container::value_type));
}

} // namespace pqkem

#endif // __cplusplus

#endif // PQKEM_CORE_SECURITY_H
