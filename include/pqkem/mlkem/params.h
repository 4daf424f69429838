/**
 * @file params.h
 * @brief ML-KEM Parameter Sets (FIPS 203)
 *
 * Security Levels:
 * - ML-KEM-512  (k=2): NIST category 1
 * - ML-KEM-768  (k=3): NIST category 3, the default set
 * - ML-KEM-1024 (k=4): NIST category 5
 *
 * All sets share the same component code; only the constants below change.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_MLKEM_PARAMS_H
#define PQKEM_MLKEM_PARAMS_H

#include <cstddef>
#include <cstdint>

namespace pqkem {
namespace mlkem {

// ============================================================================
// Common Constants
// ============================================================================

constexpr size_t MLKEM_N = 256;             // Polynomial degree
constexpr uint16_t MLKEM_Q = 3329;          // Modulus q

constexpr size_t MLKEM_SEED_SIZE = 32;          // Seed-form decapsulation key
constexpr size_t MLKEM_SHARED_SECRET_SIZE = 32;
constexpr size_t MLKEM_MESSAGE_SIZE = 32;
constexpr size_t MLKEM_POLY_BYTES = 384;        // ByteEncode_12 of one polynomial

// ============================================================================
// Parameter Sets
// ============================================================================

/**
 * @brief ML-KEM security level
 */
enum class MLKEMLevel {
    MLKEM512 = 2,   ///< k=2
    MLKEM768 = 3,   ///< k=3
    MLKEM1024 = 4   ///< k=4
};

/**
 * @brief ML-KEM parameter set
 */
struct MLKEMParams {
    size_t k;           ///< Module rank
    size_t eta1;        ///< CBD parameter for s, e and the encryption r-vector
    size_t eta2;        ///< CBD parameter for e1 and e2
    size_t du;          ///< Bits per coefficient of compressed u
    size_t dv;          ///< Bits per coefficient of compressed v

    // Sizes in bytes
    size_t public_key_size;             ///< 384k + 32
    size_t secret_key_size;             ///< Classic form, 768k + 96
    size_t seed_key_size;               ///< Seed form, always 32
    size_t ciphertext_size;             ///< 32(du*k + dv)
    size_t shared_secret_size;

    /**
     * @brief Resolve a level to its constants
     * @throws std::invalid_argument for a value outside MLKEMLevel
     */
    static MLKEMParams get(MLKEMLevel level);
};

} // namespace mlkem
} // namespace pqkem

#endif // PQKEM_MLKEM_PARAMS_H
