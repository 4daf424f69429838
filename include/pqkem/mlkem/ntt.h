/**
 * @file ntt.h
 * @brief Number Theoretic Transform over R_q
 *
 * q = 3329 has a primitive 256th root of unity zeta = 17 but no 512th, so the
 * transform stops at 128 degree-1 residues mod (X^2 - gamma_i), with
 * gamma_i = 17^(2*BitRev7(i)+1). Output ordering follows FIPS 203 exactly.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_MLKEM_NTT_H
#define PQKEM_MLKEM_NTT_H

#include "pqkem/mlkem/field.h"

namespace pqkem {
namespace mlkem {

/**
 * @brief Forward NTT (FIPS 203 Algorithm 9)
 */
NttPoly ntt(const Poly& f) noexcept;

/**
 * @brief Inverse NTT (FIPS 203 Algorithm 10), inv_ntt(ntt(f)) == f
 */
Poly inv_ntt(const NttPoly& f_hat) noexcept;

/**
 * @brief Product in the NTT domain (FIPS 203 Algorithm 11)
 */
NttPoly multiply_ntts(const NttPoly& a, const NttPoly& b) noexcept;

// ============================================================================
// Vector / Matrix Helpers
// ============================================================================

NttVector ntt(const PolyVec& v);
PolyVec inv_ntt(const NttVector& v);

/**
 * @brief A∘v, or A^T∘v when transpose is set
 */
NttVector matrix_multiply(const NttMatrix& a, const NttVector& v, bool transpose);

/**
 * @brief sum_i a[i]∘b[i]
 */
NttPoly inner_product(const NttVector& a, const NttVector& b);

} // namespace mlkem
} // namespace pqkem

#endif // PQKEM_MLKEM_NTT_H
