/**
 * @file field.h
 * @brief Arithmetic in Z_q and R_q = Z_q[X]/(X^256 + 1), q = 3329
 *
 * Every coefficient is kept canonical in [0, q). Reductions are branch-free
 * (Barrett multiply-shift plus a masked conditional subtract), so the same
 * routines serve secret and public data.
 *
 * Ring elements carry their domain in the type: a coefficient-domain Poly
 * and an NTT-domain NttPoly cannot be added to each other. Crossing domains
 * goes through ntt() / inv_ntt() in ntt.h.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_MLKEM_FIELD_H
#define PQKEM_MLKEM_FIELD_H

#include "pqkem/mlkem/params.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pqkem {
namespace mlkem {

// ============================================================================
// Scalar Field Arithmetic
// ============================================================================

// Barrett reduction constants: floor(2^24 / q)
constexpr uint32_t kBarrettMultiplier = 5039;
constexpr unsigned kBarrettShift = 24;

constexpr uint16_t kHalfQ = (MLKEM_Q - 1) / 2;  // 1664

/**
 * @brief x mod q for x in [0, 2q), constant time
 */
inline uint16_t reduce_once(uint16_t x) noexcept {
    const uint16_t subtracted = static_cast<uint16_t>(x - MLKEM_Q);
    const uint16_t mask = static_cast<uint16_t>(0u - (subtracted >> 15));
    return static_cast<uint16_t>((mask & x) | (static_cast<uint16_t>(~mask) & subtracted));
}

/**
 * @brief Barrett reduction, x mod q for x < q + 2q^2, constant time
 */
inline uint16_t reduce(uint32_t x) noexcept {
    const uint64_t product = static_cast<uint64_t>(x) * kBarrettMultiplier;
    const uint32_t quotient = static_cast<uint32_t>(product >> kBarrettShift);
    const uint32_t remainder = x - quotient * MLKEM_Q;
    return reduce_once(static_cast<uint16_t>(remainder));
}

inline uint16_t field_add(uint16_t a, uint16_t b) noexcept {
    return reduce_once(static_cast<uint16_t>(a + b));
}

inline uint16_t field_sub(uint16_t a, uint16_t b) noexcept {
    return reduce_once(static_cast<uint16_t>(a + MLKEM_Q - b));
}

inline uint16_t field_neg(uint16_t a) noexcept {
    return reduce_once(static_cast<uint16_t>(MLKEM_Q - a));
}

inline uint16_t field_mul(uint16_t a, uint16_t b) noexcept {
    return reduce(static_cast<uint32_t>(a) * b);
}

// ============================================================================
// Ring Elements
// ============================================================================

/**
 * @brief Representation a ring element lives in
 */
enum class Domain {
    Coefficient,    ///< a_0 + a_1 X + ... + a_255 X^255
    Ntt             ///< 128 degree-1 residues, FIPS 203 ordering
};

/**
 * @brief Element of R_q tagged with its domain
 */
template<Domain D>
struct RingElement {
    std::array<uint16_t, MLKEM_N> coeffs{};

    RingElement& operator+=(const RingElement& other) noexcept;
    RingElement& operator-=(const RingElement& other) noexcept;
    RingElement operator+(const RingElement& other) const noexcept;
    RingElement operator-(const RingElement& other) const noexcept;

    bool operator==(const RingElement& other) const noexcept {
        return coeffs == other.coeffs;
    }
    bool operator!=(const RingElement& other) const noexcept {
        return coeffs != other.coeffs;
    }

    void negate() noexcept;
    void scale(uint16_t c) noexcept;   // c must be < q

    void clear();  // Secure zeroing
};

using Poly = RingElement<Domain::Coefficient>;
using NttPoly = RingElement<Domain::Ntt>;

/**
 * @brief Vector of k ring elements in one domain
 */
template<Domain D>
struct PolyVector {
    std::vector<RingElement<D>> polys;

    PolyVector() = default;
    explicit PolyVector(size_t k) : polys(k) {}

    size_t size() const { return polys.size(); }
    RingElement<D>& operator[](size_t i) { return polys[i]; }
    const RingElement<D>& operator[](size_t i) const { return polys[i]; }

    PolyVector& operator+=(const PolyVector& other) noexcept;

    bool operator==(const PolyVector& other) const { return polys == other.polys; }
    bool operator!=(const PolyVector& other) const { return polys != other.polys; }

    void clear();  // Secure zeroing
};

using PolyVec = PolyVector<Domain::Coefficient>;
using NttVector = PolyVector<Domain::Ntt>;

/**
 * @brief k x k matrix of NTT-domain elements, row-major
 */
struct NttMatrix {
    size_t k = 0;
    std::vector<NttPoly> entries;

    NttMatrix() = default;
    explicit NttMatrix(size_t rank) : k(rank), entries(rank * rank) {}

    NttPoly& at(size_t row, size_t col) { return entries[row * k + col]; }
    const NttPoly& at(size_t row, size_t col) const { return entries[row * k + col]; }

    bool operator==(const NttMatrix& other) const {
        return k == other.k && entries == other.entries;
    }
};

extern template struct RingElement<Domain::Coefficient>;
extern template struct RingElement<Domain::Ntt>;
extern template struct PolyVector<Domain::Coefficient>;
extern template struct PolyVector<Domain::Ntt>;

} // namespace mlkem
} // namespace pqkem

#endif // PQKEM_MLKEM_FIELD_H
