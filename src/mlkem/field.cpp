/**
 * @file field.cpp
 * @brief R_q element and vector arithmetic
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "pqkem/mlkem/field.h"
#include "pqkem/core/security.h"

namespace pqkem {
namespace mlkem {

// ============================================================================
// RingElement Implementation
// ============================================================================

template<Domain D>
RingElement<D>& RingElement<D>::operator+=(const RingElement& other) noexcept {
    for (size_t i = 0; i < MLKEM_N; ++i) {
        coeffs[i] = field_add(coeffs[i], other.coeffs[i]);
    }
    return *this;
}

template<Domain D>
RingElement<D>& RingElement<D>::operator-=(const RingElement& other) noexcept {
    for (size_t i = 0; i < MLKEM_N; ++i) {
        coeffs[i] = field_sub(coeffs[i], other.coeffs[i]);
    }
    return *this;
}

template<Domain D>
RingElement<D> RingElement<D>::operator+(const RingElement& other) const noexcept {
    RingElement result = *this;
    result += other;
    return result;
}

template<Domain D>
RingElement<D> RingElement<D>::operator-(const RingElement& other) const noexcept {
    RingElement result = *this;
    result -= other;
    return result;
}

template<Domain D>
void RingElement<D>::negate() noexcept {
    for (auto& c : coeffs) {
        c = field_neg(c);
    }
}

template<Domain D>
void RingElement<D>::scale(uint16_t c) noexcept {
    for (auto& x : coeffs) {
        x = field_mul(x, c);
    }
}

template<Domain D>
void RingElement<D>::clear() {
    secure_wipe(coeffs);
}

// ============================================================================
// PolyVector Implementation
// ============================================================================

template<Domain D>
PolyVector<D>& PolyVector<D>::operator+=(const PolyVector& other) noexcept {
    for (size_t i = 0; i < polys.size(); ++i) {
        polys[i] += other.polys[i];
    }
    return *this;
}

template<Domain D>
void PolyVector<D>::clear() {
    for (auto& p : polys) {
        p.clear();
    }
}

template struct RingElement<Domain::Coefficient>;
template struct RingElement<Domain::Ntt>;
template struct PolyVector<Domain::Coefficient>;
template struct PolyVector<Domain::Ntt>;

} // namespace mlkem
} // namespace pqkem
