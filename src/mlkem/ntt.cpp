/**
 * @file ntt.cpp
 * @brief NTT, inverse NTT and NTT-domain multiplication for ML-KEM
 *
 * All butterflies use Barrett reduction on canonical inputs, so every
 * intermediate stays below q + 2q^2 and no Montgomery form is needed.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "pqkem/mlkem/ntt.h"

namespace pqkem {
namespace mlkem {

// ============================================================================
// NTT Tables
// ============================================================================

namespace {

// zetas[i] = 17^BitRev7(i) mod q
constexpr uint16_t kZetas[128] = {
       1, 1729, 2580, 3289, 2642,  630, 1897,  848,
    1062, 1919,  193,  797, 2786, 3260,  569, 1746,
     296, 2447, 1339, 1476, 3046,   56, 2240, 1333,
    1426, 2094,  535, 2882, 2393, 2879, 1974,  821,
     289,  331, 3253, 1756, 1197, 2304, 2277, 2055,
     650, 1977, 2513,  632, 2865,   33, 1320, 1915,
    2319, 1435,  807,  452, 1438, 2868, 1534, 2402,
    2647, 2617, 1481,  648, 2474, 3110, 1227,  910,
      17, 2761,  583, 2649, 1637,  723, 2288, 1100,
    1409, 2662, 3281,  233,  756, 2156, 3015, 3050,
    1703, 1651, 2789, 1789, 1847,  952, 1461, 2687,
     939, 2308, 2437, 2388,  733, 2337,  268,  641,
    1584, 2298, 2037, 3220,  375, 2549, 2090, 1645,
    1063,  319, 2773,  757, 2099,  561, 2466, 2594,
    2804, 1092,  403, 1026, 1143, 2150, 2775,  886,
    1722, 1212, 1874, 1029, 2110, 2935,  885, 2154,
};

// gammas[i] = 17^(2*BitRev7(i)+1) mod q
constexpr uint16_t kGammas[128] = {
      17, 3312, 2761,  568,  583, 2746, 2649,  680,
    1637, 1692,  723, 2606, 2288, 1041, 1100, 2229,
    1409, 1920, 2662,  667, 3281,   48,  233, 3096,
     756, 2573, 2156, 1173, 3015,  314, 3050,  279,
    1703, 1626, 1651, 1678, 2789,  540, 1789, 1540,
    1847, 1482,  952, 2377, 1461, 1868, 2687,  642,
     939, 2390, 2308, 1021, 2437,  892, 2388,  941,
     733, 2596, 2337,  992,  268, 3061,  641, 2688,
    1584, 1745, 2298, 1031, 2037, 1292, 3220,  109,
     375, 2954, 2549,  780, 2090, 1239, 1645, 1684,
    1063, 2266,  319, 3010, 2773,  556,  757, 2572,
    2099, 1230,  561, 2768, 2466,  863, 2594,  735,
    2804,  525, 1092, 2237,  403, 2926, 1026, 2303,
    1143, 2186, 2150, 1179, 2775,  554,  886, 2443,
    1722, 1607, 1212, 2117, 1874, 1455, 1029, 2300,
    2110, 1219, 2935,  394,  885, 2444, 2154, 1175,
};

// 128^-1 mod q
constexpr uint16_t kInverseDegree = 3303;

} // anonymous namespace

// ============================================================================
// Transforms
// ============================================================================

NttPoly ntt(const Poly& f) noexcept {
    NttPoly out;
    auto& a = out.coeffs;
    a = f.coeffs;

    size_t k = 1;
    for (size_t len = 128; len >= 2; len >>= 1) {
        for (size_t start = 0; start < MLKEM_N; start += 2 * len) {
            const uint16_t zeta = kZetas[k++];
            for (size_t j = start; j < start + len; ++j) {
                const uint16_t t = field_mul(zeta, a[j + len]);
                a[j + len] = field_sub(a[j], t);
                a[j] = field_add(a[j], t);
            }
        }
    }
    return out;
}

Poly inv_ntt(const NttPoly& f_hat) noexcept {
    Poly out;
    auto& a = out.coeffs;
    a = f_hat.coeffs;

    size_t k = 127;
    for (size_t len = 2; len <= 128; len <<= 1) {
        for (size_t start = 0; start < MLKEM_N; start += 2 * len) {
            const uint16_t zeta = kZetas[k--];
            for (size_t j = start; j < start + len; ++j) {
                const uint16_t t = a[j];
                a[j] = field_add(t, a[j + len]);
                a[j + len] = field_mul(zeta, field_sub(a[j + len], t));
            }
        }
    }

    out.scale(kInverseDegree);
    return out;
}

NttPoly multiply_ntts(const NttPoly& a, const NttPoly& b) noexcept {
    NttPoly out;
    for (size_t i = 0; i < MLKEM_N / 2; ++i) {
        const uint32_t a0 = a.coeffs[2 * i];
        const uint32_t a1 = a.coeffs[2 * i + 1];
        const uint32_t b0 = b.coeffs[2 * i];
        const uint32_t b1 = b.coeffs[2 * i + 1];

        // (a0 + a1 X)(b0 + b1 X) mod (X^2 - gamma_i)
        const uint32_t a1b1 = reduce(a1 * b1);
        out.coeffs[2 * i] = reduce(a0 * b0 + a1b1 * kGammas[i]);
        out.coeffs[2 * i + 1] = reduce(a0 * b1 + a1 * b0);
    }
    return out;
}

// ============================================================================
// Vector / Matrix Helpers
// ============================================================================

NttVector ntt(const PolyVec& v) {
    NttVector out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = ntt(v[i]);
    }
    return out;
}

PolyVec inv_ntt(const NttVector& v) {
    PolyVec out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = inv_ntt(v[i]);
    }
    return out;
}

NttVector matrix_multiply(const NttMatrix& a, const NttVector& v, bool transpose) {
    NttVector out(a.k);
    for (size_t i = 0; i < a.k; ++i) {
        for (size_t j = 0; j < a.k; ++j) {
            const NttPoly& entry = transpose ? a.at(j, i) : a.at(i, j);
            out[i] += multiply_ntts(entry, v[j]);
        }
    }
    return out;
}

NttPoly inner_product(const NttVector& a, const NttVector& b) {
    NttPoly out;
    for (size_t i = 0; i < a.size(); ++i) {
        out += multiply_ntts(a[i], b[i]);
    }
    return out;
}

} // namespace mlkem
} // namespace pqkem
