/**
 * @file params.cpp
 * @brief ML-KEM parameter set table
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "pqkem/mlkem/params.h"
#include <stdexcept>

namespace pqkem {
namespace mlkem {

MLKEMParams MLKEMParams::get(MLKEMLevel level) {
    MLKEMParams p;
    p.seed_key_size = MLKEM_SEED_SIZE;
    p.shared_secret_size = MLKEM_SHARED_SECRET_SIZE;

    switch (level) {
        case MLKEMLevel::MLKEM512:
            p.k = 2;
            p.eta1 = 3;
            p.eta2 = 2;
            p.du = 10;
            p.dv = 4;
            break;
        case MLKEMLevel::MLKEM768:
            p.k = 3;
            p.eta1 = 2;
            p.eta2 = 2;
            p.du = 10;
            p.dv = 4;
            break;
        case MLKEMLevel::MLKEM1024:
            p.k = 4;
            p.eta1 = 2;
            p.eta2 = 2;
            p.du = 11;
            p.dv = 5;
            break;
        default:
            throw std::invalid_argument("Unsupported ML-KEM level");
    }

    p.public_key_size = MLKEM_POLY_BYTES * p.k + 32;
    p.secret_key_size = 2 * MLKEM_POLY_BYTES * p.k + 96;
    p.ciphertext_size = 32 * (p.du * p.k + p.dv);
    return p;
}

} // namespace mlkem
} // namespace pqkem
