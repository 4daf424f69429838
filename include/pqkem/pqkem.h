/**
 * @file pqkem.h
 * @brief pqkem - Post-Quantum Key Encapsulation Library
 *
 * Main header file that includes all public APIs.
 *
 * Features:
 * - ML-KEM-512/768/1024 (FIPS 203) with seed-form decapsulation keys
 * - SHA3-256/512, SHAKE128/256 (FIPS 202)
 * - Constant-time helpers, secure zeroing, OS CSPRNG
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef PQKEM_H
#define PQKEM_H

// Version information
#include "pqkem/version.h"

// Core definitions
#include "pqkem/core/common.h"
#include "pqkem/core/types.h"
#include "pqkem/core/security.h"

// Hash functions
#include "pqkem/crypto/sha3.h"

// C ABI
#include "pqkem_api.h"

#ifdef __cplusplus
// ML-KEM
#include "pqkem/mlkem/params.h"
#include "pqkem/mlkem/field.h"
#include "pqkem/mlkem/ntt.h"
#include "pqkem/mlkem/codec.h"
#include "pqkem/mlkem/sampler.h"
#include "pqkem/mlkem/kpke.h"
#include "pqkem/mlkem/mlkem.h"
#endif

#endif // PQKEM_H
