/**
 * @file benchmark_mlkem.cpp
 * @brief ML-KEM Performance Benchmark
 *
 * Times key generation, encapsulation and decapsulation at every level,
 * with decapsulation measured both from the 32-byte seed (full re-derivation)
 * and from an unpacked key. OpenSSL X25519 key agreement is printed as the
 * classical reference point.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

// OpenSSL headers
#include <openssl/evp.h>

#include "pqkem/mlkem/mlkem.h"
#include "pqkem/core/security.h"
#include "benchmark_common.hpp"

using namespace pqkem_bench;
using namespace pqkem::mlkem;

namespace {

constexpr size_t WARMUP_ITERATIONS = 10;
constexpr size_t BENCHMARK_ITERATIONS = 200;

void benchmark_level(MLKEMLevel level, const std::string& name) {
    MLKEM kem(level);
    MLKEMKeyPair kp = kem.keygen();
    SharedSecret ss;
    MLKEMCiphertext ct = kem.encaps(kp.public_key, ss);
    MLKEMCiphertext tampered = ct;
    tampered.data[0] ^= 0x01;
    pqkem::Seed32 seed;
    std::copy(kp.secret_key.data.begin(), kp.secret_key.data.end(), seed.begin());
    ExpandedPrivateKey expanded = kem.unpack_private(seed);

    std::cout << "\n--- " << name << " (ek " << kem.get_params().public_key_size
              << " B, ct " << kem.get_params().ciphertext_size << " B) ---" << std::endl;

    print_result(name + " KeyGen", "pqkem",
        run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return time_ms([&]() { kem.keygen(); });
        }));

    print_result(name + " Encaps", "pqkem",
        run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            SharedSecret out;
            return time_ms([&]() { kem.encaps(kp.public_key, out); });
        }));

    print_result(name + " Decaps(seed)", "pqkem",
        run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return time_ms([&]() { kem.decaps(kp.secret_key, ct); });
        }));

    print_result(name + " Decaps(reject)", "pqkem",
        run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return time_ms([&]() { kem.decaps(kp.secret_key, tampered); });
        }));

    print_result(name + " Decaps(unpacked)", "pqkem",
        run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return time_ms([&]() { kem.decaps(expanded, ct); });
        }));

    print_result(name + " Unpack", "pqkem",
        run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
            return time_ms([&]() { kem.unpack_private(seed); });
        }));

    expanded.clear();
    pqkem::secure_wipe(seed);
}

EVP_PKEY* x25519_keygen() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr);
    if (!ctx) return nullptr;
    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_keygen(ctx, &pkey) != 1) {
        pkey = nullptr;
    }
    EVP_PKEY_CTX_free(ctx);
    return pkey;
}

double x25519_derive(EVP_PKEY* priv_key, EVP_PKEY* peer_pub) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(priv_key, nullptr);
    if (!ctx) return -1.0;

    bool ok = true;
    double t = time_ms([&]() {
        uint8_t secret[32];
        size_t secret_len = sizeof(secret);
        ok = EVP_PKEY_derive_init(ctx) == 1 &&
             EVP_PKEY_derive_set_peer(ctx, peer_pub) == 1 &&
             EVP_PKEY_derive(ctx, secret, &secret_len) == 1;
    });

    EVP_PKEY_CTX_free(ctx);
    return ok ? t : -1.0;
}

void benchmark_x25519() {
    std::cout << "\n--- X25519 (classical reference) ---" << std::endl;

    print_result("X25519 KeyGen", "OpenSSL",
        run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, []() {
            EVP_PKEY* key = nullptr;
            double t = time_ms([&]() { key = x25519_keygen(); });
            if (!key) return -1.0;
            EVP_PKEY_free(key);
            return t;
        }));

    EVP_PKEY* alice = x25519_keygen();
    EVP_PKEY* bob = x25519_keygen();
    if (alice && bob) {
        print_result("X25519 Derive", "OpenSSL",
            run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, [&]() {
                return x25519_derive(alice, bob);
            }));
    } else {
        print_result("X25519 Derive", "OpenSSL", BenchmarkResult());
    }
    EVP_PKEY_free(alice);
    EVP_PKEY_free(bob);
}

} // anonymous namespace

void benchmark_mlkem() {
    print_section_header("ML-KEM (FIPS 203)", "Throughput");

    benchmark_level(MLKEMLevel::MLKEM512, "ML-KEM-512");
    benchmark_level(MLKEMLevel::MLKEM768, "ML-KEM-768");
    benchmark_level(MLKEMLevel::MLKEM1024, "ML-KEM-1024");
    benchmark_x25519();
}
