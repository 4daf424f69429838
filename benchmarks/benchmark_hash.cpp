/**
 * @file benchmark_hash.cpp
 * @brief Keccak Performance Benchmark: pqkem vs OpenSSL
 *
 * Covers the FIPS 202 functions ML-KEM is built on:
 * - SHA3-256 (H)
 * - SHA3-512 (G)
 * - SHAKE128 (matrix expansion XOF)
 * - SHAKE256 (PRF, J and seed expansion)
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// OpenSSL headers
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "pqkem/crypto/sha3.h"
#include "benchmark_common.hpp"

using namespace pqkem_bench;

namespace {

constexpr size_t WARMUP_ITERATIONS = 10;
constexpr size_t BENCHMARK_ITERATIONS = 100;

// 1 KB, 64 KB, 1 MB
const std::vector<size_t> TEST_SIZES = {1024, 64 * 1024, 1024 * 1024};

// SHAKE output length per call, one ML-KEM matrix entry worth of blocks
constexpr size_t XOF_OUTPUT = 3 * PQKEM_SHAKE128_RATE;

std::string format_size(size_t bytes) {
    if (bytes >= 1024 * 1024) return std::to_string(bytes / (1024 * 1024)) + " MB";
    if (bytes >= 1024) return std::to_string(bytes / 1024) + " KB";
    return std::to_string(bytes) + " B";
}

/**
 * @brief One-shot OpenSSL digest; XOFs use EVP_DigestFinalXOF
 */
double openssl_digest(const EVP_MD* md, const uint8_t* data, size_t len,
                      uint8_t* out, size_t out_len, bool xof) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return -1.0;

    bool ok = true;
    double t = time_ms([&]() {
        ok = EVP_DigestInit_ex(ctx, md, nullptr) == 1 &&
             EVP_DigestUpdate(ctx, data, len) == 1;
        if (!ok) return;
        if (xof) {
            ok = EVP_DigestFinalXOF(ctx, out, out_len) == 1;
        } else {
            unsigned int digest_len = 0;
            ok = EVP_DigestFinal_ex(ctx, out, &digest_len) == 1;
        }
    });

    EVP_MD_CTX_free(ctx);
    return ok ? t : -1.0;
}

void compare(const std::string& name, size_t size,
             const std::function<double()>& pqkem_fn,
             const std::function<double()>& openssl_fn) {
    BenchmarkResult ossl = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, openssl_fn);
    BenchmarkResult ours = run_benchmark_ex(WARMUP_ITERATIONS, BENCHMARK_ITERATIONS, pqkem_fn);

    double ossl_mbps = print_throughput_result(name, "OpenSSL", ossl, size);
    double ours_mbps = print_throughput_result(name, "pqkem", ours, size);
    print_ratio(ours_mbps, ossl_mbps);
}

} // anonymous namespace

void benchmark_hash_functions() {
    print_section_header("Keccak / FIPS 202", "MB/s");

    for (size_t size : TEST_SIZES) {
        std::vector<uint8_t> data(size);
        RAND_bytes(data.data(), static_cast<int>(size));
        std::vector<uint8_t> out(XOF_OUTPUT);

        std::cout << "\n--- Input " << format_size(size) << " ---" << std::endl;

        compare("SHA3-256", size,
            [&]() {
                return time_ms([&]() { pqkem_sha3_256(data.data(), size, out.data()); });
            },
            [&]() {
                return openssl_digest(EVP_sha3_256(), data.data(), size, out.data(), 32, false);
            });

        compare("SHA3-512", size,
            [&]() {
                return time_ms([&]() { pqkem_sha3_512(data.data(), size, out.data()); });
            },
            [&]() {
                return openssl_digest(EVP_sha3_512(), data.data(), size, out.data(), 64, false);
            });

        compare("SHAKE128", size,
            [&]() {
                return time_ms([&]() {
                    pqkem_shake128(data.data(), size, out.data(), out.size());
                });
            },
            [&]() {
                return openssl_digest(EVP_shake128(), data.data(), size,
                                      out.data(), out.size(), true);
            });

        compare("SHAKE256", size,
            [&]() {
                return time_ms([&]() {
                    pqkem_shake256(data.data(), size, out.data(), out.size());
                });
            },
            [&]() {
                return openssl_digest(EVP_shake256(), data.data(), size,
                                      out.data(), out.size(), true);
            });
    }
}
