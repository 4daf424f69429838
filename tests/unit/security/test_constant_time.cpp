/**
 * @file test_constant_time.cpp
 * @brief Decapsulation timing comparison for valid and tampered ciphertexts
 *
 * Coarse check only: the median time of decapsulating an honest ciphertext
 * and a tampered one must be within a factor of two. Samples are
 * interleaved so drift in clock speed hits both sides equally.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <vector>

#include "pqkem/pqkem.h"

using namespace pqkem::mlkem;

namespace {

constexpr int kSamples = 41;
constexpr int kBatch = 5;

double time_batch(const MLKEM& kem, const MLKEMSecretKey& sk, const MLKEMCiphertext& ct,
                  SharedSecret& sink) {
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < kBatch; ++i) {
        SharedSecret ss = kem.decaps(sk, ct);
        sink[0] ^= ss[0];
    }
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::micro>(end - start).count();
}

double median(std::vector<double> v) {
    std::sort(v.begin(), v.end());
    return v[v.size() / 2];
}

} // namespace

TEST(ConstantTimeTest, DecapsValidVsTampered) {
    ASSERT_EQ(pqkem_init(), PQKEM_SUCCESS);

    MLKEM kem(MLKEMLevel::MLKEM768);
    MLKEMKeyPair kp = kem.keygen();

    SharedSecret ss;
    MLKEMCiphertext valid = kem.encaps(kp.public_key, ss);
    MLKEMCiphertext tampered = valid;
    tampered.data[valid.size() / 3] ^= 0x20;

    SharedSecret sink{};
    // Warm-up
    time_batch(kem, kp.secret_key, valid, sink);
    time_batch(kem, kp.secret_key, tampered, sink);

    std::vector<double> t_valid;
    std::vector<double> t_tampered;
    for (int i = 0; i < kSamples; ++i) {
        t_valid.push_back(time_batch(kem, kp.secret_key, valid, sink));
        t_tampered.push_back(time_batch(kem, kp.secret_key, tampered, sink));
    }

    const double m_valid = median(t_valid);
    const double m_tampered = median(t_tampered);
    ASSERT_GT(m_valid, 0.0);
    const double ratio = m_tampered / m_valid;

    std::cout << "decaps median: valid " << m_valid / kBatch << " us, tampered "
              << m_tampered / kBatch << " us, ratio " << ratio << std::endl;

    EXPECT_GT(ratio, 0.5);
    EXPECT_LT(ratio, 2.0);
}
