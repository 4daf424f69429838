/**
 * @file test_mlkem.cpp
 * @brief ML-KEM unit tests
 *
 * Tests:
 * - Key, ciphertext and shared-secret sizes per level
 * - Encaps/decaps agreement
 * - Implicit rejection on tampered ciphertexts
 * - Seed-form and classic-form key equivalence
 * - Length validation
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "pqkem/pqkem.h"

using namespace pqkem::mlkem;
using pqkem::ByteVec;
using pqkem::Seed32;

namespace {

Seed32 counter_seed(uint32_t n) {
    Seed32 s{};
    for (size_t i = 0; i < 4; ++i) {
        s[i] = static_cast<uint8_t>(n >> (8 * i));
    }
    return s;
}

} // namespace

// ============================================================================
// Parameterized Level Tests
// ============================================================================

class MLKEMTest : public ::testing::TestWithParam<MLKEMLevel> {
protected:
    void SetUp() override {
        pqkem_init();
    }
};

TEST_P(MLKEMTest, ParameterSizes) {
    MLKEM kem(GetParam());
    const auto& p = kem.get_params();

    EXPECT_EQ(p.public_key_size, 384 * p.k + 32);
    EXPECT_EQ(p.secret_key_size, 768 * p.k + 96);
    EXPECT_EQ(p.seed_key_size, 32u);
    EXPECT_EQ(p.ciphertext_size, 32 * (p.du * p.k + p.dv));
    EXPECT_EQ(p.shared_secret_size, 32u);

    switch (GetParam()) {
    case MLKEMLevel::MLKEM512:
        EXPECT_EQ(p.public_key_size, 800u);
        EXPECT_EQ(p.ciphertext_size, 768u);
        EXPECT_EQ(p.eta1, 3u);
        break;
    case MLKEMLevel::MLKEM768:
        EXPECT_EQ(p.public_key_size, 1184u);
        EXPECT_EQ(p.secret_key_size, 2400u);
        EXPECT_EQ(p.ciphertext_size, 1088u);
        break;
    case MLKEMLevel::MLKEM1024:
        EXPECT_EQ(p.public_key_size, 1568u);
        EXPECT_EQ(p.ciphertext_size, 1568u);
        EXPECT_EQ(p.du, 11u);
        break;
    }
}

TEST_P(MLKEMTest, KeyGenSizes) {
    MLKEM kem(GetParam());
    auto kp = kem.keygen();

    EXPECT_EQ(kp.public_key.size(), kem.get_params().public_key_size);
    EXPECT_EQ(kp.secret_key.size(), MLKEM_SEED_SIZE);
    EXPECT_TRUE(kp.secret_key.is_seed());
}

TEST_P(MLKEMTest, EncapsDecaps) {
    MLKEM kem(GetParam());
    auto kp = kem.keygen();

    SharedSecret ss_enc;
    auto ct = kem.encaps(kp.public_key, ss_enc);
    EXPECT_EQ(ct.size(), kem.get_params().ciphertext_size);

    SharedSecret ss_dec = kem.decaps(kp.secret_key, ct);
    EXPECT_EQ(ss_enc, ss_dec);
}

TEST_P(MLKEMTest, HighLevelAPI) {
    auto kp = mlkem_keygen(GetParam());
    auto result = mlkem_encaps(kp.public_key, GetParam());
    auto ss_dec = mlkem_decaps(kp.secret_key, result.first, GetParam());
    EXPECT_EQ(result.second, ss_dec);
}

TEST_P(MLKEMTest, KeyGenDeterministic) {
    MLKEM kem(GetParam());
    const Seed32 seed = counter_seed(42);

    auto kp1 = kem.keygen_derand(seed);
    auto kp2 = kem.keygen_derand(seed);
    EXPECT_EQ(kp1.public_key.data, kp2.public_key.data);
    EXPECT_EQ(kp1.secret_key.data, ByteVec(seed.begin(), seed.end()));

    auto kp3 = kem.keygen_derand(counter_seed(43));
    EXPECT_NE(kp1.public_key.data, kp3.public_key.data);
}

TEST_P(MLKEMTest, UnpackPrivateDeterministic) {
    MLKEM kem(GetParam());
    const Seed32 seed = counter_seed(7);

    ExpandedPrivateKey a = kem.unpack_private(seed);
    ExpandedPrivateKey b = kem.unpack_private(seed);
    EXPECT_EQ(a.a_hat, b.a_hat);
    EXPECT_EQ(a.t_hat, b.t_hat);
    EXPECT_EQ(a.s_hat, b.s_hat);
    EXPECT_EQ(a.ek.data, b.ek.data);
    EXPECT_EQ(a.h, b.h);
    EXPECT_EQ(a.z, b.z);

    EXPECT_EQ(a.ek.data, kem.keygen_derand(seed).public_key.data);
    EXPECT_EQ(a.h, pqkem::mlkem::hash_h(a.ek.bytes(), a.ek.size()));
}

TEST_P(MLKEMTest, EncapsDerandDeterministic) {
    MLKEM kem(GetParam());
    auto kp = kem.keygen_derand(counter_seed(1));

    SharedSecret ss1, ss2, ss3;
    auto ct1 = kem.encaps_derand(kp.public_key, counter_seed(9), ss1);
    auto ct2 = kem.encaps_derand(kp.public_key, counter_seed(9), ss2);
    auto ct3 = kem.encaps_derand(kp.public_key, counter_seed(10), ss3);

    EXPECT_EQ(ct1.data, ct2.data);
    EXPECT_EQ(ss1, ss2);
    EXPECT_NE(ct1.data, ct3.data);
    EXPECT_NE(ss1, ss3);
}

TEST_P(MLKEMTest, ImplicitRejection) {
    MLKEM kem(GetParam());
    const Seed32 seed = counter_seed(2024);
    auto kp = kem.keygen_derand(seed);

    SharedSecret ss;
    auto ct = kem.encaps(kp.public_key, ss);
    const ExpandedPrivateKey key = kem.unpack_private(seed);

    // One flipped bit per region of the ciphertext
    for (size_t pos : {size_t(0), ct.size() / 2, ct.size() - 1}) {
        MLKEMCiphertext bad = ct;
        bad.data[pos] ^= 0x01;

        SharedSecret rejected;
        ASSERT_NO_THROW(rejected = kem.decaps(kp.secret_key, bad));
        EXPECT_NE(rejected, ss) << "pos " << pos;
        EXPECT_EQ(rejected, hash_j(key.z, bad.bytes(), bad.size()))
            << "pos " << pos;

        // Rejection is deterministic in (dk, c)
        EXPECT_EQ(kem.decaps(kp.secret_key, bad), rejected);
    }
}

TEST_P(MLKEMTest, ClassicFormMatchesSeedForm) {
    MLKEM kem(GetParam());
    const Seed32 seed = counter_seed(55);
    auto kp = kem.keygen_derand(seed);

    MLKEMSecretKey classic = kem.expand_secret_key(seed);
    ASSERT_EQ(classic.size(), kem.get_params().secret_key_size);
    EXPECT_FALSE(classic.is_seed());

    // ek sits after ŝ in the classic encoding
    const size_t s_len = MLKEM_POLY_BYTES * kem.get_params().k;
    EXPECT_EQ(ByteVec(classic.data.begin() + s_len,
                      classic.data.begin() + s_len + kp.public_key.size()),
              kp.public_key.data);

    SharedSecret ss;
    auto ct = kem.encaps(kp.public_key, ss);
    EXPECT_EQ(kem.decaps(classic, ct), ss);

    MLKEMCiphertext bad = ct;
    bad.data[3] ^= 0x80;
    EXPECT_EQ(kem.decaps(classic, bad), kem.decaps(kp.secret_key, bad));
}

TEST_P(MLKEMTest, KeyGenInternalMatchesExpandedSeed) {
    MLKEM kem(GetParam());
    const Seed32 seed = counter_seed(77);

    Seed32 d, z;
    expand_seed(seed, d, z);
    auto kp = kem.keygen_internal(d, z);

    EXPECT_EQ(kp.public_key.data, kem.keygen_derand(seed).public_key.data);
    EXPECT_EQ(kp.secret_key.data, kem.expand_secret_key(seed).data);
}

TEST_P(MLKEMTest, ExpandedKeyDecapsMatchesSeed) {
    MLKEM kem(GetParam());
    const Seed32 seed = counter_seed(88);
    auto kp = kem.keygen_derand(seed);
    ExpandedPrivateKey key = kem.unpack_private(seed);

    SharedSecret ss;
    auto ct = kem.encaps(kp.public_key, ss);
    EXPECT_EQ(kem.decaps(key, ct), ss);

    MLKEMCiphertext bad = ct;
    bad.data[ct.size() - 2] ^= 0x10;
    EXPECT_EQ(kem.decaps(key, bad), kem.decaps(kp.secret_key, bad));

    key.clear();
    EXPECT_EQ(key.z, Seed32{});
}

TEST_P(MLKEMTest, LengthValidation) {
    MLKEM kem(GetParam());
    const auto& p = kem.get_params();
    auto kp = kem.keygen();

    SharedSecret ss;
    MLKEMPublicKey short_ek{ByteVec(p.public_key_size - 1)};
    MLKEMPublicKey long_ek{ByteVec(p.public_key_size + 1)};
    EXPECT_THROW(kem.encaps(short_ek, ss), EncodingError);
    EXPECT_THROW(kem.encaps(long_ek, ss), EncodingError);
    EXPECT_THROW(kem.encaps_derand(short_ek, Seed32{}, ss), EncodingError);

    auto ct = kem.encaps(kp.public_key, ss);
    MLKEMCiphertext short_ct{ByteVec(ct.data.begin(), ct.data.end() - 1)};
    MLKEMCiphertext long_ct = ct;
    long_ct.data.push_back(0);
    EXPECT_THROW(kem.decaps(kp.secret_key, short_ct), EncodingError);
    EXPECT_THROW(kem.decaps(kp.secret_key, long_ct), EncodingError);

    MLKEMSecretKey bad_dk{ByteVec(33)};
    EXPECT_THROW(kem.decaps(bad_dk, ct), EncodingError);
    MLKEMSecretKey empty_dk;
    EXPECT_THROW(kem.decaps(empty_dk, ct), EncodingError);
}

TEST_P(MLKEMTest, SecretKeyClear) {
    MLKEM kem(GetParam());
    auto kp = kem.keygen();
    kp.secret_key.clear();
    EXPECT_EQ(kp.secret_key.size(), 0u);
}

INSTANTIATE_TEST_SUITE_P(
    AllLevels,
    MLKEMTest,
    ::testing::Values(MLKEMLevel::MLKEM512, MLKEMLevel::MLKEM768, MLKEMLevel::MLKEM1024),
    [](const ::testing::TestParamInfo<MLKEMLevel>& info) {
        switch (info.param) {
        case MLKEMLevel::MLKEM512: return std::string("MLKEM512");
        case MLKEMLevel::MLKEM768: return std::string("MLKEM768");
        case MLKEMLevel::MLKEM1024: return std::string("MLKEM1024");
        }
        return std::string("Unknown");
    }
);

// ============================================================================
// ML-KEM-768 Bulk Tests
// ============================================================================

TEST(MLKEM768Test, DefaultLevel) {
    MLKEM kem;
    EXPECT_EQ(kem.get_level(), MLKEMLevel::MLKEM768);
    EXPECT_EQ(kem.get_params().k, 3u);
}

TEST(MLKEM768Test, InvalidLevelRejected) {
    EXPECT_THROW(MLKEMParams::get(static_cast<MLKEMLevel>(5)), std::invalid_argument);
}

/**
 * @brief 100 key pairs x 100 encapsulations, all must agree
 */
TEST(MLKEM768Test, ManyRoundTrips) {
    MLKEM kem(MLKEMLevel::MLKEM768);
    size_t failures = 0;

    for (uint32_t key = 0; key < 100; ++key) {
        auto kp = kem.keygen_derand(counter_seed(key));
        for (uint32_t msg = 0; msg < 100; ++msg) {
            SharedSecret ss_enc;
            auto ct = kem.encaps_derand(kp.public_key, counter_seed(0x10000 + msg), ss_enc);
            if (kem.decaps(kp.secret_key, ct) != ss_enc) {
                ++failures;
            }
        }
    }
    EXPECT_EQ(failures, 0u);
}

TEST(MLKEM768Test, DistinctSeedsGiveDistinctKeys) {
    MLKEM kem(MLKEMLevel::MLKEM768);
    std::set<ByteVec> keys;
    for (uint32_t i = 0; i < 10000; ++i) {
        keys.insert(kem.keygen_derand(counter_seed(i)).public_key.data);
    }
    EXPECT_EQ(keys.size(), 10000u);
}
