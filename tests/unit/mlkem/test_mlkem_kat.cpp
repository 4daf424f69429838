/**
 * @file test_mlkem_kat.cpp
 * @brief ML-KEM known-answer tests
 *
 * Fixed inputs: master seed = 32 zero bytes, encapsulation message
 * m = 32 zero bytes. Keys and ciphertexts are pinned by their SHA3-256
 * digest, shared secrets in full.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <string>

#include "pqkem/pqkem.h"

using namespace pqkem::mlkem;
using pqkem::Seed32;

/**
 * @brief Convert byte array to hex string
 */
static std::string bytes_to_hex(const uint8_t* data, size_t len) {
    std::string hex;
    char buf[3];
    for (size_t i = 0; i < len; ++i) {
        snprintf(buf, sizeof(buf), "%02x", data[i]);
        hex += buf;
    }
    return hex;
}

static std::string sha3_256_hex(const uint8_t* data, size_t len) {
    uint8_t digest[32];
    if (pqkem_sha3_256(data, len, digest) != PQKEM_SUCCESS) {
        return "";
    }
    return bytes_to_hex(digest, sizeof(digest));
}

struct KatVector {
    MLKEMLevel level;
    const char* name;
    const char* ek_prefix;      ///< First 16 bytes of ek
    const char* ek_digest;
    const char* dk_digest;      ///< Classic-form dk
    const char* ct_digest;
    const char* shared_secret;
    const char* rejected;       ///< Shared secret after ct[0] ^= 1
};

static const KatVector kKatVectors[] = {
    {
        MLKEMLevel::MLKEM512, "MLKEM512",
        "ab77183c1290d0b8a627539baad66ed1",
        "01472f2d40e24cdc6638b08a80b5dac5d6f3d3a2c92e7a70e4db8daecd76ae64",
        "44edcd20c014468e3689abd7982194e4bf033718793ca07205c12b28a90d6ae4",
        "04915b1b3a975dcb74c8d70c952bb854344a2904462e49edae01fa3f49c28294",
        "197bf7a9a02e890fc2685b18bebfd2a674956c97ce8cef14330923ccb1b52ead",
        "ea815178cb1c876b7217eda7ce41ec9dac13f99e9c612a7d59c9d72515d1b697",
    },
    {
        MLKEMLevel::MLKEM768, "MLKEM768",
        "ff99ab956b000df80f1af04107680288",
        "b23523815647569321a66702418b268cea39c1177eccecb888112d901d67e9a3",
        "4dd284e323a8954b44a7a08578d9e5cf705e26f8465d2d26535e9b4222d8928b",
        "f6738564970e2666ce24041bee1ce90eee0f785b7d17b4b45f08b4dd25a8005c",
        "432cd0367f10fdc13e57e8ef32750628cd1d47b8612fac71a47350b0f96fb3c5",
        "33f805f6f18d9cea12ce042bc65969b083430fb95e3eef995f7e04f65c0d469c",
    },
    {
        MLKEMLevel::MLKEM1024, "MLKEM1024",
        "beb23de61baa7402a9e563545f4b3108",
        "fb4e3f49a959d6627fda68cf525f5e8080adae2cab6af6f6ceb9f821014bfa7b",
        "7b90d4a65aed641e2ecdb5886a7cc432991a595ff2699f1ebb2dea1e6dc1cb05",
        "baf5a5bd4c6940c7045856ec42f83c371fd7ea6ec5f4f9e33e62f61a4694d8dc",
        "f0b6d29da9ed156e159722532d6e572e5c23dd6b4f26e7a1ad793244d7998746",
        "779ee62ee39c328004cc5403e2bbb93466a5e9a3140bf1855694281b3ea336f2",
    },
};

class MLKEMKatTest : public ::testing::TestWithParam<KatVector> {
protected:
    void SetUp() override {
        pqkem_init();
    }
};

TEST_P(MLKEMKatTest, ZeroSeed) {
    const KatVector& v = GetParam();
    MLKEM kem(v.level);
    const Seed32 seed{};
    const Seed32 m{};

    MLKEMKeyPair kp = kem.keygen_derand(seed);
    EXPECT_EQ(bytes_to_hex(kp.public_key.bytes(), 16), v.ek_prefix);
    EXPECT_EQ(sha3_256_hex(kp.public_key.bytes(), kp.public_key.size()), v.ek_digest);

    MLKEMSecretKey classic = kem.expand_secret_key(seed);
    EXPECT_EQ(sha3_256_hex(classic.bytes(), classic.size()), v.dk_digest);

    SharedSecret ss;
    MLKEMCiphertext ct = kem.encaps_derand(kp.public_key, m, ss);
    EXPECT_EQ(sha3_256_hex(ct.bytes(), ct.size()), v.ct_digest);
    EXPECT_EQ(bytes_to_hex(ss.data(), ss.size()), v.shared_secret);

    SharedSecret dec = kem.decaps(kp.secret_key, ct);
    EXPECT_EQ(bytes_to_hex(dec.data(), dec.size()), v.shared_secret);

    ct.data[0] ^= 0x01;
    SharedSecret rej = kem.decaps(kp.secret_key, ct);
    EXPECT_EQ(bytes_to_hex(rej.data(), rej.size()), v.rejected);
    EXPECT_EQ(kem.decaps(classic, ct), rej);
}

TEST_P(MLKEMKatTest, ImplicitRejectionKeyIsShake256) {
    const KatVector& v = GetParam();
    MLKEM kem(v.level);
    const Seed32 seed{};

    MLKEMKeyPair kp = kem.keygen_derand(seed);
    SharedSecret ss;
    MLKEMCiphertext ct = kem.encaps_derand(kp.public_key, Seed32{}, ss);
    ct.data[0] ^= 0x01;

    // z for the zero seed is bytes 32..63 of SHAKE256(0^32)
    uint8_t dz[64];
    ASSERT_EQ(pqkem_shake256(seed.data(), seed.size(), dz, sizeof(dz)), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(dz + 32, 32),
              "221e124311ec7f7181568de7938df805d894f5fded465001a04e260a49482cf5");

    pqkem_sha3_ctx_t ctx;
    ASSERT_EQ(pqkem_shake256_init(&ctx), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_shake_absorb(&ctx, dz + 32, 32), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_shake_absorb(&ctx, ct.bytes(), ct.size()), PQKEM_SUCCESS);
    uint8_t expected[32];
    ASSERT_EQ(pqkem_shake_squeeze(&ctx, expected, sizeof(expected)), PQKEM_SUCCESS);
    pqkem_sha3_clear(&ctx);

    EXPECT_EQ(bytes_to_hex(expected, 32), v.rejected);
}

INSTANTIATE_TEST_SUITE_P(
    ZeroSeedVectors,
    MLKEMKatTest,
    ::testing::ValuesIn(kKatVectors),
    [](const ::testing::TestParamInfo<KatVector>& info) {
        return std::string(info.param.name);
    }
);
