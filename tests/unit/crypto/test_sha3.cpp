/**
 * @file test_sha3.cpp
 * @brief SHA3 / SHAKE unit tests
 *
 * Validates against NIST FIPS 202 test vectors and checks that the
 * incremental SHAKE interface produces the same stream as the one-shot call.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "pqkem/pqkem.h"

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

class SHA3Test : public ::testing::Test {
protected:
    void SetUp() override {
        pqkem_init();
    }
};

// ============================================================================
// SHA3-256 Tests
// ============================================================================

TEST_F(SHA3Test, SHA3_256_Empty) {
    uint8_t output[32];
    ASSERT_EQ(pqkem_sha3_256(nullptr, 0, output), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(output, 32),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST_F(SHA3Test, SHA3_256_ABC) {
    uint8_t output[32];
    const uint8_t input[] = {'a', 'b', 'c'};
    ASSERT_EQ(pqkem_sha3_256(input, sizeof(input), output), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(output, 32),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

/**
 * @brief 200 bytes of 0xA3, the FIPS 202 multi-block example message
 */
TEST_F(SHA3Test, SHA3_256_MultiBlock) {
    std::vector<uint8_t> input(200, 0xA3);
    uint8_t output[32];
    ASSERT_EQ(pqkem_sha3_256(input.data(), input.size(), output), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(output, 32),
              "79f38adec5c20307a98ef76e8324afbfd46cfd81b22e3973c65fa1bd9de31787");
}

TEST_F(SHA3Test, SHA3_256_IncrementalMatchesOneShot) {
    std::vector<uint8_t> input(1000);
    for (size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<uint8_t>(i * 31 + 7);
    }

    uint8_t expected[32];
    ASSERT_EQ(pqkem_sha3_256(input.data(), input.size(), expected), PQKEM_SUCCESS);

    // Chunk sizes straddling the 136-byte rate
    for (size_t chunk : {1u, 7u, 135u, 136u, 137u, 500u}) {
        pqkem_sha3_ctx_t ctx;
        ASSERT_EQ(pqkem_sha3_256_init(&ctx), PQKEM_SUCCESS);
        for (size_t off = 0; off < input.size(); off += chunk) {
            size_t n = std::min(chunk, input.size() - off);
            ASSERT_EQ(pqkem_sha3_256_update(&ctx, input.data() + off, n), PQKEM_SUCCESS);
        }
        uint8_t output[32];
        ASSERT_EQ(pqkem_sha3_256_final(&ctx, output), PQKEM_SUCCESS);
        EXPECT_EQ(memcmp(output, expected, 32), 0) << "chunk " << chunk;
    }
}

// ============================================================================
// SHA3-512 Tests
// ============================================================================

TEST_F(SHA3Test, SHA3_512_Empty) {
    uint8_t output[64];
    ASSERT_EQ(pqkem_sha3_512(nullptr, 0, output), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(output, 64),
              "a69f73cca23a9ac5c8b567dc185a756e97c982164fe25859e0d1dcc1475c80a6"
              "15b2123af1f5f94c11e3e9402c3ac558f500199d95b6d3e301758586281dcd26");
}

TEST_F(SHA3Test, SHA3_512_ABC) {
    uint8_t output[64];
    const uint8_t input[] = {'a', 'b', 'c'};
    ASSERT_EQ(pqkem_sha3_512(input, sizeof(input), output), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(output, 64),
              "b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e"
              "10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0");
}

TEST_F(SHA3Test, SHA3_512_MultiBlock) {
    std::vector<uint8_t> input(200, 0xA3);
    pqkem_sha3_ctx_t ctx;
    ASSERT_EQ(pqkem_sha3_512_init(&ctx), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_sha3_512_update(&ctx, input.data(), 100), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_sha3_512_update(&ctx, input.data() + 100, 100), PQKEM_SUCCESS);
    uint8_t output[64];
    ASSERT_EQ(pqkem_sha3_512_final(&ctx, output), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(output, 64),
              "e76dfad22084a8b1467fcf2ffa58361bec7628edf5f3fdc0e4805dc48caeeca8"
              "1b7c13c30adf52a3659584739a2df46be589c51ca1a4a8416df6545a1ce8ba00");
}

TEST_F(SHA3Test, NullPointerHandling) {
    uint8_t output[64];
    EXPECT_EQ(pqkem_sha3_256(nullptr, 10, output), PQKEM_ERROR_INVALID_PARAM);
    EXPECT_EQ(pqkem_sha3_512(nullptr, 10, output), PQKEM_ERROR_INVALID_PARAM);
    EXPECT_EQ(pqkem_sha3_256_init(nullptr), PQKEM_ERROR_INVALID_PARAM);
    EXPECT_EQ(pqkem_shake256(nullptr, 0, nullptr, 32), PQKEM_ERROR_INVALID_PARAM);
}

// ============================================================================
// SHAKE Tests
// ============================================================================

TEST_F(SHA3Test, SHAKE128_Empty) {
    uint8_t output[32];
    ASSERT_EQ(pqkem_shake128(nullptr, 0, output, sizeof(output)), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(output, 32),
              "7f9c2ba4e88f827d616045507605853ed73b8093f6efbc88eb1a6eacfa66ef26");
}

TEST_F(SHA3Test, SHAKE256_Empty) {
    uint8_t output[32];
    ASSERT_EQ(pqkem_shake256(nullptr, 0, output, sizeof(output)), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(output, 32),
              "46b9dd2b0ba88d13233b3feb743eeb243fcd52ea62b81b82b50c27646ed5762f");
}

/**
 * @brief 500 bytes spans several SHAKE128 blocks; pinned by its SHA3-256
 */
TEST_F(SHA3Test, SHAKE128_LongOutput) {
    const uint8_t input[] = {'a', 'b', 'c'};
    std::vector<uint8_t> stream(500);
    ASSERT_EQ(pqkem_shake128(input, sizeof(input), stream.data(), stream.size()),
              PQKEM_SUCCESS);

    uint8_t digest[32];
    ASSERT_EQ(pqkem_sha3_256(stream.data(), stream.size(), digest), PQKEM_SUCCESS);
    EXPECT_EQ(bytes_to_hex(digest, 32),
              "0f6b8e85c0f2803d3f0344a47d27f4b6b1ba69b0dbe0943ef27e56b405d6a7ba");
}

TEST_F(SHA3Test, SHAKE_IncrementalSqueezeMatchesOneShot) {
    const uint8_t seed[34] = {1, 2, 3, 4, 5};
    std::vector<uint8_t> expected(3 * PQKEM_SHAKE128_RATE + 17);
    ASSERT_EQ(pqkem_shake128(seed, sizeof(seed), expected.data(), expected.size()),
              PQKEM_SUCCESS);

    pqkem_sha3_ctx_t ctx;
    ASSERT_EQ(pqkem_shake128_init(&ctx), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_shake_absorb(&ctx, seed, 32), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_shake_absorb(&ctx, seed + 32, 2), PQKEM_SUCCESS);

    std::vector<uint8_t> actual(expected.size());
    size_t pos = 0;
    for (size_t step : {10u, 158u, 168u, 1u, 100u}) {
        ASSERT_EQ(pqkem_shake_squeeze(&ctx, actual.data() + pos, step), PQKEM_SUCCESS);
        pos += step;
    }
    ASSERT_EQ(pqkem_shake_squeeze(&ctx, actual.data() + pos, actual.size() - pos),
              PQKEM_SUCCESS);
    pqkem_sha3_clear(&ctx);

    EXPECT_EQ(actual, expected);
}

TEST_F(SHA3Test, SHAKE256_IncrementalAbsorb) {
    std::vector<uint8_t> input(300, 0x42);
    uint8_t expected[64];
    ASSERT_EQ(pqkem_shake256(input.data(), input.size(), expected, sizeof(expected)),
              PQKEM_SUCCESS);

    pqkem_sha3_ctx_t ctx;
    ASSERT_EQ(pqkem_shake256_init(&ctx), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_shake_absorb(&ctx, input.data(), 136), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_shake_absorb(&ctx, input.data() + 136, 164), PQKEM_SUCCESS);
    uint8_t output[64];
    ASSERT_EQ(pqkem_shake_squeeze(&ctx, output, sizeof(output)), PQKEM_SUCCESS);

    EXPECT_EQ(memcmp(output, expected, sizeof(output)), 0);
}

TEST_F(SHA3Test, SHAKE_AbsorbAfterSqueezeRejected) {
    pqkem_sha3_ctx_t ctx;
    const uint8_t data[4] = {0};
    uint8_t out[8];
    ASSERT_EQ(pqkem_shake128_init(&ctx), PQKEM_SUCCESS);
    ASSERT_EQ(pqkem_shake_squeeze(&ctx, out, sizeof(out)), PQKEM_SUCCESS);
    EXPECT_EQ(pqkem_shake_absorb(&ctx, data, sizeof(data)), PQKEM_ERROR_INVALID_PARAM);
}
