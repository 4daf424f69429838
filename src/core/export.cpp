/**
 * @file export.cpp
 * @brief Library export and initialization functions
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "pqkem/core/common.h"
#include "pqkem/core/security.h"
#include "pqkem/version.h"

#include <atomic>
#include <cstdint>

// Global initialization state
static std::atomic<int> g_pqkem_initialized{0};

extern "C" {

const char* pqkem_version(void) {
    return PQKEM_VERSION_STRING;
}

const char* pqkem_platform(void) {
    return PQKEM_PLATFORM_NAME;
}

pqkem_error_t pqkem_init(void) {
    if (g_pqkem_initialized.load()) {
        return PQKEM_SUCCESS;
    }

    // Probe the CSPRNG once so a missing entropy source fails early
    uint8_t probe[16];
    if (pqkem::internal::random_bytes(probe, sizeof(probe)) != PQKEM_SUCCESS) {
        return PQKEM_ERROR_RANDOM_FAILED;
    }
    pqkem::internal::secure_zero(probe, sizeof(probe));

    g_pqkem_initialized.store(1);
    return PQKEM_SUCCESS;
}

void pqkem_cleanup(void) {
    g_pqkem_initialized.store(0);
}

const char* pqkem_error_string(pqkem_error_t error) {
    switch (error) {
        case PQKEM_SUCCESS:
            return "Success";
        case PQKEM_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case PQKEM_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case PQKEM_ERROR_INVALID_KEY:
            return "Invalid key";
        case PQKEM_ERROR_INVALID_ENCODING:
            return "Invalid encoding length";
        case PQKEM_ERROR_RANDOM_FAILED:
            return "Random number generation failed";
        case PQKEM_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

}  // extern "C"
