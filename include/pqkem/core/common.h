/**
 * @file common.h
 * @brief Common definitions and utility macros for pqkem library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef PQKEM_CORE_COMMON_H
#define PQKEM_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define PQKEM_PLATFORM_WINDOWS 1
    #define PQKEM_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define PQKEM_PLATFORM_LINUX 1
    #define PQKEM_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define PQKEM_PLATFORM_MACOS 1
    #define PQKEM_PLATFORM_NAME "macOS"
#else
    #define PQKEM_PLATFORM_UNKNOWN 1
    #define PQKEM_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef PQKEM_PLATFORM_WINDOWS
    #ifdef PQKEM_SHARED_LIBRARY
        #ifdef PQKEM_BUILDING
            #define PQKEM_API __declspec(dllexport)
        #else
            #define PQKEM_API __declspec(dllimport)
        #endif
    #else
        #define PQKEM_API
    #endif
#else
    #ifdef PQKEM_SHARED_LIBRARY
        #define PQKEM_API __attribute__((visibility("default")))
    #else
        #define PQKEM_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    PQKEM_SUCCESS = 0,
    PQKEM_ERROR_INVALID_PARAM = -1,
    PQKEM_ERROR_BUFFER_TOO_SMALL = -2,
    PQKEM_ERROR_INVALID_KEY = -4,
    PQKEM_ERROR_INVALID_ENCODING = -5,  // Wrong-length key or ciphertext
    PQKEM_ERROR_INTERNAL = -10,
    PQKEM_ERROR_RANDOM_FAILED = -12     // CSPRNG failure
} pqkem_error_t;

// Utility macros
#define PQKEM_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#define PQKEM_MIN(a, b) ((a) < (b) ? (a) : (b))

#define PQKEM_ROTL64(x, n) ((uint64_t)(((x) << (n)) | ((x) >> (64 - (n)))))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
PQKEM_API const char* pqkem_error_string(pqkem_error_t error);

/**
 * @brief Get the library version string
 * @return Version string "major.minor.patch"
 */
PQKEM_API const char* pqkem_version(void);

/**
 * @brief Get the build platform name
 * @return Platform string ("Windows", "Linux", "macOS")
 */
PQKEM_API const char* pqkem_platform(void);

/**
 * @brief Initialize the library (checks CSPRNG availability)
 * @return PQKEM_SUCCESS on success
 * @note Thread-safe, can be called multiple times
 */
PQKEM_API pqkem_error_t pqkem_init(void);

/**
 * @brief Reset library initialization state
 */
PQKEM_API void pqkem_cleanup(void);

#ifdef __cplusplus
}
#endif

#endif // PQKEM_CORE_COMMON_H
