/**
 * @file version.h
 * @brief Unified Version Information for pqkem Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef PQKEM_VERSION_H
#define PQKEM_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define PQKEM_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define PQKEM_VERSION_MINOR 0

/** Patch version number (bug fixes) */
#define PQKEM_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define PQKEM_VERSION_STRING "1.0.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define PQKEM_VERSION_NUMBER ((PQKEM_VERSION_MAJOR * 10000) + \
                              (PQKEM_VERSION_MINOR * 100) + \
                              PQKEM_VERSION_PATCH)

/** Library name */
#define PQKEM_LIBRARY_NAME "pqkem"

/** Full library description */
#define PQKEM_DESCRIPTION "Seed-keyed ML-KEM (FIPS 203) key encapsulation"

/** Build type identifier */
#ifdef NDEBUG
#define PQKEM_BUILD_TYPE "Release"
#else
#define PQKEM_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define PQKEM_VERSION_AT_LEAST(major, minor, patch) \
    (PQKEM_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* PQKEM_VERSION_H */
