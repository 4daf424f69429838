/**
 * @file benchmark_main.cpp
 * @brief pqkem Performance Benchmark Suite
 *
 * Usage:
 *   pqkem_benchmark [suite]
 *
 * Suites:
 *   all     - Run all benchmarks (default)
 *   hash    - SHA3-256, SHA3-512, SHAKE128, SHAKE256 vs OpenSSL
 *   mlkem   - ML-KEM-512/768/1024 key generation, encaps, decaps
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <string>

#include <openssl/crypto.h>

#include "pqkem/pqkem.h"

void benchmark_hash_functions();
void benchmark_mlkem();

/**
 * @brief Print usage help
 */
static void print_usage(const char* program_name) {
    std::cout << "\nUsage: " << program_name << " [suite]\n\n";
    std::cout << "Suites:\n";
    std::cout << "  all     - Run all benchmarks (default)\n";
    std::cout << "  hash    - SHA3/SHAKE vs OpenSSL\n";
    std::cout << "  mlkem   - ML-KEM key generation, encapsulation, decapsulation\n";
}

int main(int argc, char* argv[]) {
    std::string suite = "all";
    if (argc > 1) {
        suite = argv[1];
        std::transform(suite.begin(), suite.end(), suite.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    const std::set<std::string> valid = {"all", "hash", "mlkem", "help", "-h", "--help"};
    if (valid.find(suite) == valid.end()) {
        std::cerr << "Error: Unknown suite '" << suite << "'\n";
        print_usage(argv[0]);
        return 1;
    }
    if (suite == "help" || suite == "-h" || suite == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cout << "\n";
    std::cout << "+=========================================================================+\n";
    std::cout << "|                    pqkem Performance Benchmark Suite                    |\n";
    std::cout << "+=========================================================================+\n";

    if (pqkem_init() != PQKEM_SUCCESS) {
        std::cerr << "pqkem initialization failed" << std::endl;
        return 1;
    }

    std::cout << "\npqkem Version:   " << pqkem_version() << " (" << pqkem_platform() << ")" << std::endl;
    std::cout << "OpenSSL Version: " << OpenSSL_version(OPENSSL_VERSION) << std::endl;

    if (suite == "all" || suite == "hash") {
        benchmark_hash_functions();
    }
    if (suite == "all" || suite == "mlkem") {
        benchmark_mlkem();
    }

    pqkem_cleanup();
    return 0;
}
