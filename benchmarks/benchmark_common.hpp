/**
 * @file benchmark_common.hpp
 * @brief Timing loop and table output shared by the pqkem benchmarks
 *
 * Each row prints average and best time; the last column is op/s for
 * KEM operations and MB/s for the Keccak functions.
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef PQKEM_BENCHMARK_COMMON_HPP
#define PQKEM_BENCHMARK_COMMON_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace pqkem_bench {

using Clock = std::chrono::steady_clock;
using Millis = std::chrono::duration<double, std::milli>;

struct BenchmarkResult {
    double avg_ms = 0;
    double min_ms = 0;
    double ops_per_sec = 0;
    bool valid = false;
};

inline double time_ms(const std::function<void()>& fn) {
    const auto t0 = Clock::now();
    fn();
    return Millis(Clock::now() - t0).count();
}

/**
 * @brief Call sample() warmup + iters times and summarize the timed runs
 *
 * sample() returns one measurement in ms. A negative value aborts the run
 * and yields an invalid result.
 */
inline BenchmarkResult run_benchmark_ex(size_t warmup, size_t iters,
                                        const std::function<double()>& sample) {
    BenchmarkResult r;
    for (size_t i = 0; i < warmup; ++i) {
        if (sample() < 0) return r;
    }

    double total = 0;
    double best = 0;
    for (size_t i = 0; i < iters; ++i) {
        const double t = sample();
        if (t < 0) return r;
        total += t;
        best = (i == 0) ? t : std::min(best, t);
    }
    if (iters == 0 || total <= 0) return r;

    r.avg_ms = total / static_cast<double>(iters);
    r.min_ms = best;
    r.ops_per_sec = 1000.0 / r.avg_ms;
    r.valid = true;
    return r;
}

namespace detail {

inline void row_prefix(const std::string& name, const std::string& impl) {
    std::cout << std::left << std::setw(25) << name << std::setw(12) << impl;
}

inline void timing_columns(const BenchmarkResult& r) {
    std::cout << std::right << std::fixed << std::setprecision(3)
              << std::setw(10) << r.avg_ms << " ms"
              << std::setw(10) << r.min_ms << " ms";
}

} // namespace detail

inline void print_result(const std::string& name, const std::string& impl,
                         const BenchmarkResult& r) {
    detail::row_prefix(name, impl);
    if (!r.valid) {
        std::cout << "  (failed)" << std::endl;
        return;
    }
    detail::timing_columns(r);
    std::cout << std::setw(12) << std::setprecision(1) << r.ops_per_sec << " op/s" << std::endl;
}

/**
 * @return MB/s for data_size bytes per call, 0 when the run failed
 */
inline double print_throughput_result(const std::string& name, const std::string& impl,
                                      const BenchmarkResult& r, size_t data_size) {
    detail::row_prefix(name, impl);
    if (!r.valid) {
        std::cout << "  (failed)" << std::endl;
        return 0.0;
    }
    const double mb = static_cast<double>(data_size) / (1024.0 * 1024.0);
    const double mbps = mb * 1000.0 / r.avg_ms;
    detail::timing_columns(r);
    std::cout << std::setw(10) << std::setprecision(2) << mbps << " MB/s" << std::endl;
    return mbps;
}

/**
 * @brief pqkem over OpenSSL throughput; above 1.00x means pqkem is faster
 */
inline void print_ratio(double ours, double openssl) {
    detail::row_prefix("  ==> Ratio", "");
    if (ours <= 0 || openssl <= 0) {
        std::cout << "  (n/a)" << std::endl;
        return;
    }
    const double ratio = ours / openssl;
    std::cout << std::right << std::fixed << std::setprecision(2)
              << std::setw(10) << ratio << "x    ("
              << std::showpos << std::setprecision(1) << (ratio - 1.0) * 100.0
              << std::noshowpos << "%)" << std::endl;
}

inline void print_section_header(const std::string& title, const std::string& unit) {
    const std::string rule(75, '=');
    std::cout << "\n" << rule << "\n  " << title << "\n" << rule << "\n";
    detail::row_prefix("Operation", "Impl");
    std::cout << std::right << std::setw(13) << "Avg" << std::setw(13) << "Min"
              << std::setw(12) << unit << "\n" << std::string(75, '-') << std::endl;
}

} // namespace pqkem_bench

#endif // PQKEM_BENCHMARK_COMMON_HPP
