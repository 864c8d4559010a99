/**
 * @file benchmark_common.hpp
 * @brief Common utilities for secpfield benchmarks with ratio comparison
 *
 * Provides unified benchmark output format with:
 * - Performance metrics (avg, min, throughput)
 * - Reference library vs secpfield ratio comparison
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SECPFIELD_BENCHMARK_COMMON_HPP
#define SECPFIELD_BENCHMARK_COMMON_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

namespace secpfield_bench {

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

/**
 * @brief Benchmark result containing timing and throughput data
 */
struct BenchmarkResult {
    double avg_ms;          ///< Average batch time in milliseconds
    double min_ms;          ///< Minimum batch time in milliseconds
    double throughput;      ///< Field operations per second
    bool valid;             ///< Whether benchmark completed successfully

    BenchmarkResult() : avg_ms(0), min_ms(0), throughput(0), valid(false) {}
    BenchmarkResult(double avg, double min_t, double tp)
        : avg_ms(avg), min_ms(min_t), throughput(tp), valid(true) {}
};

/**
 * @brief Print time ratio against a reference implementation
 *
 * ratio = reference_time / secpfield_time, > 1.0 means secpfield is faster.
 */
inline void print_time_ratio(double secpfield_time, double reference_time,
                             const std::string& reference_name) {
    if (reference_time <= 0 || secpfield_time <= 0) {
        std::cout << std::left << std::setw(25) << "  ==> Ratio"
                  << std::setw(12) << ""
                  << "  (comparison not available)" << std::endl;
        return;
    }

    double ratio = reference_time / secpfield_time;
    const char* status = ratio >= 1.0 ? "FASTER" : "SLOWER";

    std::cout << std::left << std::setw(25) << "  ==> Ratio"
              << std::setw(12) << ""
              << std::right << std::fixed << std::setprecision(2)
              << std::setw(8) << ratio * 100.0 << "%"
              << " of " << reference_name << " (" << ratio << "x " << status << ")"
              << std::endl;
}

/**
 * @brief Run benchmark and return result with statistics
 *
 * @param warmup_iters Number of warmup batches
 * @param bench_iters Number of timed batches
 * @param ops_per_batch Field operations performed by one call
 * @param benchmark_func Runs one batch, returns its time in ms (< 0 on error)
 */
inline BenchmarkResult run_benchmark_ex(
    size_t warmup_iters,
    size_t bench_iters,
    size_t ops_per_batch,
    std::function<double()> benchmark_func
) {
    std::vector<double> times;
    times.reserve(bench_iters);

    for (size_t i = 0; i < warmup_iters; ++i) {
        if (benchmark_func() < 0) return BenchmarkResult();
    }

    for (size_t i = 0; i < bench_iters; ++i) {
        double t = benchmark_func();
        if (t < 0) return BenchmarkResult();
        times.push_back(t);
    }

    double avg = std::accumulate(times.begin(), times.end(), 0.0) /
                 static_cast<double>(times.size());
    double min_t = *std::min_element(times.begin(), times.end());
    double ops_per_sec = static_cast<double>(ops_per_batch) * 1000.0 / avg;

    return BenchmarkResult(avg, min_t, ops_per_sec);
}

/**
 * @brief Print benchmark result line
 */
inline void print_result(
    const std::string& name,
    const std::string& impl,
    const BenchmarkResult& result
) {
    if (!result.valid) {
        std::cout << std::left << std::setw(25) << name
                  << std::setw(12) << impl
                  << "  (benchmark failed)" << std::endl;
        return;
    }

    std::cout << std::left << std::setw(25) << name
              << std::setw(12) << impl
              << std::right << std::fixed << std::setprecision(3)
              << std::setw(10) << result.avg_ms << " ms"
              << std::setw(10) << result.min_ms << " ms"
              << std::setw(14) << std::setprecision(0) << result.throughput << " op/s"
              << std::endl;
}

inline void print_header(const std::string& title) {
    std::cout << "\n" << std::string(80, '=') << "\n"
              << "  " << title << "\n"
              << std::string(80, '=') << "\n"
              << std::left << std::setw(25) << "Operation"
              << std::setw(12) << "Impl"
              << std::right << std::setw(13) << "Avg"
              << std::setw(13) << "Min"
              << std::setw(19) << "Throughput" << "\n"
              << std::string(80, '-') << std::endl;
}

} // namespace secpfield_bench

#endif // SECPFIELD_BENCHMARK_COMMON_HPP
