#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace structbin::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t data_size;
    double avg_ms;
    double min_ms;
    double throughput_mbps;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t data_size,
                          int iterations,
                          Func &&func) {
    using clock = std::chrono::steady_clock;

    double total_ms = 0.0;
    double min_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        const auto start = clock::now();
        func();
        const auto elapsed = std::chrono::duration<double, std::milli>(clock::now() - start).count();
        total_ms += elapsed;
        min_ms = (i == 0) ? elapsed : std::min(min_ms, elapsed);
    }

    const double avg_ms = iterations > 0 ? total_ms / iterations : 0.0;

    // 吞吐按平均耗时计算（MB/s）
    double throughput_mbps = 0.0;
    if (avg_ms > 0.0) {
        const double mb = static_cast<double>(data_size) / (1024.0 * 1024.0);
        throughput_mbps = mb / (avg_ms / 1000.0);
    }

    results().push_back({name, data_size, avg_ms, min_ms, throughput_mbps});
}

inline std::string format_size(std::size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

inline void print_results() {
    std::cout << "\n" << std::string(110, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(15) << "Size"
              << std::setw(15) << "Avg (ms)" << std::setw(15) << "Min (ms)"
              << "Throughput (MB/s)\n";
    std::cout << std::string(110, '-') << "\n";

    for (const auto &r : results()) {
        std::cout << std::left << std::setw(50) << r.name << std::setw(15) << format_size(r.data_size)
                  << std::fixed << std::setprecision(3) << std::setw(15) << r.avg_ms << std::setw(15)
                  << r.min_ms;
        if (r.throughput_mbps > 0.0) {
            std::cout << r.throughput_mbps;
        } else {
            std::cout << "N/A";
        }
        std::cout << "\n";
    }

    std::cout << std::string(110, '=') << "\n\n";
}

} // namespace structbin::benchmarks

#define BENCH_RUN(name, size, iterations, ...)                                 \
    ::structbin::benchmarks::run_benchmark(name, size, iterations, [&]() { __VA_ARGS__; })
