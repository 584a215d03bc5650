#pragma once

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace gtin::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t operations;
    double elapsed_ms;
    double throughput_kops; // 千次/秒
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::high_resolution_clock::now(); }

    void stop() { end_ = std::chrono::high_resolution_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::time_point<std::chrono::high_resolution_clock> start_;
    std::chrono::time_point<std::chrono::high_resolution_clock> end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t operations,
                          int iterations,
                          Func &&func) {

    std::vector<double> timings;
    timings.reserve(iterations);

    // 重复执行多次，降低单次抖动影响（取平均值作为结果）
    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        timings.push_back(timer.elapsed_ms());
    }

    // 计算平均耗时
    double total_ms = 0.0;
    for (double t : timings) {
        total_ms += t;
    }
    double avg_ms = total_ms / iterations;

    // 计算吞吐（千次操作/秒）
    double throughput_kops = 0.0;
    if (avg_ms > 0.0) {
        throughput_kops = static_cast<double>(operations) / avg_ms;
    }

    results().push_back({name, operations, avg_ms, throughput_kops});
}

inline void print_results() {
    std::cout << "\n";
    std::cout << std::string(100, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(100, '=') << "\n";
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(15)
              << "Ops" << std::setw(15) << "Time (ms)" << std::setw(20)
              << "Throughput (kops/s)"
              << "\n";
    std::cout << std::string(100, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(50) << result.name;

        std::cout << std::setw(15) << result.operations;

        std::cout << std::fixed << std::setprecision(3) << std::setw(15)
                  << result.elapsed_ms;

        if (result.throughput_kops > 0.0) {
            std::cout << std::setw(20) << result.throughput_kops;
        } else {
            std::cout << std::setw(20) << "N/A";
        }

        std::cout << "\n";
    }

    std::cout << std::string(100, '=') << "\n\n";
}

} // namespace gtin::benchmarks

#define BENCH_RUN(name, operations, iterations, code)                                \
    ::gtin::benchmarks::run_benchmark(name, operations, iterations, [&]() { code; })
