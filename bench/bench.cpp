/**
 * @file bench.cpp
 * @brief Performance benchmarks for BitUInt arithmetic.
 *
 * Measures per-operation time of addition, subtraction and Booth's
 * multiplication at several operand widths, for regression testing during
 * development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/bituint_bench              # Run with default 1000 iterations
 *   ./build/bituint_bench 10000        # Run with custom iteration count
 */

#include <bituint/bituint.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <utility>

using namespace bituint;

static constexpr int DEFAULT_ITERATIONS = 1000;

/// Operand with `width` significant bits, alternating 1 and 0 below the MSB
static UInt make_operand(std::size_t width) {
    BitVector bits(width + 1);
    for (std::size_t i = 1; i <= width; ++i) {
        bits.set_bit_unchecked(i, (i % 2 == 1) ? 1 : 0);
    }
    return UInt(std::move(bits));
}

template <typename Fn>
static void bench_op(const char* name, std::size_t width, int iterations, Fn op) {
    const UInt a = make_operand(width);
    const UInt b = make_operand(width / 2 + 1);

    // Warmup run
    UInt result = op(a, b);

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        result = op(a, b);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_op_us = total_us / static_cast<double>(iterations);
    double ns_per_bit = (per_op_us * 1000.0) / static_cast<double>(width);

    std::printf("%-10s %6zu bits  %10.3f µs/op  %8.2f ns/bit  (%zu result bits)\n", name, width,
                per_op_us, ns_per_bit, result.length());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("BitUInt Benchmarks (C++ Implementation)\n");
    std::printf("=======================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-10s %11s  %13s  %13s  %s\n", "Op", "Width", "Time", "Per-Bit", "Result");
    std::printf("%-10s %11s  %13s  %13s  %s\n", "--", "-----", "----", "-------", "------");

    const std::size_t widths[] = {16, 64, 256, 1024};

    std::printf("\nAddition:\n");
    for (const auto width : widths) {
        bench_op("add", width, iterations, [](const UInt& a, const UInt& b) { return a + b; });
    }

    std::printf("\nSubtraction:\n");
    for (const auto width : widths) {
        bench_op("sub", width, iterations, [](const UInt& a, const UInt& b) { return a - b; });
    }

    // Booth's is quadratic in width; keep the largest case affordable
    std::printf("\nMultiplication:\n");
    for (const auto width : widths) {
        const int mul_iterations = (width >= 1024) ? (iterations / 10 + 1) : iterations;
        bench_op("mul", width, mul_iterations,
                 [](const UInt& a, const UInt& b) { return a * b; });
    }

    return 0;
}
