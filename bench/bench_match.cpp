// bench_match.cpp - Throughput benchmark for compiled patterns
// Part of xglob - extended glob patterns for strings
//
// Usage: xglob_bench [iterations]

#include "xglob/pattern.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct BenchCase {
    const char* pattern;
    const char* input;
};

const std::vector<BenchCase> CASES = {
    {"some/**/**/needle.txt", "some/one/two/needle.txt"},
    {"a*a*a*a*a*a*a*a*a", "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"},
    {"*hello.txt", "gareth_says_hello.txt"},
    {"!(+(secret|private)*+(.jpg|.gif))", "secret_image.png"},
};

} // namespace

int main(int argc, char* argv[]) {
    long iterations = 10000;
    if (argc > 1) {
        iterations = std::strtol(argv[1], nullptr, 10);
        if (iterations <= 0) {
            std::cerr << "Invalid iteration count: " << argv[1] << "\n";
            return 1;
        }
    }

    std::cout << "xglob benchmark (" << iterations << " iterations per case)\n\n";

    for (const auto& bench : CASES) {
        xglob::CompileResult result = xglob::compile(bench.pattern);
        if (!result.ok()) {
            std::cerr << result.error.format() << "\n";
            return 1;
        }

        const xglob::CompiledPattern& pattern = *result.pattern;
        const std::string input = bench.input;

        size_t hits = 0;
        auto start = std::chrono::steady_clock::now();
        for (long i = 0; i < iterations; ++i) {
            if (pattern.matches(input)) {
                hits++;
            }
        }
        auto elapsed = std::chrono::steady_clock::now() - start;

        double seconds = std::chrono::duration<double>(elapsed).count();
        double per_match_us = seconds * 1e6 / static_cast<double>(iterations);
        double mb_per_s = seconds > 0
            ? static_cast<double>(input.size()) * static_cast<double>(iterations) / seconds / 1e6
            : 0.0;

        std::cout << "  " << std::left << std::setw(36) << bench.pattern
                  << std::right << std::fixed << std::setprecision(3)
                  << std::setw(10) << per_match_us << " us/match  "
                  << std::setw(10) << mb_per_s << " MB/s  "
                  << (hits == static_cast<size_t>(iterations) ? "match" : "no match")
                  << "\n";
    }

    return 0;
}
