/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_COMMON_BENCHMARK_HPP
#define CAUSEWAY_COMMON_BENCHMARK_HPP

#include <chrono>
#include <cmath>
#include <iostream>
#include <source_location>
#include <string>
#include "test.hpp"

namespace causeway {
    inline std::string humanize_rate(const double rate)
    {
        struct scale {
            double norm;
            const char *suffix;
        };
        static const std::vector<scale> scales { { 1e9, "G" }, { 1e6, "M" }, { 1e3, "K" } };
        const auto abs_rate = std::fabs(rate);
        for (const auto &[norm, suff]: scales) {
            if (abs_rate >= norm)
                return fmt::format("{:.3f}{}", rate / norm, suff);
        }
        return fmt::format("{:.3f}", rate);
    }

    template<typename T>
    double benchmark_rate(const std::string_view name, const size_t num_iter, const T &action)
    {
        const auto start = std::chrono::high_resolution_clock::now();
        for (size_t i = 0; i < num_iter; ++i)
            action();
        const std::chrono::duration<double> sec = std::chrono::high_resolution_clock::now() - start;
        const double rate = static_cast<double>(num_iter) / sec.count();
        std::clog << fmt::format("[{}] {}iters/sec, total iters: {}\n", name, humanize_rate(rate), num_iter);
        return rate;
    }

    template<typename T>
    void benchmark_r(const std::string_view name, const double min_rate, const size_t num_iter, const T &action, const std::source_location &src_loc=std::source_location::current())
    {
        boost::ut::test(name) = [=] {
            const double rate = benchmark_rate(name, num_iter, action);
            boost::ut::expect(rate >= min_rate, src_loc) << rate << " < " << min_rate;
        };
    }
}

#endif // !CAUSEWAY_COMMON_BENCHMARK_HPP
