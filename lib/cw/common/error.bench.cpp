/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <cw/common/backtrace.hpp>
#include <cw/common/benchmark.hpp>

using namespace causeway;

namespace {
    result<int> fail_deep(const size_t depth)
    {
        if (depth == 0)
            return error_value::make(error_kind::io, "connection reset");
        auto res = fail_deep(depth - 1);
        if (!res)
            return std::move(res).error();
        return res.value();
    }
}

suite error_bench_suite = [] {
    "error"_test = [] {
        const auto orig_capture = backtrace::capture_enabled();
        backtrace::set_capture(false);
        benchmark_r("make without a backtrace", 10'000.0, 100'000, [] {
            error_value::make(error_kind::io, "connection reset").ignore();
        });
        benchmark_r("pass-through 16 frames", 10'000.0, 100'000, [] {
            fail_deep(16).ignore();
        });
        benchmark_r("wrap 3 times and render", 1'000.0, 10'000, [] {
            auto err = error_value::make(error_kind::io, "connection reset");
            err = error_value::wrap(std::move(err), error_kind::parse, "while reading the header");
            err = error_value::wrap(std::move(err), error_kind::custom, "while connecting");
            static_cast<void>(err.render());
        });
        benchmark_r("construct, throw, and catch", 1'000.0, 10'000, [] {
            try {
                throw error(fmt::format("Hello {}!", "world"));
            } catch (const error &ex) {
                static_cast<void>(ex.value().depth());
            }
        });
        backtrace::set_capture(true);
        benchmark_r("make with a backtrace", 100.0, 1'000, [] {
            error_value::make(error_kind::io, "connection reset").ignore();
        });
        backtrace::set_capture(orig_capture);
    };
};
