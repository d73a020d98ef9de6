/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <filesystem>
#include <cw/common/backtrace.hpp>
#include <cw/common/test.hpp>
#include <cw/error.hpp>

namespace {
    using namespace causeway;

    int parse_port(const std::string &text)
    {
        const auto v = std::stoi(text);
        if (v <= 0 || v > 0xFFFF)
            throw error { error_value::make(error_kind::validation, fmt::format("port {} is out of range", v)) };
        return v;
    }

    int load_port(const std::string &text)
    {
        try {
            return parse_port(text);
        } catch (const std::exception &ex) {
            throw error { error_kind::parse, fmt::format("while parsing the port '{}'", text), ex };
        }
    }
}

suite error_suite = [] {
    "error"_test = [] {
        const auto orig_capture = backtrace::capture_enabled();
        backtrace::set_capture(false);
        "capture a value"_test = [] {
            auto res = capture([] { return 5; });
            static_assert(std::is_same_v<decltype(res), result<int>>);
            test_same(5, res.value());
        };
        "capture void"_test = [] {
            auto res = capture([] {});
            static_assert(std::is_same_v<decltype(res), result<void>>);
            expect(res.has_value());
        };
        "capture flattens results"_test = [] {
            auto res = capture([]() -> result<int> { return error_value::make(error_kind::io, "no route to host"); });
            static_assert(std::is_same_v<decltype(res), result<int>>);
            expect(!res);
            test_same(std::string { "io: no route to host" }, res.error().chain_text());
        };
        "capture standard exceptions"_test = [] {
            auto res = capture([]() -> int { throw std::out_of_range("too big"); });
            expect(!res);
            test_same(error_kind::parse, res.error().kind());
            expect(res.error().downcast<std::out_of_range>() != nullptr);
            auto fs_res = capture([] {
                throw std::filesystem::filesystem_error { "missing", std::make_error_code(std::errc::no_such_file_or_directory) };
            });
            expect(!fs_res);
            test_same(error_kind::io, fs_res.error().kind());
            expect(fs_res.error().downcast<std::filesystem::filesystem_error>() != nullptr);
        };
        "capture keeps thrown chains"_test = [] {
            auto res = capture([] { return load_port("70000"); });
            expect(!res);
            expect_chain(res.error(), { "parse: while parsing the port '70000'", "  caused by validation: port 70000 is out of range" });
            auto bad = capture([] { return load_port("abc"); });
            expect(!bad);
            test_same(size_t { 2 }, bad.error().depth());
            test_same(error_kind::parse, bad.error().root_cause().kind());
            expect(bad.error().root_cause().downcast<std::invalid_argument>() != nullptr);
            test_same(443, capture([] { return load_port("443"); }).value());
        };
        "capture foreign exceptions"_test = [] {
            auto res = capture([]() -> int { throw 42; });
            expect(!res);
            test_same(error_kind::custom, res.error().kind());
            const auto *p = res.error().downcast<foreign_exception>();
            expect(p != nullptr);
            if (p)
                test_same(std::string { "unknown" }, p->type_name);
        };
        "from_current_exception"_test = [] {
            try {
                throw std::domain_error("negative balance");
            } catch (...) {
                const auto err = from_current_exception();
                test_same(error_kind::validation, err.kind());
                test_same(std::string { "negative balance" }, err.message());
            }
        };
        backtrace::set_capture(orig_capture);
    };
};
