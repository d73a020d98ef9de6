/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <cw/common/test.hpp>
#include <cw/file.hpp>
#include <cw/json.hpp>

using namespace causeway;

suite json_suite = [] {
    "json"_test = [] {
        "parse"_test = [] {
            auto res = json::parse(R"({ "tracing": true, "depth": 3 })");
            expect(res.has_value());
            if (res) {
                const auto &obj = res.value().as_object();
                expect(obj.at("tracing").as_bool());
                test_same(int64_t { 3 }, obj.at("depth").as_int64());
            }
        };
        "malformed"_test = [] {
            auto res = json::parse("{\n  \"tracing\": tru\n}", "settings.json");
            expect(!res);
            if (!res) {
                const auto &err = res.error();
                test_same(error_kind::parse, err.kind());
                test_same(size_t { 1 }, err.depth());
                test_same(std::optional<std::string> { "settings.json" }, err.context().path);
                test_same(std::optional<size_t> { 2 }, err.context().line);
                expect(err.context().column.has_value());
                expect(err.downcast<boost::system::error_code>() != nullptr);
            }
        };
        "incomplete"_test = [] {
            auto res = json::parse("{ \"tracing\": ");
            expect(!res);
            if (!res) {
                test_same(error_kind::parse, res.error().kind());
                expect(!res.error().message().empty());
                expect(!res.error().context().path);
                test_same(std::optional<size_t> { 1 }, res.error().context().line);
            }
        };
        "load"_test = [] {
            const file::tmp tmp { "cw-json-test-load.json" };
            expect(file::write(tmp, "[1, 2,\n\n 3,]").has_value());
            auto res = json::load(tmp);
            expect(!res);
            if (!res) {
                test_same(error_kind::parse, res.error().kind());
                test_same(std::optional<std::string> { tmp.path() }, res.error().context().path);
                test_same(std::optional<size_t> { 3 }, res.error().context().line);
            }
            expect(file::write(tmp, "[1, 2, 3]").has_value());
            auto ok = json::load(tmp);
            expect(ok.has_value());
            if (ok)
                test_same(size_t { 3 }, ok.value().as_array().size());
        };
        "load a missing file"_test = [] {
            auto res = json::load("/nonexistent-cw-dir/settings.json");
            expect(!res);
            if (!res) {
                test_same(error_kind::io, res.error().kind());
                test_same(size_t { 1 }, res.error().depth());
            }
        };
    };
};
