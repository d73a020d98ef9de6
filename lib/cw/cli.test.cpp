/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <sstream>
#include <cw/cli.hpp>
#include <cw/cli/gcd.hpp>
#include <cw/cli/parse-number.hpp>
#include <cw/cli/show-settings.hpp>
#include <cw/common/backtrace.hpp>
#include <cw/common/test.hpp>
#include <cw/file.hpp>

using namespace causeway;
using namespace causeway::cli;

suite cli_suite = [] {
    "cli"_test = [] {
        const auto orig_capture = backtrace::capture_enabled();
        backtrace::set_capture(false);
        "parse_integer"_test = [] {
            test_same(int32_t { 42 }, parse_number::parse(" 42 ").value());
            test_same(int32_t { -17 }, parse_number::parse("-17").value());
            test_same(int32_t { 5 }, parse_number::parse("+5").value());
            test_same(int32_t { 7 }, parse_number::parse("\v7\f").value());
            test_same(uint64_t { 12 }, parse_number::parse_integer<uint64_t>(" +12\t").value());
            {
                auto res = parse_number::parse("+-5");
                expect(!res);
                if (!res)
                    test_same(std::string { "parse: '+-5' is not a valid integer at <input> column 1" }, res.error().chain_text());
            }
            {
                auto res = parse_number::parse("+");
                expect(!res);
                if (!res)
                    test_same(error_kind::parse, res.error().kind());
            }
            {
                auto res = parse_number::parse("12ab");
                expect(!res);
                if (!res)
                    test_same(std::string { "parse: '12ab' is not a valid integer at <input> column 3" }, res.error().chain_text());
            }
            {
                auto res = parse_number::parse("");
                expect(!res);
                if (!res)
                    test_same(std::string { "parse: expected an integer but got an empty string at <input> column 1" }, res.error().chain_text());
            }
            {
                auto res = parse_number::parse("2147483648");
                expect(!res);
                if (!res) {
                    test_same(error_kind::parse, res.error().kind());
                    expect(res.error().downcast<std::out_of_range>() != nullptr);
                    test_same(std::optional<size_t> { 1 }, res.error().context().column);
                }
            }
            {
                auto res = parse_number::parse_integer<uint64_t>("-5");
                expect(!res);
                if (!res)
                    test_same(error_kind::parse, res.error().kind());
            }
        };
        "read_until_valid"_test = [] {
            {
                std::istringstream is { "abc\n\n17\n" };
                std::ostringstream os {};
                auto res = parse_number::read_until_valid(is, os);
                expect(res.has_value());
                if (res)
                    test_same(int32_t { 17 }, res.value());
                test_same(std::string {
                    "Enter a number:\nInvalid input, please try again.\n"
                    "Enter a number:\nInvalid input, please try again.\n"
                    "Enter a number:\nYou entered the number: 17\n" }, os.str());
            }
            {
                std::istringstream is { "x\n" };
                std::ostringstream os {};
                auto res = parse_number::read_until_valid(is, os);
                expect(!res);
                if (!res)
                    test_same(error_kind::io, res.error().kind());
            }
        };
        "gcd"_test = [] {
            test_same(uint64_t { 7 }, gcd::gcd(14, 21).value());
            test_same(uint64_t { 7 }, gcd::gcd(49, 14).value());
            test_same(uint64_t { 1 }, gcd::gcd(1, 100).value());
            test_same(uint64_t { 3 }, gcd::gcd(6, 9).value());
            test_same(uint64_t { 12 }, gcd::gcd("36", " 24").value());
            {
                auto res = gcd::gcd(0, 5);
                expect(!res);
                if (!res)
                    test_same(std::string { "validation: gcd arguments must be non-zero but got 0 and 5" }, res.error().chain_text());
            }
            {
                auto res = gcd::gcd("abc", "5");
                expect(!res);
                if (!res)
                    test_same(error_kind::parse, res.error().kind());
            }
            test_same(uint64_t { 4 }, gcd::gcd_pair("8,12").value());
            {
                auto res = gcd::gcd_pair("8;12");
                expect(!res);
                if (!res)
                    test_same(error_kind::validation, res.error().kind());
            }
        };
        "parallel_gcd"_test = [] {
            {
                auto res = gcd::parallel_gcd({ "14,21", "6,9", "1,100" });
                expect(res.has_value());
                if (res)
                    expect(res.value() == std::vector<uint64_t> { 7, 3, 1 });
            }
            {
                auto res = gcd::parallel_gcd({ "14,21", "6,0", "x,1" });
                expect(!res);
                if (!res) {
                    expect_chain(res.error(), {
                        "custom: task #1 for '6,0' has failed",
                        "  caused by validation: gcd arguments must be non-zero but got 6 and 0"
                    });
                }
            }
        };
        "show-settings"_test = [] {
            {
                auto res = show_settings::load_or_default("/nonexistent-cw-dir/settings.json");
                expect(res.has_value());
                if (res)
                    expect(res.value() == settings::from_env());
            }
            {
                const file::tmp tmp { "cw-cli-test-settings.json" };
                expect(file::write(tmp, "{ \"tracing\": }").has_value());
                auto res = show_settings::load_or_default(tmp);
                expect(!res);
                if (!res) {
                    test_same(size_t { 2 }, res.error().depth());
                    test_same(error_kind::parse, res.error().root_cause().kind());
                }
            }
        };
        "show-settings options"_test = [] {
            const show_settings::cmd cmd {};
            config cfg {};
            cmd.configure(cfg);
            {
                auto pr = cmd.parse(cfg, {});
                expect(pr.has_value());
                if (pr)
                    test_same(std::optional<std::string> { "text" }, pr.value().opts.at("format"));
            }
            {
                auto pr = cmd.parse(cfg, { "--format=json", "settings.json" });
                expect(pr.has_value());
                if (pr) {
                    test_same(std::optional<std::string> { "json" }, pr.value().opts.at("format"));
                    expect(pr.value().args == arguments { "settings.json" });
                }
            }
            {
                auto pr = cmd.parse(cfg, { "--format" });
                expect(pr.has_value());
                if (pr)
                    expect(!pr.value().opts.at("format"));
            }
            {
                auto pr = cmd.parse(cfg, { "--format=json", "--format=text" });
                expect(!pr);
                if (!pr) {
                    test_same(error_kind::validation, pr.error().kind());
                    test_same(std::string { "duplicate option specification '--format=text'; usage: show-settings [options] [<path>]"
                        " - load the settings from a JSON file or the environment and print them;"
                        " --format (text by default) - output format: text or json" }, pr.error().message());
                }
            }
            {
                const settings s { .capture_backtraces = true, .tracing = false };
                test_same(std::string { "captureBacktraces: true\ntracing: false\n" }, show_settings::format_settings(s, "text").value());
                test_same(std::string { "{\"captureBacktraces\":true,\"tracing\":false}\n" }, show_settings::format_settings(s, "json").value());
                auto res = show_settings::format_settings(s, "yaml");
                expect(!res);
                if (!res)
                    test_same(std::string { "validation: unsupported output format 'yaml', expected text or json" }, res.error().chain_text());
            }
        };
        "run"_test = [] {
            {
                const char *argv[] = { "cw" };
                std::ostringstream err {};
                test_same(1, cli::run(1, argv, default_commands(), err));
                expect(err.str().find("gcd <n> <m>") != std::string::npos) << err.str();
            }
            {
                const char *argv[] = { "cw", "nope" };
                std::ostringstream err {};
                test_same(1, cli::run(2, argv, default_commands(), err));
                test_same(std::string { "validation: unknown command nope\n" }, err.str());
            }
            {
                const char *argv[] = { "cw", "gcd", "14", "21" };
                std::ostringstream err {};
                test_same(0, cli::run(4, argv, default_commands(), err));
                test_same(std::string {}, err.str());
            }
            {
                const char *argv[] = { "cw", "gcd", "0", "5" };
                std::ostringstream err {};
                test_same(1, cli::run(4, argv, default_commands(), err));
                test_same(std::string {
                    "custom: command gcd has failed\n"
                    "  caused by validation: gcd arguments must be non-zero but got 0 and 5\n" }, err.str());
            }
            {
                const char *argv[] = { "cw", "gcd", "14" };
                std::ostringstream err {};
                test_same(1, cli::run(3, argv, default_commands(), err));
                const auto lines = split_lines(err.str());
                expect(lines.size() > 1);
                if (lines.size() > 1)
                    expect(lines[1].starts_with("  caused by validation: too few arguments; usage: gcd <n> <m>")) << lines[1];
            }
            {
                const char *argv[] = { "cw", "parse-number", "42" };
                std::ostringstream err {};
                test_same(0, cli::run(3, argv, default_commands(), err));
                test_same(std::string {}, err.str());
            }
            {
                const char *argv[] = { "cw", "parse-number", "x" };
                std::ostringstream err {};
                test_same(1, cli::run(3, argv, default_commands(), err));
                test_same(std::string {
                    "custom: command parse-number has failed\n"
                    "  caused by parse: 'x' is not a valid integer at <input> column 1\n" }, err.str());
            }
            {
                const char *argv[] = { "cw", "show-settings", "--format=json" };
                std::ostringstream err {};
                test_same(0, cli::run(3, argv, default_commands(), err));
                test_same(std::string {}, err.str());
            }
            {
                const char *argv[] = { "cw", "show-settings", "--format" };
                std::ostringstream err {};
                test_same(1, cli::run(3, argv, default_commands(), err));
                test_same(std::string {
                    "custom: command show-settings has failed\n"
                    "  caused by validation: option --format requires a value\n" }, err.str());
            }
            {
                const char *argv[] = { "cw", "show-settings", "--format=xml" };
                std::ostringstream err {};
                test_same(1, cli::run(3, argv, default_commands(), err));
                expect(err.str().find("unsupported output format 'xml'") != std::string::npos) << err.str();
            }
            {
                const char *argv[] = { "cw", "parse-number", "--fast", "5" };
                std::ostringstream err {};
                test_same(1, cli::run(4, argv, default_commands(), err));
                expect(err.str().find("unknown option '--fast'") != std::string::npos) << err.str();
            }
        };
        backtrace::set_capture(orig_capture);
    };
};
