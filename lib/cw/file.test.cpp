/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <filesystem>
#include <cw/common/test.hpp>
#include <cw/file.hpp>

using namespace causeway;

suite file_suite = [] {
    "file"_test = [] {
        "write and read"_test = [] {
            std::string path {};
            {
                const file::tmp tmp { "cw-file-test-write-read.txt" };
                path = tmp.path();
                const std::string data { "line one\nline two\n" };
                expect(file::write(tmp, data).has_value());
                auto res = file::read(tmp);
                expect(res.has_value());
                if (res)
                    test_same(data, res.value());
            }
            expect(!std::filesystem::exists(path));
        };
        "empty file"_test = [] {
            const file::tmp tmp { "cw-file-test-empty.txt" };
            expect(file::write(tmp, "").has_value());
            test_same(std::string {}, file::read(tmp).value());
        };
        "missing file"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "cw-file-test-missing" / "no-such-file.txt").string();
            auto res = file::read(path);
            expect(!res);
            if (!res) {
                test_same(error_kind::io, res.error().kind());
                const auto *p = res.error().downcast<std::filesystem::filesystem_error>();
                expect(p != nullptr);
                if (p) {
                    expect(p->code() == std::errc::no_such_file_or_directory);
                    test_same(path, p->path1().string());
                }
            }
        };
        "write to a missing directory"_test = [] {
            const auto path = (std::filesystem::temp_directory_path() / "cw-file-test-missing" / "out.txt").string();
            auto res = file::write(path, "data");
            expect(!res);
            if (!res)
                test_same(error_kind::io, res.error().kind());
        };
    };
};
