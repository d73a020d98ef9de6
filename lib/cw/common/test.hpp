/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_COMMON_TEST_HPP
#define CAUSEWAY_COMMON_TEST_HPP

#include <algorithm>
#include <iostream>
#include <source_location>
#include <string>
#include <vector>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "format.hpp"
#include <cw/result.hpp>

namespace causeway {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T>
    bool test_same(const T &x, const T &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    inline std::vector<std::string> split_lines(const std::string_view text)
    {
        std::vector<std::string> lines {};
        size_t start = 0;
        for (;;) {
            const auto end = text.find('\n', start);
            lines.emplace_back(text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
            if (end == std::string_view::npos)
                break;
            start = end + 1;
        }
        return lines;
    }

    // Compares the rendered chain line by line so that a mismatch points at the differing link
    inline void expect_chain(const error_value &err, const std::vector<std::string> &exp_lines, const std::source_location &loc=std::source_location::current())
    {
        const auto act_lines = split_lines(err.chain_text());
        expect(act_lines.size() == exp_lines.size(), loc) << fmt::format("expected {} lines but got {}: {}", exp_lines.size(), act_lines.size(), err.chain_text());
        for (size_t i = 0; i < std::min(act_lines.size(), exp_lines.size()); ++i)
            expect(act_lines[i] == exp_lines[i], loc) << fmt::format("line {}: '{}' != '{}'", i, act_lines[i], exp_lines[i]);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<causeway::test_printer>> {};

#endif // !CAUSEWAY_COMMON_TEST_HPP
