/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_CLI_GCD_HPP
#define CAUSEWAY_CLI_GCD_HPP

#include <utility>
#include <cw/async.hpp>
#include <cw/cli.hpp>
#include <cw/cli/parse-number.hpp>

namespace causeway::cli::gcd {
    inline result<uint64_t> gcd(uint64_t n, uint64_t m)
    {
        if (n == 0 || m == 0)
            return error_value::make(error_kind::validation, fmt::format("gcd arguments must be non-zero but got {} and {}", n, m));
        while (m != 0) {
            if (m < n)
                std::swap(m, n);
            m %= n;
        }
        return n;
    }

    inline result<uint64_t> gcd(const std::string_view n_text, const std::string_view m_text)
    {
        auto n = parse_number::parse_integer<uint64_t>(n_text);
        if (!n)
            return std::move(n).error();
        auto m = parse_number::parse_integer<uint64_t>(m_text);
        if (!m)
            return std::move(m).error();
        return gcd(n.value(), m.value());
    }

    // A pair is written as n,m
    inline result<uint64_t> gcd_pair(const std::string_view pair)
    {
        const auto sep = pair.find(',');
        if (sep == std::string_view::npos)
            return error_value::make(error_kind::validation, fmt::format("expected a pair in the form n,m but got '{}'", pair));
        return gcd(pair.substr(0, sep), pair.substr(sep + 1));
    }

    // Every pair is processed on its own thread. All tasks are joined; the first failure is reported.
    inline result<std::vector<uint64_t>> parallel_gcd(const arguments &pairs)
    {
        std::vector<async::task<uint64_t>> tasks {};
        tasks.reserve(pairs.size());
        for (const auto &p: pairs)
            tasks.emplace_back(async::spawn([p] { return gcd_pair(p); }));
        std::vector<uint64_t> values {};
        std::optional<error_value> first_err {};
        for (size_t i = 0; i < tasks.size(); ++i) {
            auto res = tasks[i].join();
            if (res) {
                values.emplace_back(res.value());
                continue;
            }
            auto err = std::move(res).with_context(error_kind::custom, fmt::format("task #{} for '{}' has failed", i, pairs[i])).error();
            if (!first_err)
                first_err.emplace(std::move(err));
            else
                std::move(err).ignore();
        }
        if (first_err)
            return std::move(*first_err);
        return values;
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "gcd";
            cmd.desc = "compute the greatest common divisor of two positive integers";
            cmd.args.expect({ "<n>", "<m>" });
        }

        result<void> run(const arguments &args, const options &) const override
        {
            auto res = gcd(args.at(0), args.at(1));
            if (!res)
                return std::move(res).error();
            std::cout << fmt::format("{}\n", res.value());
            return {};
        }
    };

    struct parallel_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "parallel-gcd";
            cmd.desc = "compute the greatest common divisor for each pair using a separate thread per pair";
            cmd.args.expect({ "<n,m>", "[<n,m> ...]" });
        }

        result<void> run(const arguments &args, const options &) const override
        {
            auto res = parallel_gcd(args);
            if (!res)
                return std::move(res).error();
            std::cout << fmt::format("{}\n", res.value());
            return {};
        }
    };
}

#endif // !CAUSEWAY_CLI_GCD_HPP
