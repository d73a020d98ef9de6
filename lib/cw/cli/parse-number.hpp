/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_CLI_PARSE_NUMBER_HPP
#define CAUSEWAY_CLI_PARSE_NUMBER_HPP

#include <charconv>
#include <concepts>
#include <cstdint>
#include <istream>
#include <cw/cli.hpp>

namespace causeway::cli::parse_number {
    // Surrounding whitespace is ignored; the reported column points into the original text
    template<std::integral T>
    result<T> parse_integer(const std::string_view text)
    {
        static constexpr std::string_view space { " \t\n\v\f\r" };
        const auto start = text.find_first_not_of(space);
        if (start == std::string_view::npos)
            return error_value::make(error_kind::parse, "expected an integer but got an empty string", error_context { .column = text.size() + 1 });
        const auto trimmed = text.substr(start, text.find_last_not_of(space) - start + 1);
        // a single plus sign is accepted only directly before a digit
        const size_t sign = trimmed.size() > 1 && trimmed[0] == '+' && trimmed[1] >= '0' && trimmed[1] <= '9' ? 1 : 0;
        T val {};
        const auto [ptr, ec] = std::from_chars(trimmed.data() + sign, trimmed.data() + trimmed.size(), val);
        const size_t column = static_cast<size_t>(ptr - text.data()) + 1;
        if (ec == std::errc::result_out_of_range)
            return error_value::from_external(std::out_of_range { fmt::format("{} does not fit into a {}-bit {} integer",
                trimmed, sizeof(T) * 8, std::is_signed_v<T> ? "signed" : "unsigned") }, error_context { .column = start + 1 });
        if (ec != std::errc {} || ptr != trimmed.data() + trimmed.size())
            return error_value::make(error_kind::parse, fmt::format("'{}' is not a valid integer", trimmed), error_context { .column = column });
        return val;
    }

    inline result<int32_t> parse(const std::string_view text)
    {
        return parse_integer<int32_t>(text);
    }

    // Rejected lines are recovered by asking again; only the end of input is a failure
    inline result<int32_t> read_until_valid(std::istream &is, std::ostream &os)
    {
        std::string line {};
        for (;;) {
            os << "Enter a number:\n";
            if (!std::getline(is, line))
                return error_value::make(error_kind::io, "the input ended before a valid number has been entered");
            auto res = parse(line);
            if (res) {
                os << fmt::format("You entered the number: {}\n", res.value());
                return res;
            }
            os << "Invalid input, please try again.\n";
            std::move(res).ignore();
        }
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "parse-number";
            cmd.desc = "parse a 32-bit signed integer";
            cmd.args.expect({ "<text>" });
        }

        result<void> run(const arguments &args, const options &) const override
        {
            auto val = parse_number::parse(args.at(0));
            if (!val)
                return std::move(val).error();
            std::cout << fmt::format("{}\n", val.value());
            return {};
        }
    };

    struct read_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "read-number";
            cmd.desc = "read lines from the standard input until one of them is a valid integer";
            cmd.args.expect({});
        }

        result<void> run(const arguments &, const options &) const override
        {
            auto val = read_until_valid(std::cin, std::cout);
            if (!val)
                return std::move(val).error();
            return {};
        }
    };
}

#endif // !CAUSEWAY_CLI_PARSE_NUMBER_HPP
