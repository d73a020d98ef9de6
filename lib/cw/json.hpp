/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_JSON_HPP
#define CAUSEWAY_JSON_HPP

#include <boost/json.hpp>
#include <cw/result.hpp>

namespace causeway {
    // Errors reported by Boost.JSON are parse errors; other Boost error codes are treated as I/O failures
    template<>
    struct external_traits<boost::system::error_code> {
        static error_kind kind(const boost::system::error_code &ec)
        {
            if (ec.category() == boost::json::make_error_code(boost::json::error::syntax).category())
                return error_kind::parse;
            return error_kind::io;
        }

        static std::string message(const boost::system::error_code &ec)
        {
            return ec.message();
        }
    };
}

namespace causeway::json {
    using namespace boost::json;

    // Malformed input is reported with the line and column of the first byte the parser rejected
    extern result<json::value> parse(std::string_view text, const std::optional<std::string> &path={});
    // Failures to read the file are passed through unchanged
    extern result<json::value> load(const std::string &path);
}

#endif // !CAUSEWAY_JSON_HPP
