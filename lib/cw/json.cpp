/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <algorithm>
#include <cw/file.hpp>
#include <cw/json.hpp>

namespace causeway::json {
    static error_context _location(const std::string_view text, const size_t offset, const std::optional<std::string> &path)
    {
        const auto prefix = text.substr(0, std::min(offset, text.size()));
        const auto line = static_cast<size_t>(std::count(prefix.begin(), prefix.end(), '\n')) + 1;
        const auto line_start = prefix.rfind('\n');
        const auto column = line_start == std::string_view::npos ? prefix.size() + 1 : prefix.size() - line_start;
        return error_context { path, line, column };
    }

    result<json::value> parse(const std::string_view text, const std::optional<std::string> &path)
    {
        stream_parser p {};
        boost::system::error_code ec {};
        const auto consumed = p.write(text.data(), text.size(), ec);
        if (ec)
            return error_value::from_external(ec, _location(text, consumed, path));
        p.finish(ec);
        if (ec)
            return error_value::from_external(ec, _location(text, text.size(), path));
        return p.release();
    }

    result<json::value> load(const std::string &path)
    {
        auto text = file::read(path);
        if (!text)
            return std::move(text).error();
        return parse(text.value(), path);
    }
}
