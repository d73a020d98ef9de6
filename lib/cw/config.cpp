/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <cstdlib>
#include <cw/common/backtrace.hpp>
#include <cw/config.hpp>
#include <cw/logger.hpp>

namespace causeway {
    settings settings::from_env()
    {
        settings s {};
        s.capture_backtraces = std::getenv("CW_BACKTRACE") != nullptr;
        s.tracing = std::getenv("CW_DEBUG") != nullptr;
        return s;
    }

    static result<bool> _bool_field(const json::value &v, const std::string_view name)
    {
        if (!v.is_bool())
            return error_value::make(error_kind::validation, fmt::format("field {} must be a boolean but is {}", name, json::to_string(v.kind())));
        return v.get_bool();
    }

    result<settings> settings::from_json(const json::value &j, const settings &base)
    {
        if (!j.is_object())
            return error_value::make(error_kind::validation, fmt::format("settings must be a JSON object but are {}", json::to_string(j.kind())));
        settings s = base;
        for (const auto &kv: j.get_object()) {
            const std::string_view name { kv.key().data(), kv.key().size() };
            const auto &val = kv.value();
            if (name == "captureBacktraces") {
                auto b = _bool_field(val, name);
                if (!b)
                    return std::move(b).error();
                s.capture_backtraces = b.value();
            } else if (name == "tracing") {
                auto b = _bool_field(val, name);
                if (!b)
                    return std::move(b).error();
                s.tracing = b.value();
            } else {
                return error_value::make(error_kind::validation, fmt::format("unknown settings field {}", name));
            }
        }
        return s;
    }

    result<settings> settings::load(const std::string &path, const settings &base)
    {
        return json::load(path)
            .and_then([&](json::value &&j) { return from_json(j, base); })
            .with_context(error_kind::parse, fmt::format("while loading settings from {}", path));
    }

    void settings::apply() const
    {
        backtrace::set_capture(capture_backtraces);
        logger::set_tracing(tracing);
        logger::debug("settings applied: capture backtraces: {} tracing: {}", capture_backtraces, tracing);
    }
}
