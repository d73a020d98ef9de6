/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_CONFIG_HPP
#define CAUSEWAY_CONFIG_HPP

#include <string>
#include <cw/json.hpp>
#include <cw/result.hpp>

namespace causeway {
    struct settings {
        bool capture_backtraces = false;
        bool tracing = false;

        // CW_BACKTRACE and CW_DEBUG
        static settings from_env();
        // Fields that are not present keep the values of base
        static result<settings> from_json(const json::value &j, const settings &base=settings {});
        static result<settings> load(const std::string &path, const settings &base=settings {});

        // Must be called once at startup before any other thread is started
        void apply() const;

        bool operator==(const settings &) const =default;
    };
}

#endif // !CAUSEWAY_CONFIG_HPP
