/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_CLI_SHOW_SETTINGS_HPP
#define CAUSEWAY_CLI_SHOW_SETTINGS_HPP

#include <filesystem>
#include <cw/cli.hpp>
#include <cw/config.hpp>

namespace causeway::cli::show_settings {
    // A missing settings file is not an error: the environment defaults are used instead
    inline result<settings> load_or_default(const std::string &path)
    {
        const auto defaults = settings::from_env();
        return settings::load(path, defaults).recover([&](error_value &&err) -> result<settings> {
            const auto *fs_err = err.root_cause().downcast<std::filesystem::filesystem_error>();
            if (fs_err && fs_err->code() == std::errc::no_such_file_or_directory) {
                logger::warn("using the default settings: {}", err);
                return defaults;
            }
            return std::move(err);
        });
    }

    inline result<std::string> format_settings(const settings &s, const std::string_view format)
    {
        if (format == "text")
            return fmt::format("captureBacktraces: {}\ntracing: {}\n", s.capture_backtraces, s.tracing);
        if (format == "json")
            return json::serialize(json::object { { "captureBacktraces", s.capture_backtraces }, { "tracing", s.tracing } }) + "\n";
        return error_value::make(error_kind::validation, fmt::format("unsupported output format '{}', expected text or json", format));
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "show-settings";
            cmd.desc = "load the settings from a JSON file or the environment and print them";
            cmd.args.expect({ "[<path>]" });
            cmd.opts.try_emplace("format", option_config { "output format: text or json", "text" });
        }

        result<void> run(const arguments &args, const options &opts) const override
        {
            const auto &format = opts.at("format");
            if (!format)
                return error_value::make(error_kind::validation, "option --format requires a value");
            auto s = args.empty() ? result<settings> { settings::from_env() } : load_or_default(args.at(0));
            if (!s)
                return std::move(s).error();
            auto text = format_settings(s.value(), *format);
            if (!text)
                return std::move(text).error();
            std::cout << text.value();
            return {};
        }
    };
}

#endif // !CAUSEWAY_CLI_SHOW_SETTINGS_HPP
