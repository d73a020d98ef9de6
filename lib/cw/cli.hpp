/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_CLI_HPP
#define CAUSEWAY_CLI_HPP

#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cw/error.hpp>
#include <cw/logger.hpp>

namespace causeway::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};
    };
    using option_config_map = std::map<std::string, option_config>;

    struct argument_config {
        std::optional<size_t> min {};
        std::optional<size_t> max {};
        std::vector<std::string> names {};

        void expect(const std::initializer_list<std::string> &args)
        {
            names = args;
            size_t req = 0;
            size_t opt = 0;
            for (const auto &a: args) {
                if (a.at(0) == '[') {
                    if (a.ends_with("...]"))
                        opt = std::numeric_limits<size_t>::max();
                    if (opt < std::numeric_limits<size_t>::max())
                        ++opt;
                } else {
                    ++req;
                }
            }
            min = req;
            max = req;
            if (opt == std::numeric_limits<size_t>::max())
                *max = opt;
            else
                *max += opt;
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        option_config_map opts {};

        std::string make_usage() const
        {
            std::string arg_info {};
            for (const auto &arg_name: args.names)
                arg_info += fmt::format(" {}", arg_name);
            const std::string opt_info { opts.empty() ? "" : " [options]" };
            return fmt::format("{}{}{} - {}", name, opt_info, arg_info, desc);
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    struct command {
        using command_list = std::vector<std::shared_ptr<command>>;

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;
        virtual result<void> run(const arguments &args, const options &opts) const =0;

        // Malformed command lines are validation errors carrying the usage text
        result<parse_result> parse(const config &cfg, const arguments &args) const
        {
            parse_result pr {};
            for (const auto &arg: args) {
                if (arg.substr(0, 2) == "--") {
                    std::string name = arg.substr(2);
                    std::optional<std::string> val {};
                    if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                        val = arg.substr(eq_pos + 1);
                        name = arg.substr(2, eq_pos - 2);
                    }
                    if (!cfg.opts.contains(name))
                        return _usage_error(cfg, fmt::format("unknown option '--{}'", name));
                    if (const auto [opt_it, opt_created] = pr.opts.try_emplace(name, std::move(val)); !opt_created)
                        return _usage_error(cfg, fmt::format("duplicate option specification '{}'", arg));
                } else {
                    pr.args.emplace_back(arg);
                }
            }
            for (const auto &[name, opt_cfg]: cfg.opts) {
                if (opt_cfg.default_value && !pr.opts.contains(name))
                    pr.opts.emplace(name, *opt_cfg.default_value);
            }
            if (cfg.args.min && pr.args.size() < *cfg.args.min)
                return _usage_error(cfg, "too few arguments");
            if (cfg.args.max && pr.args.size() > *cfg.args.max)
                return _usage_error(cfg, "too many arguments");
            return pr;
        }
    protected:
        static error_value _usage_error(const config &cmd, const std::string_view reason)
        {
            std::string usage = fmt::format("{}; usage: {}", reason, cmd.make_usage());
            for (const auto &[name, cfg]: cmd.opts) {
                if (cfg.default_value)
                    usage += fmt::format("; --{} ({} by default) - {}", name, *cfg.default_value, cfg.desc);
                else
                    usage += fmt::format("; --{} - {}", name, cfg.desc);
            }
            return error_value::make(error_kind::validation, std::move(usage));
        }
    };

    struct command_meta {
        std::shared_ptr<command> cmd {};
        config cfg {};
    };

    extern command::command_list default_commands();
    // Unhandled errors are rendered to err and yield a non-zero exit code
    extern int run(int argc, const char **argv, const command::command_list &command_list, std::ostream &err=std::cerr);
    extern int run(int argc, const char **argv);
}

#endif // !CAUSEWAY_CLI_HPP
