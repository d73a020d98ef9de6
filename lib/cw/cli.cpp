/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <cstdlib>
#include <exception>
#include <cw/cli.hpp>
#include <cw/cli/gcd.hpp>
#include <cw/cli/parse-number.hpp>
#include <cw/cli/show-settings.hpp>

namespace causeway::cli {
    command::command_list default_commands()
    {
        return {
            std::make_shared<gcd::cmd>(),
            std::make_shared<gcd::parallel_cmd>(),
            std::make_shared<parse_number::cmd>(),
            std::make_shared<parse_number::read_cmd>(),
            std::make_shared<show_settings::cmd>()
        };
    }

    int run(const int argc, const char **argv, const command::command_list &command_list, std::ostream &err)
    {
        std::map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            const auto name = meta.cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]]
                fatal(fmt::format("multiple definitions for command {}", name));
        }
        if (argc < 2) {
            err << "Usage: <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, meta]: commands)
                err << fmt::format("    {}\n", meta.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            err << error_value::make(error_kind::validation, fmt::format("unknown command {}", cmd)).render() << '\n';
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        const auto &meta = cmd_it->second;
        // commands may still throw from third-party code: capture converts those into the same chain
        auto res = capture([&]() -> result<void> {
            auto pr = meta.cmd->parse(meta.cfg, args);
            if (!pr)
                return std::move(pr).error();
            return meta.cmd->run(pr.value().args, pr.value().opts);
        }).with_context(error_kind::custom, fmt::format("command {} has failed", cmd));
        if (!res) {
            err << res.error().render() << '\n';
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        std::set_terminate([]() {
            std::cerr << "std::terminate called; terminating\n";
            std::abort();
        });
        return run(argc, argv, default_commands());
    }
}
