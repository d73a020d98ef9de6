/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cw/logger.hpp>

namespace causeway::logger {
    static std::atomic_bool &_tracing()
    {
        static std::atomic_bool enabled { std::getenv("CW_DEBUG") != nullptr };
        return enabled;
    }

    static std::string log_path()
    {
        const char *env_log_path = std::getenv("CW_LOG");
        return env_log_path ? env_log_path : "./log/cw.log";
    }

    static bool console_enabled()
    {
        return !std::getenv("CW_LOG_NO_CONSOLE");
    }

    static bool file_writable(const std::string &path)
    {
        const auto parent = std::filesystem::path { path }.parent_path();
        if (!parent.empty()) {
            std::error_code ec {};
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                std::cerr << fmt::format("CW_INIT: unable to create the log directory {}: {}\n", parent.string(), ec.message());
                return false;
            }
        }
        std::ofstream os { path, std::ios_base::app };
        if (!os) {
            std::cerr << fmt::format("CW_INIT: unable to write to the log file: {}; logging to the console only\n", path);
            return false;
        }
        return true;
    }

    static spdlog::logger create(const std::string &path)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (console_enabled()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        if (file_writable(path)) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        }
        spdlog::logger logger { "cw", sinks.begin(), sinks.end() };
        logger.set_level(_tracing() ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    bool tracing_enabled()
    {
        return _tracing().load(std::memory_order_relaxed);
    }

    void set_tracing(const bool enabled)
    {
        _tracing().store(enabled, std::memory_order_relaxed);
        get().set_level(enabled ? spdlog::level::trace : spdlog::level::debug);
    }

    void log(level lev, const std::string &msg)
    {
        switch (lev) {
            case level::trace:
                get().trace(msg);
                break;
            case level::debug:
                get().debug(msg);
                break;
            case level::info:
                get().info(msg);
                break;
            case level::warn:
                get().warn(msg);
                break;
            case level::error:
                get().error(msg);
                break;
            default:
                fatal(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}
