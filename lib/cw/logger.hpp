/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_LOGGER_HPP
#define CAUSEWAY_LOGGER_HPP

#include <functional>
#include <optional>
#include <source_location>
#include <cw/common/format.hpp>
#include <cw/error.hpp>

namespace causeway::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    extern void log(level lev, const std::string &msg);
    extern bool tracing_enabled();
    extern void set_tracing(bool enabled);

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        log(lev, format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }

    using action = std::function<void()>;
    using optional_action = std::optional<action>;

    // Runs main and logs the full chain of any failure, whether it was returned as a result or thrown.
    template<typename F>
    std::optional<error_value> run_log_errors(F &&main, const optional_action &cleanup={},
        const std::source_location &loc=std::source_location::current())
    {
        auto res = capture(std::forward<F>(main), loc);
        if (cleanup)
            (*cleanup)();
        if (res)
            return {};
        logger::error("block at {}:{} failed with {}", loc.file_name(), loc.line(), res.error());
        return std::move(res).error();
    }

    template<typename F>
    void run_log_errors_rethrow(F &&main, const optional_action &cleanup={},
        const std::source_location &loc=std::source_location::current())
    {
        if (auto err = run_log_errors(std::forward<F>(main), cleanup, loc); err)
            throw causeway::error { std::move(*err) };
    }
}

#endif // !CAUSEWAY_LOGGER_HPP
