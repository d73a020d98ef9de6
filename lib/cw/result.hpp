/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_RESULT_HPP
#define CAUSEWAY_RESULT_HPP

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <cw/common/error.hpp>

namespace causeway {
    template<typename T>
    struct result;

    template<typename T>
    struct is_result: std::false_type {};

    template<typename T>
    struct is_result<result<T>>: std::true_type {};

    template<typename T>
    constexpr bool is_result_v = is_result<std::decay_t<T>>::value;

    /*
     * Either a value or an error_value. A failure is propagated by one of:
     * - pass-through: return std::move(res).error(); the chain is moved, nothing is allocated
     * - with_context: wraps the error into a new outermost link
     * - recover: lets a handler replace the failure with a value or with another error
     * Dropping a failure silently is not an option: use ignore() to acknowledge it explicitly.
     */
    template<typename T>
    struct [[nodiscard]] result {
        using value_type = T;

        template<typename U>
            requires std::is_constructible_v<T, U&&> && (!std::is_same_v<std::decay_t<U>, result>)
                && (!std::is_same_v<std::decay_t<U>, error_value>)
        result(U &&val): _data { std::in_place_index<0>, std::forward<U>(val) }
        {
        }

        result(error_value &&err): _data { std::in_place_index<1>, std::move(err) }
        {
        }

        bool has_value() const noexcept
        {
            return _data.index() == 0;
        }

        explicit operator bool() const noexcept
        {
            return has_value();
        }

        T &value() &
        {
            if (!has_value()) [[unlikely]]
                throw causeway::error { std::get<1>(_data) };
            return std::get<0>(_data);
        }

        const T &value() const &
        {
            if (!has_value()) [[unlikely]]
                throw causeway::error { std::get<1>(_data) };
            return std::get<0>(_data);
        }

        T value() &&
        {
            if (!has_value()) [[unlikely]]
                throw causeway::error { std::move(std::get<1>(_data)) };
            return std::move(std::get<0>(_data));
        }

        const error_value &error() const &
        {
            if (has_value()) [[unlikely]]
                fatal("the result holds a value and not an error");
            return std::get<1>(_data);
        }

        error_value error() &&
        {
            if (has_value()) [[unlikely]]
                fatal("the result holds a value and not an error");
            return std::move(std::get<1>(_data));
        }

        result with_context(const error_kind kind, std::string message, error_context context={},
            const std::source_location &loc=std::source_location::current()) &&
        {
            if (has_value())
                return std::move(*this);
            return error_value::wrap(std::move(std::get<1>(_data)), kind, std::move(message), std::move(context), loc);
        }

        // handler: error_value && -> result<T>; returning the error unchanged keeps the failure
        template<typename F>
        result recover(F &&handler) &&
        {
            if (has_value())
                return std::move(*this);
            return std::forward<F>(handler)(std::move(std::get<1>(_data)));
        }

        // f: T && -> result<U>; a failure is passed through without calling f
        template<typename F>
        auto and_then(F &&f) && -> std::invoke_result_t<F, T&&>
        {
            using res_type = std::invoke_result_t<F, T&&>;
            static_assert(is_result_v<res_type>, "and_then requires a callable returning a result");
            if (!has_value())
                return std::move(std::get<1>(_data));
            return std::forward<F>(f)(std::move(std::get<0>(_data)));
        }

        void ignore() &&
        {
            if (!has_value())
                std::move(std::get<1>(_data)).ignore();
        }
    private:
        std::variant<T, error_value> _data;
    };

    template<>
    struct [[nodiscard]] result<void> {
        using value_type = void;

        result() =default;

        result(error_value &&err): _err { std::move(err) }
        {
        }

        bool has_value() const noexcept
        {
            return !_err.has_value();
        }

        explicit operator bool() const noexcept
        {
            return has_value();
        }

        void value() const &
        {
            if (_err) [[unlikely]]
                throw causeway::error { *_err };
        }

        void value() &&
        {
            if (_err) [[unlikely]]
                throw causeway::error { std::move(*_err) };
        }

        const error_value &error() const &
        {
            if (!_err) [[unlikely]]
                fatal("the result holds a value and not an error");
            return *_err;
        }

        error_value error() &&
        {
            if (!_err) [[unlikely]]
                fatal("the result holds a value and not an error");
            return std::move(*_err);
        }

        result with_context(const error_kind kind, std::string message, error_context context={},
            const std::source_location &loc=std::source_location::current()) &&
        {
            if (!_err)
                return {};
            return error_value::wrap(std::move(*_err), kind, std::move(message), std::move(context), loc);
        }

        template<typename F>
        result recover(F &&handler) &&
        {
            if (!_err)
                return {};
            return std::forward<F>(handler)(std::move(*_err));
        }

        template<typename F>
        auto and_then(F &&f) && -> std::invoke_result_t<F>
        {
            using res_type = std::invoke_result_t<F>;
            static_assert(is_result_v<res_type>, "and_then requires a callable returning a result");
            if (_err)
                return std::move(*_err);
            return std::forward<F>(f)();
        }

        void ignore() &&
        {
            if (_err)
                std::move(*_err).ignore();
        }
    private:
        std::optional<error_value> _err {};
    };
}

#endif // !CAUSEWAY_RESULT_HPP
