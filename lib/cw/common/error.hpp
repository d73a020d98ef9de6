/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_COMMON_ERROR_HPP
#define CAUSEWAY_COMMON_ERROR_HPP

#include <any>
#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <typeinfo>

namespace causeway {
    // Reports a broken invariant and terminates the process. Never used for recoverable conditions.
    [[noreturn]] extern void fatal(std::string_view msg, const std::source_location &loc=std::source_location::current());

    enum class error_kind: uint8_t {
        io, parse, validation, custom
    };

    extern std::string_view kind_name(error_kind kind);

    struct error_context {
        std::optional<std::string> path {};
        std::optional<size_t> line {};
        std::optional<size_t> column {};

        bool empty() const noexcept
        {
            return !path && !line && !column;
        }

        std::string to_string() const;
        bool operator==(const error_context &) const =default;
    };

    struct payload_id {
        template<typename T>
        static payload_id of() noexcept
        {
            return payload_id { typeid(T) };
        }

        std::string name() const;

        bool operator==(const payload_id &o) const noexcept
        {
            return *_type == *o._type;
        }
    private:
        const std::type_info *_type;

        explicit payload_id(const std::type_info &type) noexcept: _type { &type }
        {
        }
    };

    // Payloads of errors created by make and wrap. Each kind has its own type so their ids never collide.
    template<error_kind K>
    struct builtin_payload {
        static constexpr error_kind kind = K;
        std::string message {};
    };
    using io_payload = builtin_payload<error_kind::io>;
    using parse_payload = builtin_payload<error_kind::parse>;
    using validation_payload = builtin_payload<error_kind::validation>;
    using custom_payload = builtin_payload<error_kind::custom>;

    // Describes how an error produced by an external collaborator is absorbed by from_external.
    // Specialize for own types: static error_kind kind(const E &) and static std::string message(const E &).
    template<typename E>
    struct external_traits;

    template<typename E>
        requires std::derived_from<E, std::exception>
    struct external_traits<E> {
        static error_kind kind(const E &)
        {
            if constexpr (std::derived_from<E, std::system_error>) {
                return error_kind::io;
            } else if constexpr (std::derived_from<E, std::invalid_argument> || std::derived_from<E, std::out_of_range>) {
                return error_kind::parse;
            } else if constexpr (std::derived_from<E, std::domain_error> || std::derived_from<E, std::length_error>) {
                return error_kind::validation;
            } else {
                return error_kind::custom;
            }
        }

        static std::string message(const E &ex)
        {
            return ex.what();
        }
    };

    template<>
    struct external_traits<std::error_code> {
        static error_kind kind(const std::error_code &)
        {
            return error_kind::io;
        }

        static std::string message(const std::error_code &ec)
        {
            return ec.message();
        }
    };

    // An exception of a type unknown to from_exception, reduced to its type name and description
    struct foreign_exception {
        std::string type_name {};
        std::string what {};
    };

    template<>
    struct external_traits<foreign_exception> {
        static error_kind kind(const foreign_exception &)
        {
            return error_kind::custom;
        }

        static std::string message(const foreign_exception &ex)
        {
            return ex.what;
        }
    };

    template<typename E>
    concept external_error = std::copy_constructible<E> && requires(const E &e) {
        { external_traits<E>::kind(e) } -> std::same_as<error_kind>;
        { external_traits<E>::message(e) } -> std::convertible_to<std::string>;
    };

    struct [[nodiscard]] error_value {
        static error_value make(error_kind kind, std::string message, error_context context={},
            const std::source_location &loc=std::source_location::current());
        static error_value wrap(error_value &&cause, error_kind kind, std::string message, error_context context={},
            const std::source_location &loc=std::source_location::current());
        static error_value from_errno(std::string_view message, const std::source_location &loc=std::source_location::current());

        template<external_error E>
        static error_value from_external(const E &payload, error_context context={},
            const std::source_location &loc=std::source_location::current())
        {
            const auto id = payload_id::of<E>();
            std::string msg = external_traits<E>::message(payload);
            if (msg.empty())
                msg = id.name() + " with no message";
            return _make_terminal(external_traits<E>::kind(payload), std::move(msg), std::move(context), id, std::any { payload }, loc);
        }

        // Every distinct payload type T acts as its own custom error sub-kind
        template<typename T>
            requires std::copy_constructible<std::decay_t<T>>
        static error_value custom(T &&payload, std::string message, const std::source_location &loc=std::source_location::current())
        {
            using payload_type = std::decay_t<T>;
            return _make_terminal(error_kind::custom, std::move(message), {}, payload_id::of<payload_type>(),
                std::any { payload_type { std::forward<T>(payload) } }, loc);
        }

        // copies clone the whole cause chain
        error_value(const error_value &o);
        error_value(error_value &&o) noexcept;
        ~error_value();
        error_value &operator=(const error_value &o);
        error_value &operator=(error_value &&o) noexcept;

        error_kind kind() const;
        const std::string &message() const;
        const error_context &context() const;
        payload_id type_id() const;
        const std::source_location &site() const;
        const error_value *source() const;
        const error_value &root_cause() const;
        size_t depth() const;
        bool has_backtrace() const;
        std::string chain_text() const;
        std::string render() const;

        // The only sanctioned way to drop an error without rendering or wrapping it.
        void ignore() &&;

        template<typename T>
        [[nodiscard]] const T *downcast() const
        {
            if (type_id() != payload_id::of<T>())
                return nullptr;
            return std::any_cast<T>(&_payload());
        }
    private:
        struct node;
        std::unique_ptr<node> _node;

        explicit error_value(std::unique_ptr<node> &&n) noexcept;
        const node &_get() const;
        const std::any &_payload() const;
        static error_value _make_terminal(error_kind kind, std::string &&message, error_context &&context,
            payload_id id, std::any &&payload, const std::source_location &loc);
    };

    // Carries an error_value through code that communicates failures with exceptions
    struct error: std::exception {
        explicit error(error_value &&val);
        explicit error(const error_value &val);
        explicit error(std::string_view msg, const std::source_location &loc=std::source_location::current());
        explicit error(std::string_view msg, const std::exception &cause, const std::source_location &loc=std::source_location::current());
        explicit error(error_kind kind, std::string_view msg, const std::exception &cause, const std::source_location &loc=std::source_location::current());
        const char *what() const noexcept override;

        const error_value &value() const noexcept
        {
            return _value;
        }
    private:
        error_value _value;
        std::string _what;
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg, const std::source_location &loc=std::source_location::current());
    };

    // Recovers the dynamic type of the standard exceptions so that downcast keeps working after the conversion
    extern error_value from_exception(const std::exception &ex, const std::source_location &loc=std::source_location::current());
}

#endif // !CAUSEWAY_COMMON_ERROR_HPP
