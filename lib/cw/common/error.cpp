/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <ios>
#include <boost/core/demangle.hpp>
#include "backtrace.hpp"
#include "error.hpp"
#include "format.hpp"
#include <cw/logger.hpp>

namespace causeway {
    void fatal(const std::string_view msg, const std::source_location &loc)
    {
        std::cerr << fmt::format("CW_FATAL: {} at {}:{}\n", msg, loc.file_name(), loc.line());
        std::terminate();
    }

    std::string_view kind_name(const error_kind kind)
    {
        switch (kind) {
            case error_kind::io: return "io";
            case error_kind::parse: return "parse";
            case error_kind::validation: return "validation";
            case error_kind::custom: return "custom";
            default: fatal(fmt::format("unsupported error kind: {}", static_cast<int>(kind)));
        }
    }

    std::string error_context::to_string() const
    {
        std::string res { path ? *path : std::string { "<input>" } };
        if (line) {
            res += fmt::format(":{}", *line);
            if (column)
                res += fmt::format(":{}", *column);
        } else if (column) {
            res += fmt::format(" column {}", *column);
        }
        return res;
    }

    std::string payload_id::name() const
    {
        return boost::core::demangle(_type->name());
    }

    struct error_value::node {
        error_kind kind;
        std::string message;
        error_context context;
        payload_id id;
        std::any payload;
        std::source_location site;
        std::optional<error_value> cause {};
        std::unique_ptr<backtrace::snapshot> trace {};

        node(const error_kind k, std::string &&msg, error_context &&ctx, const payload_id pid, std::any &&pl, const std::source_location &loc):
            kind { k }, message { std::move(msg) }, context { std::move(ctx) }, id { pid }, payload { std::move(pl) }, site { loc }
        {
        }

        node(const node &o):
            kind { o.kind }, message { o.message }, context { o.context }, id { o.id }, payload { o.payload }, site { o.site },
            cause { o.cause }, trace { o.trace ? std::make_unique<backtrace::snapshot>(*o.trace) : nullptr }
        {
        }
    };

    template<error_kind K>
    static std::any _builtin(const std::string &msg)
    {
        return builtin_payload<K> { msg };
    }

    static std::pair<payload_id, std::any> _builtin_payload(const error_kind kind, const std::string &msg)
    {
        switch (kind) {
            case error_kind::io: return { payload_id::of<io_payload>(), _builtin<error_kind::io>(msg) };
            case error_kind::parse: return { payload_id::of<parse_payload>(), _builtin<error_kind::parse>(msg) };
            case error_kind::validation: return { payload_id::of<validation_payload>(), _builtin<error_kind::validation>(msg) };
            case error_kind::custom: return { payload_id::of<custom_payload>(), _builtin<error_kind::custom>(msg) };
            default: fatal(fmt::format("unsupported error kind: {}", static_cast<int>(kind)));
        }
    }

    static std::string _escape(const std::string_view msg)
    {
        std::string res {};
        res.reserve(msg.size());
        for (const auto c: msg) {
            switch (c) {
                case '\n': res += "\\n"; break;
                case '\r': res += "\\r"; break;
                default: res += c; break;
            }
        }
        return res;
    }

    error_value::error_value(std::unique_ptr<node> &&n) noexcept: _node { std::move(n) }
    {
    }

    error_value::error_value(const error_value &o): _node { std::make_unique<node>(o._get()) }
    {
    }

    error_value::error_value(error_value &&o) noexcept =default;
    error_value::~error_value() =default;

    error_value &error_value::operator=(const error_value &o)
    {
        if (this != &o)
            _node = std::make_unique<node>(o._get());
        return *this;
    }

    error_value &error_value::operator=(error_value &&o) noexcept =default;

    error_value error_value::_make_terminal(const error_kind kind, std::string &&message, error_context &&context,
        const payload_id id, std::any &&payload, const std::source_location &loc)
    {
        if (message.empty()) [[unlikely]]
            fatal("an error_value requires a non-empty message", loc);
        auto n = std::make_unique<node>(kind, std::move(message), std::move(context), id, std::move(payload), loc);
        n->trace = backtrace::capture();
        return error_value { std::move(n) };
    }

    error_value error_value::make(const error_kind kind, std::string message, error_context context, const std::source_location &loc)
    {
        auto [id, payload] = _builtin_payload(kind, message);
        return _make_terminal(kind, std::move(message), std::move(context), id, std::move(payload), loc);
    }

    error_value error_value::wrap(error_value &&cause, const error_kind kind, std::string message, error_context context, const std::source_location &loc)
    {
        if (!cause._node) [[unlikely]]
            fatal("cannot wrap a moved-from error_value", loc);
        if (message.empty()) [[unlikely]]
            fatal("an error_value requires a non-empty message", loc);
        auto [id, payload] = _builtin_payload(kind, message);
        auto n = std::make_unique<node>(kind, std::move(message), std::move(context), id, std::move(payload), loc);
        n->cause.emplace(std::move(cause));
        return error_value { std::move(n) };
    }

    error_value error_value::from_errno(const std::string_view message, const std::source_location &loc)
    {
        const int errnum = errno;
        return from_external(std::system_error { errnum, std::generic_category(), std::string { message } }, {}, loc);
    }

    const error_value::node &error_value::_get() const
    {
        if (!_node) [[unlikely]]
            fatal("use of a moved-from error_value");
        return *_node;
    }

    const std::any &error_value::_payload() const
    {
        return _get().payload;
    }

    error_kind error_value::kind() const
    {
        return _get().kind;
    }

    const std::string &error_value::message() const
    {
        return _get().message;
    }

    const error_context &error_value::context() const
    {
        return _get().context;
    }

    payload_id error_value::type_id() const
    {
        return _get().id;
    }

    const std::source_location &error_value::site() const
    {
        return _get().site;
    }

    const error_value *error_value::source() const
    {
        const auto &n = _get();
        return n.cause ? &*n.cause : nullptr;
    }

    const error_value &error_value::root_cause() const
    {
        const auto *e = this;
        while (const auto *next = e->source())
            e = next;
        return *e;
    }

    size_t error_value::depth() const
    {
        size_t d = 0;
        for (const auto *e = this; e; e = e->source())
            ++d;
        return d;
    }

    bool error_value::has_backtrace() const
    {
        for (const auto *e = this; e; e = e->source()) {
            if (e->_get().trace)
                return true;
        }
        return false;
    }

    std::string error_value::chain_text() const
    {
        std::string res {};
        size_t level = 0;
        for (const auto *e = this; e; e = e->source(), ++level) {
            const auto &n = e->_get();
            if (level) {
                res += '\n';
                res += fmt::format("{:{}}caused by ", "", level * 2);
            }
            res += fmt::format("{}: {}", kind_name(n.kind), _escape(n.message));
            if (!n.context.empty())
                res += fmt::format(" at {}", n.context.to_string());
        }
        return res;
    }

    std::string error_value::render() const
    {
        auto res = chain_text();
        // the innermost snapshot points at the true origin
        const backtrace::snapshot *trace = nullptr;
        for (const auto *e = this; e; e = e->source()) {
            if (const auto &t = e->_get().trace; t)
                trace = t.get();
        }
        if (trace) {
            res += "\nbacktrace:";
            if (const auto frames = trace->to_string(); !frames.empty()) {
                res += '\n';
                res += frames;
            }
        }
        return res;
    }

    void error_value::ignore() &&
    {
        logger::debug("an error has been explicitly ignored at {}: {}", _get().site, chain_text());
        _node.reset();
    }

    error::error(error_value &&val): _value { std::move(val) }, _what { _value.chain_text() }
    {
    }

    error::error(const error_value &val): _value { val }, _what { _value.chain_text() }
    {
    }

    error::error(const std::string_view msg, const std::source_location &loc):
        error { error_value::make(error_kind::custom, std::string { msg }, {}, loc) }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause, const std::source_location &loc):
        error { error_kind::custom, msg, cause, loc }
    {
    }

    error::error(const error_kind kind, const std::string_view msg, const std::exception &cause, const std::source_location &loc):
        error { error_value::wrap(from_exception(cause, loc), kind, std::string { msg }, {}, loc) }
    {
    }

    const char *error::what() const noexcept
    {
        return _what.c_str();
    }

    error_sys::error_sys(const std::string_view msg, const std::source_location &loc):
        error { error_value::from_errno(msg, loc) }
    {
    }

    template<typename T>
    static std::optional<error_value> _try_as(const std::exception &ex, const std::source_location &loc)
    {
        if (const auto *p = dynamic_cast<const T *>(&ex); p)
            return error_value::from_external(*p, {}, loc);
        return {};
    }

    error_value from_exception(const std::exception &ex, const std::source_location &loc)
    {
        if (const auto *err = dynamic_cast<const error *>(&ex); err)
            return err->value();
        // the most derived types go first
        if (auto v = _try_as<std::filesystem::filesystem_error>(ex, loc); v)
            return std::move(*v);
        if (auto v = _try_as<std::ios_base::failure>(ex, loc); v)
            return std::move(*v);
        if (auto v = _try_as<std::system_error>(ex, loc); v)
            return std::move(*v);
        if (auto v = _try_as<std::invalid_argument>(ex, loc); v)
            return std::move(*v);
        if (auto v = _try_as<std::out_of_range>(ex, loc); v)
            return std::move(*v);
        if (auto v = _try_as<std::domain_error>(ex, loc); v)
            return std::move(*v);
        if (auto v = _try_as<std::length_error>(ex, loc); v)
            return std::move(*v);
        return error_value::from_external(foreign_exception { boost::core::demangle(typeid(ex).name()), ex.what() }, {}, loc);
    }
}
