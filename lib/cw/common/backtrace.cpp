/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#ifdef __APPLE__
#   define _GNU_SOURCE 1
#endif
#include <atomic>
#include <cstdlib>
#include <boost/stacktrace.hpp>
#include "backtrace.hpp"

namespace causeway::backtrace {
    static std::atomic_bool &_capture_flag()
    {
        static std::atomic_bool enabled { std::getenv("CW_BACKTRACE") != nullptr };
        return enabled;
    }

    snapshot::snapshot(const size_t skip)
    {
        _size = boost::stacktrace::safe_dump_to(skip, _dump.data(), _dump.size());
    }

    std::string snapshot::to_string() const
    {
        auto text = boost::stacktrace::to_string(boost::stacktrace::stacktrace::from_dump(_dump.data(), _size * sizeof(void*)));
        while (!text.empty() && text.back() == '\n')
            text.pop_back();
        return text;
    }

    bool capture_enabled() noexcept
    {
        return _capture_flag().load(std::memory_order_relaxed);
    }

    void set_capture(const bool enabled) noexcept
    {
        _capture_flag().store(enabled, std::memory_order_relaxed);
    }

    std::unique_ptr<snapshot> capture(const size_t skip)
    {
        if (!capture_enabled())
            return {};
        return std::make_unique<snapshot>(skip);
    }
}
