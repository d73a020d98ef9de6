/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_COMMON_BACKTRACE_HPP
#define CAUSEWAY_COMMON_BACKTRACE_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace causeway::backtrace {
    struct snapshot {
        static constexpr size_t max_frames = 0x20;

        explicit snapshot(size_t skip);
        std::string to_string() const;

        size_t size() const noexcept
        {
            return _size;
        }
    private:
        std::array<std::byte, sizeof(void*) * max_frames> _dump {};
        size_t _size = 0;
    };

    // The initial value comes from the CW_BACKTRACE environment variable.
    // Must be set only at startup before any concurrently running code creates errors.
    extern bool capture_enabled() noexcept;
    extern void set_capture(bool enabled) noexcept;

    // Returns nullptr when capture is disabled so that the cost is not paid
    extern std::unique_ptr<snapshot> capture(size_t skip=3);
}

#endif // !CAUSEWAY_COMMON_BACKTRACE_HPP
