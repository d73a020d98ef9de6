/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_ERROR_HPP
#define CAUSEWAY_ERROR_HPP

#include <functional>
#include <type_traits>
#include <cw/common/error.hpp>
#include <cw/result.hpp>

namespace causeway {
    // Must be called from within a catch block
    extern error_value from_current_exception(const std::source_location &loc=std::source_location::current());

    template<typename F>
    using capture_result_t = std::conditional_t<is_result_v<std::invoke_result_t<F>>,
        std::decay_t<std::invoke_result_t<F>>, result<std::invoke_result_t<F>>>;

    // The boundary between code that throws and code that returns results
    template<typename F>
    capture_result_t<F> capture(F &&f, const std::source_location &loc=std::source_location::current())
    {
        using res_type = std::invoke_result_t<F>;
        try {
            if constexpr (std::is_void_v<res_type>) {
                std::invoke(std::forward<F>(f));
                return {};
            } else {
                return std::invoke(std::forward<F>(f));
            }
        } catch (...) {
            return from_current_exception(loc);
        }
    }
}

#endif // !CAUSEWAY_ERROR_HPP
