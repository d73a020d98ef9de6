/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <exception>
#include <cw/error.hpp>

namespace causeway {
    error_value from_current_exception(const std::source_location &loc)
    {
        const auto ex_ptr = std::current_exception();
        if (!ex_ptr) [[unlikely]]
            fatal("from_current_exception must be called only while an exception is being handled", loc);
        try {
            std::rethrow_exception(ex_ptr);
        } catch (const std::exception &ex) {
            return from_exception(ex, loc);
        } catch (...) {
            return error_value::from_external(foreign_exception { "unknown", "an exception of a type not derived from std::exception" }, {}, loc);
        }
    }
}
