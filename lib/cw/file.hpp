/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_FILE_HPP
#define CAUSEWAY_FILE_HPP

#include <string>
#include <string_view>
#include <cw/result.hpp>

namespace causeway::file {
    // Failures are io errors with a std::filesystem::filesystem_error payload
    extern result<std::string> read(const std::string &path);
    extern result<void> write(const std::string &path, std::string_view data);

    struct tmp {
        explicit tmp(const std::string &name);
        ~tmp();

        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        const std::string &path() const
        {
            return _path;
        }

        operator const std::string &() const
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !CAUSEWAY_FILE_HPP
