/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <array>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <cw/file.hpp>
#include <cw/logger.hpp>

namespace causeway::file {
    using file_ptr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

    static error_value _io_error(const char *op, const std::string &path, const int errnum)
    {
        return error_value::from_external(std::filesystem::filesystem_error {
            op, std::filesystem::path { path }, std::error_code { errnum, std::generic_category() } });
    }

    result<std::string> read(const std::string &path)
    {
        file_ptr f { std::fopen(path.c_str(), "rb"), &std::fclose };
        if (!f)
            return _io_error("can't open a file for reading", path, errno);
        std::string data {};
        std::array<char, 0x10000> buf {};
        for (;;) {
            const auto n = std::fread(buf.data(), 1, buf.size(), f.get());
            data.append(buf.data(), n);
            if (n < buf.size())
                break;
        }
        if (std::ferror(f.get()))
            return _io_error("can't read a file", path, errno ? errno : EIO);
        return data;
    }

    result<void> write(const std::string &path, const std::string_view data)
    {
        file_ptr f { std::fopen(path.c_str(), "wb"), &std::fclose };
        if (!f)
            return _io_error("can't open a file for writing", path, errno);
        if (std::fwrite(data.data(), 1, data.size(), f.get()) != data.size())
            return _io_error("can't write to a file", path, errno ? errno : EIO);
        if (std::fflush(f.get()) != 0)
            return _io_error("can't flush a file", path, errno);
        return {};
    }

    tmp::tmp(const std::string &name): _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
        if (ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}
