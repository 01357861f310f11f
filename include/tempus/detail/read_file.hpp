#pragma once

#include "tempus/errors.hpp"
#include "tempus/expected.hpp"

#include <memory>
#include <string>

#include <cerrno>
#include <cstdio>

namespace tempus::detail {

struct FileCloser {
    void operator()(std::FILE* file) const noexcept { std::fclose(file); }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

/**
 * Read a whole text file.
 *
 * @param path File to read
 * @return The file contents, or ParseError{io_error} carrying errno
 */
inline expected<std::string, ParseError> read_file(const std::string& path) {
    errno = 0;
    FilePtr file{std::fopen(path.c_str(), "rb")};
    if (!file) {
        return unexpected(ParseError{ParseError::Kind::io_error, errno, "cannot open file"});
    }

    std::string contents;
    char buffer[4096];
    while (true) {
        const size_t n = std::fread(buffer, 1, sizeof(buffer), file.get());
        contents.append(buffer, n);
        if (n < sizeof(buffer)) {
            break;
        }
    }
    if (std::ferror(file.get())) {
        return unexpected(ParseError{ParseError::Kind::io_error, errno, "cannot read file"});
    }
    return contents;
}

} // namespace tempus::detail
