#ifndef RHA_FILE_UTILS_HPP
#define RHA_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File reading helpers for working-tree analysis.
 */

#include "rha/result.hpp"
#include "rha/error.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>
#include <string>
#include <string_view>

namespace rha::file_utils {

    namespace fs = std::filesystem;

    /**
     * Whole file as bytes. NotFound when the path is gone, FileReadError
     * when it cannot be opened or read.
     */
    inline Result<std::string> read_file(const fs::path& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<std::string>::failure(Error::not_found("No such file", path.string()));
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Result<std::string>::failure(Error::file_read_error("Cannot open file", path.string()));
        }

        std::string bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) {
            return Result<std::string>::failure(Error::file_read_error("Read failed", path.string()));
        }
        return Result<std::string>::success(std::move(bytes));
    }

    /**
     * Heuristic binary check: a NUL byte within the first probe_bytes.
     */
    inline bool looks_binary(const std::string_view content, const std::size_t probe_bytes) noexcept {
        const auto probe = content.substr(0, std::min(content.size(), probe_bytes));
        return probe.find('\0') != std::string_view::npos;
    }

    /**
     * Size in bytes, or 0 when the file cannot be stat'ed.
     */
    inline std::size_t file_size_or_zero(const fs::path& path) noexcept {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        return ec ? 0 : static_cast<std::size_t>(size);
    }

}  // namespace rha::file_utils

#endif // RHA_FILE_UTILS_HPP
