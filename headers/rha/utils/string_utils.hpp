#ifndef RHA_STRING_UTILS_HPP
#define RHA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers used by the history parser and the filters.
 *
 * All functions operate on string_view and avoid copies unless the result
 * has to own its characters.
 */

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rha::string_utils {

    inline constexpr std::string_view whitespace = " \t\n\r\f\v";

    inline std::string_view trim_left(const std::string_view s) noexcept {
        const auto first = s.find_first_not_of(whitespace);
        return first == std::string_view::npos ? std::string_view{} : s.substr(first);
    }

    inline std::string_view trim_right(const std::string_view s) noexcept {
        const auto last = s.find_last_not_of(whitespace);
        return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits on a single character. Empty fields are kept, so "a\t\tb"
     * yields three parts.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits text into lines, accepting "\n" and "\r\n". A trailing newline
     * does not produce an empty last line.
     */
    inline std::vector<std::string_view> split_lines(std::string_view s) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        while (start < s.size()) {
            std::size_t end = s.find('\n', start);
            if (end == std::string_view::npos) {
                end = s.size();
            }
            std::string_view line = s.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.push_back(line);
            start = end + 1;
        }
        return lines;
    }

    /**
     * Concatenates @p parts with @p delimiter between neighbours.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::string joined;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                joined.append(delimiter);
            }
            joined.append(part);
            first = false;
        }
        return joined;
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.starts_with(prefix);
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.ends_with(suffix);
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Parses a non-negative decimal integer occupying the whole view.
     */
    inline std::optional<std::size_t> parse_size(std::string_view s) noexcept {
        s = trim(s);
        if (s.empty()) {
            return std::nullopt;
        }
        std::size_t value = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * Parses a signed decimal integer occupying the whole view.
     */
    inline std::optional<long long> parse_int(std::string_view s) noexcept {
        s = trim(s);
        if (s.empty()) {
            return std::nullopt;
        }
        long long value = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * Last path component of a '/'-separated repository path.
     */
    inline std::string_view basename(const std::string_view path) noexcept {
        const auto slash = path.rfind('/');
        return slash == std::string_view::npos ? path : path.substr(slash + 1);
    }

    /**
     * Directory part of a repository path; "" for files at the root.
     */
    inline std::string_view dirname(const std::string_view path) noexcept {
        const auto slash = path.rfind('/');
        return slash == std::string_view::npos ? std::string_view{} : path.substr(0, slash);
    }

    /**
     * Lower-cased extension including the dot (".cpp"), or "" when the
     * basename has none or is a dotfile.
     */
    inline std::string extension_of(const std::string_view path) {
        const auto name = basename(path);
        const auto dot = name.rfind('.');
        if (dot == std::string_view::npos || dot == 0) {
            return "";
        }
        return to_lower(name.substr(dot));
    }

}  // namespace rha::string_utils

#endif // RHA_STRING_UTILS_HPP
