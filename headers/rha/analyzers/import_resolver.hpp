#ifndef RHA_ANALYZERS_IMPORT_RESOLVER_HPP
#define RHA_ANALYZERS_IMPORT_RESOLVER_HPP

/**
 * @file import_resolver.hpp
 * @brief Maps import specifiers onto files of the analyzed set.
 *
 * Resolution rules by language family:
 * - C, C++, Objective-C, IDL: relative to the including file, then by path suffix
 * - Java, Kotlin, Scala: dotted name to path; a wildcard names a package directory
 * - Python: absolute and relative modules, packages via __init__.py
 * - JavaScript, TypeScript: relative specifiers with extension and index probing
 * - Go: import path suffix to package directory
 * - Rust: crate::, self:: and super:: paths
 * - Lua: require() module names
 *
 * Anything that does not land on a known file is external and yields nothing.
 * When a suffix matches several files, the one sharing the longest directory
 * prefix with the importer wins; ties go to the lexicographically first path.
 */

#include "rha/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rha::analyzers {

    /**
     * Collapses "." and ".." components of a '/'-separated path.
     *
     * @return std::nullopt if the path climbs above the root.
     */
    [[nodiscard]] std::optional<std::string> normalize_path(std::string_view path);

    class ImportResolver {
    public:
        /**
         * @param paths Repository-relative, '/'-separated paths of every
         *              analyzed file.
         */
        explicit ImportResolver(const std::vector<std::string>& paths);

        /**
         * Resolves every specifier of one file. The importer itself is never
         * part of the result.
         */
        [[nodiscard]] std::set<std::string> resolve(
            const std::string& from,
            Language language,
            const std::vector<std::string>& imports
        ) const;

        [[nodiscard]] std::set<std::string> resolve_one(
            const std::string& from,
            Language language,
            std::string_view spec
        ) const;

    private:
        [[nodiscard]] bool contains(const std::string& path) const;

        [[nodiscard]] std::optional<std::string> best_suffix_match(
            const std::string& from, const std::string& suffix) const;

        [[nodiscard]] std::optional<std::string> best_directory_match(
            const std::string& from, const std::string& suffix) const;

        [[nodiscard]] std::set<std::string> resolve_include(const std::string& from, std::string_view spec) const;
        [[nodiscard]] std::set<std::string> resolve_jvm(const std::string& from, std::string_view spec) const;
        [[nodiscard]] std::set<std::string> resolve_python(const std::string& from, std::string_view spec) const;
        [[nodiscard]] std::set<std::string> resolve_javascript(const std::string& from, std::string_view spec) const;
        [[nodiscard]] std::set<std::string> resolve_go(const std::string& from, std::string_view spec) const;
        [[nodiscard]] std::set<std::string> resolve_rust(const std::string& from, std::string_view spec) const;
        [[nodiscard]] std::set<std::string> resolve_lua(const std::string& from, std::string_view spec) const;

        std::set<std::string> paths_;
        std::map<std::string, std::vector<std::string>> by_basename_;
        std::map<std::string, std::vector<std::string>> by_directory_;
    };

}  // namespace rha::analyzers

#endif // RHA_ANALYZERS_IMPORT_RESOLVER_HPP
