#include "rha/analyzers/import_resolver.hpp"

#include "rha/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <ranges>

namespace rha::analyzers {

    namespace {

        constexpr std::array<std::string_view, 4> jvm_extensions = {".java", ".kt", ".scala", ".kts"};
        constexpr std::array<std::string_view, 7> script_extensions = {
            ".ts", ".tsx", ".d.ts", ".js", ".jsx", ".mjs", ".cjs"
        };

        std::string join_path(const std::string_view directory, const std::string_view name) {
            if (directory.empty()) {
                return std::string(name);
            }
            std::string joined(directory);
            joined += '/';
            joined += name;
            return joined;
        }

        std::string dotted_to_path(std::string_view dotted) {
            std::string path(dotted);
            std::ranges::replace(path, '.', '/');
            return path;
        }

        /// Number of leading directory components two paths share
        std::size_t common_directory_depth(const std::string_view a, const std::string_view b) {
            const auto left = string_utils::split(string_utils::dirname(a), '/');
            const auto right = string_utils::split(string_utils::dirname(b), '/');
            std::size_t depth = 0;
            while (depth < left.size() && depth < right.size() && left[depth] == right[depth] &&
                   !left[depth].empty()) {
                ++depth;
            }
            return depth;
        }

        bool path_ends_with(const std::string_view path, const std::string_view suffix) {
            if (path == suffix) {
                return true;
            }
            return path.size() > suffix.size() && string_utils::ends_with(path, suffix) &&
                   path[path.size() - suffix.size() - 1] == '/';
        }

        bool has_jvm_extension(const std::string_view path) {
            return std::ranges::any_of(jvm_extensions, [path](const std::string_view ext) {
                return string_utils::ends_with(path, ext);
            });
        }

    }  // namespace

    std::optional<std::string> normalize_path(const std::string_view path) {
        std::vector<std::string_view> parts;
        for (const auto part : string_utils::split(path, '/')) {
            if (part.empty() || part == ".") {
                continue;
            }
            if (part == "..") {
                if (parts.empty()) {
                    return std::nullopt;
                }
                parts.pop_back();
                continue;
            }
            parts.push_back(part);
        }
        return string_utils::join(parts, "/");
    }

    ImportResolver::ImportResolver(const std::vector<std::string>& paths)
        : paths_(paths.begin(), paths.end()) {
        for (const auto& path : paths_) {
            by_basename_[std::string(string_utils::basename(path))].push_back(path);
            by_directory_[std::string(string_utils::dirname(path))].push_back(path);
        }
    }

    bool ImportResolver::contains(const std::string& path) const {
        return paths_.contains(path);
    }

    std::optional<std::string> ImportResolver::best_suffix_match(
        const std::string& from, const std::string& suffix) const {
        const auto it = by_basename_.find(std::string(string_utils::basename(suffix)));
        if (it == by_basename_.end()) {
            return std::nullopt;
        }

        std::optional<std::string> best;
        std::size_t best_depth = 0;
        for (const auto& candidate : it->second) {
            if (candidate == from || !path_ends_with(candidate, suffix)) {
                continue;
            }
            const auto depth = common_directory_depth(candidate, from);
            if (!best || depth > best_depth) {
                best = candidate;
                best_depth = depth;
            }
        }
        return best;
    }

    std::optional<std::string> ImportResolver::best_directory_match(
        const std::string& from, const std::string& suffix) const {
        std::optional<std::string> best;
        std::size_t best_depth = 0;
        for (const auto& directory : by_directory_ | std::views::keys) {
            if (!path_ends_with(directory, suffix)) {
                continue;
            }
            const auto depth = common_directory_depth(directory + "/x", from);
            if (!best || depth > best_depth) {
                best = directory;
                best_depth = depth;
            }
        }
        return best;
    }

    std::set<std::string> ImportResolver::resolve(
        const std::string& from,
        const Language language,
        const std::vector<std::string>& imports
    ) const {
        std::set<std::string> resolved;
        for (const auto& spec : imports) {
            resolved.merge(resolve_one(from, language, spec));
        }
        resolved.erase(from);
        return resolved;
    }

    std::set<std::string> ImportResolver::resolve_one(
        const std::string& from,
        const Language language,
        const std::string_view spec
    ) const {
        if (spec.empty()) {
            return {};
        }
        switch (language) {
            case Language::C:
            case Language::Cpp:
            case Language::ObjectiveC:
            case Language::InterfaceDefinition:
                return resolve_include(from, spec);
            case Language::Java:
            case Language::Kotlin:
            case Language::Scala:
                return resolve_jvm(from, spec);
            case Language::Python:
                return resolve_python(from, spec);
            case Language::JavaScript:
            case Language::TypeScript:
                return resolve_javascript(from, spec);
            case Language::Go:
                return resolve_go(from, spec);
            case Language::Rust:
                return resolve_rust(from, spec);
            case Language::Lua:
                return resolve_lua(from, spec);
            case Language::Swift:
            case Language::R:
            case Language::Assembly:
            case Language::Other:
                break;
        }
        return {};
    }

    std::set<std::string> ImportResolver::resolve_include(const std::string& from, const std::string_view spec) const {
        if (const auto relative = normalize_path(join_path(string_utils::dirname(from), spec));
            relative && contains(*relative)) {
            return {*relative};
        }
        const auto suffix = normalize_path(spec);
        if (!suffix || suffix->empty()) {
            return {};
        }
        if (const auto match = best_suffix_match(from, *suffix)) {
            return {*match};
        }
        return {};
    }

    std::set<std::string> ImportResolver::resolve_jvm(const std::string& from, std::string_view spec) const {
        const bool wildcard = string_utils::ends_with(spec, ".*");
        if (wildcard) {
            spec.remove_suffix(2);
        }
        std::string path = dotted_to_path(spec);

        if (wildcard) {
            if (const auto directory = best_directory_match(from, path)) {
                std::set<std::string> files;
                for (const auto& file : by_directory_.at(*directory)) {
                    if (has_jvm_extension(file)) {
                        files.insert(file);
                    }
                }
                if (!files.empty()) {
                    return files;
                }
            }
        }

        // a.b.C, then a.b.C.Inner and static members a.b.C.member
        for (int attempt = 0; attempt < 3 && !path.empty(); ++attempt) {
            for (const auto ext : jvm_extensions) {
                if (const auto match = best_suffix_match(from, path + std::string(ext))) {
                    return {*match};
                }
            }
            const auto slash = path.rfind('/');
            if (slash == std::string::npos) {
                break;
            }
            path.resize(slash);
        }
        return {};
    }

    std::set<std::string> ImportResolver::resolve_python(const std::string& from, const std::string_view spec) const {
        const auto dots = spec.find_first_not_of('.');
        const std::size_t level = dots == std::string_view::npos ? spec.size() : dots;
        const std::string module = dotted_to_path(spec.substr(level));

        const auto probe_exact = [this](const std::string& base) -> std::set<std::string> {
            for (const auto& candidate : {base + ".py", base + ".pyi", join_path(base, "__init__.py")}) {
                if (contains(candidate)) {
                    return {candidate};
                }
            }
            return {};
        };

        if (level > 0) {
            std::string base(string_utils::dirname(from));
            for (std::size_t up = 1; up < level; ++up) {
                if (base.empty()) {
                    return {};
                }
                base = std::string(string_utils::dirname(base));
            }
            if (module.empty()) {
                const auto init = join_path(base, "__init__.py");
                return contains(init) ? std::set<std::string>{init} : std::set<std::string>{};
            }
            return probe_exact(join_path(base, module));
        }

        if (auto rooted = probe_exact(module); !rooted.empty()) {
            return rooted;
        }
        if (auto sibling = probe_exact(join_path(string_utils::dirname(from), module)); !sibling.empty()) {
            return sibling;
        }
        for (const auto& suffix : {module + ".py", module + "/__init__.py", module + ".pyi"}) {
            if (const auto match = best_suffix_match(from, suffix)) {
                return {*match};
            }
        }
        return {};
    }

    std::set<std::string> ImportResolver::resolve_javascript(const std::string& from, const std::string_view spec) const {
        const bool relative = string_utils::starts_with(spec, "./") || string_utils::starts_with(spec, "../") ||
                              spec == "." || spec == "..";
        if (!relative) {
            return {};
        }
        const auto base = normalize_path(join_path(string_utils::dirname(from), spec));
        if (!base) {
            return {};
        }

        std::vector<std::string> candidates;
        candidates.push_back(*base);
        if (string_utils::ends_with(*base, ".js")) {
            const auto stem = base->substr(0, base->size() - 3);
            candidates.push_back(stem + ".ts");
            candidates.push_back(stem + ".tsx");
        }
        for (const auto ext : script_extensions) {
            candidates.push_back(*base + std::string(ext));
        }
        for (const auto ext : script_extensions) {
            candidates.push_back(join_path(*base, "index" + std::string(ext)));
        }

        for (const auto& candidate : candidates) {
            if (contains(candidate)) {
                return {candidate};
            }
        }
        return {};
    }

    std::set<std::string> ImportResolver::resolve_go(const std::string& from, const std::string_view spec) const {
        // Longest package directory that is a suffix of the import path
        std::optional<std::string> best;
        for (const auto& [directory, files] : by_directory_) {
            if (directory.empty() || !path_ends_with(spec, directory)) {
                continue;
            }
            const bool has_go = std::ranges::any_of(files, [](const std::string& file) {
                return string_utils::ends_with(file, ".go");
            });
            if (has_go && (!best || directory.size() > best->size())) {
                best = directory;
            }
        }
        if (!best) {
            return {};
        }

        std::set<std::string> package;
        for (const auto& file : by_directory_.at(*best)) {
            if (file != from && string_utils::ends_with(file, ".go") && !string_utils::ends_with(file, "_test.go")) {
                package.insert(file);
            }
        }
        return package;
    }

    std::set<std::string> ImportResolver::resolve_rust(const std::string& from, const std::string_view spec) const {
        std::vector<std::string_view> segments;
        std::size_t start = 0;
        while (start <= spec.size()) {
            auto end = spec.find("::", start);
            if (end == std::string_view::npos) {
                end = spec.size();
            }
            if (end > start) {
                segments.push_back(spec.substr(start, end - start));
            }
            start = end + 2;
        }
        if (segments.empty()) {
            return {};
        }

        const auto crate_root = [this, &from]() {
            std::string directory(string_utils::dirname(from));
            while (true) {
                if (contains(join_path(directory, "lib.rs")) || contains(join_path(directory, "main.rs"))) {
                    return directory;
                }
                if (directory.empty()) {
                    break;
                }
                directory = std::string(string_utils::dirname(directory));
            }
            return std::string(string_utils::dirname(from));
        };

        const auto module_directory = [&from]() {
            const auto name = string_utils::basename(from);
            const auto directory = string_utils::dirname(from);
            if (name == "mod.rs" || name == "lib.rs" || name == "main.rs") {
                return std::string(directory);
            }
            return join_path(directory, name.substr(0, name.size() - std::min<std::size_t>(name.size(), 3)));
        };

        std::string base;
        std::size_t first = 1;
        if (segments[0] == "crate") {
            base = crate_root();
        } else if (segments[0] == "self") {
            base = module_directory();
        } else if (segments[0] == "super") {
            base = std::string(string_utils::dirname(module_directory()));
            while (first < segments.size() && segments[first] == "super") {
                base = std::string(string_utils::dirname(base));
                ++first;
            }
        } else {
            return {};
        }

        // Longest module path first: crate::a::b::Item may name a.rs, a/b.rs or a/b/mod.rs
        for (std::size_t n = segments.size(); n > first; --n) {
            std::string module = base;
            for (std::size_t i = first; i < n; ++i) {
                module = join_path(module, segments[i]);
            }
            if (contains(module + ".rs")) {
                return {module + ".rs"};
            }
            if (contains(join_path(module, "mod.rs"))) {
                return {join_path(module, "mod.rs")};
            }
        }
        return {};
    }

    std::set<std::string> ImportResolver::resolve_lua(const std::string& from, const std::string_view spec) const {
        const std::string module = dotted_to_path(spec);
        for (const auto& suffix : {module + ".lua", module + "/init.lua"}) {
            if (contains(suffix)) {
                return {suffix};
            }
            if (const auto match = best_suffix_match(from, suffix)) {
                return {*match};
            }
        }
        return {};
    }

}  // namespace rha::analyzers
