#include "rha/analyzers/structure_extractor.hpp"

#include "rha/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <regex>
#include <set>

namespace rha::analyzers {

    namespace {

        using metrics::Span;
        using ViewMatch = std::match_results<std::string_view::const_iterator>;

        enum class TypeKind {
            Concrete,
            Abstract,
            Interface
        };

        struct TypeDecl {
            TypeKind kind = TypeKind::Concrete;
            std::optional<Span> body;
        };

        /// Working state shared by the per-language extractors
        struct Extraction {
            const std::string& code;     // comments and strings blanked
            const std::string& imports;  // comments blanked
            std::vector<TypeDecl> types;
            std::size_t methods = 0;
            std::size_t attributes = 0;
            std::set<std::string> import_specs;
        };

        const std::set<std::string_view> control_words = {
            "if", "for", "while", "switch", "catch", "return", "sizeof", "alignof", "alignas",
            "decltype", "static_assert", "defined", "do", "else", "new", "delete", "throw",
            "noexcept", "requires", "synchronized", "function", "elif", "when", "typeof",
            "await", "super", "this"
        };

        const std::set<std::string_view> statement_words = {
            "return", "throw", "using", "typedef", "friend", "goto", "delete", "co_return",
            "static_assert", "package", "import", "case", "break", "continue", "else"
        };

        bool is_space(const char c) noexcept {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        bool is_word_char(const char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
        }

        bool is_word_start(const char c) noexcept {
            return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
        }

        template <typename Fn>
        void for_each_match(const std::string& text, const std::regex& pattern, Fn&& fn) {
            for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
                 it != std::sregex_iterator(); ++it) {
                fn(*it);
            }
        }

        std::size_t count_matches(const std::string& text, const std::regex& pattern) {
            return static_cast<std::size_t>(std::distance(
                std::sregex_iterator(text.begin(), text.end(), pattern), std::sregex_iterator()));
        }

        bool line_matches(const std::string_view line, const std::regex& pattern) {
            return std::regex_search(line.begin(), line.end(), pattern);
        }

        std::string_view first_word(const std::string_view line) {
            const auto trimmed = string_utils::trim_left(line);
            std::size_t end = 0;
            while (end < trimmed.size() && is_word_char(trimmed[end])) {
                ++end;
            }
            return trimmed.substr(0, end);
        }

        bool contains_word(const std::string_view text, const std::string_view word) {
            std::size_t pos = text.find(word);
            while (pos != std::string_view::npos) {
                const bool left = pos == 0 || !is_word_char(text[pos - 1]);
                const std::size_t after = pos + word.size();
                const bool right = after >= text.size() || !is_word_char(text[after]);
                if (left && right) {
                    return true;
                }
                pos = text.find(word, pos + 1);
            }
            return false;
        }

        /// Last non-space character before pos, or '\0'
        char preceding_char(const std::string& text, std::size_t pos) {
            while (pos > 0) {
                const char c = text[--pos];
                if (!is_space(c)) {
                    return c;
                }
            }
            return '\0';
        }

        std::string_view preceding_word(const std::string& text, const std::size_t pos) {
            std::size_t end = pos;
            while (end > 0 && is_space(text[end - 1])) {
                --end;
            }
            std::size_t begin = end;
            while (begin > 0 && is_word_char(text[begin - 1])) {
                --begin;
            }
            return std::string_view(text).substr(begin, end - begin);
        }

        /// Text on the same line before pos
        std::string_view line_prefix(const std::string& text, const std::size_t pos) {
            if (pos == 0) {
                return {};
            }
            const auto newline = text.rfind('\n', pos - 1);
            const std::size_t begin = newline == std::string::npos ? 0 : newline + 1;
            return std::string_view(text).substr(begin, pos - begin);
        }

        bool is_continuation_word(const std::string_view word) {
            return word == "extends" || word == "implements" || word == "with" ||
                   word == "where" || word == "throws" || word == "permits";
        }

        /**
         * Span between the '{' that opens a declaration's body and its
         * matching '}'. Gives up at ';' or '}' outside parentheses, or when
         * a new line starts what looks like a new declaration.
         */
        std::optional<Span> find_brace_body(const std::string& text, const std::size_t from) {
            int parens = 0;
            std::size_t i = from;
            for (; i < text.size(); ++i) {
                const char c = text[i];
                if (c == '(' || c == '[') {
                    ++parens;
                } else if ((c == ')' || c == ']') && parens > 0) {
                    --parens;
                } else if (parens > 0) {
                    continue;
                } else if (c == '{') {
                    break;
                } else if (c == ';' || c == '}') {
                    return std::nullopt;
                } else if (c == '\n') {
                    std::size_t j = i + 1;
                    while (j < text.size() && is_space(text[j])) {
                        ++j;
                    }
                    if (j < text.size() && is_word_start(text[j])) {
                        std::size_t k = j;
                        while (k < text.size() && is_word_char(text[k])) {
                            ++k;
                        }
                        const char previous = preceding_char(text, i);
                        if (!is_continuation_word(std::string_view(text).substr(j, k - j)) &&
                            previous != ',' && previous != ':') {
                            return std::nullopt;
                        }
                    }
                }
            }
            if (i >= text.size()) {
                return std::nullopt;
            }

            const std::size_t open = i;
            int depth = 0;
            for (; i < text.size(); ++i) {
                if (text[i] == '{') {
                    ++depth;
                } else if (text[i] == '}' && --depth == 0) {
                    return Span{open + 1, i};
                }
            }
            return Span{open + 1, text.size()};
        }

        /**
         * Lines of a body that start at brace depth zero.
         */
        std::vector<std::string_view> top_level_lines(const std::string& text, const Span& body) {
            std::vector<std::string_view> lines;
            const auto view = std::string_view(text).substr(body.begin, body.end - body.begin);
            int depth = 0;
            std::size_t start = 0;
            while (start <= view.size()) {
                auto end = view.find('\n', start);
                if (end == std::string_view::npos) {
                    end = view.size();
                }
                const auto line = view.substr(start, end - start);
                if (depth == 0) {
                    lines.push_back(line);
                }
                for (const char c : line) {
                    if (c == '{') {
                        ++depth;
                    } else if (c == '}' && depth > 0) {
                        --depth;
                    }
                }
                start = end + 1;
            }
            return lines;
        }

        std::size_t indentation(const std::string_view line) {
            std::size_t n = 0;
            while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
                ++n;
            }
            return n;
        }

        /**
         * Indented block that follows a Python header line.
         */
        Span python_block(const std::string& text, const std::size_t header_end, const std::size_t header_indent) {
            const auto newline = text.find('\n', header_end);
            if (newline == std::string::npos) {
                return Span{text.size(), text.size()};
            }
            const std::size_t begin = newline + 1;
            std::size_t end = begin;
            std::size_t pos = begin;
            while (pos < text.size()) {
                auto eol = text.find('\n', pos);
                if (eol == std::string::npos) {
                    eol = text.size();
                }
                const auto line = std::string_view(text).substr(pos, eol - pos);
                if (!string_utils::trim(line).empty()) {
                    if (indentation(line) <= header_indent) {
                        break;
                    }
                    end = eol;
                }
                pos = eol + 1;
            }
            return Span{begin, end};
        }

        /**
         * Records one type per match; classify() returns nullopt to reject.
         */
        template <typename Classify>
        void collect_types(Extraction& ex, const std::regex& pattern, Classify classify) {
            for_each_match(ex.code, pattern, [&](const std::smatch& m) {
                const auto position = static_cast<std::size_t>(m.position(0));
                const auto length = static_cast<std::size_t>(m.length(0));
                const auto kind = classify(m, position);
                if (!kind) {
                    return;
                }
                std::size_t from = position + length;
                if (length > 0 && ex.code[from - 1] == '{') {
                    --from;
                }
                ex.types.push_back(TypeDecl{*kind, find_brace_body(ex.code, from)});
            });
        }

        template <typename Accept>
        std::size_t count_member_lines(const Extraction& ex, const std::regex& pattern, Accept accept) {
            std::size_t count = 0;
            for (const auto& type : ex.types) {
                if (!type.body || !accept(type.kind)) {
                    continue;
                }
                for (const auto line : top_level_lines(ex.code, *type.body)) {
                    if (line_matches(line, pattern) && !statement_words.contains(first_word(line))) {
                        ++count;
                    }
                }
            }
            return count;
        }

        void add_imports(Extraction& ex, const std::regex& pattern, const int group = 1) {
            for_each_match(ex.imports, pattern, [&](const std::smatch& m) {
                const std::string matched = m[group].str();
                const auto spec = string_utils::trim(matched);
                if (!spec.empty()) {
                    ex.import_specs.emplace(spec);
                }
            });
        }

        TypeKind abstract_if_marked(const std::string& code, const std::size_t position) {
            const auto prefix = line_prefix(code, position);
            return contains_word(prefix, "abstract") || contains_word(prefix, "sealed")
                ? TypeKind::Abstract
                : TypeKind::Concrete;
        }

        // ============================================================================
        // C, C++ and Objective-C
        // ============================================================================

        void extract_c_family(Extraction& ex, const Language language) {
            static const std::regex type_pattern(
                R"(\b(class|struct|union)\s{1,64}(?:[A-Z_][A-Z0-9_]{0,128}\s{1,64})?([A-Za-z_]\w{0,128})\s{0,64}(?:final\s{0,64})?(?::[^;{}()]{0,512})?\{)");
            static const std::regex pure_virtual(
                R"(\)\s{0,64}(?:const\s{0,64})?(?:noexcept\s{0,64})?(?:override\s{0,64})?=\s{0,64}0\s{0,64};)");
            static const std::regex function_definition(
                R"(\b([A-Za-z_]\w{0,128})\s{0,64}\([^;{}()]{0,256}(?:\([^;{}()]{0,128}\)[^;{}()]{0,256}){0,8}\)\s{0,64}(?:(?:const|noexcept|override|final|mutable)\b\s{0,64}|->\s{0,64}[\w:<>,\*&\s]{1,128}){0,8}\{)");
            static const std::regex member_variable(
                R"(^\s{0,64}(?:(?:static|mutable|const|constexpr|inline|volatile|thread_local)\s{1,64}){0,8}[A-Za-z_][\w:]{0,128}(?:\s{0,64}<[^;()]{0,512}>)?[\s\*&]{1,64}[A-Za-z_]\w{0,128}(?:\s{0,64}\[[^\]]{0,512}\])?\s{0,64}(?:=[^;]{0,512}|\{[^;]{0,512}\})?;\s{0,64}$)");
            static const std::regex include_pattern(
                R"((?:^|\n)[ \t]{0,64}#[ \t]{0,64}(?:include|import)[ \t]{0,64}[<"]([^>"\n]{1,512})[>"])");
            static const std::regex objc_type(R"(@(interface|protocol)\s{1,64}([A-Za-z_]\w{0,128})\b(?!\s{0,64}[;,]))");
            static const std::regex objc_method(R"((?:^|\n)[ \t]{0,64}[-+][ \t]{0,64}\([^)\n]{0,512}\)[ \t]{0,64}[A-Za-z_]\w{0,128})");
            static const std::regex objc_property(R"(@property\b)");

            collect_types(ex, type_pattern, [&](const std::smatch& m, const std::size_t position) -> std::optional<TypeKind> {
                if (preceding_word(ex.code, position) == "enum") {
                    return std::nullopt;
                }
                if (language == Language::C && m[1] == "class") {
                    return std::nullopt;
                }
                const auto body = find_brace_body(ex.code, position + static_cast<std::size_t>(m.length(0)) - 1);
                if (body) {
                    const std::string content = ex.code.substr(body->begin, body->end - body->begin);
                    if (std::regex_search(content, pure_virtual)) {
                        return TypeKind::Abstract;
                    }
                }
                return TypeKind::Concrete;
            });

            for_each_match(ex.code, function_definition, [&](const std::smatch& m) {
                const std::string name = m[1].str();
                if (!control_words.contains(name)) {
                    ++ex.methods;
                }
            });
            ex.methods += count_matches(ex.code, pure_virtual);
            ex.attributes += count_member_lines(ex, member_variable, [](TypeKind) { return true; });

            if (language == Language::ObjectiveC) {
                for_each_match(ex.code, objc_type, [&](const std::smatch& m) {
                    ex.types.push_back(TypeDecl{m[1] == "protocol" ? TypeKind::Interface : TypeKind::Concrete, std::nullopt});
                });
                ex.methods += count_matches(ex.code, objc_method);
                ex.attributes += count_matches(ex.code, objc_property);
            }

            add_imports(ex, include_pattern);
        }

        // ============================================================================
        // JVM languages
        // ============================================================================

        void extract_java(Extraction& ex) {
            static const std::regex type_pattern(R"(\b(class|interface|enum|record)\s{1,64}([A-Za-z_]\w{0,128})\b)");
            static const std::regex method_definition(
                R"(\b([A-Za-z_]\w{0,128})\s{0,64}\([^;{}()]{0,256}(?:\([^;{}()]{0,128}\)[^;{}()]{0,256}){0,8}\)\s{0,64}(?:throws\s{1,64}[\w.,\s]{1,128})?\{)");
            static const std::regex abstract_method(
                R"(^[^=(]{0,512}\b[A-Za-z_]\w{0,128}\s{0,64}\([^;{}]{0,512}\)\s{0,64}(?:throws\s{1,64}[^;]{0,512})?;\s{0,64}$)");
            static const std::regex field(
                R"(^\s{0,64}(?:@\w{1,128}(?:\([^)]{0,512}\))?\s{1,64}){0,8}(?:(?:public|private|protected|static|final|transient|volatile)\s{1,64}){0,8}[A-Za-z_][\w.]{0,128}(?:\s{0,64}<[^;()]{0,512}>)?(?:\s{0,64}\[\s{0,64}\]){0,8}\s{1,64}[A-Za-z_]\w{0,128}\s{0,64}(?:=.{0,512})?;\s{0,64}$)");
            static const std::regex import_pattern(
                R"((?:^|\n)[ \t]{0,64}import[ \t]{1,64}(?:static[ \t]{1,64})?([\w.]{1,128}(?:\.\*)?)[ \t]{0,64};)");

            collect_types(ex, type_pattern, [&](const std::smatch& m, const std::size_t position) -> std::optional<TypeKind> {
                const char before = preceding_char(ex.code, position);
                if (before == '.') {
                    return std::nullopt;
                }
                if (before == '@' || m[1] == "interface") {
                    return TypeKind::Interface;
                }
                return abstract_if_marked(ex.code, position);
            });

            for_each_match(ex.code, method_definition, [&](const std::smatch& m) {
                const auto position = static_cast<std::size_t>(m.position(0));
                const std::string name = m[1].str();
                if (!control_words.contains(name) && preceding_word(ex.code, position) != "new") {
                    ++ex.methods;
                }
            });
            ex.methods += count_member_lines(ex, abstract_method, [](const TypeKind kind) {
                return kind != TypeKind::Concrete;
            });
            ex.attributes += count_member_lines(ex, field, [](TypeKind) { return true; });

            add_imports(ex, import_pattern);
        }

        /**
         * Counts val/var parameters of a primary constructor following a
         * type name.
         */
        std::size_t constructor_properties(const std::string& code, std::size_t from) {
            static const std::regex property(R"(\b(?:val|var)\s{1,64}[A-Za-z_]\w{0,128})");
            while (from < code.size() && is_space(code[from])) {
                ++from;
            }
            if (from < code.size() && code[from] == '<') {
                const auto close = code.find('>', from);
                if (close == std::string::npos) {
                    return 0;
                }
                from = close + 1;
            }
            while (from < code.size() && is_space(code[from])) {
                ++from;
            }
            if (from >= code.size() || code[from] != '(') {
                return 0;
            }
            int depth = 0;
            std::size_t end = from;
            for (; end < code.size(); ++end) {
                if (code[end] == '(') {
                    ++depth;
                } else if (code[end] == ')' && --depth == 0) {
                    break;
                }
            }
            return count_matches(code.substr(from, end - from), property);
        }

        void extract_kotlin(Extraction& ex) {
            static const std::regex type_pattern(R"(\b(class|interface|object)\s{1,64}([A-Za-z_]\w{0,128})\b)");
            static const std::regex function_pattern(R"(\bfun\s{1,64}(?!interface\b))");
            static const std::regex property(
                R"(^\s{0,64}(?:@\w{1,128}\s{1,64}){0,8}(?:(?:private|public|protected|internal|override|open|lateinit|const|abstract|final)\s{1,64}){0,8}(?:val|var)\s{1,64}[A-Za-z_]\w{0,128})");
            static const std::regex import_pattern(R"((?:^|\n)[ \t]{0,64}import[ \t]{1,64}([\w.]{1,128}(?:\.\*)?))");

            collect_types(ex, type_pattern, [&](const std::smatch& m, const std::size_t position) -> std::optional<TypeKind> {
                const char before = preceding_char(ex.code, position);
                if (before == '.' || before == ':') {
                    return std::nullopt;
                }
                if (m[1] == "class") {
                    ex.attributes += constructor_properties(ex.code, position + static_cast<std::size_t>(m.length(0)));
                }
                if (m[1] == "interface") {
                    return TypeKind::Interface;
                }
                return abstract_if_marked(ex.code, position);
            });

            ex.methods += count_matches(ex.code, function_pattern);
            ex.attributes += count_member_lines(ex, property, [](TypeKind) { return true; });

            add_imports(ex, import_pattern);
        }

        void extract_scala(Extraction& ex) {
            static const std::regex type_pattern(R"(\b(class|trait|object)\s{1,64}([A-Za-z_]\w{0,128})\b)");
            static const std::regex def_pattern(R"(\bdef\s{1,64})");
            static const std::regex member(
                R"(^\s{0,64}(?:@\w{1,128}\s{1,64}){0,8}(?:(?:private|protected|override|final|lazy|implicit)(?:\[\w{1,128}\])?\s{1,64}){0,8}(?:val|var)\s{1,64}[A-Za-z_]\w{0,128})");
            static const std::regex import_pattern(
                R"((?:^|\n)[ \t]{0,64}import[ \t]{1,64}([\w.]{1,128}?)(?:\.(_|\*|\{[^}\n]{0,512}\}))?[ \t]{0,64}(?=\n|;|$))");

            collect_types(ex, type_pattern, [&](const std::smatch& m, const std::size_t position) -> std::optional<TypeKind> {
                if (preceding_char(ex.code, position) == '.') {
                    return std::nullopt;
                }
                if (m[1] == "trait") {
                    return TypeKind::Interface;
                }
                return abstract_if_marked(ex.code, position);
            });

            ex.methods += count_matches(ex.code, def_pattern);
            ex.attributes += count_member_lines(ex, member, [](TypeKind) { return true; });

            for_each_match(ex.imports, import_pattern, [&](const std::smatch& m) {
                const std::string base = m[1].str();
                const std::string selector = m[2].str();
                if (selector.empty()) {
                    ex.import_specs.insert(base);
                } else if (selector == "_" || selector == "*") {
                    ex.import_specs.insert(base + ".*");
                } else {
                    const auto inner = std::string_view(selector).substr(1, selector.size() - 2);
                    for (const auto item : string_utils::split(inner, ',')) {
                        auto name = string_utils::trim(item);
                        if (const auto arrow = name.find("=>"); arrow != std::string_view::npos) {
                            name = string_utils::trim(name.substr(0, arrow));
                        }
                        if (name == "_" || name == "*") {
                            ex.import_specs.insert(base + ".*");
                        } else if (!name.empty()) {
                            ex.import_specs.insert(base + "." + std::string(name));
                        }
                    }
                }
            });
        }

        // ============================================================================
        // Swift, Go, Rust
        // ============================================================================

        void extract_swift(Extraction& ex) {
            static const std::regex type_pattern(R"(\b(class|struct|enum|protocol|actor)\s{1,64}([A-Za-z_]\w{0,128})\b)");
            static const std::regex func_pattern(R"(\bfunc\s{1,64})");
            static const std::regex property(
                R"(^\s{0,64}(?:@\w{1,128}\s{1,64}){0,8}(?:(?:public|private|fileprivate|internal|open|static|class|lazy|weak|unowned|final|override)(?:\(set\))?\s{1,64}){0,8}(?:var|let)\s{1,64}[A-Za-z_]\w{0,128})");
            static const std::regex import_pattern(
                R"((?:^|\n)[ \t]{0,64}import[ \t]{1,64}(?:(?:class|struct|func|enum|protocol|typealias|var|let)[ \t]{1,64})?([\w.]{1,128}))");
            static const std::set<std::string_view> modifiers = {
                "func", "var", "let", "subscript", "init", "override", "final", "static", "open", "public", "private"
            };

            collect_types(ex, type_pattern, [&](const std::smatch& m, std::size_t) -> std::optional<TypeKind> {
                if (modifiers.contains(m[2].str())) {
                    return std::nullopt;
                }
                return m[1] == "protocol" ? TypeKind::Interface : TypeKind::Concrete;
            });

            ex.methods += count_matches(ex.code, func_pattern);
            ex.attributes += count_member_lines(ex, property, [](TypeKind) { return true; });

            add_imports(ex, import_pattern);
        }

        void extract_go(Extraction& ex) {
            static const std::regex type_pattern(
                R"(\btype\s{1,64}([A-Za-z_]\w{0,128})(?:\s{0,64}\[[^\]]{0,512}\])?\s{1,64}(struct|interface)\s{0,64}\{)");
            static const std::regex method_pattern(R"(\bfunc\s{0,64}\([^)]{0,512}\)\s{0,64}[A-Za-z_]\w{0,128})");
            static const std::regex interface_method(R"(^\s{0,64}[A-Za-z_]\w{0,128}\s{0,64}\()");
            static const std::regex field_names(R"(^\s{0,64}([A-Za-z_]\w{0,128}(?:\s{0,64},\s{0,64}[A-Za-z_]\w{0,128}){0,8})\s{1,64}\S)");
            static const std::regex embedded_field(R"(^\s{0,64}\*?[A-Za-z_][\w.]{0,128}\s{0,64}$)");
            static const std::regex import_block(R"(\bimport\s{0,64}\(([^)]{0,512})\))");
            static const std::regex import_single(R"re(\bimport\s{1,64}(?:[\w.]{1,128}\s{1,64})?"([^"\n]{1,512})")re");
            static const std::regex quoted(R"re("([^"\n]{1,512})")re");

            collect_types(ex, type_pattern, [](const std::smatch& m, std::size_t) -> std::optional<TypeKind> {
                return m[2] == "interface" ? TypeKind::Interface : TypeKind::Concrete;
            });

            ex.methods += count_matches(ex.code, method_pattern);
            ex.methods += count_member_lines(ex, interface_method, [](const TypeKind kind) {
                return kind == TypeKind::Interface;
            });

            for (const auto& type : ex.types) {
                if (type.kind != TypeKind::Concrete || !type.body) {
                    continue;
                }
                for (const auto line : top_level_lines(ex.code, *type.body)) {
                    ViewMatch m;
                    if (std::regex_search(line.begin(), line.end(), m, field_names)) {
                        ex.attributes += static_cast<std::size_t>(std::ranges::count(m[1].str(), ',')) + 1;
                    } else if (line_matches(line, embedded_field)) {
                        ++ex.attributes;
                    }
                }
            }

            for_each_match(ex.imports, import_block, [&](const std::smatch& m) {
                const std::string block = m[1].str();
                for_each_match(block, quoted, [&](const std::smatch& q) {
                    ex.import_specs.insert(q[1].str());
                });
            });
            add_imports(ex, import_single);
        }

        void extract_rust(Extraction& ex) {
            static const std::regex type_pattern(R"(\b(struct|enum|union|trait)\s{1,64}([A-Za-z_]\w{0,128})\b)");
            static const std::regex fn_pattern(R"(\bfn\s{1,64}[A-Za-z_]\w{0,128})");
            static const std::regex named_field(R"(^\s{0,64}(?:pub(?:\s{0,64}\([^)]{0,512}\))?\s{1,64})?[A-Za-z_]\w{0,128}\s{0,64}:(?!:))");
            static const std::regex use_pattern(
                R"(\buse\s{1,64}((?:::)?[\w:]{0,128}?)(?:::(\{[^}]{0,512}\}|\*))?(?:\s{1,64}as\s{1,64}\w{1,128})?\s{0,64};)");
            static const std::regex mod_pattern(R"(\bmod\s{1,64}([A-Za-z_]\w{0,128})\s{0,64};)");

            collect_types(ex, type_pattern, [](const std::smatch& m, std::size_t) -> std::optional<TypeKind> {
                return m[1] == "trait" ? TypeKind::Interface : TypeKind::Concrete;
            });

            ex.methods += count_matches(ex.code, fn_pattern);
            ex.attributes += count_member_lines(ex, named_field, [](const TypeKind kind) {
                return kind == TypeKind::Concrete;
            });

            for_each_match(ex.code, use_pattern, [&](const std::smatch& m) {
                const std::string base = m[1].str();
                const std::string group = m[2].str();
                if (group.empty() || group == "*") {
                    ex.import_specs.insert(base);
                    return;
                }
                const auto inner = std::string_view(group).substr(1, group.size() - 2);
                for (const auto item : string_utils::split(inner, ',')) {
                    auto name = string_utils::trim(item);
                    if (const auto as = name.find(" as "); as != std::string_view::npos) {
                        name = string_utils::trim(name.substr(0, as));
                    }
                    if (name == "self") {
                        ex.import_specs.insert(base);
                    } else if (!name.empty() && name != "*") {
                        ex.import_specs.insert(base + "::" + std::string(name));
                    }
                }
            });
            for_each_match(ex.code, mod_pattern, [&](const std::smatch& m) {
                ex.import_specs.insert("self::" + m[1].str());
            });
        }

        // ============================================================================
        // Python
        // ============================================================================

        /// Leading dotted name of an import list item
        std::string_view dotted_name(const std::string_view item) {
            const auto trimmed = string_utils::trim(item);
            std::size_t end = 0;
            while (end < trimmed.size() && (is_word_char(trimmed[end]) || trimmed[end] == '.')) {
                ++end;
            }
            return trimmed.substr(0, end);
        }

        void extract_python(Extraction& ex) {
            static const std::regex class_pattern(
                R"((?:^|\n)([ \t]{0,64})class[ \t]{1,64}([A-Za-z_]\w{0,128})[ \t]{0,64}(?:\(([^)]{0,512})\))?[ \t]{0,64}:)");
            static const std::regex method_pattern(R"((?:^|\n)[ \t]{1,64}(?:async[ \t]{1,64})?def[ \t]{1,64}[A-Za-z_]\w{0,128})");
            static const std::regex self_attribute(R"(\bself\.([A-Za-z_]\w{0,128})\s{0,64}(?::[^=\n]{1,512})?=(?!=))");
            static const std::regex abstract_marker(R"(@(?:abc\.)?abstractmethod\b)");
            static const std::regex interface_base(R"(\b(?:Protocol|Interface)\b)");
            static const std::regex abstract_base(R"(\bABC\b|\bABCMeta\b)");
            static const std::regex from_import(
                R"((?:^|\n)[ \t]{0,64}from[ \t]{1,64}(\.{0,128}[\w.]{0,128})[ \t]{1,64}import[ \t]{1,64}(\([^)]{0,512}\)|[^\n]{1,512}))");
            static const std::regex plain_import(R"((?:^|\n)[ \t]{0,64}import[ \t]{1,64}([^\n]{1,512}))");

            for_each_match(ex.code, class_pattern, [&](const std::smatch& m) {
                const auto position = static_cast<std::size_t>(m.position(0));
                const auto body = python_block(ex.code, position + static_cast<std::size_t>(m.length(0)),
                                               static_cast<std::size_t>(m[1].length()));
                const std::string bases = m[3].str();

                TypeKind kind = TypeKind::Concrete;
                if (std::regex_search(bases, interface_base)) {
                    kind = TypeKind::Interface;
                } else if (std::regex_search(bases, abstract_base) ||
                           std::regex_search(ex.code.substr(body.begin, body.end - body.begin), abstract_marker)) {
                    kind = TypeKind::Abstract;
                }
                ex.types.push_back(TypeDecl{kind, body});
            });

            ex.methods += count_matches(ex.code, method_pattern);

            std::set<std::string> attributes;
            for_each_match(ex.code, self_attribute, [&](const std::smatch& m) {
                attributes.insert(m[1].str());
            });
            ex.attributes += attributes.size();

            for_each_match(ex.imports, from_import, [&](const std::smatch& m) {
                const std::string module = m[1].str();
                std::string names = m[2].str();
                std::erase(names, '(');
                std::erase(names, ')');

                const bool only_dots = std::ranges::all_of(module, [](const char c) { return c == '.'; });
                if (!only_dots) {
                    ex.import_specs.insert(module);
                }
                for (const auto item : string_utils::split(names, ',')) {
                    const auto name = dotted_name(item);
                    if (name.empty()) {
                        continue;
                    }
                    const std::string separator = module.ends_with('.') ? "" : ".";
                    ex.import_specs.insert(module + separator + std::string(name));
                }
            });
            for_each_match(ex.imports, plain_import, [&](const std::smatch& m) {
                const std::string names = m[1].str();
                for (const auto item : string_utils::split(names, ',')) {
                    if (const auto name = dotted_name(item); !name.empty()) {
                        ex.import_specs.emplace(name);
                    }
                }
            });
        }

        // ============================================================================
        // JavaScript and TypeScript
        // ============================================================================

        void extract_javascript(Extraction& ex) {
            static const std::regex type_pattern(R"(\b(class|interface)\s{1,64}([A-Za-z_$][\w$]{0,128}))");
            static const std::regex function_keyword(R"(\bfunction\b)");
            static const std::regex class_method(
                R"(^\s{0,64}(?:(?:public|private|protected|static|async|get|set|readonly|abstract|override)\s{1,64}){0,8}\*?#?([A-Za-z_$][\w$]{0,128})\s{0,64}(?:<[^>]{0,512}>)?\s{0,64}\()");
            static const std::regex arrow_function(
                R"(\b(?:const|let|var)\s{1,64}[A-Za-z_$][\w$]{0,128}\s{0,64}(?::[^=\n]{1,512})?=\s{0,64}(?:async\s{0,64})?(?:\([^()]{0,512}\)|[A-Za-z_$][\w$]{0,128})\s{0,64}(?::[^=\n]{1,512})?=>)");
            static const std::regex field(
                R"(^\s{0,64}(?:(?:public|private|protected|static|readonly|declare|override|abstract)\s{1,64}){0,8}(#?[A-Za-z_$][\w$]{0,128})\s{0,64}[?!]?\s{0,64}(?::[^=;(]{1,512})?(?:=.{0,512})?;?\s{0,64}$)");
            static const std::regex this_assignment(R"(\bthis\.(#?[A-Za-z_$][\w$]{0,128})\s{0,64}=(?!=))");
            static const std::regex import_from(
                R"(\b(?:import|export)\s{1,64}(?:type\s{1,64})?(?:[\w$*{}\s,]{1,128}?\s{1,64}from\s{1,64})?["']([^"'\n]{1,512})["'])");
            static const std::regex require_call(R"(\b(?:require|import)\s{0,64}\(\s{0,64}["']([^"'\n]{1,512})["']\s{0,64}\))");
            static const std::set<std::string_view> non_members = {
                "constructor", "get", "set", "static", "async", "return", "if", "for", "while",
                "switch", "catch", "function"
            };

            collect_types(ex, type_pattern, [&](const std::smatch& m, const std::size_t position) -> std::optional<TypeKind> {
                if (preceding_char(ex.code, position) == '.') {
                    return std::nullopt;
                }
                if (m[1] == "interface") {
                    return TypeKind::Interface;
                }
                return abstract_if_marked(ex.code, position);
            });

            ex.methods += count_matches(ex.code, function_keyword);
            ex.methods += count_matches(ex.code, arrow_function);

            std::set<std::string> fields;
            for (const auto& type : ex.types) {
                if (!type.body) {
                    continue;
                }
                for (const auto line : top_level_lines(ex.code, *type.body)) {
                    ViewMatch m;
                    if (std::regex_search(line.begin(), line.end(), m, class_method)) {
                        const std::string name = m[1].str();
                        if (!non_members.contains(name) || name == "constructor") {
                            ++ex.methods;
                        }
                    } else if (std::regex_search(line.begin(), line.end(), m, field)) {
                        const std::string name = m[1].str();
                        if (!non_members.contains(name)) {
                            fields.insert(name);
                        }
                    }
                }
            }
            for_each_match(ex.code, this_assignment, [&](const std::smatch& m) {
                fields.insert(m[1].str());
            });
            ex.attributes += fields.size();

            add_imports(ex, import_from);
            add_imports(ex, require_call);
        }

        // ============================================================================
        // Lua and interface definition files
        // ============================================================================

        void extract_lua(Extraction& ex) {
            static const std::regex function_keyword(R"(\bfunction\b)");
            static const std::regex require_pattern(R"(\brequire\s{0,64}\(?\s{0,64}["']([^"'\n]{1,512})["'])");

            ex.methods += count_matches(ex.code, function_keyword);
            add_imports(ex, require_pattern);
        }

        void extract_idl(Extraction& ex) {
            static const std::regex type_pattern(
                R"(\b(message|service|struct|union|exception)\s{1,64}([A-Za-z_]\w{0,128})\s{0,64}\{)");
            static const std::regex rpc_pattern(R"(\brpc\s{1,64}[A-Za-z_]\w{0,128})");
            static const std::regex field(
                R"(^\s{0,64}(?:\d{1,128}\s{0,64}:\s{0,64})?(?:(?:repeated|optional|required)\s{1,64})?[\w.]{1,128}(?:\s{0,64}<[^>]{0,512}>)?\s{1,64}[A-Za-z_]\w{0,128}\s{0,64}(?:=\s{0,64}\d{1,128})?\s{0,64}[;,]?\s{0,64}$)");
            static const std::regex import_pattern(
                R"re((?:^|\n)[ \t]{0,64}(?:import|include)[ \t]{1,64}(?:public[ \t]{1,64}|weak[ \t]{1,64})?"([^"\n]{1,512})")re");

            collect_types(ex, type_pattern, [](const std::smatch& m, std::size_t) -> std::optional<TypeKind> {
                return m[1] == "service" ? TypeKind::Interface : TypeKind::Concrete;
            });

            ex.methods += count_matches(ex.code, rpc_pattern);
            ex.attributes += count_member_lines(ex, field, [](const TypeKind kind) {
                return kind == TypeKind::Concrete;
            });

            add_imports(ex, import_pattern);
        }

    }  // namespace

    FileStructure extract_structure(
        const std::string_view text,
        const metrics::LexResult& lexed,
        const metrics::LanguageSyntax& syntax
    ) {
        const std::string code = metrics::strip_source(text, lexed, false);
        const std::string import_text = metrics::strip_source(text, lexed, true);
        Extraction ex{code, import_text};

        switch (syntax.language) {
            case Language::C:
            case Language::Cpp:
            case Language::ObjectiveC:
                extract_c_family(ex, syntax.language);
                break;
            case Language::Java:
                extract_java(ex);
                break;
            case Language::Kotlin:
                extract_kotlin(ex);
                break;
            case Language::Scala:
                extract_scala(ex);
                break;
            case Language::Swift:
                extract_swift(ex);
                break;
            case Language::Go:
                extract_go(ex);
                break;
            case Language::Rust:
                extract_rust(ex);
                break;
            case Language::Python:
                extract_python(ex);
                break;
            case Language::JavaScript:
            case Language::TypeScript:
                extract_javascript(ex);
                break;
            case Language::Lua:
                extract_lua(ex);
                break;
            case Language::InterfaceDefinition:
                extract_idl(ex);
                break;
            case Language::R:
            case Language::Assembly:
            case Language::Other:
                break;
        }

        FileStructure structure;
        structure.language = syntax.language;
        for (const auto& type : ex.types) {
            ++structure.class_count;
            if (type.kind == TypeKind::Abstract) {
                ++structure.abstract_class_count;
            } else if (type.kind == TypeKind::Interface) {
                ++structure.abstract_class_count;
                ++structure.interface_count;
            }
        }
        structure.method_count = ex.methods;
        structure.attribute_count = ex.attributes;
        structure.imports.assign(ex.import_specs.begin(), ex.import_specs.end());
        return structure;
    }

    FileStructure extract_structure(const std::string_view text, const Language language) {
        const auto& syntax = metrics::syntax_for(language);
        return extract_structure(text, metrics::lex(text, syntax), syntax);
    }

}  // namespace rha::analyzers
