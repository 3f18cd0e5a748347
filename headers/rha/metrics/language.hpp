#ifndef RHA_METRICS_LANGUAGE_HPP
#define RHA_METRICS_LANGUAGE_HPP

/**
 * @file language.hpp
 * @brief Per-language lexical descriptors.
 *
 * Every Language value has exactly one LanguageSyntax in a static table.
 * The tokenizer, the McCabe counter and the structure extractor are all
 * driven by these descriptors; supporting a new language means adding an
 * enum value and a table entry.
 */

#include "rha/types.hpp"

#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rha::metrics {

    struct BlockComment {
        std::string_view open;
        std::string_view close;
    };

    struct LanguageSyntax {
        Language language = Language::Other;

        /// Line comment introducers, longest first ("//", "#", "--", ";")
        std::vector<std::string_view> line_comments;

        /// Block comment delimiters, if the language has them
        std::optional<BlockComment> block_comment;

        /// Rust, Swift, Scala, Kotlin allow nested block comments
        bool nested_block_comments = false;

        /// '...' is a string or character literal
        bool single_quote_strings = true;

        /// Python """...""" / '''...''' and Swift/Kotlin/Scala """..."""
        bool triple_quote_strings = false;

        /// `...` is a string (JS/TS template, Go raw string)
        bool backtick_strings = false;

        /// Backslash escapes apply inside backtick strings (JS/TS yes, Go no)
        bool backtick_escapes = false;

        /// C++ R"delim(...)delim" raw strings
        bool cpp_raw_strings = false;

        /// Rust 'a lifetimes must not open a character literal
        bool rust_lifetimes = false;

        /// Lua [[...]] long strings
        bool lua_long_strings = false;

        /// Words that count as operators for Halstead
        std::unordered_set<std::string_view> keywords;

        /// Words that add a McCabe decision point
        std::unordered_set<std::string_view> decision_keywords;

        /// Decision words that are multi-way rather than two-way branches
        std::unordered_set<std::string_view> multiway_keywords;

        /// "?" is a ternary conditional (C family, Java, JS/TS)
        bool ternary_decision = false;

        /// Files of this language define classes/modules for coupling metrics
        bool has_type_concept = false;
    };

    /**
     * Returns the descriptor for a language. Never fails.
     */
    const LanguageSyntax& syntax_for(Language language);

    /**
     * Detects the language from a path's extension; ".d.ts" is TypeScript.
     * Unknown extensions map to Language::Other.
     */
    Language detect_language(std::string_view path);

}  // namespace rha::metrics

#endif // RHA_METRICS_LANGUAGE_HPP
