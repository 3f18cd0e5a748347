#ifndef RHA_ANALYZERS_STRUCTURE_EXTRACTOR_HPP
#define RHA_ANALYZERS_STRUCTURE_EXTRACTOR_HPP

/**
 * @file structure_extractor.hpp
 * @brief Lexical extraction of type structure and import statements.
 *
 * Types, methods and attributes are matched over source text with comments
 * and string literals blanked out. Imports are matched over text with only
 * comments blanked, since include paths and module specifiers are strings
 * in most languages.
 *
 * Counting rules:
 * - class_count counts every type declaration, interfaces and traits included
 * - abstract_class_count counts abstract classes plus interfaces, traits and
 *   protocols
 * - interface_count counts interfaces, traits and protocols only
 *
 * so abstract_class_count <= class_count always holds.
 */

#include "rha/metrics/language.hpp"
#include "rha/metrics/tokenizer.hpp"
#include "rha/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rha::analyzers {

    struct FileStructure {
        Language language = Language::Other;
        std::size_t class_count = 0;
        std::size_t abstract_class_count = 0;
        std::size_t interface_count = 0;
        std::size_t method_count = 0;
        std::size_t attribute_count = 0;

        /// Import specifiers as written in the source, sorted and unique
        std::vector<std::string> imports;

        bool operator==(const FileStructure&) const = default;
    };

    /**
     * Extracts structure from already-lexed text.
     *
     * @param text   The file contents.
     * @param lexed  Result of metrics::lex() over the same text.
     * @param syntax Descriptor the text was lexed with.
     */
    [[nodiscard]] FileStructure extract_structure(
        std::string_view text,
        const metrics::LexResult& lexed,
        const metrics::LanguageSyntax& syntax
    );

    /**
     * Lexes and extracts in one call.
     */
    [[nodiscard]] FileStructure extract_structure(std::string_view text, Language language);

}  // namespace rha::analyzers

#endif // RHA_ANALYZERS_STRUCTURE_EXTRACTOR_HPP
