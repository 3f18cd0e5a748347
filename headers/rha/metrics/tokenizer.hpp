#ifndef RHA_METRICS_TOKENIZER_HPP
#define RHA_METRICS_TOKENIZER_HPP

/**
 * @file tokenizer.hpp
 * @brief State-machine lexer shared by the metrics and coupling analyzers.
 *
 * The lexer walks the text once and produces:
 * - a token stream (keywords, identifiers, numbers, string literals, operator symbols)
 * - a per-line classification (blank, comment-only, program)
 * - the byte spans covered by comments and by string literals
 *
 * Closing brackets are consumed but not emitted: a bracket pair counts as one
 * operator occurrence, the opening one.
 */

#include "rha/metrics/language.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rha::metrics {

    enum class TokenKind {
        Keyword,
        Identifier,
        Number,
        String,
        Operator
    };

    struct Token {
        TokenKind kind;
        std::string_view text;  // view into the lexed source
        std::size_t line = 0;   // zero-based
    };

    enum class LineKind {
        Blank,
        Comment,
        Program
    };

    struct Span {
        std::size_t begin = 0;
        std::size_t end = 0;  // exclusive
    };

    struct LexResult {
        std::vector<Token> tokens;
        std::vector<LineKind> lines;
        std::vector<Span> comments;
        std::vector<Span> strings;
    };

    /**
     * Lexes @p text with the rules of @p syntax.
     *
     * Physical lines are split on '\n'; a trailing newline does not open a
     * new line and empty text has no lines. Unterminated constructs run to
     * the end of the text without failing.
     */
    [[nodiscard]] LexResult lex(std::string_view text, const LanguageSyntax& syntax);

    /**
     * Copy of @p text with comments (and, unless @p keep_strings, string
     * literals) overwritten by spaces. Newlines are preserved so line
     * structure survives.
     */
    [[nodiscard]] std::string strip_source(std::string_view text, const LexResult& lexed, bool keep_strings);

}  // namespace rha::metrics

#endif // RHA_METRICS_TOKENIZER_HPP
