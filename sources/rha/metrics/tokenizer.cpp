#include "rha/metrics/tokenizer.hpp"

#include <algorithm>
#include <iterator>
#include <cctype>

namespace rha::metrics {

    namespace {

        /// Multi-character operators, longest first for maximal munch
        constexpr std::string_view multi_char_operators[] = {
            ">>>=", "<<=", ">>=", ">>>", "===", "!==", "**=", "//=", "&&=", "||=", "?\?=",
            "<=>", "->*", "...",
            "::", "->", "=>", "++", "--", "&&", "||", "==", "!=", "<=", ">=", "+=", "-=",
            "*=", "/=", "%=", "&=", "|=", "^=", "<<", ">>", "**", "??", "?.", ":=", "..",
            "//", "<-", ".*"
        };

        bool is_space(const char c) noexcept {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        bool is_digit(const char c) noexcept {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_ident_start(const char c) noexcept {
            const auto u = static_cast<unsigned char>(c);
            return std::isalpha(u) != 0 || c == '_' || c == '$' || u >= 0x80;
        }

        bool is_ident_char(const char c) noexcept {
            return is_ident_start(c) || is_digit(c);
        }

        bool is_python_string_prefix(const std::string_view word) noexcept {
            if (word.empty() || word.size() > 2) {
                return false;
            }
            return std::ranges::all_of(word, [](const char c) {
                const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                return lower == 'r' || lower == 'b' || lower == 'f' || lower == 'u';
            });
        }

        bool is_cpp_raw_prefix(const std::string_view word) noexcept {
            return word == "R" || word == "u8R" || word == "uR" || word == "UR" || word == "LR";
        }

        class Lexer {
        public:
            Lexer(const std::string_view text, const LanguageSyntax& syntax)
                : text_(text)
                , syntax_(syntax) {
                std::size_t count = static_cast<std::size_t>(std::ranges::count(text_, '\n'));
                if (!text_.empty() && text_.back() != '\n') {
                    ++count;
                }
                has_code_.assign(count, false);
                has_comment_.assign(count, false);
            }

            LexResult run() {
                while (pos_ < text_.size()) {
                    const char c = text_[pos_];

                    if (c == '\n') {
                        ++line_;
                        ++pos_;
                        continue;
                    }
                    if (is_space(c)) {
                        ++pos_;
                        continue;
                    }
                    if (try_block_comment() || try_line_comment() || try_string()) {
                        continue;
                    }
                    if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
                        lex_number();
                        continue;
                    }
                    if (is_ident_start(c) || (c == '@' && syntax_.language == Language::ObjectiveC && is_ident_start(peek(1)))) {
                        lex_identifier();
                        continue;
                    }
                    lex_operator();
                }

                classify_lines();
                return std::move(result_);
            }

        private:
            [[nodiscard]] char peek(const std::size_t offset) const noexcept {
                const std::size_t index = pos_ + offset;
                return index < text_.size() ? text_[index] : '\0';
            }

            [[nodiscard]] bool at(const std::string_view s) const noexcept {
                return text_.substr(pos_).starts_with(s);
            }

            /**
             * Moves one character forward, tracking newlines.
             */
            void step() noexcept {
                if (text_[pos_] == '\n') {
                    ++line_;
                }
                ++pos_;
            }

            void mark(std::vector<bool>& flags, const std::size_t first, const std::size_t last) {
                for (std::size_t i = first; i <= last && i < flags.size(); ++i) {
                    flags[i] = true;
                }
            }

            void emit(const TokenKind kind, const std::size_t begin, const std::size_t line) {
                result_.tokens.push_back(Token{kind, text_.substr(begin, pos_ - begin), line});
                mark(has_code_, line, line_);
            }

            bool try_block_comment() {
                if (!syntax_.block_comment || !at(syntax_.block_comment->open)) {
                    return false;
                }
                const auto& [open, close] = *syntax_.block_comment;
                const std::size_t begin = pos_;
                const std::size_t first_line = line_;

                pos_ += open.size();
                int depth = 1;
                while (pos_ < text_.size()) {
                    if (syntax_.nested_block_comments && at(open)) {
                        ++depth;
                        pos_ += open.size();
                    } else if (at(close)) {
                        pos_ += close.size();
                        if (--depth == 0) {
                            break;
                        }
                    } else {
                        step();
                    }
                }

                result_.comments.push_back(Span{begin, pos_});
                mark(has_comment_, first_line, line_);
                return true;
            }

            bool try_line_comment() {
                const auto it = std::ranges::find_if(syntax_.line_comments, [this](const std::string_view prefix) {
                    return at(prefix);
                });
                if (it == syntax_.line_comments.end()) {
                    return false;
                }
                const std::size_t begin = pos_;
                while (pos_ < text_.size() && text_[pos_] != '\n') {
                    ++pos_;
                }
                result_.comments.push_back(Span{begin, pos_});
                mark(has_comment_, line_, line_);
                return true;
            }

            /**
             * Scans a literal whose opening delimiter starts at pos_.
             */
            void scan_quoted(const std::size_t begin, const std::size_t first_line, const std::string_view close,
                             const bool escapes, const bool multiline) {
                while (pos_ < text_.size()) {
                    if (escapes && text_[pos_] == '\\' && pos_ + 1 < text_.size()) {
                        step();
                        step();
                        continue;
                    }
                    if (at(close)) {
                        pos_ += close.size();
                        break;
                    }
                    if (!multiline && text_[pos_] == '\n') {
                        break;  // unterminated; the newline stays for the main loop
                    }
                    step();
                }
                result_.strings.push_back(Span{begin, pos_});
                emit(TokenKind::String, begin, first_line);
            }

            bool try_string() {
                const std::size_t begin = pos_;
                const std::size_t first_line = line_;
                const char c = text_[pos_];

                if (syntax_.triple_quote_strings && (at("\"\"\"") ||
                    (syntax_.language == Language::Python && at("'''")))) {
                    const std::string_view delimiter = text_.substr(pos_, 3);
                    pos_ += 3;
                    scan_quoted(begin, first_line, delimiter, true, true);
                    return true;
                }
                if (syntax_.lua_long_strings && at("[[")) {
                    pos_ += 2;
                    scan_quoted(begin, first_line, "]]", false, true);
                    return true;
                }
                if (c == '"') {
                    ++pos_;
                    scan_quoted(begin, first_line, "\"", true, false);
                    return true;
                }
                if (c == '\'' && syntax_.single_quote_strings) {
                    if (syntax_.rust_lifetimes && is_ident_start(peek(1)) && peek(2) != '\'') {
                        return false;  // lifetime or label, lexed as operator + identifier
                    }
                    ++pos_;
                    scan_quoted(begin, first_line, "'", true, false);
                    return true;
                }
                if (c == '`' && syntax_.backtick_strings) {
                    ++pos_;
                    scan_quoted(begin, first_line, "`", syntax_.backtick_escapes, true);
                    return true;
                }
                return false;
            }

            void lex_number() {
                const std::size_t begin = pos_;
                while (pos_ < text_.size()) {
                    const char c = text_[pos_];
                    if (c == '.' && peek(1) == '.') {
                        break;  // range operator
                    }
                    if ((c == '+' || c == '-') && pos_ > begin &&
                        (text_[pos_ - 1] == 'e' || text_[pos_ - 1] == 'E') && is_digit(peek(1))) {
                        ++pos_;
                        continue;
                    }
                    if (!is_ident_char(c) && c != '.' && c != '\'') {
                        break;
                    }
                    // C++14 digit separators only between digits
                    if (c == '\'' && !(syntax_.language == Language::Cpp && is_digit(peek(1)))) {
                        break;
                    }
                    ++pos_;
                }
                emit(TokenKind::Number, begin, line_);
            }

            void lex_identifier() {
                const std::size_t begin = pos_;
                const std::size_t first_line = line_;
                ++pos_;
                while (pos_ < text_.size() && is_ident_char(text_[pos_])) {
                    ++pos_;
                }
                const std::string_view word = text_.substr(begin, pos_ - begin);
                const char next = peek(0);

                if (syntax_.cpp_raw_strings && next == '"' && is_cpp_raw_prefix(word)) {
                    lex_cpp_raw_string(begin, first_line);
                    return;
                }
                if (syntax_.language == Language::Python && (next == '"' || next == '\'') &&
                    is_python_string_prefix(word)) {
                    const bool raw = word.find_first_of("rR") != std::string_view::npos;
                    if (at("\"\"\"") || at("'''")) {
                        const std::string_view delimiter = text_.substr(pos_, 3);
                        pos_ += 3;
                        scan_quoted(begin, first_line, delimiter, !raw, true);
                    } else {
                        const std::string_view delimiter = text_.substr(pos_, 1);
                        ++pos_;
                        scan_quoted(begin, first_line, delimiter, !raw, false);
                    }
                    return;
                }

                const TokenKind kind = syntax_.keywords.contains(word) ? TokenKind::Keyword : TokenKind::Identifier;
                emit(kind, begin, first_line);
            }

            void lex_cpp_raw_string(const std::size_t begin, const std::size_t first_line) {
                ++pos_;  // opening quote
                const std::size_t paren = text_.find('(', pos_);
                if (paren == std::string_view::npos || paren - pos_ > 16) {
                    scan_quoted(begin, first_line, "\"", true, false);
                    return;
                }
                const std::string terminator = ")" + std::string(text_.substr(pos_, paren - pos_)) + "\"";
                while (pos_ <= paren) {
                    step();
                }
                const std::size_t end = text_.find(terminator, pos_);
                const std::size_t stop = end == std::string_view::npos ? text_.size() : end + terminator.size();
                while (pos_ < stop) {
                    step();
                }
                result_.strings.push_back(Span{begin, pos_});
                emit(TokenKind::String, begin, first_line);
            }

            void lex_operator() {
                const std::size_t begin = pos_;
                const char c = text_[pos_];

                if (c == ')' || c == ']' || c == '}') {
                    ++pos_;
                    mark(has_code_, line_, line_);
                    return;
                }

                const auto it = std::ranges::find_if(multi_char_operators, [this](const std::string_view op) {
                    return at(op);
                });
                pos_ += it != std::end(multi_char_operators) ? it->size() : 1;
                emit(TokenKind::Operator, begin, line_);
            }

            void classify_lines() {
                result_.lines.reserve(has_code_.size());
                std::size_t start = 0;
                for (std::size_t i = 0; i < has_code_.size(); ++i) {
                    std::size_t end = text_.find('\n', start);
                    if (end == std::string_view::npos) {
                        end = text_.size();
                    }
                    const auto line = text_.substr(start, end - start);
                    start = end + 1;

                    if (std::ranges::all_of(line, is_space)) {
                        result_.lines.push_back(LineKind::Blank);
                    } else if (has_code_[i]) {
                        result_.lines.push_back(LineKind::Program);
                    } else if (has_comment_[i]) {
                        result_.lines.push_back(LineKind::Comment);
                    } else {
                        result_.lines.push_back(LineKind::Program);
                    }
                }
            }

            std::string_view text_;
            const LanguageSyntax& syntax_;
            std::size_t pos_ = 0;
            std::size_t line_ = 0;
            std::vector<bool> has_code_;
            std::vector<bool> has_comment_;
            LexResult result_;
        };

    }  // namespace

    LexResult lex(const std::string_view text, const LanguageSyntax& syntax) {
        return Lexer(text, syntax).run();
    }

    std::string strip_source(const std::string_view text, const LexResult& lexed, const bool keep_strings) {
        std::string stripped(text);
        const auto blank = [&stripped](const Span& span) {
            for (std::size_t i = span.begin; i < span.end && i < stripped.size(); ++i) {
                if (stripped[i] != '\n') {
                    stripped[i] = ' ';
                }
            }
        };
        for (const auto& span : lexed.comments) {
            blank(span);
        }
        if (!keep_strings) {
            for (const auto& span : lexed.strings) {
                blank(span);
            }
        }
        return stripped;
    }

}  // namespace rha::metrics
