#include "rha/metrics/tokenizer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace rha::metrics
{
    namespace {
        std::vector<std::string_view> texts_of(const LexResult& result, const TokenKind kind) {
            std::vector<std::string_view> texts;
            for (const auto& token : result.tokens) {
                if (token.kind == kind) {
                    texts.push_back(token.text);
                }
            }
            return texts;
        }
    }

    TEST(TokenizerTest, EmptyTextHasNoLines) {
        const auto result = lex("", syntax_for(Language::Cpp));
        EXPECT_TRUE(result.lines.empty());
        EXPECT_TRUE(result.tokens.empty());
    }

    TEST(TokenizerTest, TrailingNewlineDoesNotOpenLine) {
        EXPECT_EQ(lex("int x;\n", syntax_for(Language::Cpp)).lines.size(), 1u);
        EXPECT_EQ(lex("int x;", syntax_for(Language::Cpp)).lines.size(), 1u);
        EXPECT_EQ(lex("int x;\n\n", syntax_for(Language::Cpp)).lines.size(), 2u);
    }

    TEST(TokenizerTest, ClassifiesLines) {
        const auto result = lex(
            "// header\n"
            "\n"
            "int x = 1; // trailing\n"
            "/* block\n"
            "   still block */\n",
            syntax_for(Language::Cpp));

        ASSERT_EQ(result.lines.size(), 5u);
        EXPECT_EQ(result.lines[0], LineKind::Comment);
        EXPECT_EQ(result.lines[1], LineKind::Blank);
        EXPECT_EQ(result.lines[2], LineKind::Program);
        EXPECT_EQ(result.lines[3], LineKind::Comment);
        EXPECT_EQ(result.lines[4], LineKind::Comment);
        EXPECT_EQ(result.comments.size(), 3u);
    }

    TEST(TokenizerTest, TokenKinds) {
        const auto result = lex("return a + 42;", syntax_for(Language::C));

        EXPECT_EQ(texts_of(result, TokenKind::Keyword), (std::vector<std::string_view>{"return"}));
        EXPECT_EQ(texts_of(result, TokenKind::Identifier), (std::vector<std::string_view>{"a"}));
        EXPECT_EQ(texts_of(result, TokenKind::Number), (std::vector<std::string_view>{"42"}));
        EXPECT_EQ(texts_of(result, TokenKind::Operator), (std::vector<std::string_view>{"+", ";"}));
    }

    TEST(TokenizerTest, ClosingBracketsAreNotEmitted) {
        const auto result = lex("f(a[0]) { }", syntax_for(Language::Cpp));

        EXPECT_EQ(texts_of(result, TokenKind::Operator), (std::vector<std::string_view>{"(", "[", "{"}));
    }

    TEST(TokenizerTest, MaximalMunchOperators) {
        const auto result = lex("a <<= b->c && d", syntax_for(Language::Cpp));

        EXPECT_EQ(texts_of(result, TokenKind::Operator), (std::vector<std::string_view>{"<<=", "->", "&&"}));
    }

    TEST(TokenizerTest, NullishAssignmentIsOneOperator) {
        const auto result = lex("a ?\?= b ?? c;", syntax_for(Language::TypeScript));

        EXPECT_EQ(texts_of(result, TokenKind::Operator), (std::vector<std::string_view>{"?\?=", "??", ";"}));
    }

    TEST(TokenizerTest, CommentMarkersInsideStringsAreIgnored) {
        const auto result = lex("const char* s = \"// not a comment\";", syntax_for(Language::Cpp));

        EXPECT_TRUE(result.comments.empty());
        ASSERT_EQ(result.strings.size(), 1u);
        EXPECT_EQ(texts_of(result, TokenKind::String), (std::vector<std::string_view>{"\"// not a comment\""}));
    }

    TEST(TokenizerTest, EscapedQuoteStaysInString) {
        const auto result = lex(R"(s = "a\"b" + c)", syntax_for(Language::JavaScript));

        EXPECT_EQ(texts_of(result, TokenKind::String), (std::vector<std::string_view>{R"("a\"b")"}));
        EXPECT_EQ(texts_of(result, TokenKind::Identifier), (std::vector<std::string_view>{"s", "c"}));
    }

    TEST(TokenizerTest, CppRawString) {
        const auto result = lex("auto s = R\"x(quote \" and )\" inside)x\";", syntax_for(Language::Cpp));

        ASSERT_EQ(result.strings.size(), 1u);
        EXPECT_EQ(texts_of(result, TokenKind::String).front(), "R\"x(quote \" and )\" inside)x\"");
    }

    TEST(TokenizerTest, PythonTripleQuotedDocstringSpansLines) {
        const auto result = lex(
            "def f():\n"
            "    \"\"\"Doc\n"
            "    # not a comment\n"
            "    \"\"\"\n"
            "    return 1  # comment\n",
            syntax_for(Language::Python));

        ASSERT_EQ(result.strings.size(), 1u);
        EXPECT_EQ(result.comments.size(), 1u);
        ASSERT_EQ(result.lines.size(), 5u);
        EXPECT_TRUE(std::ranges::all_of(result.lines, [](const LineKind kind) {
            return kind == LineKind::Program;
        }));
    }

    TEST(TokenizerTest, PythonPrefixedStrings) {
        const auto result = lex("x = rb'\\d' + f\"{y}\"", syntax_for(Language::Python));

        EXPECT_EQ(texts_of(result, TokenKind::String), (std::vector<std::string_view>{"rb'\\d'", "f\"{y}\""}));
    }

    TEST(TokenizerTest, RustNestedCommentsAndLifetimes) {
        const auto result = lex(
            "/* outer /* inner */ still */ fn f<'a>(x: &'a str) -> char { 'c' }",
            syntax_for(Language::Rust));

        EXPECT_EQ(result.comments.size(), 1u);
        EXPECT_EQ(texts_of(result, TokenKind::String), (std::vector<std::string_view>{"'c'"}));
    }

    TEST(TokenizerTest, UnterminatedBlockCommentRunsToEnd) {
        const auto result = lex("int a;\n/* never closed\nint b;\n", syntax_for(Language::C));

        ASSERT_EQ(result.lines.size(), 3u);
        EXPECT_EQ(result.lines[0], LineKind::Program);
        EXPECT_EQ(result.lines[1], LineKind::Comment);
        EXPECT_EQ(result.lines[2], LineKind::Comment);
    }

    TEST(TokenizerTest, TokenLinesAreZeroBased) {
        const auto result = lex("a\n\nb", syntax_for(Language::Go));

        ASSERT_EQ(result.tokens.size(), 2u);
        EXPECT_EQ(result.tokens[0].line, 0u);
        EXPECT_EQ(result.tokens[1].line, 2u);
    }

    TEST(StripSourceTest, BlanksCommentsKeepsNewlines) {
        const std::string text = "#include \"a.h\" // x\n/* y\n */ int z;\n";
        const auto lexed = lex(text, syntax_for(Language::Cpp));

        const auto with_strings = strip_source(text, lexed, true);
        ASSERT_EQ(with_strings.size(), text.size());
        EXPECT_NE(with_strings.find("\"a.h\""), std::string::npos);
        EXPECT_EQ(with_strings.find("//"), std::string::npos);
        EXPECT_EQ(with_strings.find("/*"), std::string::npos);
        EXPECT_EQ(std::ranges::count(with_strings, '\n'), 3);
        EXPECT_NE(with_strings.find("int z;"), std::string::npos);

        const auto without_strings = strip_source(text, lexed, false);
        EXPECT_EQ(without_strings.find("a.h"), std::string::npos);
    }
}
