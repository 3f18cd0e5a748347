#include "rha/metrics/language.hpp"

#include "rha/utils/string_utils.hpp"

#include <array>
#include <unordered_map>

namespace rha::metrics {

    namespace {

        constexpr BlockComment c_block{"/*", "*/"};

        LanguageSyntax make_c() {
            LanguageSyntax s;
            s.language = Language::C;
            s.line_comments = {"//"};
            s.block_comment = c_block;
            s.keywords = {
                "auto", "break", "case", "char", "const", "continue", "default", "do", "double",
                "else", "enum", "extern", "float", "for", "goto", "if", "inline", "int", "long",
                "register", "restrict", "return", "short", "signed", "sizeof", "static", "struct",
                "switch", "typedef", "union", "unsigned", "void", "volatile", "while", "_Bool",
                "__global", "__kernel", "__local", "__device__", "__global__", "__host__"
            };
            s.decision_keywords = {"if", "for", "while", "case"};
            s.multiway_keywords = {"case"};
            s.ternary_decision = true;
            return s;
        }

        LanguageSyntax make_cpp() {
            LanguageSyntax s = make_c();
            s.language = Language::Cpp;
            s.cpp_raw_strings = true;
            s.keywords.insert({
                "alignas", "alignof", "bool", "catch", "class", "concept", "consteval", "constexpr",
                "constinit", "const_cast", "co_await", "co_return", "co_yield", "decltype", "delete",
                "dynamic_cast", "explicit", "export", "false", "final", "friend", "mutable",
                "namespace", "new", "noexcept", "nullptr", "operator", "override", "private",
                "protected", "public", "reinterpret_cast", "requires", "static_assert",
                "static_cast", "template", "this", "thread_local", "throw", "true", "try",
                "typeid", "typename", "using", "virtual", "wchar_t", "char8_t", "char16_t",
                "char32_t"
            });
            s.decision_keywords.insert("catch");
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_objc() {
            LanguageSyntax s = make_cpp();
            s.language = Language::ObjectiveC;
            s.keywords.insert({
                "@interface", "@implementation", "@protocol", "@end", "@property", "@class",
                "@selector", "@try", "@catch", "@finally", "@throw", "@autoreleasepool",
                "self", "super", "nil", "YES", "NO", "id", "instancetype"
            });
            return s;
        }

        LanguageSyntax make_java() {
            LanguageSyntax s;
            s.language = Language::Java;
            s.line_comments = {"//"};
            s.block_comment = c_block;
            s.triple_quote_strings = true;  // text blocks
            s.keywords = {
                "abstract", "assert", "boolean", "break", "byte", "case", "catch", "char", "class",
                "const", "continue", "default", "do", "double", "else", "enum", "extends", "final",
                "finally", "float", "for", "goto", "if", "implements", "import", "instanceof",
                "int", "interface", "long", "native", "new", "package", "private", "protected",
                "public", "record", "return", "short", "static", "strictfp", "super", "switch",
                "synchronized", "this", "throw", "throws", "transient", "try", "var", "void",
                "volatile", "while", "yield", "true", "false", "null", "sealed", "permits"
            };
            s.decision_keywords = {"if", "for", "while", "case", "catch"};
            s.multiway_keywords = {"case"};
            s.ternary_decision = true;
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_kotlin() {
            LanguageSyntax s;
            s.language = Language::Kotlin;
            s.line_comments = {"//"};
            s.block_comment = c_block;
            s.nested_block_comments = true;
            s.triple_quote_strings = true;
            s.keywords = {
                "abstract", "annotation", "as", "break", "by", "catch", "class", "companion",
                "const", "constructor", "continue", "crossinline", "data", "do", "else", "enum",
                "external", "false", "final", "finally", "for", "fun", "get", "if", "import",
                "in", "infix", "init", "inline", "inner", "interface", "internal", "is",
                "lateinit", "noinline", "null", "object", "open", "operator", "out", "override",
                "package", "private", "protected", "public", "reified", "return", "sealed", "set",
                "super", "suspend", "tailrec", "this", "throw", "true", "try", "typealias", "val",
                "var", "vararg", "when", "where", "while"
            };
            s.decision_keywords = {"if", "for", "while", "when", "catch"};
            s.multiway_keywords = {"when"};
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_scala() {
            LanguageSyntax s;
            s.language = Language::Scala;
            s.line_comments = {"//"};
            s.block_comment = c_block;
            s.nested_block_comments = true;
            s.triple_quote_strings = true;
            s.keywords = {
                "abstract", "case", "catch", "class", "def", "do", "else", "enum", "extends",
                "false", "final", "finally", "for", "forSome", "given", "if", "implicit", "import",
                "lazy", "match", "new", "null", "object", "override", "package", "private",
                "protected", "return", "sealed", "super", "then", "this", "throw", "trait", "true",
                "try", "type", "using", "val", "var", "while", "with", "yield"
            };
            s.decision_keywords = {"if", "for", "while", "case", "catch"};
            s.multiway_keywords = {"case"};
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_swift() {
            LanguageSyntax s;
            s.language = Language::Swift;
            s.line_comments = {"//"};
            s.block_comment = c_block;
            s.nested_block_comments = true;
            s.single_quote_strings = false;
            s.triple_quote_strings = true;
            s.keywords = {
                "associatedtype", "break", "case", "catch", "class", "continue", "default", "defer",
                "deinit", "do", "else", "enum", "extension", "fallthrough", "false", "fileprivate",
                "final", "for", "func", "guard", "if", "import", "in", "init", "inout", "internal",
                "is", "let", "nil", "open", "operator", "override", "private", "protocol", "public",
                "repeat", "rethrows", "return", "self", "Self", "static", "struct", "subscript",
                "super", "switch", "throw", "throws", "true", "try", "typealias", "var", "where",
                "while", "async", "await", "actor"
            };
            s.decision_keywords = {"if", "guard", "for", "while", "case", "catch"};
            s.multiway_keywords = {"case"};
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_go() {
            LanguageSyntax s;
            s.language = Language::Go;
            s.line_comments = {"//"};
            s.block_comment = c_block;
            s.backtick_strings = true;
            s.keywords = {
                "break", "case", "chan", "const", "continue", "default", "defer", "else",
                "fallthrough", "for", "func", "go", "goto", "if", "import", "interface", "map",
                "package", "range", "return", "select", "struct", "switch", "type", "var",
                "nil", "true", "false", "iota"
            };
            s.decision_keywords = {"if", "for", "case", "select"};
            s.multiway_keywords = {"case", "select"};
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_rust() {
            LanguageSyntax s;
            s.language = Language::Rust;
            s.line_comments = {"//"};
            s.block_comment = c_block;
            s.nested_block_comments = true;
            s.rust_lifetimes = true;
            s.keywords = {
                "as", "async", "await", "break", "const", "continue", "crate", "dyn", "else",
                "enum", "extern", "false", "fn", "for", "if", "impl", "in", "let", "loop", "match",
                "mod", "move", "mut", "pub", "ref", "return", "self", "Self", "static", "struct",
                "super", "trait", "true", "type", "unsafe", "use", "where", "while"
            };
            s.decision_keywords = {"if", "for", "while", "loop", "match"};
            s.multiway_keywords = {"match"};
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_python() {
            LanguageSyntax s;
            s.language = Language::Python;
            s.line_comments = {"#"};
            s.triple_quote_strings = true;
            s.keywords = {
                "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class",
                "continue", "def", "del", "elif", "else", "except", "finally", "for", "from",
                "global", "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass",
                "raise", "return", "try", "while", "with", "yield", "match", "case"
            };
            s.decision_keywords = {"if", "elif", "for", "while", "except", "with", "and", "or", "case"};
            s.multiway_keywords = {"case"};
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_javascript() {
            LanguageSyntax s;
            s.language = Language::JavaScript;
            s.line_comments = {"//"};
            s.block_comment = c_block;
            s.backtick_strings = true;
            s.backtick_escapes = true;
            s.keywords = {
                "async", "await", "break", "case", "catch", "class", "const", "continue",
                "debugger", "default", "delete", "do", "else", "export", "extends", "false",
                "finally", "for", "from", "function", "if", "import", "in", "instanceof", "let",
                "new", "null", "of", "return", "static", "super", "switch", "this", "throw",
                "true", "try", "typeof", "undefined", "var", "void", "while", "with", "yield"
            };
            s.decision_keywords = {"if", "for", "while", "case", "catch"};
            s.multiway_keywords = {"case"};
            s.ternary_decision = true;
            s.has_type_concept = true;
            return s;
        }

        LanguageSyntax make_typescript() {
            LanguageSyntax s = make_javascript();
            s.language = Language::TypeScript;
            s.keywords.insert({
                "abstract", "any", "as", "boolean", "declare", "enum", "implements", "interface",
                "keyof", "module", "namespace", "never", "number", "private", "protected", "public",
                "readonly", "string", "type", "unknown"
            });
            return s;
        }

        LanguageSyntax make_lua() {
            LanguageSyntax s;
            s.language = Language::Lua;
            s.line_comments = {"--"};
            s.block_comment = BlockComment{"--[[", "]]"};
            s.lua_long_strings = true;
            s.keywords = {
                "and", "break", "do", "else", "elseif", "end", "false", "for", "function", "goto",
                "if", "in", "local", "nil", "not", "or", "repeat", "return", "then", "true",
                "until", "while"
            };
            s.decision_keywords = {"if", "elseif", "for", "while", "repeat", "and", "or"};
            return s;
        }

        LanguageSyntax make_r() {
            LanguageSyntax s;
            s.language = Language::R;
            s.line_comments = {"#"};
            s.keywords = {
                "if", "else", "repeat", "while", "function", "for", "in", "next", "break",
                "TRUE", "FALSE", "NULL", "Inf", "NaN", "NA", "return"
            };
            s.decision_keywords = {"if", "for", "while", "repeat"};
            return s;
        }

        LanguageSyntax make_idl() {
            LanguageSyntax s;
            s.language = Language::InterfaceDefinition;
            s.line_comments = {"//", "#"};
            s.block_comment = c_block;
            s.keywords = {
                "syntax", "package", "import", "option", "message", "enum", "service", "rpc",
                "returns", "repeated", "optional", "required", "oneof", "map", "reserved",
                "extend", "struct", "union", "exception", "namespace", "include", "typedef",
                "const", "throws", "oneway", "list", "set", "true", "false"
            };
            return s;
        }

        LanguageSyntax make_assembly() {
            LanguageSyntax s;
            s.language = Language::Assembly;
            s.line_comments = {"//", ";", "#"};
            s.block_comment = c_block;
            s.single_quote_strings = false;
            return s;
        }

        LanguageSyntax make_other() {
            LanguageSyntax s;
            s.language = Language::Other;
            s.line_comments = {"//", "#"};
            s.block_comment = c_block;
            return s;
        }

        struct SyntaxTable {
            std::unordered_map<Language, LanguageSyntax> entries;

            SyntaxTable() {
                for (auto syntax : {make_c(), make_cpp(), make_objc(), make_swift(), make_java(),
                                    make_kotlin(), make_scala(), make_go(), make_rust(), make_python(),
                                    make_javascript(), make_typescript(), make_lua(), make_r(),
                                    make_idl(), make_assembly(), make_other()}) {
                    entries.emplace(syntax.language, std::move(syntax));
                }
            }
        };

        const SyntaxTable& table() {
            static const SyntaxTable instance;
            return instance;
        }

        const std::unordered_map<std::string_view, Language>& extension_map() {
            static const std::unordered_map<std::string_view, Language> map = {
                {".c", Language::C}, {".h", Language::C}, {".cl", Language::C},
                {".cc", Language::Cpp}, {".cpp", Language::Cpp}, {".cxx", Language::Cpp},
                {".hh", Language::Cpp}, {".hpp", Language::Cpp}, {".hxx", Language::Cpp},
                {".cu", Language::Cpp}, {".cuh", Language::Cpp},
                {".m", Language::ObjectiveC}, {".mm", Language::ObjectiveC},
                {".swift", Language::Swift},
                {".java", Language::Java}, {".kt", Language::Kotlin}, {".kts", Language::Kotlin},
                {".scala", Language::Scala},
                {".go", Language::Go}, {".rs", Language::Rust},
                {".py", Language::Python}, {".pyi", Language::Python},
                {".pyx", Language::Python}, {".pxd", Language::Python},
                {".js", Language::JavaScript}, {".mjs", Language::JavaScript},
                {".cjs", Language::JavaScript}, {".jsx", Language::JavaScript},
                {".ts", Language::TypeScript}, {".tsx", Language::TypeScript},
                {".lua", Language::Lua}, {".r", Language::R},
                {".proto", Language::InterfaceDefinition}, {".thrift", Language::InterfaceDefinition},
                {".asm", Language::Assembly}, {".s", Language::Assembly}
            };
            return map;
        }

    }  // namespace

    const LanguageSyntax& syntax_for(const Language language) {
        const auto& entries = table().entries;
        if (const auto it = entries.find(language); it != entries.end()) {
            return it->second;
        }
        return entries.at(Language::Other);
    }

    Language detect_language(const std::string_view path) {
        const std::string ext = string_utils::extension_of(path);
        if (const auto it = extension_map().find(ext); it != extension_map().end()) {
            return it->second;
        }
        return Language::Other;
    }

}  // namespace rha::metrics
