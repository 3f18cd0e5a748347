#include "rha/analyzers/import_resolver.hpp"

#include <gtest/gtest.h>

namespace rha::analyzers
{
    using Files = std::set<std::string>;

    TEST(NormalizePathTest, CollapsesDotComponents) {
        EXPECT_EQ(normalize_path("a/./b/../c"), "a/c");
        EXPECT_EQ(normalize_path("./a//b/"), "a/b");
        EXPECT_EQ(normalize_path(""), "");
    }

    TEST(NormalizePathTest, ClimbingAboveRootFails) {
        EXPECT_FALSE(normalize_path("../x").has_value());
        EXPECT_FALSE(normalize_path("a/../../x").has_value());
    }

    TEST(ImportResolverTest, IncludeRelativeThenSuffix) {
        const ImportResolver resolver({
            "src/core/widget.hpp", "src/core/widget.cpp", "src/app/main.cpp",
            "lib/util/widget.hpp", "include/api.h"
        });

        EXPECT_EQ(resolver.resolve_one("src/core/widget.cpp", Language::Cpp, "widget.hpp"),
                  (Files{"src/core/widget.hpp"}));
        EXPECT_EQ(resolver.resolve_one("src/app/main.cpp", Language::Cpp, "core/widget.hpp"),
                  (Files{"src/core/widget.hpp"}));
        EXPECT_EQ(resolver.resolve_one("src/app/main.cpp", Language::Cpp, "../core/widget.hpp"),
                  (Files{"src/core/widget.hpp"}));
        EXPECT_EQ(resolver.resolve_one("src/app/main.cpp", Language::C, "api.h"),
                  (Files{"include/api.h"}));
        EXPECT_TRUE(resolver.resolve_one("src/app/main.cpp", Language::Cpp, "vector").empty());
    }

    TEST(ImportResolverTest, SuffixTiePrefersLongestSharedDirectory) {
        const ImportResolver resolver({"src/core/widget.hpp", "lib/util/widget.hpp", "src/app/main.cpp"});

        EXPECT_EQ(resolver.resolve_one("src/app/main.cpp", Language::Cpp, "widget.hpp"),
                  (Files{"src/core/widget.hpp"}));
    }

    TEST(ImportResolverTest, SuffixTieWithoutSharedDirectoryIsLexicographic) {
        const ImportResolver resolver({"b/x/util.h", "a/x/util.h", "c/main.c"});

        EXPECT_EQ(resolver.resolve_one("c/main.c", Language::C, "util.h"), (Files{"a/x/util.h"}));
    }

    TEST(ImportResolverTest, JvmClassesPackagesAndNestedNames) {
        const ImportResolver resolver({
            "src/main/java/com/acme/Foo.java",
            "src/main/java/com/acme/Bar.java",
            "src/main/java/com/acme/util/Helper.java"
        });
        const std::string from = "src/main/java/com/acme/Bar.java";

        EXPECT_EQ(resolver.resolve_one(from, Language::Java, "com.acme.Foo"),
                  (Files{"src/main/java/com/acme/Foo.java"}));
        EXPECT_EQ(resolver.resolve_one(from, Language::Java, "com.acme.Foo.Inner"),
                  (Files{"src/main/java/com/acme/Foo.java"}));
        EXPECT_EQ(resolver.resolve_one(from, Language::Java, "com.acme.util.*"),
                  (Files{"src/main/java/com/acme/util/Helper.java"}));
        EXPECT_TRUE(resolver.resolve_one(from, Language::Java, "java.util.List").empty());
    }

    TEST(ImportResolverTest, PythonAbsoluteRelativeAndPackages) {
        const ImportResolver resolver({
            "pkg/__init__.py", "pkg/models.py", "pkg/sub/__init__.py", "pkg/sub/views.py", "tools/run.py"
        });

        EXPECT_EQ(resolver.resolve_one("pkg/sub/views.py", Language::Python, ".."),
                  (Files{"pkg/__init__.py"}));
        EXPECT_EQ(resolver.resolve_one("pkg/sub/views.py", Language::Python, "..models"),
                  (Files{"pkg/models.py"}));
        EXPECT_EQ(resolver.resolve_one("pkg/models.py", Language::Python, "."),
                  (Files{"pkg/__init__.py"}));
        EXPECT_EQ(resolver.resolve_one("tools/run.py", Language::Python, "pkg.models"),
                  (Files{"pkg/models.py"}));
        EXPECT_EQ(resolver.resolve_one("tools/run.py", Language::Python, "pkg.sub"),
                  (Files{"pkg/sub/__init__.py"}));
        EXPECT_TRUE(resolver.resolve_one("tools/run.py", Language::Python, "os").empty());
    }

    TEST(ImportResolverTest, JavaScriptRelativeSpecifiers) {
        const ImportResolver resolver({
            "web/src/app.ts", "web/src/api/index.ts", "web/src/util.js", "web/lib/helpers.tsx"
        });
        const std::string from = "web/src/app.ts";

        EXPECT_EQ(resolver.resolve_one(from, Language::TypeScript, "./api"), (Files{"web/src/api/index.ts"}));
        EXPECT_EQ(resolver.resolve_one(from, Language::TypeScript, "./util.js"), (Files{"web/src/util.js"}));
        EXPECT_EQ(resolver.resolve_one(from, Language::TypeScript, "../lib/helpers"), (Files{"web/lib/helpers.tsx"}));
        EXPECT_TRUE(resolver.resolve_one(from, Language::TypeScript, "react").empty());
    }

    TEST(ImportResolverTest, GoPackageDirectoryExcludesTests) {
        const ImportResolver resolver({
            "cmd/server/main.go", "internal/store/store.go", "internal/store/store_test.go",
            "internal/store/cache.go"
        });

        EXPECT_EQ(resolver.resolve_one("cmd/server/main.go", Language::Go, "example.com/app/internal/store"),
                  (Files{"internal/store/cache.go", "internal/store/store.go"}));
        EXPECT_TRUE(resolver.resolve_one("cmd/server/main.go", Language::Go, "fmt").empty());
    }

    TEST(ImportResolverTest, RustModulePaths) {
        const ImportResolver resolver({"src/lib.rs", "src/model.rs", "src/parser/mod.rs", "src/parser/lexer.rs"});

        EXPECT_EQ(resolver.resolve_one("src/lib.rs", Language::Rust, "crate::model::Item"),
                  (Files{"src/model.rs"}));
        EXPECT_EQ(resolver.resolve_one("src/lib.rs", Language::Rust, "self::parser"),
                  (Files{"src/parser/mod.rs"}));
        EXPECT_EQ(resolver.resolve_one("src/parser/mod.rs", Language::Rust, "self::lexer"),
                  (Files{"src/parser/lexer.rs"}));
        EXPECT_EQ(resolver.resolve_one("src/parser/lexer.rs", Language::Rust, "crate::parser"),
                  (Files{"src/parser/mod.rs"}));
        EXPECT_TRUE(resolver.resolve_one("src/lib.rs", Language::Rust, "std::collections::HashMap").empty());
    }

    TEST(ImportResolverTest, LuaRequire) {
        const ImportResolver resolver({"lua/util/strings.lua", "lua/core/init.lua", "lua/main.lua"});

        EXPECT_EQ(resolver.resolve_one("lua/main.lua", Language::Lua, "util.strings"),
                  (Files{"lua/util/strings.lua"}));
        EXPECT_EQ(resolver.resolve_one("lua/main.lua", Language::Lua, "core"),
                  (Files{"lua/core/init.lua"}));
    }

    TEST(ImportResolverTest, ResolveNeverReturnsImporter) {
        const ImportResolver resolver({"src/a.cpp", "src/a.hpp"});

        EXPECT_EQ(resolver.resolve("src/a.cpp", Language::Cpp, {"a.cpp", "a.hpp", "string"}),
                  (Files{"src/a.hpp"}));
    }

    TEST(ImportResolverTest, SwiftImportsAreExternal) {
        const ImportResolver resolver({"Sources/App/Model.swift"});

        EXPECT_TRUE(resolver.resolve_one("Sources/App/View.swift", Language::Swift, "Model").empty());
    }
}
