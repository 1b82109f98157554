#include <catch2/catch_test_macros.hpp>
#include "language_handler.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace {

bool hasComponent(const std::vector<ComponentRecord>& components, const std::string& name, ComponentKind kind) {
    return std::any_of(components.begin(), components.end(), [&](const ComponentRecord& c) {
        return c.name == name && c.kind == kind;
    });
}

bool hasName(const std::vector<ComponentRecord>& components, const std::string& name) {
    return std::any_of(components.begin(), components.end(), [&](const ComponentRecord& c) {
        return c.name == name;
    });
}

} // namespace

TEST_CASE("Control keywords are recognized", "[LanguageHandler]") {
    REQUIRE(isControlKeyword("if"));
    REQUIRE(isControlKeyword("for"));
    REQUIRE(isControlKeyword("while"));
    REQUIRE(isControlKeyword("switch"));
    REQUIRE(isControlKeyword("catch"));
    REQUIRE(isControlKeyword("return"));
    REQUIRE(isControlKeyword("sizeof"));
    REQUIRE_FALSE(isControlKeyword("main"));
    REQUIRE_FALSE(isControlKeyword("iffy"));
}

TEST_CASE("CppHandler extracts structure", "[LanguageHandler]") {
    CppHandler handler;

    const std::string source =
        "#include <vector>\n"
        "#include \"widget.hpp\"\n"
        "#  include <map>\n"
        "#include <vector>\n"
        "\n"
        "class Widget;\n"
        "enum class Color { Red, Green };\n"
        "\n"
        "class Button : public Widget {\n"
        "public:\n"
        "    int size() const { return size_; }\n"
        "};\n"
        "\n"
        "struct Point {\n"
        "    int x;\n"
        "};\n"
        "\n"
        "int main(int argc, char** argv) {\n"
        "    if (argc > 1) {\n"
        "        for (int i = 0; i < argc; ++i) {\n"
        "        }\n"
        "    }\n"
        "    while (false) {\n"
        "    }\n"
        "    return argc > 2 ? 1 : 0;\n"
        "}\n";

    SECTION("Components") {
        auto components = handler.extractComponents(source);

        REQUIRE(hasComponent(components, "main", ComponentKind::Function));
        REQUIRE(hasComponent(components, "size", ComponentKind::Function));
        REQUIRE(hasComponent(components, "Button", ComponentKind::Class));
        REQUIRE(hasComponent(components, "Point", ComponentKind::Struct));

        // Forward declarations and enum classes are not definitions
        REQUIRE_FALSE(hasName(components, "Widget"));
        REQUIRE_FALSE(hasName(components, "Color"));
    }

    SECTION("Control keywords never become components") {
        auto components = handler.extractComponents(source);

        REQUIRE_FALSE(hasName(components, "if"));
        REQUIRE_FALSE(hasName(components, "for"));
        REQUIRE_FALSE(hasName(components, "while"));
    }

    SECTION("Includes are deduplicated in first-seen order") {
        auto dependencies = handler.extractDependencies(source);

        REQUIRE(dependencies == std::vector<std::string>{"vector", "widget.hpp", "map"});
    }

    SECTION("Complexity counts branches, loops and ternaries") {
        // 1 + if + for + while + ternary
        REQUIRE(handler.estimateComplexity(source) == 5.0);
    }

    SECTION("analyze marks the result as handled") {
        auto analysis = handler.analyze(source, "main.cpp");

        REQUIRE(analysis.handled);
        REQUIRE(analysis.error.empty());
        REQUIRE(analysis.complexity == 5.0);
        REQUIRE(analysis.hasComplexitySample());
    }
}

TEST_CASE("CppHandler complexity baseline is 1", "[LanguageHandler]") {
    CppHandler handler;

    REQUIRE(handler.estimateComplexity("") == 1.0);
    REQUIRE(handler.estimateComplexity("int add(int a, int b) { return a + b; }") == 1.0);
}

TEST_CASE("JavaHandler extracts structure", "[LanguageHandler]") {
    JavaHandler handler;

    const std::string source =
        "package com.example;\n"
        "\n"
        "import java.util.List;\n"
        "import static org.junit.Assert.assertEquals;\n"
        "import java.io.*;\n"
        "\n"
        "public class OrderService {\n"
        "    private final List<String> orders;\n"
        "\n"
        "    public List<String> findAll() {\n"
        "        return orders;\n"
        "    }\n"
        "\n"
        "    private static int count(String value) throws IllegalStateException {\n"
        "        if (value == null) {\n"
        "            return 0;\n"
        "        }\n"
        "        try {\n"
        "            return value.length();\n"
        "        } catch (RuntimeException e) {\n"
        "            return -1;\n"
        "        }\n"
        "    }\n"
        "}\n"
        "\n"
        "interface Repository {}\n"
        "enum Status { OPEN, CLOSED }\n";

    SECTION("Components") {
        auto components = handler.extractComponents(source);

        REQUIRE(hasComponent(components, "OrderService", ComponentKind::Class));
        REQUIRE(hasComponent(components, "Repository", ComponentKind::Class));
        REQUIRE(hasComponent(components, "Status", ComponentKind::Class));
        REQUIRE(hasComponent(components, "findAll", ComponentKind::Method));
        REQUIRE(hasComponent(components, "count", ComponentKind::Method));
        REQUIRE_FALSE(hasName(components, "if"));
    }

    SECTION("Imports") {
        auto dependencies = handler.extractDependencies(source);

        REQUIRE(dependencies == std::vector<std::string>{
            "java.util.List", "org.junit.Assert.assertEquals", "java.io.*"});
    }

    SECTION("Complexity") {
        // 1 + if + catch
        REQUIRE(handler.estimateComplexity(source) == 3.0);
    }
}

TEST_CASE("JavaScriptHandler extracts structure", "[LanguageHandler]") {
    JavaScriptHandler handler;

    const std::string source =
        "import React from 'react';\n"
        "import { useState } from \"react\";\n"
        "import './styles.css';\n"
        "const path = require('path');\n"
        "\n"
        "function loadConfig(name) {\n"
        "  if (!name) {\n"
        "    return null;\n"
        "  }\n"
        "  return name;\n"
        "}\n"
        "\n"
        "const handler = async (req, res) => {\n"
        "  try {\n"
        "    res.send(req.user?.name ?? 'anonymous');\n"
        "  } catch {\n"
        "    res.status(500);\n"
        "  }\n"
        "};\n"
        "\n"
        "class Store {}\n"
        "\n"
        "const Header: React.FC = () => null;\n";

    SECTION("Components") {
        auto components = handler.extractComponents(source);

        REQUIRE(hasComponent(components, "loadConfig", ComponentKind::Function));
        REQUIRE(hasComponent(components, "handler", ComponentKind::Function));
        REQUIRE(hasComponent(components, "Store", ComponentKind::Class));
        REQUIRE(hasComponent(components, "Header", ComponentKind::Component));
    }

    SECTION("Imports and requires") {
        auto dependencies = handler.extractDependencies(source);

        REQUIRE(dependencies == std::vector<std::string>{"react", "./styles.css", "path"});
    }

    SECTION("Optional chaining and nullish coalescing are not branches") {
        // 1 + if + catch
        REQUIRE(handler.estimateComplexity(source) == 3.0);
    }
}

TEST_CASE("Text prepared for pattern matching", "[LanguageHandler]") {
    SECTION("Overlong lines are blanked") {
        std::string content = "a\n" + std::string(kMaxMatchedLineLength + 1, 'x') + "\nb\n";
        REQUIRE(prepareForMatching(content) == "a\n\nb\n");
    }

    SECTION("Lines at the limit are kept") {
        std::string line(kMaxMatchedLineLength, 'x');
        REQUIRE(prepareForMatching(line + "\n") == line + "\n");
    }

    SECTION("Runs of blank lines collapse") {
        REQUIRE(prepareForMatching("a\n\n  \n\t\nb") == "a\n\nb");
    }

    SECTION("Custom limit") {
        REQUIRE(prepareForMatching("short\nlonger line\n", 5) == "short\n\n");
    }
}

TEST_CASE("Regex handlers survive minified and unterminated input", "[LanguageHandler]") {
    SECTION("Minified JavaScript on a single line") {
        JavaScriptHandler handler;
        std::string content = "import React from 'react';";
        while (content.size() < 110 * 1024) {
            content += "function f(a){if(a){return a?1:2}};const g=(x)=>x;";
        }

        FileAnalysis analysis;
        REQUIRE_NOTHROW(analysis = handler.analyze(content, "dist/bundle.min.js"));
        REQUIRE(analysis.handled);
        REQUIRE(analysis.error.empty());
        REQUIRE(analysis.components.empty());
        REQUIRE(analysis.dependencies.empty());
        REQUIRE(analysis.complexity == 1.0);
    }

    SECTION("Readable lines around a minified one still count") {
        JavaScriptHandler handler;
        std::string content = "function before() {}\n";
        content += "var x=" + std::string(200 * 1024, '1') + ";\n";
        content += "function after() {}\n";

        auto analysis = handler.analyze(content, "mixed.js");
        REQUIRE(hasComponent(analysis.components, "before", ComponentKind::Function));
        REQUIRE(hasComponent(analysis.components, "after", ComponentKind::Function));
    }

    SECTION("Parameter list that never closes on one line") {
        CppHandler handler;
        std::string content = "int f(";
        for (int i = 0; i < 200000; ++i) {
            content += "a, ";
        }

        FileAnalysis analysis;
        REQUIRE_NOTHROW(analysis = handler.analyze(content, "broken.cpp"));
        REQUIRE(analysis.error.empty());
        REQUIRE(analysis.components.empty());
        REQUIRE(analysis.complexity == 1.0);
    }

    SECTION("Parameter list that never closes across lines") {
        CppHandler handler;
        std::string content = "#include <map>\nint f(\n";
        for (int i = 0; i < 50000; ++i) {
            content += "    a,\n";
        }

        auto analysis = handler.analyze(content, "broken.cpp");
        REQUIRE(analysis.error.empty());
        REQUIRE(analysis.components.empty());
        REQUIRE(analysis.dependencies == std::vector<std::string>{"map"});
    }
}

TEST_CASE("Generic wildcards are not ternaries", "[LanguageHandler]") {
    JavaHandler handler;

    const std::string source =
        "class Registry {\n"
        "    void put(boolean flag) {\n"
        "        Map<String, ? extends Number> values = flag ? small : large;\n"
        "        Map< ? super Integer, List<?>> sinks = null;\n"
        "    }\n"
        "}\n";

    // 1 + the one real ternary
    REQUIRE(handler.estimateComplexity(source) == 2.0);
}

TEST_CASE("Regex handlers stop when cancelled", "[LanguageHandler]") {
    CancellationToken token;
    token.cancel();

    CppHandler cpp;
    REQUIRE_THROWS_AS(cpp.analyze("int f() { return 0; }\n", "a.cpp", token), AnalysisCancelled);

    JavaScriptHandler js;
    REQUIRE_THROWS_AS(js.analyze("function f() {}\n", "a.js", token), AnalysisCancelled);
}
