#include <catch2/catch_test_macros.hpp>
#include "go_syntax.hpp"
#include <stdexcept>

TEST_CASE("GoParser extracts import specs", "[GoParser]") {
    GoParser parser;

    const std::string source = R"(package test

import (
	"fmt" // test comment
	alias "github.com/pkg/errors"
	_ "github.com/lib/pq"
	. "github.com/onsi/ginkgo/v2"
)
)";

    SyntaxTree tree = parser.parse(source);

    REQUIRE(tree.packageName == "test");
    REQUIRE(tree.declarations.size() == 1);
    REQUIRE(tree.declarations[0].isImport());
    REQUIRE(tree.importCount() == 4);

    const auto& specs = tree.declarations[0].specs;
    REQUIRE(specs[0].path == "fmt");
    REQUIRE(specs[0].alias.empty());
    REQUIRE(specs[0].comment == "test comment");

    REQUIRE(specs[1].path == "github.com/pkg/errors");
    REQUIRE(specs[1].alias == "alias");
    REQUIRE(specs[1].comment.empty());

    REQUIRE(specs[2].path == "github.com/lib/pq");
    REQUIRE(specs[2].alias == "_");

    REQUIRE(specs[3].path == "github.com/onsi/ginkgo/v2");
    REQUIRE(specs[3].alias == ".");
}

TEST_CASE("GoParser handles single and repeated import declarations", "[GoParser]") {
    GoParser parser;

    SECTION("Single import with trailing comment") {
        const std::string source = "package main\n\nimport \"fmt\" // printing\n\nfunc main() {}\n";
        SyntaxTree tree = parser.parse(source);

        REQUIRE(tree.declarations.size() == 2);
        REQUIRE(tree.declarations[0].isImport());
        REQUIRE(tree.declarations[0].specs.size() == 1);
        REQUIRE(tree.declarations[0].specs[0].path == "fmt");
        REQUIRE(tree.declarations[0].specs[0].comment == "printing");
        REQUIRE_FALSE(tree.declarations[1].isImport());
        REQUIRE(printSource(tree) == source);
    }

    SECTION("Several import declarations") {
        const std::string source =
            "package main\n\nimport \"os\"\nimport (\n\t\"fmt\"\n)\nimport x \"example.com/x\"\n";
        SyntaxTree tree = parser.parse(source);

        REQUIRE(tree.declarations.size() == 3);
        REQUIRE(tree.importCount() == 3);
        REQUIRE(tree.declarations[2].specs[0].alias == "x");
    }

    SECTION("Raw string import path") {
        SyntaxTree tree = parser.parse("package main\n\nimport `fmt`\n");
        REQUIRE(tree.declarations[0].specs[0].path == "fmt");
    }

    SECTION("No imports") {
        SyntaxTree tree = parser.parse("package main\n\nfunc main() {}\n");
        REQUIRE(tree.importCount() == 0);
        REQUIRE(tree.declarations.size() == 1);
    }
}

TEST_CASE("GoParser separates trailing and free-standing import comments", "[GoParser]") {
    GoParser parser;

    const std::string source =
        "package main\n"
        "\n"
        "import (\n"
        "\t// Logging\n"
        "\t\"log\" // std logger\n"
        "\n"
        "\t/* Formatting */\n"
        "\t\"fmt\" /* first line\n"
        "\t   second line */\n"
        ")\n";

    SyntaxTree tree = parser.parse(source);
    const Declaration& decl = tree.declarations[0];

    REQUIRE(decl.specs.size() == 2);
    REQUIRE(decl.specs[0].comment == "std logger");
    REQUIRE(decl.specs[1].comment == "first line\n\t   second line");
    REQUIRE(decl.detachedComments == std::vector<std::string>{"// Logging", "/* Formatting */"});
    REQUIRE(printSource(tree) == source);

    SECTION("Comment after a whole import list") {
        SyntaxTree listed = parser.parse("package main\n\nimport (\n\t\"fmt\"\n) // grouped\n");
        REQUIRE(listed.declarations[0].specs[0].comment.empty());
        REQUIRE(listed.declarations[0].detachedComments == std::vector<std::string>{"// grouped"});
    }
}

TEST_CASE("GoParser keeps the file byte for byte", "[GoParser]") {
    GoParser parser;

    const std::string source = R"(// Copyright 2024 Example Authors.

//go:build linux

// Package demo does things.
package demo

import (
	"strings"

	"fmt" /* block */
)

// Doc comment stays with the type.
type T struct {
	Name string // field
}

var x = 1

func (t T) String() string {
	return strings.ToUpper(fmt.Sprint(t.Name))
}

// trailing comment
)";

    SyntaxTree tree = parser.parse(source);

    REQUIRE(tree.packageName == "demo");
    REQUIRE(tree.header.find("//go:build linux") != std::string::npos);
    REQUIRE(tree.header.find("package demo") != std::string::npos);
    REQUIRE(tree.declarations.size() == 4);
    REQUIRE(tree.declarations[0].specs[1].comment == "block");
    REQUIRE(tree.declarations[1].leading.find("// Doc comment stays with the type.") != std::string::npos);
    REQUIRE(tree.trailer.find("// trailing comment") != std::string::npos);
    REQUIRE(printSource(tree) == source);
}

TEST_CASE("GoParser rejects invalid sources", "[GoParser]") {
    GoParser parser;

    SECTION("Syntax error") {
        const std::string source = "package main\n\nimport (\n\t\"fmt\"\n\nfunc main() {\n";
        REQUIRE_THROWS_AS(parser.parse(source), std::runtime_error);
        REQUIRE_FALSE(parser.isValid(source));
    }

    SECTION("Missing package clause") {
        REQUIRE_THROWS_AS(parser.parse("func main() {}\n"), std::runtime_error);
        REQUIRE_FALSE(parser.isValid("func main() {}\n"));
    }

    SECTION("Valid source") {
        REQUIRE(parser.isValid("package main\n\nimport \"fmt\"\n"));
    }
}

TEST_CASE("commentText strips comment markers", "[GoParser]") {
    REQUIRE(commentText("// hello") == "hello");
    REQUIRE(commentText("//hello  ") == "hello");
    REQUIRE(commentText("/* block */") == "block");
    REQUIRE(commentText("//") == "");
    REQUIRE(commentText("plain") == "plain");
}
