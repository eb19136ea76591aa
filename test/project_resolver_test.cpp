#include <catch2/catch_test_macros.hpp>
#include "project_resolver.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// Helper function to create temporary files for testing
void createTestFile(const fs::path& filePath, const std::string& content) {
    std::ofstream file(filePath);
    file << content;
    file.close();
}

TEST_CASE("ProjectResolver reads the module path from go.mod", "[ProjectResolver]") {
    fs::path tempDir = fs::temp_directory_path() / "gig_resolver_test";
    fs::remove_all(tempDir);
    fs::create_directories(tempDir / "internal" / "pkg");

    createTestFile(tempDir / "go.mod", "module github.com/test/project\n\ngo 1.21\n");
    createTestFile(tempDir / "internal" / "pkg" / "test.go", "package pkg\n");

    ProjectResolver resolver;

    SECTION("Finds go.mod in an ancestor directory") {
        REQUIRE(resolver.resolve(tempDir / "internal" / "pkg" / "test.go") == "github.com/test/project");
    }

    SECTION("Finds go.mod next to the file") {
        createTestFile(tempDir / "main.go", "package main\n");
        REQUIRE(resolver.resolve(tempDir / "main.go") == "github.com/test/project");
    }

    SECTION("Nearest go.mod wins") {
        createTestFile(tempDir / "internal" / "go.mod", "module github.com/test/nested\n");
        REQUIRE(resolver.resolve(tempDir / "internal" / "pkg" / "test.go") == "github.com/test/nested");
    }

    SECTION("Depth limit stops the walk") {
        ProjectResolver shallow(1);
        REQUIRE(shallow.resolve(tempDir / "internal" / "pkg" / "test.go").empty());
    }

    fs::remove_all(tempDir);
}

TEST_CASE("ProjectResolver::readModulePath parses the module directive", "[ProjectResolver]") {
    fs::path tempDir = fs::temp_directory_path() / "gig_resolver_gomod_test";
    fs::remove_all(tempDir);
    fs::create_directories(tempDir);

    SECTION("Module directive after comments") {
        createTestFile(tempDir / "go.mod", "// generated\n\nmodule   example.com/tool  \n\nrequire x v1.0.0\n");
        REQUIRE(ProjectResolver::readModulePath(tempDir / "go.mod") == "example.com/tool");
    }

    SECTION("No module directive") {
        createTestFile(tempDir / "go.mod", "go 1.21\n");
        REQUIRE(ProjectResolver::readModulePath(tempDir / "go.mod").empty());
    }

    SECTION("Missing file") {
        REQUIRE(ProjectResolver::readModulePath(tempDir / "missing.mod").empty());
    }

    fs::remove_all(tempDir);
}

TEST_CASE("ProjectResolver falls back to the GOPATH layout", "[ProjectResolver]") {
    ProjectResolver resolver;

    SECTION("Non-existent path without src yields nothing") {
        REQUIRE(resolver.resolve("/non/existent/path/file.go").empty());
    }

    SECTION("Three segments after /src/") {
        REQUIRE(resolver.resolve("/some/path/src/github.com/user/project/internal/file.go") ==
                "github.com/user/project");
    }

    SECTION("Too few segments after /src/") {
        REQUIRE(ProjectResolver::inferFromSourcePath("/some/path/src/github.com/file.go").empty());
    }
}
