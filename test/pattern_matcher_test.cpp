#include <catch2/catch_test_macros.hpp>
#include "pattern_matcher.hpp"
#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("PatternMatcher constructor adds default patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Go files are included") {
        REQUIRE(matcher.shouldProcess("main.go"));
        REQUIRE(matcher.shouldProcess("pkg/server/server.go"));
        REQUIRE(matcher.shouldProcess("pkg/server/server_test.go"));
    }

    SECTION("Other files are not included") {
        REQUIRE_FALSE(matcher.shouldProcess("README.md"));
        REQUIRE_FALSE(matcher.shouldProcess("go.mod"));
        REQUIRE_FALSE(matcher.shouldProcess("main.go.orig"));
    }

    SECTION("Vendored and hidden directories are ignored") {
        REQUIRE(matcher.isIgnoredDirectory("vendor"));
        REQUIRE(matcher.isIgnoredDirectory("pkg/vendor"));
        REQUIRE(matcher.isIgnoredDirectory(".git"));
        REQUIRE(matcher.isIgnoredDirectory(".idea"));
        REQUIRE(matcher.isIgnored("vendor/github.com/pkg/errors/errors.go"));
        REQUIRE(matcher.isIgnored(".cache/gen.go"));
        REQUIRE_FALSE(matcher.shouldProcess("vendor/lib/lib.go"));
    }

    SECTION("Directory rules do not apply to file names") {
        REQUIRE_FALSE(matcher.isIgnored(".hidden.go"));
        REQUIRE_FALSE(matcher.isIgnored("vendor.go"));
        REQUIRE_FALSE(matcher.isIgnoredDirectory("pkg"));
        REQUIRE_FALSE(matcher.isIgnoredDirectory("vendored"));
    }
}

TEST_CASE("PatternMatcher can add custom patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Adding wildcard patterns") {
        matcher.addIgnorePattern("*_gen.go");
        REQUIRE(matcher.isIgnored("types_gen.go"));
        REQUIRE(matcher.isIgnored("path/to/types_gen.go"));
        REQUIRE_FALSE(matcher.isIgnored("types.go"));
    }

    SECTION("Adding directory patterns") {
        matcher.addIgnorePattern("build/**");
        REQUIRE(matcher.isIgnored("build/main.go"));
        REQUIRE(matcher.isIgnored("build/obj/main.go"));
        REQUIRE_FALSE(matcher.isIgnored("src/build.go"));
    }

    SECTION("Adding specific file patterns") {
        matcher.addIgnorePattern("internal/secret.go");
        REQUIRE(matcher.isIgnored("internal/secret.go"));
        REQUIRE_FALSE(matcher.isIgnored("secret.go"));
        REQUIRE_FALSE(matcher.isIgnored("internal/not_secret.go"));
    }

    SECTION("Adding include patterns") {
        matcher.addIncludePattern("*.go.tmpl");
        REQUIRE(matcher.isIncluded("main.go.tmpl"));
        REQUIRE(matcher.isIncluded("main.go"));
        REQUIRE_FALSE(matcher.isIncluded("main.tmpl"));
    }
}

TEST_CASE("PatternMatcher reads comma-separated patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Exclude patterns are added to the defaults") {
        matcher.setExcludePatterns("*_gen.go, testdata/ ,,internal/gen/**");
        REQUIRE(matcher.isIgnored("api_gen.go"));
        REQUIRE(matcher.isIgnoredDirectory("testdata"));
        REQUIRE(matcher.isIgnored("pkg/testdata/input.go"));
        REQUIRE(matcher.isIgnored("internal/gen/models/user.go"));
        REQUIRE(matcher.isIgnoredDirectory("vendor"));
        REQUIRE(matcher.shouldProcess("pkg/api.go"));
    }

    SECTION("Blank exclude list adds nothing") {
        matcher.setExcludePatterns(" , ,");
        REQUIRE(matcher.shouldProcess("main.go"));
        REQUIRE(matcher.shouldProcess("pkg/testdata/input.go"));
    }
}

TEST_CASE("PatternMatcher properly converts patterns to regex", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("* wildcard") {
        matcher.addIgnorePattern("*.pb.go");
        REQUIRE(matcher.isIgnored("api.pb.go"));
        REQUIRE(matcher.isIgnored("proto/service.pb.go"));
        REQUIRE_FALSE(matcher.isIgnored("api.go"));
        REQUIRE_FALSE(matcher.isIgnored("apixpbxgo"));
    }

    SECTION("? wildcard") {
        matcher.addIgnorePattern("file?.go");
        REQUIRE(matcher.isIgnored("file1.go"));
        REQUIRE(matcher.isIgnored("fileA.go"));
        REQUIRE_FALSE(matcher.isIgnored("file.go"));
        REQUIRE_FALSE(matcher.isIgnored("file12.go"));
    }

    SECTION("** wildcard") {
        matcher.addIgnorePattern("src/**/test");
        REQUIRE(matcher.isIgnored("src/test"));
        REQUIRE(matcher.isIgnored("src/foo/test"));
        REQUIRE(matcher.isIgnored("src/foo/bar/test"));
        REQUIRE_FALSE(matcher.isIgnored("foo/test"));
        REQUIRE_FALSE(matcher.isIgnored("src/test/foo"));
    }

    SECTION("Anchored directory pattern") {
        matcher.addIgnorePattern("/tools/");
        REQUIRE(matcher.isIgnoredDirectory("tools"));
        REQUIRE(matcher.isIgnored("tools/gen/main.go"));
        REQUIRE_FALSE(matcher.isIgnoredDirectory("cmd/tools"));
    }
}
