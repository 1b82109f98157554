#include <catch2/catch_test_macros.hpp>
#include "pattern_matcher.hpp"
#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("PatternMatcher constructor adds default ignored directories", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Default ignored directories work") {
        REQUIRE(matcher.isIgnored(".git/config"));
        REQUIRE(matcher.isIgnored("node_modules/react/index.js"));
        REQUIRE(matcher.isIgnored("build/main.cpp"));
        REQUIRE(matcher.isIgnored("bin/tool.sh"));
        REQUIRE(matcher.isIgnored("src/__pycache__/module.py"));
        REQUIRE(matcher.isIgnored("venv/lib/site.py"));
        REQUIRE(matcher.isIgnored("web/dist/bundle.js"));
    }

    SECTION("Non-ignored files are not matched") {
        REQUIRE_FALSE(matcher.isIgnored("src/main.cpp"));
        REQUIRE_FALSE(matcher.isIgnored("README.md"));
        REQUIRE_FALSE(matcher.isIgnored("src/utils/helper.h"));
        REQUIRE_FALSE(matcher.isIgnored("src/builder.py"));
    }

    SECTION("Only directories are matched by name") {
        REQUIRE_FALSE(matcher.isIgnored("build"));
        REQUIRE_FALSE(matcher.isIgnored("tools/dist.py"));
    }
}

TEST_CASE("PatternMatcher can add custom patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Adding wildcard patterns") {
        matcher.addIgnorePattern("*.txt");
        REQUIRE(matcher.isIgnored("file.txt"));
        REQUIRE(matcher.isIgnored("path/to/file.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file.md"));
    }

    SECTION("Adding directory patterns") {
        matcher.addIgnorePattern("generated/**");
        REQUIRE(matcher.isIgnored("generated/api.cpp"));
        REQUIRE(matcher.isIgnored("generated/proto/api.pb.cc"));
        REQUIRE_FALSE(matcher.isIgnored("src/generated.cpp"));
    }

    SECTION("Trailing slash names a directory") {
        matcher.addIgnorePattern("docs/");
        REQUIRE(matcher.isIgnored("docs/guide.md"));
        REQUIRE_FALSE(matcher.isIgnored("src/docs.py"));
    }

    SECTION("Adding specific file patterns") {
        matcher.addIgnorePattern("src/secret.py");
        REQUIRE(matcher.isIgnored("src/secret.py"));
        REQUIRE_FALSE(matcher.isIgnored("secret.py"));
        REQUIRE_FALSE(matcher.isIgnored("src/not_secret.py"));
    }

    SECTION("Adding ignored directories") {
        matcher.addIgnoredDirectory("vendor");
        REQUIRE(matcher.isIgnored("vendor/lib/util.go"));
        REQUIRE_FALSE(matcher.isIgnored("src/vendor.go"));
    }
}

TEST_CASE("PatternMatcher glob syntax", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("* wildcard") {
        matcher.addIgnorePattern("*.min.js");
        REQUIRE(matcher.isIgnored("vendor.min.js"));
        REQUIRE(matcher.isIgnored("static/app.min.js"));
        REQUIRE_FALSE(matcher.isIgnored("app.js"));
        REQUIRE_FALSE(matcher.isIgnored("app.min.js/index.py"));
    }

    SECTION("? wildcard") {
        matcher.addIgnorePattern("migration_?.py");
        REQUIRE(matcher.isIgnored("migration_1.py"));
        REQUIRE(matcher.isIgnored("db/migration_a.py"));
        REQUIRE_FALSE(matcher.isIgnored("migration_.py"));
        REQUIRE_FALSE(matcher.isIgnored("migration_12.py"));
    }

    SECTION("** wildcard") {
        matcher.addIgnorePattern("app/**/fixtures.py");
        REQUIRE(matcher.isIgnored("app/fixtures.py"));
        REQUIRE(matcher.isIgnored("app/orders/fixtures.py"));
        REQUIRE(matcher.isIgnored("app/orders/tests/fixtures.py"));
        REQUIRE_FALSE(matcher.isIgnored("lib/fixtures.py"));
        REQUIRE_FALSE(matcher.isIgnored("app/fixtures.py/conftest.py"));
    }

    SECTION("Regex characters are literal") {
        matcher.addIgnorePattern("a+b(1).py");
        REQUIRE(matcher.isIgnored("a+b(1).py"));
        REQUIRE_FALSE(matcher.isIgnored("aab1.py"));
    }
}

TEST_CASE("PatternMatcher include and exclude lists", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Everything is included without include patterns") {
        REQUIRE_FALSE(matcher.hasIncludePatterns());
        REQUIRE(matcher.isIncluded("any/file.rs"));
    }

    SECTION("Comma-separated include patterns") {
        matcher.setIncludePatterns("*.py, src/**/*.js");

        REQUIRE(matcher.hasIncludePatterns());
        REQUIRE(matcher.shouldProcess("app.py"));
        REQUIRE(matcher.shouldProcess("pkg/app.py"));
        REQUIRE(matcher.shouldProcess("src/index.js"));
        REQUIRE(matcher.shouldProcess("src/ui/button.js"));
        REQUIRE_FALSE(matcher.shouldProcess("lib/index.js"));
        REQUIRE_FALSE(matcher.shouldProcess("main.cpp"));
    }

    SECTION("Excludes win over includes") {
        matcher.setIncludePatterns("*.py");
        matcher.setExcludePatterns("*_test.py,scripts/**");

        REQUIRE(matcher.shouldProcess("app.py"));
        REQUIRE_FALSE(matcher.shouldProcess("app_test.py"));
        REQUIRE_FALSE(matcher.shouldProcess("scripts/deploy.py"));
        REQUIRE_FALSE(matcher.shouldProcess("node_modules/pkg/setup.py"));
    }

    SECTION("Empty entries are skipped") {
        matcher.setIncludePatterns(" , ,");
        REQUIRE_FALSE(matcher.hasIncludePatterns());
    }
}
