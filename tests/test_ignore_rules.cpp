#include <catch2/catch_test_macros.hpp>
#include "core/ignore_rules.hpp"
#include "tmp_dir.hpp"

#include <string>

using namespace redactor;
using redactor::testing::TmpDir;

TEST_CASE("IgnoreRules: pattern forms", "[ignore]") {

    SECTION("Bare name matches at any depth") {
        const auto rules = IgnoreRules::parse("*.log\nnode_modules\n");
        CHECK(rules.is_ignored("app.log", false));
        CHECK(rules.is_ignored("logs/2024/app.log", false));
        CHECK(rules.is_ignored("web/node_modules", true));
        CHECK_FALSE(rules.is_ignored("app.log.txt", false));
        CHECK_FALSE(rules.is_ignored("notes.txt", false));
    }

    SECTION("Slash anchors to the root") {
        const auto rules = IgnoreRules::parse("/build\nconfig/local.toml\n");
        CHECK(rules.is_ignored("build", true));
        CHECK_FALSE(rules.is_ignored("src/build", true));
        CHECK(rules.is_ignored("config/local.toml", false));
        CHECK_FALSE(rules.is_ignored("other/config/local.toml", false));
    }

    SECTION("Trailing slash matches directories only") {
        const auto rules = IgnoreRules::parse("out/\n");
        CHECK(rules.is_ignored("out", true));
        CHECK(rules.is_ignored("pkg/out", true));
        CHECK_FALSE(rules.is_ignored("out", false));
    }

    SECTION("Double star spans directories") {
        const auto rules = IgnoreRules::parse("**/cache/*.bin\ndocs/**\n");
        CHECK(rules.is_ignored("cache/a.bin", false));
        CHECK(rules.is_ignored("x/y/cache/a.bin", false));
        CHECK(rules.is_ignored("docs/a/b.md", false));
        CHECK_FALSE(rules.is_ignored("docs", true));
    }

    SECTION("Negation re-includes; last match wins") {
        const auto rules = IgnoreRules::parse("*.env\n!example.env\n");
        CHECK(rules.is_ignored("prod.env", false));
        CHECK_FALSE(rules.is_ignored("example.env", false));
    }

    SECTION("Character classes and single-character wildcards") {
        const auto rules = IgnoreRules::parse("tmp[0-9]\nfile?.txt\n[!a]*.bak\n");
        CHECK(rules.is_ignored("tmp7", false));
        CHECK_FALSE(rules.is_ignored("tmpx", false));
        CHECK(rules.is_ignored("file1.txt", false));
        CHECK_FALSE(rules.is_ignored("file10.txt", false));
        CHECK(rules.is_ignored("b.bak", false));
        CHECK_FALSE(rules.is_ignored("a.bak", false));
    }

    SECTION("Comments, blanks and escapes") {
        const auto rules = IgnoreRules::parse("# comment\n\n   \n\\#literal\r\n");
        CHECK(rules.size() == 1);
        CHECK(rules.is_ignored("#literal", false));
    }
}

TEST_CASE("IgnoreRules: loading from a directory", "[ignore]") {
    TmpDir tmp("ignore_load");

    SECTION("No file means no rules") {
        const auto r = IgnoreRules::load(tmp.path.string());
        REQUIRE(r.is_ok());
        CHECK(r.value().empty());
    }

    SECTION("Rules read from .gitignore") {
        tmp.file(".gitignore", "secrets/\n*.pem\n");
        const auto r = IgnoreRules::load(tmp.path.string());
        REQUIRE(r.is_ok());
        CHECK(r.value().size() == 2);
        CHECK(r.value().is_ignored("keys/server.pem", false));
    }
}
