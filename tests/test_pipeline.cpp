#include <catch2/catch_test_macros.hpp>
#include "core/pipeline.hpp"
#include "manifest/manifest_store.hpp"
#include "tmp_dir.hpp"

#include <filesystem>
#include <string>

using namespace redactor;
using redactor::testing::TmpDir;

namespace {

const std::string kScenario =
    "Contact a@b.com or c@d.com, call 555-123-4567, token: AAAAAAAAAAAAAAAAAAAAAAAABBBB";

RedactorConfig config_in(const TmpDir& tmp) {
    RedactorConfig config;
    config.manifest.manifest_path = tmp.path_of(".redactor/manifest.json");
    return config;
}

size_t occurrences(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

} // namespace

TEST_CASE("RedactionPipeline: preview", "[pipeline]") {
    TmpDir tmp("pipeline_preview");
    const RedactionPipeline pipeline(config_in(tmp));
    const auto input = tmp.file("notes.txt", kScenario);

    const auto r = pipeline.preview(input);
    REQUIRE(r.is_ok());
    const auto& doc = r.value();

    CHECK(doc["counts"]["email"] == 2);
    CHECK(doc["counts"]["phone"] == 1);
    CHECK(doc["counts"]["credential"] == 1);
    CHECK(doc["counts"]["url"] == 0);
    CHECK(doc["counts"]["keyword_line"] == 0);
    CHECK(doc["counts"]["total"] == 4);
    CHECK(doc["risk_flags"] == nlohmann::json::array({"POSSIBLE_PRIVATE_KEY"}));
    CHECK(doc["source"]["name"] == "notes.txt");
    CHECK(doc["source"]["size_bytes"] == kScenario.size());
    CHECK_FALSE(doc.contains("samples"));

    SECTION("Preview writes nothing") {
        CHECK_FALSE(std::filesystem::exists(pipeline.config().manifest.manifest_path));
        CHECK_FALSE(std::filesystem::exists(input + ".redacted.txt"));
    }

    SECTION("Samples on request") {
        const auto with = pipeline.preview(input, true);
        REQUIRE(with.is_ok());
        CHECK(with.value()["samples"]["email"] == nlohmann::json::array({"a@b.com", "c@d.com"}));
    }
}

TEST_CASE("RedactionPipeline: redact", "[pipeline]") {
    TmpDir tmp("pipeline_redact");
    const RedactionPipeline pipeline(config_in(tmp));
    const auto input = tmp.file("notes.txt", kScenario);

    const auto r = pipeline.redact(input);
    REQUIRE(r.is_ok());
    const auto& report = r.value();
    CHECK(report.output_path == input + ".redacted.txt");
    CHECK(report.substitutions == 8);
    CHECK(report.entries.size() == 8);
    CHECK(report.assessment.total == 4);
    CHECK(report.assessment.has_flag(RiskFlag::POSSIBLE_PRIVATE_KEY));

    const auto out = TmpDir::read(report.output_path);
    CHECK(out.find("a@b.com") == std::string::npos);
    CHECK(out.find("c@d.com") == std::string::npos);
    CHECK(out.find("555-123-4567") == std::string::npos);
    CHECK(out.find("AAAAAAAAAAAAAAAAAAAAAAAABBBB") == std::string::npos);
    CHECK(occurrences(out, "REDACTED:email:") == 2);
    CHECK(occurrences(out, "REDACTED:credential:") == 1);

    SECTION("Two distinct email placeholders") {
        const auto first = out.find("REDACTED:email:");
        const auto second = out.find("REDACTED:email:", first + 1);
        CHECK(out.substr(first, 31) != out.substr(second, 31));
    }

    SECTION("Input is untouched and a record exists") {
        CHECK(TmpDir::read(input) == kScenario);
        const auto manifest = ManifestStore::load(pipeline.config().manifest.manifest_path);
        REQUIRE(manifest.is_ok());
        REQUIRE(manifest.value().files.size() == 1);
        CHECK(manifest.value().files[0].output ==
              std::filesystem::canonical(report.output_path).string());
    }

    SECTION("Output may not be the input") {
        const auto again = pipeline.redact(input, input);
        REQUIRE(again.is_error());
        CHECK(again.error_category() == ErrorCategory::INVALID_PATH);
        CHECK(TmpDir::read(input) == kScenario);
    }
}

TEST_CASE("RedactionPipeline: input rejection happens before detection", "[pipeline]") {
    TmpDir tmp("pipeline_reject");
    const RedactionPipeline pipeline(config_in(tmp));

    const auto big = tmp.file("big.txt", std::string(3 * 1024 * 1024, 'a'));
    CHECK(pipeline.preview(big).error_category() == ErrorCategory::INPUT_TOO_LARGE);
    CHECK(pipeline.redact(big).error_category() == ErrorCategory::INPUT_TOO_LARGE);

    const auto bin = tmp.file("bin.dat", std::string("a@b.com\0", 8));
    CHECK(pipeline.redact(bin).error_category() == ErrorCategory::BINARY_UNSUPPORTED);
    CHECK_FALSE(std::filesystem::exists(pipeline.config().manifest.manifest_path));
}

TEST_CASE("RedactionPipeline: patch and verify", "[pipeline][patch]") {
    TmpDir tmp("pipeline_patch");
    const RedactionPipeline pipeline(config_in(tmp));
    const auto input = tmp.file("notes.txt", kScenario);
    const auto redacted = pipeline.redact(input);
    REQUIRE(redacted.is_ok());
    const auto expected = TmpDir::read(redacted.value().output_path);

    SECTION("Patch to a new file reproduces the redaction") {
        const auto out = tmp.path_of("patched.txt");
        const auto r = pipeline.patch(input, out);
        REQUIRE(r.is_ok());
        CHECK(r.value().state == PatchState::PATCHED);
        CHECK(r.value().substitutions == 8);
        CHECK(TmpDir::read(out) == expected);
    }

    SECTION("In-place patch") {
        const auto r = pipeline.patch(input, {}, true);
        REQUIRE(r.is_ok());
        CHECK(TmpDir::read(input) == expected);
    }

    SECTION("Overwriting the input requires in-place") {
        const auto r = pipeline.patch(input, input, false);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_PATH);
    }

    SECTION("Changed file is rejected and left alone") {
        tmp.file("notes.txt", kScenario + "\n");
        const auto r = pipeline.patch(input, {}, true);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::MANIFEST_MISMATCH);
        CHECK(TmpDir::read(input) == kScenario + "\n");
    }

    SECTION("Verify") {
        const auto ok = pipeline.verify(input);
        REQUIRE(ok.is_ok());
        CHECK(ok.value().ok);

        tmp.file("notes.txt", kScenario + "\n");
        const auto changed = pipeline.verify(input);
        REQUIRE(changed.is_ok());
        CHECK_FALSE(changed.value().ok);
        CHECK_FALSE(changed.value().hash_matches);
    }

    SECTION("No manifest") {
        std::filesystem::remove(pipeline.config().manifest.manifest_path);
        const auto r = pipeline.patch(input, tmp.path_of("patched.txt"));
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_MANIFEST);
    }
}

TEST_CASE("RedactionPipeline: directory scan", "[pipeline][dir]") {
    TmpDir tmp("pipeline_dir");
    auto config = config_in(tmp);
    config.input.max_bytes = 1024;
    config.manifest.max_input_bytes = 1024;
    const RedactionPipeline pipeline(config);

    const auto src = tmp.path / "src";
    tmp.file("src/a.txt", "owner a@b.com\n");
    tmp.file("src/nested/b.cfg", "api_key = hunter2\nurl = https://example.com/x\n");
    tmp.file("src/clean.txt", "nothing to see\n");
    tmp.file("src/big.txt", std::string(2048, 'x'));
    tmp.file("src/bin.dat", std::string("\0\1\2", 3));

    const auto out_dir = tmp.path_of("out");
    const auto r = pipeline.redact_directory(src.string(), out_dir);
    REQUIRE(r.is_ok());
    const auto& report = r.value();

    CHECK(report.files_scanned == 5);
    CHECK(report.files_with_findings == 2);
    CHECK(report.files_skipped == 2);
    CHECK(report.total_redactions == 3);

    CHECK(std::filesystem::exists(tmp.path / "out" / "a.txt.redacted.txt"));
    CHECK(std::filesystem::exists(tmp.path / "out" / "nested" / "b.cfg.redacted.txt"));
    CHECK_FALSE(std::filesystem::exists(tmp.path / "out" / "clean.txt.redacted.txt"));

    const auto b = TmpDir::read((tmp.path / "out" / "nested" / "b.cfg.redacted.txt").string());
    CHECK(b.find("hunter2") == std::string::npos);
    CHECK(b.find("https://example.com/x") == std::string::npos);

    const auto manifest = ManifestStore::load(pipeline.config().manifest.manifest_path);
    REQUIRE(manifest.is_ok());
    CHECK(manifest.value().files.size() == 2);

    SECTION("Outputs inside the tree are not rescanned") {
        const auto inner = pipeline.redact_directory(src.string(), (src / "redacted").string());
        REQUIRE(inner.is_ok());
        const auto again = pipeline.redact_directory(src.string(), (src / "redacted").string());
        REQUIRE(again.is_ok());
        CHECK(again.value().files_scanned == 5);
    }

    SECTION("Not a directory") {
        const auto bad = pipeline.redact_directory(tmp.path_of("src/a.txt"), out_dir);
        REQUIRE(bad.is_error());
        CHECK(bad.error_category() == ErrorCategory::INVALID_PATH);
    }
}

TEST_CASE("RedactionPipeline: directory scan honors .gitignore", "[pipeline][dir]") {
    TmpDir tmp("pipeline_gitignore");
    const RedactionPipeline pipeline(config_in(tmp));

    const auto repo = tmp.path / "repo";
    tmp.file("repo/.gitignore", "*.local\nbuild/\n");
    tmp.file("repo/app.txt", "owner a@b.com\n");
    tmp.file("repo/dev.local", "owner c@d.com\n");
    tmp.file("repo/build/out.txt", "owner e@f.com\n");
    tmp.file("repo/.git/config", "[remote \"origin\"]\n\turl = https://example.com/repo.git\n");

    const auto r = pipeline.redact_directory(repo.string(), tmp.path_of("out"));
    REQUIRE(r.is_ok());
    CHECK(r.value().files_scanned == 2);
    CHECK(r.value().files_with_findings == 1);
    CHECK(r.value().files_ignored == 1);

    const auto out = tmp.path / "out";
    CHECK(std::filesystem::exists(out / "app.txt.redacted.txt"));
    CHECK_FALSE(std::filesystem::exists(out / "dev.local.redacted.txt"));
    CHECK_FALSE(std::filesystem::exists(out / "build"));
    CHECK_FALSE(std::filesystem::exists(out / ".git"));

    const auto manifest = ManifestStore::load(pipeline.config().manifest.manifest_path);
    REQUIRE(manifest.is_ok());
    REQUIRE(manifest.value().files.size() == 1);
    CHECK(manifest.value().files[0].source_name == "app.txt");
}
