#include <catch2/catch_test_macros.hpp>
#include "core/file_source.hpp"
#include "tmp_dir.hpp"

#include <filesystem>
#include <string>

using namespace redactor;
using redactor::testing::TmpDir;

TEST_CASE("FileSource: rejects invalid inputs", "[file_source]") {
    TmpDir tmp("file_source");
    FileSource source;

    SECTION("3 MiB file is too large") {
        const auto path = tmp.file("big.txt", std::string(3 * 1024 * 1024, 'a'));
        const auto r = source.load(path);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INPUT_TOO_LARGE);
    }

    SECTION("Exactly the limit is accepted") {
        FileSource small(16);
        const auto path = tmp.file("edge.txt", std::string(16, 'a'));
        CHECK(small.load(path).is_ok());
        const auto over = tmp.file("over.txt", std::string(17, 'a'));
        CHECK(small.load(over).error_category() == ErrorCategory::INPUT_TOO_LARGE);
    }

    SECTION("Null byte is binary") {
        const auto path = tmp.file("bin.dat", std::string("abc\0def", 7));
        const auto r = source.load(path);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::BINARY_UNSUPPORTED);
    }

    SECTION("Missing file") {
        const auto r = source.load(tmp.path_of("nope.txt"));
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_PATH);
    }

    SECTION("Directory is not a regular file") {
        const auto r = source.load(tmp.path.string());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INVALID_PATH);
    }
}

TEST_CASE("FileSource: loads text", "[file_source]") {
    TmpDir tmp("file_source_ok");
    FileSource source;

    const auto path = tmp.file("notes.txt", "hello\r\nworld\xff\n");
    const auto r = source.load(path);
    REQUIRE(r.is_ok());
    CHECK(r.value().bytes == "hello\r\nworld\xff\n");
    CHECK(r.value().name == "notes.txt");
    CHECK(r.value().identity == std::filesystem::canonical(path).string());

    SECTION("Identity does not depend on how the path is spelled") {
        const auto dotted = (tmp.path / "." / "notes.txt").string();
        CHECK(FileSource::identity_of(dotted) == r.value().identity);
    }

    SECTION("Empty file is valid") {
        const auto empty = tmp.file("empty.txt", "");
        const auto e = source.load(empty);
        REQUIRE(e.is_ok());
        CHECK(e.value().bytes.empty());
    }
}

TEST_CASE("FileSource: atomic write", "[file_source]") {
    TmpDir tmp("file_source_write");

    const auto target = tmp.path_of("nested/dir/out.txt");
    REQUIRE(FileSource::write_atomic(target, "first").is_ok());
    CHECK(TmpDir::read(target) == "first");

    REQUIRE(FileSource::write_atomic(target, "second").is_ok());
    CHECK(TmpDir::read(target) == "second");
    CHECK_FALSE(std::filesystem::exists(target + ".tmp"));
}
