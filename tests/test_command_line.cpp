#include <catch2/catch_test_macros.hpp>
#include "cli/command_line.hpp"

#include <string>
#include <vector>

using namespace redactor;

namespace {

CommandLineParser::ParseResult parse(std::vector<std::string> args) {
    return CommandLineParser::parse(args);
}

} // namespace

TEST_CASE("CommandLineParser: accepted forms", "[cli]") {

    SECTION("Global config before the command") {
        const auto r = parse({"--config", "redactor.toml", "scan", "notes.txt", "--samples"});
        REQUIRE(r.success);
        CHECK(r.command_line.config_file == "redactor.toml");
        CHECK(r.command_line.command == "scan");
        CHECK(r.command_line.target == "notes.txt");
        CHECK(r.command_line.samples);
    }

    SECTION("Each output flag with its own command") {
        const auto redact = parse({"redact", "notes.txt", "--out", "clean.txt"});
        REQUIRE(redact.success);
        CHECK(redact.command_line.out == "clean.txt");

        const auto dir = parse({"scan-dir", "src", "--out-dir", "clean"});
        REQUIRE(dir.success);
        CHECK(dir.command_line.out_dir == "clean");
        CHECK(dir.command_line.out.empty());

        const auto patch = parse({"patch", "notes.txt", "--in-place"});
        REQUIRE(patch.success);
        CHECK(patch.command_line.in_place);
    }
}

TEST_CASE("CommandLineParser: usage errors", "[cli]") {

    SECTION("Output flag belonging to another command") {
        const auto redact = parse({"redact", "notes.txt", "--out-dir", "x"});
        REQUIRE_FALSE(redact.success);
        CHECK(redact.error_message.find("--out-dir") != std::string::npos);

        const auto dir = parse({"scan-dir", "src", "--out", "x"});
        REQUIRE_FALSE(dir.success);
        CHECK(dir.error_message.find("--out") != std::string::npos);

        CHECK_FALSE(parse({"verify", "notes.txt", "--out", "x"}).success);
        CHECK_FALSE(parse({"scan", "notes.txt", "--out-dir", "x"}).success);
    }

    SECTION("Patch needs exactly one destination") {
        CHECK_FALSE(parse({"patch", "notes.txt"}).success);
        CHECK_FALSE(parse({"patch", "notes.txt", "--out", "a", "--in-place"}).success);
    }

    SECTION("Flags on the wrong command") {
        CHECK_FALSE(parse({"redact", "notes.txt", "--samples"}).success);
        CHECK_FALSE(parse({"redact", "notes.txt", "--in-place"}).success);
    }

    SECTION("Unknown command, option or missing value") {
        CHECK(parse({"shred", "notes.txt"}).error_message == "Unknown command: shred");
        CHECK(parse({"scan", "notes.txt", "--fast"}).error_message == "Unknown option: --fast");
        CHECK(parse({"scan", "notes.txt", "--config"}).error_message == "--config requires a value");
    }

    SECTION("Help is a failure without a message") {
        const auto r = parse({"--help"});
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.empty());
        CHECK(parse({}).error_message.empty());
    }
}
