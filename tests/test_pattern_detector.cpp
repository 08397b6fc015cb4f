#include <catch2/catch_test_macros.hpp>
#include "detector/pattern_detector.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace redactor;

namespace {

std::vector<std::string> values_of(const std::vector<Match>& matches, Category category) {
    std::vector<std::string> out;
    for (const auto& m : matches) {
        if (m.category == category) out.push_back(m.value);
    }
    return out;
}

size_t count_of(const std::vector<Match>& matches, Category category) {
    return values_of(matches, category).size();
}

const std::string kScenario =
    "Contact a@b.com or c@d.com, call 555-123-4567, token: AAAAAAAAAAAAAAAAAAAAAAAABBBB";

} // namespace

TEST_CASE("PatternDetector: mixed scenario", "[detector]") {
    PatternDetector detector;

    SECTION("All overlapping matches are reported") {
        const auto matches = detector.detect(kScenario);
        CHECK(values_of(matches, Category::EMAIL) == std::vector<std::string>{"a@b.com", "c@d.com"});
        CHECK(values_of(matches, Category::PHONE) == std::vector<std::string>{"555-123-4567"});
        CHECK(values_of(matches, Category::CREDENTIAL) ==
              std::vector<std::string>{"AAAAAAAAAAAAAAAAAAAAAAAABBBB"});
        CHECK(count_of(matches, Category::URL) == 0);
        CHECK(count_of(matches, Category::KEYWORD_LINE) == 1);
    }

    SECTION("Findings count tokens, not the keyword line around them") {
        const auto found = PatternDetector::findings(detector.detect(kScenario));
        REQUIRE(found.size() == 4);
        CHECK(count_of(found, Category::EMAIL) == 2);
        CHECK(count_of(found, Category::PHONE) == 1);
        CHECK(count_of(found, Category::CREDENTIAL) == 1);
        CHECK(count_of(found, Category::KEYWORD_LINE) == 0);
    }

    SECTION("Plan redacts the rest of the keyword line between tokens") {
        const auto plan = PatternDetector::plan(detector.detect(kScenario));
        CHECK(count_of(plan, Category::EMAIL) == 2);
        CHECK(count_of(plan, Category::PHONE) == 1);
        CHECK(count_of(plan, Category::CREDENTIAL) == 1);
        CHECK(values_of(plan, Category::KEYWORD_LINE) ==
              std::vector<std::string>{"Contact", "or", ", call", ", token:"});

        for (size_t i = 1; i < plan.size(); ++i) {
            CHECK(plan[i - 1].end() <= plan[i].begin());
        }
        for (const auto& m : plan) {
            CHECK(kScenario.compare(m.begin(), m.value.size(), m.value) == 0);
        }
    }

    SECTION("Detection is deterministic") {
        const auto first = detector.detect(kScenario, "a.txt");
        const auto second = detector.detect(kScenario, "a.txt");
        REQUIRE(first.size() == second.size());
        for (size_t i = 0; i < first.size(); ++i) {
            CHECK(first[i].category == second[i].category);
            CHECK(first[i].value == second[i].value);
            CHECK(first[i].locator.offset == second[i].locator.offset);
            CHECK(first[i].locator.source == "a.txt");
        }
    }
}

TEST_CASE("PatternDetector: email rule", "[detector][email]") {
    PatternDetector detector;

    SECTION("Plus tags and subdomains, trailing period excluded") {
        const auto m = detector.detect("mail first.last+tag@sub.example.org.");
        CHECK(values_of(m, Category::EMAIL) == std::vector<std::string>{"first.last+tag@sub.example.org"});
    }

    SECTION("Domain without a real TLD is ignored") {
        CHECK(count_of(detector.detect("root@localhost"), Category::EMAIL) == 0);
        CHECK(count_of(detector.detect("x@y.c"), Category::EMAIL) == 0);
        CHECK(count_of(detector.detect("x@host.123"), Category::EMAIL) == 0);
        CHECK(count_of(detector.detect("x@a..com"), Category::EMAIL) == 0);
    }

    SECTION("Bare @ mentions are ignored") {
        CHECK(count_of(detector.detect("ping @alice about it"), Category::EMAIL) == 0);
    }
}

TEST_CASE("PatternDetector: phone rule", "[detector][phone]") {
    PatternDetector detector;

    SECTION("International format with parentheses") {
        const auto m = detector.detect("call +1 (555) 123-4567 today");
        CHECK(values_of(m, Category::PHONE) == std::vector<std::string>{"+1 (555) 123-4567"});
    }

    SECTION("Dotted and compact forms") {
        CHECK(values_of(detector.detect("tel 555.123.4567"), Category::PHONE) ==
              std::vector<std::string>{"555.123.4567"});
        CHECK(values_of(detector.detect("tel 5551234567"), Category::PHONE) ==
              std::vector<std::string>{"5551234567"});
    }

    SECTION("Too few or too many digits") {
        CHECK(count_of(detector.detect("ext 12345"), Category::PHONE) == 0);
        CHECK(count_of(detector.detect("id 12345678901234567890"), Category::PHONE) == 0);
    }

    SECTION("Timestamps and versions are not phone numbers") {
        CHECK(count_of(detector.detect("at 2024-01-15 10:30:00 UTC"), Category::PHONE) == 0);
        CHECK(count_of(detector.detect("version 1.2.3"), Category::PHONE) == 0);
    }

    SECTION("Digits embedded in identifiers are ignored") {
        CHECK(count_of(detector.detect("build_5551234567"), Category::PHONE) == 0);
        CHECK(count_of(detector.detect("v5551234567"), Category::PHONE) == 0);
    }
}

TEST_CASE("PatternDetector: url rule", "[detector][url]") {
    PatternDetector detector;

    SECTION("Trailing punctuation is not part of the URL") {
        const auto m = detector.detect("see (https://example.com/docs?q=1).");
        CHECK(values_of(m, Category::URL) == std::vector<std::string>{"https://example.com/docs?q=1"});
    }

    SECTION("www prefix, case-insensitive") {
        const auto m = detector.detect("Visit WWW.Example.com, then http://x.io");
        CHECK(values_of(m, Category::URL) == std::vector<std::string>{"WWW.Example.com", "http://x.io"});
    }

    SECTION("Quotes end a URL") {
        const auto m = detector.detect(R"(href="https://example.com/a")");
        CHECK(values_of(m, Category::URL) == std::vector<std::string>{"https://example.com/a"});
    }

    SECTION("Prefix alone is not a URL") {
        CHECK(count_of(detector.detect("https:// nothing"), Category::URL) == 0);
    }

    SECTION("URL wins over an embedded email in the plan") {
        const auto matches = detector.detect("open https://user@example.com/path now");
        CHECK(count_of(matches, Category::EMAIL) == 1);

        const auto plan = PatternDetector::plan(matches);
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].category == Category::URL);
        CHECK(plan[0].value == "https://user@example.com/path");
    }
}

TEST_CASE("PatternDetector: credential rule", "[detector][credential]") {
    PatternDetector detector;

    CHECK(count_of(detector.detect(std::string(23, 'x')), Category::CREDENTIAL) == 0);
    CHECK(count_of(detector.detect(std::string(24, 'x')), Category::CREDENTIAL) == 1);
    CHECK(values_of(detector.detect("id=ghp_aB3-dE6_gH9iJ2kL5mN8oP1q;"), Category::CREDENTIAL) ==
          std::vector<std::string>{"ghp_aB3-dE6_gH9iJ2kL5mN8oP1q"});

    SECTION("Configurable minimum length") {
        PatternDetector::Config cfg;
        cfg.credential_min_length = 32;
        PatternDetector strict(cfg);
        CHECK(count_of(strict.detect(std::string(31, 'z')), Category::CREDENTIAL) == 0);
        CHECK(count_of(strict.detect(std::string(32, 'z')), Category::CREDENTIAL) == 1);
    }
}

TEST_CASE("PatternDetector: keyword line rule", "[detector][keyword]") {
    const std::string text = "name = demo\n  API_KEY = \"hunter2\"  \r\nport = 80\n";

    SECTION("Whole trimmed line by default") {
        PatternDetector detector;
        const auto m = detector.detect(text);
        REQUIRE(count_of(m, Category::KEYWORD_LINE) == 1);

        const auto& line = *std::find_if(m.begin(), m.end(),
            [](const Match& x) { return x.category == Category::KEYWORD_LINE; });
        CHECK(line.value == "API_KEY = \"hunter2\"");
        CHECK(line.locator.line == 2);
        CHECK(line.locator.offset == text.find("API_KEY"));
    }

    SECTION("Value-only mode") {
        PatternDetector::Config cfg;
        cfg.keyword_line_mode = KeywordLineMode::VALUE;
        PatternDetector detector(cfg);
        CHECK(values_of(detector.detect(text), Category::KEYWORD_LINE) ==
              std::vector<std::string>{"hunter2"});
    }

    SECTION("Value-only mode with nothing after the keyword") {
        PatternDetector::Config cfg;
        cfg.keyword_line_mode = KeywordLineMode::VALUE;
        PatternDetector detector(cfg);
        CHECK(count_of(detector.detect("secret:\n"), Category::KEYWORD_LINE) == 0);
    }

    SECTION("Custom keywords are case-insensitive") {
        PatternDetector::Config cfg;
        cfg.keywords = {"Password"};
        PatternDetector detector(cfg);
        CHECK(count_of(detector.detect("db_password=abc\n"), Category::KEYWORD_LINE) == 1);
        CHECK(count_of(detector.detect("api_key=abc\n"), Category::KEYWORD_LINE) == 0);
    }

    SECTION("Keyword line kept when no token rule covers it") {
        PatternDetector detector;
        const auto plan = PatternDetector::plan(detector.detect(text));
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].category == Category::KEYWORD_LINE);
        CHECK(plan[0].value == "API_KEY = \"hunter2\"");
        CHECK(PatternDetector::findings(detector.detect(text)).size() == 1);
    }
}

TEST_CASE("PatternDetector: keyword line sharing a line with tokens", "[detector][keyword]") {
    const std::string text = "secret = hunter2 (owner ops@corp.com)\n";

    SECTION("Line mode keeps the email and redacts the rest of the line") {
        PatternDetector detector;
        const auto plan = PatternDetector::plan(detector.detect(text));
        CHECK(values_of(plan, Category::EMAIL) == std::vector<std::string>{"ops@corp.com"});
        CHECK(values_of(plan, Category::KEYWORD_LINE) ==
              std::vector<std::string>{"secret = hunter2 (owner", ")"});

        const auto found = PatternDetector::findings(detector.detect(text));
        REQUIRE(found.size() == 1);
        CHECK(found[0].category == Category::EMAIL);
    }

    SECTION("Value mode redacts the value around the email") {
        PatternDetector::Config cfg;
        cfg.keyword_line_mode = KeywordLineMode::VALUE;
        PatternDetector detector(cfg);
        const auto plan = PatternDetector::plan(detector.detect(text));
        CHECK(values_of(plan, Category::EMAIL) == std::vector<std::string>{"ops@corp.com"});
        CHECK(values_of(plan, Category::KEYWORD_LINE) ==
              std::vector<std::string>{"hunter2 (owner", ")"});
        CHECK(plan.front().begin() == text.find("hunter2"));
    }

    SECTION("Token straddling the start of the value") {
        PatternDetector::Config cfg;
        cfg.keyword_line_mode = KeywordLineMode::VALUE;
        PatternDetector detector(cfg);
        const std::string line = "my_token_abcdefghijklmnopqrstuv rest";
        const auto plan = PatternDetector::plan(detector.detect(line));
        CHECK(values_of(plan, Category::CREDENTIAL) ==
              std::vector<std::string>{"my_token_abcdefghijklmnopqrstuv"});
        CHECK(values_of(plan, Category::KEYWORD_LINE) == std::vector<std::string>{"rest"});
    }
}

TEST_CASE("PatternDetector: category subsets and odd input", "[detector]") {
    PatternDetector detector;

    SECTION("Only requested categories run") {
        const auto m = detector.detect(kScenario, {}, {Category::EMAIL});
        REQUIRE(m.size() == 2);
        CHECK(m[0].category == Category::EMAIL);
        CHECK(m[1].category == Category::EMAIL);
    }

    SECTION("Empty input") {
        CHECK(detector.detect("").empty());
    }

    SECTION("Non-UTF-8 bytes never fail") {
        std::string text = "\xff\xfe a@b.com \x80\x81";
        CHECK(count_of(detector.detect(text), Category::EMAIL) == 1);
    }

    SECTION("Line numbers are 1-based") {
        const auto m = detector.detect("x\ny\nreach a@b.com");
        REQUIRE(m.size() == 1);
        CHECK(m[0].locator.line == 3);
    }
}
