#pragma once

#include "core/types.hpp"
#include "detector/detection_rules.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace redactor {

/**
 * @brief Pattern detector - runs one rule per category over raw text
 *
 * detect() is read-only and deterministic: the same text always yields the
 * same ordered matches. Categories are not mutually exclusive, so a keyword
 * line may also contain an email or a credential; all are reported.
 *
 * Overlaps are resolved in two ways:
 * - plan(): the spans to replace. Token-level matches are kept greedily
 *   (earliest first, longest first on ties). Each keyword line is then cut
 *   around the kept tokens and every non-blank remainder is replaced as
 *   keyword_line, so nothing on a keyword line survives redaction.
 * - findings(): what a preview counts. The same kept tokens, plus keyword
 *   lines that hold no kept token.
 */
class PatternDetector {
public:
    struct Config {
        std::vector<std::string> keywords = {"key", "token", "secret", "api_key", "bearer"};
        size_t credential_min_length = 24;
        size_t phone_min_digits = 10;
        size_t phone_max_digits = 15;
        KeywordLineMode keyword_line_mode = KeywordLineMode::LINE;
    };

    PatternDetector() : PatternDetector(Config{}) {}
    explicit PatternDetector(const Config& config);

    /**
     * @brief Detect all categories
     * @param text Raw text (any bytes; never fails)
     * @param source Identity copied into each match locator
     * @return Matches ordered by offset, longer first, then category order
     */
    [[nodiscard]] std::vector<Match> detect(
        std::string_view text,
        std::string_view source = {}) const;

    /**
     * @brief Detect only the given categories (used for manifest replay)
     */
    [[nodiscard]] std::vector<Match> detect(
        std::string_view text,
        std::string_view source,
        const std::vector<Category>& categories) const;

    /**
     * @brief Resolve overlaps into the redaction plan (ordered by offset)
     */
    [[nodiscard]] static std::vector<Match> plan(std::vector<Match> matches);

    /**
     * @brief Resolve overlaps into counted findings (ordered by offset)
     */
    [[nodiscard]] static std::vector<Match> findings(std::vector<Match> matches);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    std::array<DetectionRule, kCategoryCount> rules_;
};

} // namespace redactor
