#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace redactor {

/**
 * @brief One span replacement: bytes [offset, offset + length) -> replacement
 */
struct Substitution {
    size_t offset = 0;
    size_t length = 0;
    std::string replacement;
};

/**
 * @brief Redaction mapper - stable placeholders for detected values
 *
 * fingerprint = first N hex chars of SHA-256(value)
 * placeholder = "REDACTED:" + category tag + ":" + fingerprint
 *
 * The placeholder is a pure function of (category, fingerprint), so the same
 * secret maps to the same placeholder in every file and every run. Raw values
 * are hashed and dropped; only fingerprints reach the table.
 */
class RedactionMapper {
public:
    static constexpr std::string_view kPlaceholderPrefix = "REDACTED:";
    static constexpr size_t kMinFingerprintLength = 8;
    static constexpr size_t kMaxFingerprintLength = 64;

    struct Config {
        size_t fingerprint_hex_length = 16;
    };

    RedactionMapper() : RedactionMapper(Config{}) {}
    explicit RedactionMapper(const Config& config);

    [[nodiscard]] std::string fingerprint(std::string_view value) const;

    [[nodiscard]] static std::string fingerprint(std::string_view value, size_t hex_length);

    [[nodiscard]] static std::string placeholder(Category category, std::string_view fingerprint);

    /**
     * @brief Build the redaction table, one entry per distinct (category, value)
     * @param matches Matches in detection order; entry order follows first occurrence
     */
    [[nodiscard]] std::vector<RedactionEntry> build_table(const std::vector<Match>& matches) const;

    /**
     * @brief Replace every planned span with its placeholder
     * @param plan Non-overlapping matches ordered by offset
     */
    [[nodiscard]] std::string render(std::string_view text, const std::vector<Match>& plan) const;

    /**
     * @brief Copy text, replacing the given spans; every other byte is kept
     * @param substitutions Ordered by offset, non-overlapping
     */
    [[nodiscard]] static std::string apply_substitutions(
        std::string_view text,
        const std::vector<Substitution>& substitutions);

    [[nodiscard]] size_t fingerprint_length() const { return config_.fingerprint_hex_length; }

private:
    Config config_;
};

} // namespace redactor
