#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace redactor {

/**
 * @brief Half-open byte span [offset, offset + length) produced by a rule
 */
struct Span {
    size_t offset = 0;
    size_t length = 0;
};

/**
 * @brief Redaction unit for keyword lines
 *
 * LINE:  the whole trimmed line
 * VALUE: only the text after the first keyword and its separators
 */
enum class KeywordLineMode : uint8_t {
    LINE,
    VALUE
};

inline const char* keyword_line_mode_to_string(KeywordLineMode mode) {
    return mode == KeywordLineMode::VALUE ? "value" : "line";
}

// ============================================================================
// Category rules
//
// Each rule is a single-pass scanner over the raw bytes. Rules never fail:
// malformed input is simply not recognized. Spans emitted by one rule are
// ordered by offset and do not overlap each other.
// ============================================================================

struct EmailRule {
    static constexpr Category kCategory = Category::EMAIL;
    static constexpr size_t kMaxLocalLength = 64;
    static constexpr size_t kMaxDomainLength = 255;

    void scan(std::string_view text, std::vector<Span>& out) const;
};

struct PhoneRule {
    static constexpr Category kCategory = Category::PHONE;

    size_t min_digits = 10;
    size_t max_digits = 15;

    void scan(std::string_view text, std::vector<Span>& out) const;
};

struct UrlRule {
    static constexpr Category kCategory = Category::URL;

    void scan(std::string_view text, std::vector<Span>& out) const;
};

struct CredentialRule {
    static constexpr Category kCategory = Category::CREDENTIAL;

    size_t min_length = 24;

    void scan(std::string_view text, std::vector<Span>& out) const;
};

struct KeywordLineRule {
    static constexpr Category kCategory = Category::KEYWORD_LINE;

    std::vector<std::string> keywords;  // Lowercase
    KeywordLineMode mode = KeywordLineMode::LINE;

    void scan(std::string_view text, std::vector<Span>& out) const;
};

/**
 * @brief Closed set of category handlers. Adding a category means adding one
 * alternative here and one enumerator in Category.
 */
using DetectionRule = std::variant<EmailRule, PhoneRule, UrlRule, CredentialRule, KeywordLineRule>;

[[nodiscard]] inline Category rule_category(const DetectionRule& rule) {
    return std::visit([](const auto& r) { return r.kCategory; }, rule);
}

inline void scan_rule(const DetectionRule& rule, std::string_view text, std::vector<Span>& out) {
    std::visit([&](const auto& r) { r.scan(text, out); }, rule);
}

} // namespace redactor
