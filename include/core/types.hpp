#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redactor {

// ============================================================================
// Categories
// ============================================================================

/**
 * @brief Sensitive data category. Each category has exactly one detection rule.
 */
enum class Category : uint8_t {
    EMAIL,
    PHONE,
    URL,
    CREDENTIAL,
    KEYWORD_LINE
};

inline constexpr std::array<Category, 5> kAllCategories = {
    Category::EMAIL,
    Category::PHONE,
    Category::URL,
    Category::CREDENTIAL,
    Category::KEYWORD_LINE
};

inline constexpr size_t kCategoryCount = kAllCategories.size();

inline constexpr size_t category_index(Category category) {
    return static_cast<size_t>(category);
}

inline const char* category_to_string(Category category) {
    switch (category) {
        case Category::EMAIL: return "email";
        case Category::PHONE: return "phone";
        case Category::URL: return "url";
        case Category::CREDENTIAL: return "credential";
        case Category::KEYWORD_LINE: return "keyword_line";
        default: return "unknown";
    }
}

inline std::optional<Category> category_from_string(std::string_view tag) {
    for (const auto category : kAllCategories) {
        if (tag == category_to_string(category)) {
            return category;
        }
    }
    return std::nullopt;
}

/// Token-level categories take precedence over keyword lines during planning
inline constexpr bool is_token_category(Category category) {
    return category != Category::KEYWORD_LINE;
}

// ============================================================================
// Matches
// ============================================================================

struct SourceLocator {
    std::string source;     // File identity (empty for in-memory text)
    size_t offset = 0;      // Byte offset of the first byte of the span
    size_t line = 0;        // 1-based line number
};

/**
 * @brief Raw detected span. Transient: the value never outlives the scan.
 */
struct Match {
    Category category = Category::EMAIL;
    std::string value;
    SourceLocator locator;

    [[nodiscard]] size_t begin() const { return locator.offset; }
    [[nodiscard]] size_t end() const { return locator.offset + value.size(); }
};

// ============================================================================
// Redaction table
// ============================================================================

struct RedactionEntry {
    std::string placeholder;
    Category category = Category::EMAIL;
    std::string value_fingerprint;
    uint32_t occurrence_count = 0;
};

// ============================================================================
// Risk assessment
// ============================================================================

enum class RiskFlag : uint8_t {
    POSSIBLE_PRIVATE_KEY,
    MANY_EMAILS,
    MANY_PHONE_NUMBERS,
    MANY_URLS,
    HIGH_SENSITIVITY,
    NO_DETECTIONS
};

inline const char* risk_flag_to_string(RiskFlag flag) {
    switch (flag) {
        case RiskFlag::POSSIBLE_PRIVATE_KEY: return "POSSIBLE_PRIVATE_KEY";
        case RiskFlag::MANY_EMAILS: return "MANY_EMAILS";
        case RiskFlag::MANY_PHONE_NUMBERS: return "MANY_PHONE_NUMBERS";
        case RiskFlag::MANY_URLS: return "MANY_URLS";
        case RiskFlag::HIGH_SENSITIVITY: return "HIGH_SENSITIVITY";
        case RiskFlag::NO_DETECTIONS: return "NO_DETECTIONS";
        default: return "UNKNOWN";
    }
}

struct RiskAssessment {
    std::array<size_t, kCategoryCount> counts{};
    size_t total = 0;
    std::vector<RiskFlag> risk_flags;  // Ordered as RiskFlag, no duplicates
    std::array<std::vector<std::string>, kCategoryCount> samples;  // Preview only

    [[nodiscard]] size_t count(Category category) const {
        return counts[category_index(category)];
    }

    [[nodiscard]] bool has_flag(RiskFlag flag) const {
        for (const auto f : risk_flags) {
            if (f == flag) return true;
        }
        return false;
    }
};

// ============================================================================
// Manifest
// ============================================================================

struct ManifestFileRecord {
    std::string file_identity;
    std::string source_name;
    std::string file_content_hash;
    std::string recorded_at;
    std::string output;
    std::vector<RedactionEntry> entries;
};

struct Manifest {
    int version = 1;
    std::string created_at;
    std::string policy;
    std::vector<ManifestFileRecord> files;
};

} // namespace redactor
