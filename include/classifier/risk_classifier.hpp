#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace redactor {

/**
 * @brief Risk classifier - aggregates matches into counts, flags and samples
 *
 * Pure aggregation over the matches it is given (PatternDetector::findings
 * in the pipeline). Flags are evaluated independently:
 * - credential > 0           -> POSSIBLE_PRIVATE_KEY
 * - email > max_emails       -> MANY_EMAILS
 * - phone > max_phones       -> MANY_PHONE_NUMBERS
 * - url > max_urls           -> MANY_URLS
 * - total > max_total        -> HIGH_SENSITIVITY
 * - total == 0               -> NO_DETECTIONS (informational, not an error)
 *
 * Samples are the first sample_limit distinct values per category, for human
 * preview only. They are never part of the redaction table or the manifest.
 */
class RiskClassifier {
public:
    struct Config {
        size_t max_emails = 5;
        size_t max_phones = 3;
        size_t max_urls = 5;
        size_t max_total = 30;
        size_t sample_limit = 3;
    };

    RiskClassifier() : RiskClassifier(Config{}) {}
    explicit RiskClassifier(const Config& config) : config_(config) {}

    [[nodiscard]] RiskAssessment classify(const std::vector<Match>& matches) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

/**
 * @brief Source description attached to a risk preview
 */
struct PreviewSource {
    std::string name;
    size_t size_bytes = 0;
};

/**
 * @brief Risk preview document for the UI/CLI layer
 * @param include_samples Samples are emitted only when explicitly requested
 */
[[nodiscard]] nlohmann::json risk_preview_to_json(
    const RiskAssessment& assessment,
    const PreviewSource& source,
    const std::string& created_at,
    bool include_samples);

} // namespace redactor
