#include "classifier/risk_classifier.hpp"

#include <algorithm>

namespace redactor {

RiskAssessment RiskClassifier::classify(const std::vector<Match>& matches) const {
    RiskAssessment assessment;

    for (const auto& match : matches) {
        const size_t idx = category_index(match.category);
        ++assessment.counts[idx];
        ++assessment.total;

        // Distinct, encounter-ordered, capped
        auto& samples = assessment.samples[idx];
        if (samples.size() < config_.sample_limit &&
            std::find(samples.begin(), samples.end(), match.value) == samples.end()) {
            samples.push_back(match.value);
        }
    }

    if (assessment.count(Category::CREDENTIAL) > 0) {
        assessment.risk_flags.push_back(RiskFlag::POSSIBLE_PRIVATE_KEY);
    }
    if (assessment.count(Category::EMAIL) > config_.max_emails) {
        assessment.risk_flags.push_back(RiskFlag::MANY_EMAILS);
    }
    if (assessment.count(Category::PHONE) > config_.max_phones) {
        assessment.risk_flags.push_back(RiskFlag::MANY_PHONE_NUMBERS);
    }
    if (assessment.count(Category::URL) > config_.max_urls) {
        assessment.risk_flags.push_back(RiskFlag::MANY_URLS);
    }
    if (assessment.total > config_.max_total) {
        assessment.risk_flags.push_back(RiskFlag::HIGH_SENSITIVITY);
    }
    if (assessment.total == 0) {
        assessment.risk_flags.push_back(RiskFlag::NO_DETECTIONS);
    }

    return assessment;
}

nlohmann::json risk_preview_to_json(
    const RiskAssessment& assessment,
    const PreviewSource& source,
    const std::string& created_at,
    bool include_samples) {

    nlohmann::json counts = nlohmann::json::object();
    for (const auto category : kAllCategories) {
        counts[category_to_string(category)] = assessment.count(category);
    }
    counts["total"] = assessment.total;

    nlohmann::json flags = nlohmann::json::array();
    for (const auto flag : assessment.risk_flags) {
        flags.push_back(risk_flag_to_string(flag));
    }

    nlohmann::json doc = {
        {"created_at", created_at},
        {"source", {{"name", source.name}, {"size_bytes", source.size_bytes}}},
        {"counts", std::move(counts)},
        {"risk_flags", std::move(flags)},
    };

    if (include_samples) {
        nlohmann::json samples = nlohmann::json::object();
        for (const auto category : kAllCategories) {
            samples[category_to_string(category)] = assessment.samples[category_index(category)];
        }
        doc["samples"] = std::move(samples);
    }

    return doc;
}

} // namespace redactor
