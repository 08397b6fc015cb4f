#include "patch/patch_engine.hpp"
#include "core/hashing.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace redactor {

PatchEngine::Located PatchEngine::locate(
    const ManifestFileRecord& record,
    std::string_view original) const {

    Located located;
    located.counts.assign(record.entries.size(), 0);

    // Index entries by "<category>:<fingerprint>"; fingerprint widths may differ
    std::unordered_map<std::string, size_t> index;
    std::vector<size_t> widths;
    std::vector<Category> categories;
    for (size_t i = 0; i < record.entries.size(); ++i) {
        const auto& entry = record.entries[i];
        index.emplace(std::format("{}:{}", category_to_string(entry.category), entry.value_fingerprint), i);
        if (std::find(widths.begin(), widths.end(), entry.value_fingerprint.size()) == widths.end()) {
            widths.push_back(entry.value_fingerprint.size());
        }
        if (std::find(categories.begin(), categories.end(), entry.category) == categories.end()) {
            categories.push_back(entry.category);
        }
    }

    const auto plan = PatternDetector::plan(
        detector_.detect(original, record.file_identity, categories));

    for (const auto& match : plan) {
        const auto digest = sha256_hex(match.value);
        for (const size_t width : widths) {
            const auto key = std::format("{}:{}", category_to_string(match.category),
                                         std::string_view(digest).substr(0, width));
            const auto it = index.find(key);
            if (it == index.end()) continue;

            ++located.counts[it->second];
            located.substitutions.push_back({
                match.begin(), match.value.size(), record.entries[it->second].placeholder});
            break;
        }
    }

    return located;
}

Result<PatchEngine::Outcome> PatchEngine::apply(
    const ManifestFileRecord& record,
    std::string_view original) const {

    PatchState state = PatchState::UNPATCHED;
    const auto reject = [&](ErrorCategory category, std::string message) {
        utils::log::warn(std::format("Patch {}: {} -> {} ({})", record.file_identity,
            patch_state_to_string(state), patch_state_to_string(PatchState::REJECTED),
            error_category_to_string(category)));
        return Result<Outcome>::error(category, std::move(message));
    };

    state = PatchState::VERIFYING;
    const auto actual_hash = sha256_hex(original);
    if (actual_hash != record.file_content_hash) {
        return reject(ErrorCategory::MANIFEST_MISMATCH,
            std::format("{} has changed since the manifest was built (expected sha256 {}, found {}); "
                        "rescan and rebuild the manifest", record.file_identity,
                        record.file_content_hash, actual_hash));
    }

    auto located = locate(record, original);
    for (size_t i = 0; i < record.entries.size(); ++i) {
        const auto& entry = record.entries[i];
        if (located.counts[i] != entry.occurrence_count) {
            return reject(ErrorCategory::UNLOCATABLE_REDACTION,
                std::format("{}: {} expected {} occurrence(s), located {}", record.file_identity,
                    entry.placeholder, entry.occurrence_count, located.counts[i]));
        }
    }

    Outcome outcome;
    outcome.sanitized = RedactionMapper::apply_substitutions(original, located.substitutions);
    outcome.substitutions = located.substitutions.size();
    outcome.state = PatchState::PATCHED;

    utils::log::info(std::format("Patch {}: VERIFYING -> PATCHED ({} substitutions)",
        record.file_identity, outcome.substitutions));
    return Result<Outcome>::ok(std::move(outcome));
}

PatchEngine::VerifyReport PatchEngine::verify(
    const ManifestFileRecord& record,
    std::string_view original) const {

    VerifyReport report;
    report.file_identity = record.file_identity;
    report.expected_hash = record.file_content_hash;
    report.actual_hash = sha256_hex(original);
    report.hash_matches = (report.actual_hash == report.expected_hash);

    const auto located = locate(record, original);

    bool all_good = report.hash_matches;
    for (size_t i = 0; i < record.entries.size(); ++i) {
        const auto& entry = record.entries[i];

        EntryCheck check;
        check.placeholder = entry.placeholder;
        check.category = entry.category;
        check.expected = entry.occurrence_count;
        check.located = located.counts[i];
        check.placeholder_consistent =
            entry.placeholder == RedactionMapper::placeholder(entry.category, entry.value_fingerprint);

        all_good = all_good && check.placeholder_consistent && check.located == check.expected;
        report.entries.emplace_back(std::move(check));
    }
    report.ok = all_good;
    return report;
}

nlohmann::json verify_report_to_json(const PatchEngine::VerifyReport& report) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& check : report.entries) {
        entries.push_back({
            {"placeholder", check.placeholder},
            {"category", category_to_string(check.category)},
            {"expected", check.expected},
            {"located", check.located},
            {"placeholder_consistent", check.placeholder_consistent},
        });
    }

    return {
        {"file_identity", report.file_identity},
        {"expected_hash", report.expected_hash},
        {"actual_hash", report.actual_hash},
        {"hash_matches", report.hash_matches},
        {"entries", std::move(entries)},
        {"ok", report.ok},
    };
}

} // namespace redactor
