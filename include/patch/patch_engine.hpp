#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "detector/pattern_detector.hpp"
#include "redaction/redaction_mapper.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace redactor {

/**
 * @brief Patch lifecycle: UNPATCHED -> VERIFYING -> {PATCHED | REJECTED}
 *
 * PATCHED and REJECTED are terminal. There is no retry: recovering from
 * REJECTED means rescanning and rebuilding the manifest.
 */
enum class PatchState : uint8_t {
    UNPATCHED,
    VERIFYING,
    PATCHED,
    REJECTED
};

inline const char* patch_state_to_string(PatchState state) {
    switch (state) {
        case PatchState::UNPATCHED: return "UNPATCHED";
        case PatchState::VERIFYING: return "VERIFYING";
        case PatchState::PATCHED: return "PATCHED";
        case PatchState::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Patch engine - replays a manifest record against original bytes
 *
 * 1. The SHA-256 of the bytes must equal the recorded content hash
 *    (MANIFEST_MISMATCH otherwise).
 * 2. Occurrences are relocated with the detection rules of the recorded
 *    categories only, resolved into a plan, and matched to entries by
 *    (category, fingerprint). Matches without an entry are left alone.
 * 3. Every entry must be found exactly occurrence_count times
 *    (UNLOCATABLE_REDACTION otherwise). No partial patch is ever produced.
 *
 * Placeholders always come from the record; none are derived here.
 */
class PatchEngine {
public:
    struct Outcome {
        PatchState state = PatchState::UNPATCHED;
        std::string sanitized;
        size_t substitutions = 0;
    };

    struct EntryCheck {
        std::string placeholder;
        Category category = Category::EMAIL;
        uint32_t expected = 0;
        uint32_t located = 0;
        bool placeholder_consistent = false;  // Re-derivable from (category, fingerprint)
    };

    struct VerifyReport {
        std::string file_identity;
        std::string expected_hash;
        std::string actual_hash;
        bool hash_matches = false;
        std::vector<EntryCheck> entries;
        bool ok = false;
    };

    explicit PatchEngine(PatternDetector detector) : detector_(std::move(detector)) {}

    /**
     * @brief Reapply a record's substitutions
     * @return Outcome in state PATCHED; any error means the patch was REJECTED
     */
    [[nodiscard]] Result<Outcome> apply(
        const ManifestFileRecord& record,
        std::string_view original) const;

    /**
     * @brief Check a record against bytes without producing output
     *
     * Mismatches are reported, not raised.
     */
    [[nodiscard]] VerifyReport verify(
        const ManifestFileRecord& record,
        std::string_view original) const;

private:
    struct Located {
        std::vector<Substitution> substitutions;
        std::vector<uint32_t> counts;  // Parallel to record.entries
    };

    [[nodiscard]] Located locate(const ManifestFileRecord& record, std::string_view original) const;

    PatternDetector detector_;
};

[[nodiscard]] nlohmann::json verify_report_to_json(const PatchEngine::VerifyReport& report);

} // namespace redactor
