#pragma once

#include "classifier/risk_classifier.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/file_source.hpp"
#include "detector/pattern_detector.hpp"
#include "manifest/manifest_builder.hpp"
#include "patch/patch_engine.hpp"
#include "redaction/redaction_mapper.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace redactor {

/**
 * @brief Pipeline coordinator - wires the stages for each file operation
 *
 * Stages:
 * 1. Load + validate (size ceiling, binary rejection)
 * 2. Detect (all category rules)
 * 3. Resolve overlaps (findings to count, plan to replace)
 * 4. Classify findings (counts, flags, samples)
 * 5. Map (placeholders, redaction table)
 * 6. Record (manifest, integrity-checked)
 * 7. Patch / verify (manifest replay)
 *
 * Stages share no mutable state; a pipeline can serve any number of files.
 * Writes to one manifest path must not run concurrently.
 */
class RedactionPipeline {
public:
    static constexpr std::string_view kRedactedSuffix = ".redacted.txt";

    struct RedactReport {
        std::string file_identity;
        std::string output_path;
        std::string file_content_hash;
        RiskAssessment assessment;
        std::vector<RedactionEntry> entries;
        size_t substitutions = 0;
    };

    struct PatchReport {
        std::string file_identity;
        std::string output_path;
        PatchState state = PatchState::UNPATCHED;
        size_t substitutions = 0;
    };

    struct DirectoryReport {
        size_t files_scanned = 0;
        size_t files_with_findings = 0;
        size_t files_skipped = 0;
        size_t files_ignored = 0;       // Matched by the root .gitignore
        size_t total_redactions = 0;
    };

    RedactionPipeline() : RedactionPipeline(RedactorConfig{}) {}
    explicit RedactionPipeline(const RedactorConfig& config);

    /**
     * @brief Risk preview of a file; nothing is written
     * @param include_samples Add up to sample_limit raw values per category
     */
    [[nodiscard]] Result<nlohmann::json> preview(const std::string& path, bool include_samples = false) const;

    /**
     * @brief Write a sanitized copy and record the redaction table
     * @param output Destination; empty means "<path>.redacted.txt". Never the input.
     */
    [[nodiscard]] Result<RedactReport> redact(const std::string& path, const std::string& output = {}) const;

    /**
     * @brief Replay the manifest record for a file
     * @param output Destination; empty means "<path>.redacted.txt" unless in_place
     * @param in_place Overwrite the original file with the patched content
     */
    [[nodiscard]] Result<PatchReport> patch(
        const std::string& path,
        const std::string& output = {},
        bool in_place = false) const;

    /**
     * @brief Verify a file against its manifest record
     * @return Report (which may say "not ok"); errors only when no check can run
     */
    [[nodiscard]] Result<PatchEngine::VerifyReport> verify(const std::string& path) const;

    /**
     * @brief Redact every eligible file under a directory tree
     *
     * .git directories and paths matched by <dir>/.gitignore are not walked.
     * @param out_dir Root for sanitized copies, mirroring the input layout
     */
    [[nodiscard]] Result<DirectoryReport> redact_directory(
        const std::string& dir,
        const std::string& out_dir) const;

    [[nodiscard]] const RedactorConfig& config() const { return config_; }

private:
    [[nodiscard]] Result<ManifestFileRecord> record_for(const SourceFile& source) const;

    RedactorConfig config_;
    FileSource source_;
    PatternDetector detector_;
    RiskClassifier classifier_;
    RedactionMapper mapper_;
    ManifestBuilder builder_;
    PatchEngine patch_engine_;
};

} // namespace redactor
