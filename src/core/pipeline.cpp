#include "core/pipeline.hpp"
#include "core/hashing.hpp"
#include "core/ignore_rules.hpp"
#include "core/utils.hpp"
#include "manifest/manifest_store.hpp"

#include <filesystem>
#include <format>
#include <system_error>

namespace redactor {

namespace fs = std::filesystem;

namespace {

std::string default_output_for(const std::string& path) {
    return path + std::string(RedactionPipeline::kRedactedSuffix);
}

constexpr std::string_view kGitDir = ".git";

bool has_suffix(const std::string& value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

RedactionPipeline::RedactionPipeline(const RedactorConfig& config)
    : config_(config),
      source_(config.input.max_bytes),
      detector_(config.detector),
      classifier_(config.risk),
      mapper_(config.redaction),
      builder_(config.manifest),
      patch_engine_(PatternDetector(config.detector)) {}

// ============================================================================
// Preview
// ============================================================================

Result<nlohmann::json> RedactionPipeline::preview(const std::string& path, bool include_samples) const {
    auto loaded = source_.load(path);
    if (loaded.is_error()) {
        return Result<nlohmann::json>::error_from(loaded);
    }
    const auto& source = loaded.value();

    const auto assessment = classifier_.classify(
        PatternDetector::findings(detector_.detect(source.bytes, source.identity)));

    utils::log::info(std::format("Scanned {} ({} bytes): {} detections",
        source.identity, source.bytes.size(), assessment.total));

    return Result<nlohmann::json>::ok(risk_preview_to_json(
        assessment,
        PreviewSource{source.name, source.bytes.size()},
        utils::format_timestamp_utc(utils::now()),
        include_samples));
}

// ============================================================================
// Redact
// ============================================================================

Result<RedactionPipeline::RedactReport> RedactionPipeline::redact(
    const std::string& path,
    const std::string& output) const {

    auto loaded = source_.load(path);
    if (loaded.is_error()) {
        return Result<RedactReport>::error_from(loaded);
    }
    const auto& source = loaded.value();

    const std::string output_path = output.empty() ? default_output_for(path) : output;
    if (FileSource::identity_of(output_path) == source.identity) {
        return Result<RedactReport>::error(ErrorCategory::INVALID_PATH,
            std::format("Refusing to overwrite the input file {}; choose another output", path));
    }

    const auto matches = detector_.detect(source.bytes, source.identity);
    const auto plan = PatternDetector::plan(matches);

    RedactReport report;
    report.file_identity = source.identity;
    report.output_path = output_path;
    report.file_content_hash = sha256_hex(source.bytes);
    report.assessment = classifier_.classify(PatternDetector::findings(matches));
    report.entries = mapper_.build_table(plan);
    report.substitutions = plan.size();

    const auto sanitized = mapper_.render(source.bytes, plan);
    auto written = FileSource::write_atomic(output_path, sanitized);
    if (written.is_error()) {
        return Result<RedactReport>::error_from(written);
    }

    auto recorded = builder_.write(source.identity, report.file_content_hash, report.entries,
                                   FileSource::identity_of(output_path));
    if (recorded.is_error()) {
        // A sanitized copy without a manifest record cannot be patched or verified
        std::error_code ec;
        fs::remove(output_path, ec);
        return Result<RedactReport>::error_from(recorded);
    }

    utils::log::info(std::format("Redacted {} -> {}: {} substitutions, {} distinct values",
        source.identity, output_path, report.substitutions, report.entries.size()));
    return Result<RedactReport>::ok(std::move(report));
}

// ============================================================================
// Patch / Verify
// ============================================================================

Result<ManifestFileRecord> RedactionPipeline::record_for(const SourceFile& source) const {
    auto manifest = ManifestStore::load(config_.manifest.manifest_path);
    if (manifest.is_error()) {
        return Result<ManifestFileRecord>::error_from(manifest);
    }

    const auto* record = ManifestStore::find_record(manifest.value(), source.identity);
    if (record == nullptr) {
        return Result<ManifestFileRecord>::error(ErrorCategory::MANIFEST_MISMATCH,
            std::format("Manifest {} has no record for {}",
                config_.manifest.manifest_path, source.identity));
    }
    return Result<ManifestFileRecord>::ok(*record);
}

Result<RedactionPipeline::PatchReport> RedactionPipeline::patch(
    const std::string& path,
    const std::string& output,
    bool in_place) const {

    auto loaded = source_.load(path);
    if (loaded.is_error()) {
        return Result<PatchReport>::error_from(loaded);
    }
    const auto& source = loaded.value();

    std::string output_path;
    if (in_place) {
        output_path = path;
    } else {
        output_path = output.empty() ? default_output_for(path) : output;
        if (FileSource::identity_of(output_path) == source.identity) {
            return Result<PatchReport>::error(ErrorCategory::INVALID_PATH,
                std::format("Overwriting {} requires in-place patching", path));
        }
    }

    auto record = record_for(source);
    if (record.is_error()) {
        return Result<PatchReport>::error_from(record);
    }

    auto outcome = patch_engine_.apply(record.value(), source.bytes);
    if (outcome.is_error()) {
        return Result<PatchReport>::error_from(outcome);
    }

    auto written = FileSource::write_atomic(output_path, outcome.value().sanitized);
    if (written.is_error()) {
        return Result<PatchReport>::error_from(written);
    }

    PatchReport report;
    report.file_identity = source.identity;
    report.output_path = output_path;
    report.state = outcome.value().state;
    report.substitutions = outcome.value().substitutions;
    return Result<PatchReport>::ok(std::move(report));
}

Result<PatchEngine::VerifyReport> RedactionPipeline::verify(const std::string& path) const {
    auto loaded = source_.load(path);
    if (loaded.is_error()) {
        return Result<PatchEngine::VerifyReport>::error_from(loaded);
    }

    auto record = record_for(loaded.value());
    if (record.is_error()) {
        return Result<PatchEngine::VerifyReport>::error_from(record);
    }

    auto report = patch_engine_.verify(record.value(), loaded.value().bytes);
    if (!report.ok) {
        utils::log::warn(std::format("Verification failed for {} (hash {})",
            report.file_identity, report.hash_matches ? "matches" : "differs"));
    }
    return Result<PatchEngine::VerifyReport>::ok(std::move(report));
}

// ============================================================================
// Directory scan
// ============================================================================

Result<RedactionPipeline::DirectoryReport> RedactionPipeline::redact_directory(
    const std::string& dir,
    const std::string& out_dir) const {

    std::error_code ec;
    const fs::path root = fs::canonical(dir, ec);
    if (ec || !fs::is_directory(root, ec)) {
        return Result<DirectoryReport>::error(ErrorCategory::INVALID_PATH,
            std::format("Not a directory: {}", dir));
    }

    const fs::path manifest_file(FileSource::identity_of(config_.manifest.manifest_path));
    const fs::path manifest_root = manifest_file.parent_path();
    const fs::path out_root = out_dir.empty()
        ? manifest_root / "redacted"
        : fs::path(FileSource::identity_of(out_dir));

    auto ignore = IgnoreRules::load(root.string());
    if (ignore.is_error()) {
        return Result<DirectoryReport>::error_from(ignore);
    }
    const auto& rules = ignore.value();
    if (!rules.empty()) {
        utils::log::debug(std::format("{} ignore patterns from {}/{}",
            rules.size(), root.string(), IgnoreRules::kFileName));
    }

    DirectoryReport report;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Result<DirectoryReport>::error(ErrorCategory::INVALID_PATH,
            std::format("Cannot read directory {}: {}", dir, ec.message()));
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const fs::path entry = it->path();
        const std::string relative = entry.lexically_relative(root).generic_string();

        // Tool output and repository metadata are never scanned
        if (it->is_directory(ec)) {
            if (entry == manifest_root || entry == out_root || entry.filename().string() == kGitDir) {
                it.disable_recursion_pending();
            } else if (rules.is_ignored(relative, true)) {
                utils::log::debug(std::format("Ignoring directory {}", relative));
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec) || entry == manifest_file ||
            has_suffix(entry.string(), kRedactedSuffix)) {
            continue;
        }
        if (rules.is_ignored(relative, false)) {
            ++report.files_ignored;
            continue;
        }

        ++report.files_scanned;

        auto loaded = source_.load(entry.string());
        if (loaded.is_error()) {
            ++report.files_skipped;
            utils::log::warn(std::format("Skipping {}: {} ({})", entry.string(),
                error_category_to_string(loaded.error_category()), loaded.error_message()));
            continue;
        }
        const auto& source = loaded.value();

        const auto plan = PatternDetector::plan(detector_.detect(source.bytes, source.identity));
        if (plan.empty()) {
            continue;
        }

        fs::path output_path = out_root / entry.lexically_relative(root);
        output_path += std::string(kRedactedSuffix);

        auto written = FileSource::write_atomic(output_path.string(), mapper_.render(source.bytes, plan));
        if (written.is_error()) {
            return Result<DirectoryReport>::error_from(written);
        }

        auto recorded = builder_.write(source.identity, sha256_hex(source.bytes),
                                       mapper_.build_table(plan), output_path.string());
        if (recorded.is_error()) {
            fs::remove(output_path, ec);
            return Result<DirectoryReport>::error_from(recorded);
        }

        ++report.files_with_findings;
        report.total_redactions += plan.size();
    }
    if (ec) {
        utils::log::warn(std::format("Directory walk of {} stopped early: {}", root.string(), ec.message()));
    }

    utils::log::info(std::format(
        "Directory {}: {} files scanned, {} with findings, {} skipped, {} ignored, {} redactions",
        root.string(), report.files_scanned, report.files_with_findings,
        report.files_skipped, report.files_ignored, report.total_redactions));
    return Result<DirectoryReport>::ok(report);
}

} // namespace redactor
