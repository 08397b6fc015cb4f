#include "manifest/manifest_store.hpp"
#include "core/file_source.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace redactor {

// Document keys
static constexpr std::string_view kVersion         = "version";
static constexpr std::string_view kCreatedAt       = "created_at";
static constexpr std::string_view kPolicy          = "policy";
static constexpr std::string_view kFiles           = "files";
static constexpr std::string_view kFileIdentity    = "file_identity";
static constexpr std::string_view kSourceName      = "source_name";
static constexpr std::string_view kFileContentHash = "file_content_hash";
static constexpr std::string_view kRecordedAt      = "recorded_at";
static constexpr std::string_view kOutput          = "output";
static constexpr std::string_view kEntries         = "entries";
static constexpr std::string_view kPlaceholder     = "placeholder";
static constexpr std::string_view kCategory        = "category";
static constexpr std::string_view kFingerprint     = "value_fingerprint_prefix";
static constexpr std::string_view kOccurrences     = "occurrence_count";

// ============================================================================
// Encoding
// ============================================================================

nlohmann::json ManifestStore::to_json(const Manifest& manifest) {
    nlohmann::json files = nlohmann::json::array();

    for (const auto& record : manifest.files) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : record.entries) {
            entries.push_back({
                {kPlaceholder, entry.placeholder},
                {kCategory, category_to_string(entry.category)},
                {kFingerprint, entry.value_fingerprint},
                {kOccurrences, entry.occurrence_count},
            });
        }

        files.push_back({
            {kFileIdentity, record.file_identity},
            {kSourceName, record.source_name},
            {kFileContentHash, record.file_content_hash},
            {kRecordedAt, record.recorded_at},
            {kOutput, record.output},
            {kEntries, std::move(entries)},
        });
    }

    return {
        {kVersion, manifest.version},
        {kCreatedAt, manifest.created_at},
        {kPolicy, manifest.policy},
        {kFiles, std::move(files)},
    };
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

// Throws nlohmann::json::exception on type errors; caught by from_json
std::string required_string(const nlohmann::json& obj, std::string_view key) {
    const auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::runtime_error(std::format("missing field '{}'", key));
    }
    return it->get<std::string>();
}

} // anonymous namespace

Result<Manifest> ManifestStore::from_json(const nlohmann::json& doc) {
    try {
        if (!doc.is_object()) {
            return Result<Manifest>::error(ErrorCategory::INVALID_MANIFEST,
                "Manifest root is not an object");
        }

        Manifest manifest;
        manifest.version = doc.value(kVersion, kFormatVersion);
        if (manifest.version != kFormatVersion) {
            return Result<Manifest>::error(ErrorCategory::INVALID_MANIFEST,
                std::format("Unsupported manifest version {}", manifest.version));
        }
        manifest.created_at = doc.value(kCreatedAt, std::string{});
        manifest.policy = doc.value(kPolicy, std::string{});

        const auto files_it = doc.find(kFiles);
        if (files_it == doc.end() || !files_it->is_array()) {
            return Result<Manifest>::error(ErrorCategory::INVALID_MANIFEST,
                "Manifest has no 'files' array");
        }

        for (const auto& file : *files_it) {
            ManifestFileRecord record;
            record.file_identity = required_string(file, kFileIdentity);
            record.file_content_hash = required_string(file, kFileContentHash);
            record.source_name = file.value(kSourceName, std::string{});
            record.recorded_at = file.value(kRecordedAt, std::string{});
            record.output = file.value(kOutput, std::string{});

            for (const auto& e : file.at(kEntries)) {
                const auto tag = required_string(e, kCategory);
                const auto category = category_from_string(tag);
                if (!category) {
                    return Result<Manifest>::error(ErrorCategory::INVALID_MANIFEST,
                        std::format("Unknown category '{}' in manifest", tag));
                }

                RedactionEntry entry;
                entry.placeholder = required_string(e, kPlaceholder);
                entry.category = *category;
                entry.value_fingerprint = required_string(e, kFingerprint);
                entry.occurrence_count = e.at(kOccurrences).get<uint32_t>();
                if (entry.value_fingerprint.empty() || entry.occurrence_count == 0) {
                    return Result<Manifest>::error(ErrorCategory::INVALID_MANIFEST,
                        std::format("Malformed entry {} in manifest", entry.placeholder));
                }
                record.entries.emplace_back(std::move(entry));
            }

            manifest.files.emplace_back(std::move(record));
        }

        return Result<Manifest>::ok(std::move(manifest));

    } catch (const std::exception& e) {
        return Result<Manifest>::error(ErrorCategory::INVALID_MANIFEST,
            std::format("Malformed manifest: {}", e.what()));
    }
}

// ============================================================================
// File I/O
// ============================================================================

Result<Manifest> ManifestStore::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Manifest>::error(ErrorCategory::INVALID_MANIFEST,
            std::format("Manifest not found: {}", path));
    }

    const std::string buffer((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());

    const auto doc = nlohmann::json::parse(buffer, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return Result<Manifest>::error(ErrorCategory::INVALID_MANIFEST,
            std::format("Manifest is not valid JSON: {}", path));
    }

    auto result = from_json(doc);
    if (result.is_error()) {
        return Result<Manifest>::error(result.error_category(),
            std::format("{}: {}", path, result.error_message()));
    }
    return result;
}

Result<bool> ManifestStore::save(const std::string& path, const Manifest& manifest) {
    auto written = FileSource::write_atomic(path, to_json(manifest).dump(2) + "\n");
    if (written.is_error()) {
        return Result<bool>::error(written.error_category(),
            std::format("Cannot save manifest: {}", written.error_message()));
    }
    return written;
}

const ManifestFileRecord* ManifestStore::find_record(
    const Manifest& manifest,
    const std::string& file_identity) {

    for (auto it = manifest.files.rbegin(); it != manifest.files.rend(); ++it) {
        if (it->file_identity == file_identity) {
            return &*it;
        }
    }
    if (manifest.files.size() == 1) {
        return &manifest.files.front();
    }
    return nullptr;
}

} // namespace redactor
