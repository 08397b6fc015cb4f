#include "manifest/manifest_builder.hpp"
#include "manifest/manifest_store.hpp"
#include "core/hashing.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace redactor {

namespace fs = std::filesystem;

namespace {

// <stem>.corrupt.json, then <stem>.corrupt.1.json, ... so earlier backups survive
fs::path free_backup_path(const fs::path& manifest_path) {
    std::error_code ec;
    fs::path backup = fs::path(manifest_path).replace_extension(".corrupt.json");
    for (size_t n = 1; fs::exists(backup, ec); ++n) {
        backup = fs::path(manifest_path).replace_extension(std::format(".corrupt.{}.json", n));
    }
    return backup;
}

} // anonymous namespace

Result<Manifest> ManifestBuilder::open_or_create() const {
    std::error_code ec;
    if (fs::exists(config_.manifest_path, ec)) {
        auto existing = ManifestStore::load(config_.manifest_path);
        if (existing.is_ok()) {
            return existing;
        }

        // Keep the unreadable document for inspection and start over
        const auto backup = free_backup_path(config_.manifest_path);
        fs::rename(config_.manifest_path, backup, ec);
        if (ec) {
            return Result<Manifest>::error(ErrorCategory::IO_ERROR,
                std::format("Manifest {} is unreadable and cannot be moved aside: {}",
                    config_.manifest_path, ec.message()));
        }
        utils::log::warn(std::format("{}; moved to {}",
            existing.error_message(), backup.string()));
    }

    Manifest manifest;
    manifest.version = ManifestStore::kFormatVersion;
    manifest.created_at = utils::format_timestamp_utc(utils::now());
    manifest.policy = config_.policy;
    return Result<Manifest>::ok(std::move(manifest));
}

Result<Manifest> ManifestBuilder::write(
    const std::string& file_identity,
    const std::string& file_content_hash,
    const std::vector<RedactionEntry>& entries,
    const std::string& output) const {

    // Fresh hash of the referenced file at build time
    const FileSource source(config_.max_input_bytes);
    auto current = source.load(file_identity);
    if (current.is_error()) {
        return Result<Manifest>::error_from(current);
    }

    const auto current_hash = sha256_hex(current.value().bytes);
    if (current_hash != file_content_hash) {
        return Result<Manifest>::error(ErrorCategory::INTEGRITY_ERROR,
            std::format("Content of {} changed since it was scanned; rescan before recording",
                current.value().identity));
    }

    auto opened = open_or_create();
    if (opened.is_error()) {
        return opened;
    }
    Manifest manifest = std::move(opened.value());

    ManifestFileRecord record;
    record.file_identity = current.value().identity;
    record.source_name = current.value().name;
    record.file_content_hash = current_hash;
    record.recorded_at = utils::format_timestamp_utc(utils::now());
    record.output = output;
    record.entries = entries;
    manifest.files.emplace_back(std::move(record));

    auto saved = ManifestStore::save(config_.manifest_path, manifest);
    if (saved.is_error()) {
        return Result<Manifest>::error_from(saved);
    }

    utils::log::info(std::format("Recorded {} redaction entries for {} in {}",
        entries.size(), current.value().identity, config_.manifest_path));
    return Result<Manifest>::ok(std::move(manifest));
}

} // namespace redactor
