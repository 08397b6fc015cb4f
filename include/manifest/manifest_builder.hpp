#pragma once

#include "core/error.hpp"
#include "core/file_source.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace redactor {

/**
 * @brief Manifest builder - records a redaction table against file content
 *
 * write() re-reads the referenced file and refuses (INTEGRITY_ERROR) to record
 * entries against a content hash that no longer matches it. On success the
 * record is appended to the manifest at manifest_path (created on first use)
 * and the whole document is written atomically.
 *
 * Callers serialize writes per manifest file; the builder holds no state
 * between calls.
 */
class ManifestBuilder {
public:
    struct Config {
        std::string manifest_path = ".redactor/manifest.json";
        std::string policy = "default";
        size_t max_input_bytes = kDefaultMaxInputBytes;
    };

    ManifestBuilder() : ManifestBuilder(Config{}) {}
    explicit ManifestBuilder(const Config& config) : config_(config) {}

    /**
     * @brief Append a record for a file and persist the manifest
     * @param file_identity Path of the original file
     * @param file_content_hash SHA-256 hex of the bytes the entries were built from
     * @param entries Redaction table
     * @param output Path of the sanitized copy (may be empty)
     * @return The manifest as written
     */
    [[nodiscard]] Result<Manifest> write(
        const std::string& file_identity,
        const std::string& file_content_hash,
        const std::vector<RedactionEntry>& entries,
        const std::string& output = {}) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    /// Existing manifest, or a fresh one. A corrupt file is moved aside to an unused backup name.
    [[nodiscard]] Result<Manifest> open_or_create() const;

    Config config_;
};

} // namespace redactor
