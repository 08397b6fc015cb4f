#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace redactor {

/**
 * @brief Manifest persistence - JSON codec plus durable file I/O
 *
 * The manifest never holds raw values: entries carry placeholder, category,
 * fingerprint prefix and occurrence count only.
 *
 * save() writes a sibling temp file and renames it over the target so a
 * reader never observes a half-written manifest.
 */
class ManifestStore {
public:
    static constexpr int kFormatVersion = 1;

    [[nodiscard]] static nlohmann::json to_json(const Manifest& manifest);

    /**
     * @brief Decode a manifest document
     * @return INVALID_MANIFEST on missing fields, wrong types or unknown categories
     */
    [[nodiscard]] static Result<Manifest> from_json(const nlohmann::json& doc);

    /**
     * @brief Load and decode a manifest file
     * @return INVALID_MANIFEST if missing or malformed
     */
    [[nodiscard]] static Result<Manifest> load(const std::string& path);

    /**
     * @brief Atomically write a manifest file, creating parent directories
     * @return IO_ERROR on failure
     */
    [[nodiscard]] static Result<bool> save(const std::string& path, const Manifest& manifest);

    /**
     * @brief Latest record for a file identity
     *
     * A manifest holding exactly one record matches any identity, so a
     * single-file manifest can be replayed against a moved copy.
     * @return nullptr when no record applies
     */
    [[nodiscard]] static const ManifestFileRecord* find_record(
        const Manifest& manifest,
        const std::string& file_identity);
};

} // namespace redactor
