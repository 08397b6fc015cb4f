#pragma once

#include "classifier/risk_classifier.hpp"
#include "core/file_source.hpp"
#include "detector/pattern_detector.hpp"
#include "manifest/manifest_builder.hpp"
#include "redaction/redaction_mapper.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace redactor {

// ============================================================================
// Input Config
// ============================================================================

struct InputConfig {
    size_t max_bytes = kDefaultMaxInputBytes;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

// ============================================================================
// Top-level config (mirrors redactor.toml sections)
// ============================================================================

struct RedactorConfig {
    InputConfig input;
    PatternDetector::Config detector;
    RedactionMapper::Config redaction;
    RiskClassifier::Config risk;
    ManifestBuilder::Config manifest;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Supported conveniences on top of plain TOML:
 * - `include = "base.toml"` or `include = ["a.toml", "b.toml"]` (file loads only)
 * - `${VAR}` expansion in every string value
 *
 * Missing sections and keys fall back to the defaults above.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RedactorConfig config;

        static LoadResult ok(RedactorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to redactor.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config, returning every problem found (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RedactorConfig& config);

private:
    // Extractors append type and sign problems to errors and keep the default
    static InputConfig extract_input(const toml::table& root, std::vector<std::string>& errors);
    static PatternDetector::Config extract_detector(const toml::table& root, std::vector<std::string>& errors);
    static RedactionMapper::Config extract_redaction(const toml::table& root, std::vector<std::string>& errors);
    static RiskClassifier::Config extract_risk(const toml::table& root, std::vector<std::string>& errors);
    static ManifestBuilder::Config extract_manifest(const toml::table& root, size_t max_input_bytes);
    static LoggingConfig extract_logging(const toml::table& root);

    static RedactorConfig extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors);
    static LoadResult validate_and_return(RedactorConfig config, std::vector<std::string> errors);

    // Helper: parse keyword line mode string
    static std::optional<KeywordLineMode> parse_keyword_line_mode(const std::string& mode_str);
};

} // namespace redactor
