#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iterator>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace redactor {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_in_string(toml::value<std::string>& s) {
    auto expanded = expand_env_vars(s.get());
    if (expanded != s.get()) {
        s = std::move(expanded);
    }
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            expand_env_vars_in_string(*val.as_string());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            expand_env_vars_in_string(*elem.as_string());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars and arrays.
 *
 * Arrays are replaced rather than concatenated: a keyword list in the main
 * file overrides the included one instead of extending it.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {} (possible circular include)", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/// Non-negative integer with a default; a bad value is reported and the default kept
size_t toml_size(const toml::table& tbl, const std::string_view section, const std::string_view key,
                 const size_t fallback, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (!node.is_integer()) {
        errors.push_back(std::format("{}.{} must be an integer", section, key));
        return fallback;
    }
    const int64_t v = node.as_integer()->get();
    if (v < 0) {
        errors.push_back(std::format("{}.{} must not be negative, got {}", section, key, v));
        return fallback;
    }
    return static_cast<size_t>(v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<KeywordLineMode> ConfigLoader::parse_keyword_line_mode(const std::string& mode_str) {
    const std::string lower = utils::to_lower(mode_str);

    static const std::unordered_map<std::string, KeywordLineMode> lookup = {
        {"line",  KeywordLineMode::LINE},
        {"value", KeywordLineMode::VALUE},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

InputConfig ConfigLoader::extract_input(const toml::table& root, std::vector<std::string>& errors) {
    InputConfig cfg;
    const auto* input = root["input"].as_table();
    if (!input) return cfg;

    cfg.max_bytes = toml_size(*input, "input", "max_bytes", cfg.max_bytes, errors);
    return cfg;
}

PatternDetector::Config ConfigLoader::extract_detector(
    const toml::table& root, std::vector<std::string>& errors) {
    PatternDetector::Config cfg;
    const auto* detector = root["detector"].as_table();
    if (!detector) return cfg;
    const auto& d = *detector;

    if (d["keywords"].is_array()) {
        cfg.keywords = toml_string_array(d, "keywords");
    }
    cfg.credential_min_length =
        toml_size(d, "detector", "credential_min_length", cfg.credential_min_length, errors);
    cfg.phone_min_digits = toml_size(d, "detector", "phone_min_digits", cfg.phone_min_digits, errors);
    cfg.phone_max_digits = toml_size(d, "detector", "phone_max_digits", cfg.phone_max_digits, errors);

    const std::string mode = d["keyword_line_mode"].value_or("line"s);
    if (const auto parsed = parse_keyword_line_mode(mode)) {
        cfg.keyword_line_mode = *parsed;
    } else {
        errors.push_back(
            std::format("detector.keyword_line_mode must be \"line\" or \"value\", got \"{}\"", mode));
    }
    return cfg;
}

RedactionMapper::Config ConfigLoader::extract_redaction(
    const toml::table& root, std::vector<std::string>& errors) {
    RedactionMapper::Config cfg;
    const auto* redaction = root["redaction"].as_table();
    if (!redaction) return cfg;

    cfg.fingerprint_hex_length =
        toml_size(*redaction, "redaction", "fingerprint_hex_length", cfg.fingerprint_hex_length, errors);
    return cfg;
}

RiskClassifier::Config ConfigLoader::extract_risk(const toml::table& root, std::vector<std::string>& errors) {
    RiskClassifier::Config cfg;
    const auto* risk = root["risk"].as_table();
    if (!risk) return cfg;
    const auto& r = *risk;

    cfg.max_emails = toml_size(r, "risk", "max_emails", cfg.max_emails, errors);
    cfg.max_phones = toml_size(r, "risk", "max_phones", cfg.max_phones, errors);
    cfg.max_urls = toml_size(r, "risk", "max_urls", cfg.max_urls, errors);
    cfg.max_total = toml_size(r, "risk", "max_total", cfg.max_total, errors);
    cfg.sample_limit = toml_size(r, "risk", "sample_limit", cfg.sample_limit, errors);
    return cfg;
}

ManifestBuilder::Config ConfigLoader::extract_manifest(const toml::table& root, size_t max_input_bytes) {
    ManifestBuilder::Config cfg;
    cfg.max_input_bytes = max_input_bytes;
    const auto* manifest = root["manifest"].as_table();
    if (!manifest) return cfg;
    const auto& m = *manifest;

    cfg.manifest_path = m["path"].value_or(cfg.manifest_path);
    cfg.policy = m["policy"].value_or(cfg.policy);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    cfg.file = l["file"].value_or(""s);
    return cfg;
}

// ---- Aggregation -----------------------------------------------------------

RedactorConfig ConfigLoader::extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors) {
    RedactorConfig config;
    config.input = extract_input(tbl, errors);
    config.detector = extract_detector(tbl, errors);
    config.redaction = extract_redaction(tbl, errors);
    config.risk = extract_risk(tbl, errors);
    config.manifest = extract_manifest(tbl, config.input.max_bytes);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(
    RedactorConfig config, std::vector<std::string> errors) {
    // Extraction problems first, then range checks on what was extracted
    auto validation = validate_config(config);
    errors.insert(errors.end(), std::make_move_iterator(validation.begin()),
                  std::make_move_iterator(validation.end()));
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RedactorConfig& config) {
    std::vector<std::string> errors;

    if (config.input.max_bytes == 0) {
        errors.emplace_back("input.max_bytes must be greater than 0");
    }

    const auto& d = config.detector;
    for (size_t i = 0; i < d.keywords.size(); ++i) {
        if (utils::trim(d.keywords[i]).empty()) {
            errors.push_back(std::format("detector.keywords[{}] must not be empty", i));
        }
    }
    if (d.credential_min_length < 8) {
        errors.push_back(std::format(
            "detector.credential_min_length must be at least 8, got {}", d.credential_min_length));
    }
    if (d.phone_min_digits == 0) {
        errors.emplace_back("detector.phone_min_digits must be greater than 0");
    }
    if (d.phone_min_digits > d.phone_max_digits) {
        errors.push_back(std::format(
            "detector.phone_min_digits ({}) must not exceed detector.phone_max_digits ({})",
            d.phone_min_digits, d.phone_max_digits));
    }

    const size_t fp_len = config.redaction.fingerprint_hex_length;
    if (fp_len < RedactionMapper::kMinFingerprintLength ||
        fp_len > RedactionMapper::kMaxFingerprintLength) {
        errors.push_back(std::format(
            "redaction.fingerprint_hex_length must be {}-{}, got {}",
            RedactionMapper::kMinFingerprintLength, RedactionMapper::kMaxFingerprintLength, fp_len));
    }

    if (config.manifest.manifest_path.empty()) {
        errors.emplace_back("manifest.path must not be empty");
    }
    if (config.manifest.policy.empty()) {
        errors.emplace_back("manifest.policy must not be empty");
    }

    utils::log::Level level;
    if (!utils::log::parse_level(config.logging.level, level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got \"{}\"", config.logging.level));
    }

    return errors;
}

} // namespace redactor
