#include "redaction/redaction_mapper.hpp"
#include "core/hashing.hpp"

#include <algorithm>
#include <unordered_map>

namespace redactor {

RedactionMapper::RedactionMapper(const Config& config) : config_(config) {
    config_.fingerprint_hex_length = std::clamp(
        config_.fingerprint_hex_length, kMinFingerprintLength, kMaxFingerprintLength);
}

std::string RedactionMapper::fingerprint(std::string_view value) const {
    return fingerprint(value, config_.fingerprint_hex_length);
}

std::string RedactionMapper::fingerprint(std::string_view value, size_t hex_length) {
    auto digest = sha256_hex(value);
    if (digest.size() > hex_length) {
        digest.resize(hex_length);
    }
    return digest;
}

std::string RedactionMapper::placeholder(Category category, std::string_view fingerprint) {
    std::string result;
    result.reserve(kPlaceholderPrefix.size() + 16 + fingerprint.size());
    result.append(kPlaceholderPrefix);
    result.append(category_to_string(category));
    result += ':';
    result.append(fingerprint);
    return result;
}

std::vector<RedactionEntry> RedactionMapper::build_table(const std::vector<Match>& matches) const {
    std::vector<RedactionEntry> table;
    std::unordered_map<std::string, size_t> index;  // "<category>:<fingerprint>" -> table slot

    for (const auto& match : matches) {
        auto fp = fingerprint(match.value);
        auto key = placeholder(match.category, fp);

        const auto it = index.find(key);
        if (it != index.end()) {
            ++table[it->second].occurrence_count;
            continue;
        }

        RedactionEntry entry;
        entry.placeholder = key;
        entry.category = match.category;
        entry.value_fingerprint = std::move(fp);
        entry.occurrence_count = 1;

        index.emplace(std::move(key), table.size());
        table.emplace_back(std::move(entry));
    }

    return table;
}

std::string RedactionMapper::render(std::string_view text, const std::vector<Match>& plan) const {
    std::vector<Substitution> substitutions;
    substitutions.reserve(plan.size());
    for (const auto& match : plan) {
        substitutions.push_back({
            match.begin(),
            match.value.size(),
            placeholder(match.category, fingerprint(match.value))});
    }
    return apply_substitutions(text, substitutions);
}

std::string RedactionMapper::apply_substitutions(
    std::string_view text,
    const std::vector<Substitution>& substitutions) {

    std::string out;
    out.reserve(text.size());

    size_t cursor = 0;
    for (const auto& sub : substitutions) {
        if (sub.offset < cursor || sub.offset + sub.length > text.size()) {
            continue;  // Overlapping or out of range; callers pass a resolved plan
        }
        out.append(text.substr(cursor, sub.offset - cursor));
        out.append(sub.replacement);
        cursor = sub.offset + sub.length;
    }
    out.append(text.substr(cursor));
    return out;
}

} // namespace redactor
