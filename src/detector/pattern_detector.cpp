#include "detector/pattern_detector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <span>
#include <utility>

namespace redactor {

namespace {

// Match ordering: offset, then longer span, then category order
bool match_before(const Match& a, const Match& b) {
    if (a.begin() != b.begin()) return a.begin() < b.begin();
    if (a.value.size() != b.value.size()) return a.value.size() > b.value.size();
    return a.category < b.category;
}

/// 1-based line number of a byte offset, given sorted newline offsets
size_t line_of(const std::vector<size_t>& newlines, size_t offset) {
    const auto it = std::lower_bound(newlines.begin(), newlines.end(), offset);
    return static_cast<size_t>(it - newlines.begin()) + 1;
}

struct Resolved {
    std::vector<Match> tokens;          // non-overlapping, ordered by offset
    std::vector<Match> keyword_lines;
};

// Token-level spans are greedy on (offset, longest); keyword lines set aside
Resolved resolve(std::vector<Match> matches) {
    std::sort(matches.begin(), matches.end(), match_before);

    Resolved resolved;
    size_t last_end = 0;
    for (auto& m : matches) {
        if (!is_token_category(m.category)) {
            resolved.keyword_lines.emplace_back(std::move(m));
            continue;
        }
        if (resolved.tokens.empty() || m.begin() >= last_end) {
            last_end = m.end();
            resolved.tokens.emplace_back(std::move(m));
        }
    }
    return resolved;
}

/// Tokens intersecting a span; tokens are disjoint, so their ends are sorted too
std::pair<const Match*, const Match*> overlapping(std::span<const Match> tokens, const Match& span) {
    auto first = std::upper_bound(tokens.begin(), tokens.end(), span.begin(),
        [](size_t offset, const Match& m) { return offset < m.end(); });
    auto last = first;
    while (last != tokens.end() && last->begin() < span.end()) {
        ++last;
    }
    return {std::to_address(first), std::to_address(last)};
}

// Part of a keyword line between token spans, trimmed of blanks
void append_fragment(const Match& line, size_t begin, size_t end, std::vector<Match>& out) {
    constexpr std::string_view kBlank = " \t\r";
    const auto piece = std::string_view(line.value).substr(begin - line.begin(), end - begin);
    const size_t first = piece.find_first_not_of(kBlank);
    if (first == std::string_view::npos) {
        return;
    }
    const size_t last = piece.find_last_not_of(kBlank);

    Match fragment;
    fragment.category = line.category;
    fragment.value.assign(piece.substr(first, last - first + 1));
    fragment.locator = line.locator;
    fragment.locator.offset = begin + first;
    out.emplace_back(std::move(fragment));
}

} // anonymous namespace

PatternDetector::PatternDetector(const Config& config)
    : config_(config),
      rules_{
          EmailRule{},
          PhoneRule{config.phone_min_digits, config.phone_max_digits},
          UrlRule{},
          CredentialRule{config.credential_min_length},
          KeywordLineRule{{}, config.keyword_line_mode}} {

    // Keywords are matched case-insensitively against lowercase needles
    auto& keyword_rule = std::get<KeywordLineRule>(rules_[category_index(Category::KEYWORD_LINE)]);
    for (const auto& kw : config_.keywords) {
        if (!kw.empty()) {
            keyword_rule.keywords.push_back(utils::to_lower(kw));
        }
    }
}

std::vector<Match> PatternDetector::detect(std::string_view text, std::string_view source) const {
    return detect(text, source, std::vector<Category>(kAllCategories.begin(), kAllCategories.end()));
}

std::vector<Match> PatternDetector::detect(
    std::string_view text,
    std::string_view source,
    const std::vector<Category>& categories) const {

    std::vector<Match> matches;
    if (text.empty() || categories.empty()) {
        return matches;
    }

    std::vector<size_t> newlines;
    for (size_t pos = text.find('\n'); pos != std::string_view::npos; pos = text.find('\n', pos + 1)) {
        newlines.push_back(pos);
    }

    std::vector<Span> spans;
    for (const auto& rule : rules_) {
        const Category category = rule_category(rule);
        if (std::find(categories.begin(), categories.end(), category) == categories.end()) {
            continue;
        }

        spans.clear();
        scan_rule(rule, text, spans);

        for (const auto& span : spans) {
            Match match;
            match.category = category;
            match.value.assign(text.substr(span.offset, span.length));
            match.locator.source.assign(source);
            match.locator.offset = span.offset;
            match.locator.line = line_of(newlines, span.offset);
            matches.emplace_back(std::move(match));
        }
    }

    std::sort(matches.begin(), matches.end(), match_before);
    return matches;
}

std::vector<Match> PatternDetector::plan(std::vector<Match> matches) {
    auto resolved = resolve(std::move(matches));

    std::vector<Match> kept;
    for (const auto& line : resolved.keyword_lines) {
        const auto [first, last] = overlapping(resolved.tokens, line);
        size_t cursor = line.begin();
        for (auto it = first; it != last; ++it) {
            if (it->begin() > cursor) {
                append_fragment(line, cursor, it->begin(), kept);
            }
            cursor = std::max(cursor, it->end());
        }
        if (cursor < line.end()) {
            append_fragment(line, cursor, line.end(), kept);
        }
    }

    kept.insert(kept.end(),
                std::make_move_iterator(resolved.tokens.begin()),
                std::make_move_iterator(resolved.tokens.end()));
    std::sort(kept.begin(), kept.end(), match_before);
    return kept;
}

std::vector<Match> PatternDetector::findings(std::vector<Match> matches) {
    auto resolved = resolve(std::move(matches));

    std::vector<Match> kept = std::move(resolved.tokens);
    const size_t token_count = kept.size();
    for (auto& line : resolved.keyword_lines) {
        const auto [first, last] = overlapping(
            std::span<const Match>(kept.data(), token_count), line);
        if (first == last) {
            kept.emplace_back(std::move(line));
        }
    }

    std::sort(kept.begin(), kept.end(), match_before);
    return kept;
}

} // namespace redactor
