#include "detector/detection_rules.hpp"

#include <algorithm>
#include <cstdint>

namespace redactor {

// ============================================================================
// Lookup table for character classification. Locale-independent, one load
// per byte, shared by every rule.
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_DIGIT        = 1,
    CC_ALPHA        = 2,
    CC_SPACE        = 4,
    CC_TOKEN_PUNCT  = 8,    // _ -
    CC_LOCAL_PUNCT  = 16,   // . _ % + -
    CC_DOMAIN_PUNCT = 32,   // . -
};

struct CharTable {
    uint8_t cls[256];
    char    lower[256];

    constexpr CharTable() : cls{}, lower{} {
        for (int i = 0; i < 256; ++i) {
            lower[i] = static_cast<char>(i);
        }
        cls[static_cast<unsigned char>(' ')] = CC_SPACE;
        cls[static_cast<unsigned char>('\t')] = CC_SPACE;
        cls[static_cast<unsigned char>('\n')] = CC_SPACE;
        cls[static_cast<unsigned char>('\r')] = CC_SPACE;
        cls[static_cast<unsigned char>('\f')] = CC_SPACE;
        cls[static_cast<unsigned char>('\v')] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 'A'; i <= 'Z'; ++i) {
            cls[i] = CC_ALPHA;
            lower[i] = static_cast<char>(i + 32);
        }
        cls[static_cast<unsigned char>('_')] = CC_TOKEN_PUNCT | CC_LOCAL_PUNCT;
        cls[static_cast<unsigned char>('-')] = CC_TOKEN_PUNCT | CC_LOCAL_PUNCT | CC_DOMAIN_PUNCT;
        cls[static_cast<unsigned char>('.')] = CC_LOCAL_PUNCT | CC_DOMAIN_PUNCT;
        cls[static_cast<unsigned char>('%')] = CC_LOCAL_PUNCT;
        cls[static_cast<unsigned char>('+')] = CC_LOCAL_PUNCT;
    }
};

static constexpr CharTable CT{};

inline bool ct_is(unsigned char c, uint8_t mask) { return (CT.cls[c] & mask) != 0; }
inline bool ct_digit(char c)  { return ct_is(static_cast<unsigned char>(c), CC_DIGIT); }
inline bool ct_alpha(char c)  { return ct_is(static_cast<unsigned char>(c), CC_ALPHA); }
inline bool ct_alnum(char c)  { return ct_is(static_cast<unsigned char>(c), CC_DIGIT | CC_ALPHA); }
inline bool ct_space(char c)  { return ct_is(static_cast<unsigned char>(c), CC_SPACE); }
inline bool ct_token(char c)  { return ct_is(static_cast<unsigned char>(c), CC_DIGIT | CC_ALPHA | CC_TOKEN_PUNCT); }
inline bool ct_local(char c)  { return ct_is(static_cast<unsigned char>(c), CC_DIGIT | CC_ALPHA | CC_LOCAL_PUNCT); }
inline bool ct_domain(char c) { return ct_is(static_cast<unsigned char>(c), CC_DIGIT | CC_ALPHA | CC_DOMAIN_PUNCT); }
inline char ct_lower(char c)  { return CT.lower[static_cast<unsigned char>(c)]; }

/// Case-insensitive prefix test; `lower_prefix` must already be lowercase
bool starts_with_ci(std::string_view text, size_t pos, std::string_view lower_prefix) {
    if (text.size() - pos < lower_prefix.size()) return false;
    for (size_t i = 0; i < lower_prefix.size(); ++i) {
        if (ct_lower(text[pos + i]) != lower_prefix[i]) return false;
    }
    return true;
}

/// Case-insensitive find; `lower_needle` must already be lowercase
size_t find_ci(std::string_view haystack, std::string_view lower_needle) {
    if (lower_needle.empty() || haystack.size() < lower_needle.size()) {
        return std::string_view::npos;
    }
    const size_t last = haystack.size() - lower_needle.size();
    for (size_t i = 0; i <= last; ++i) {
        if (starts_with_ci(haystack, i, lower_needle)) return i;
    }
    return std::string_view::npos;
}

// Domain must contain a dot, no empty labels, and an alphabetic TLD >= 2 chars
bool valid_email_domain(std::string_view domain) {
    const size_t last_dot = domain.rfind('.');
    if (last_dot == std::string_view::npos) return false;

    const auto tld = domain.substr(last_dot + 1);
    if (tld.size() < 2) return false;
    for (const char c : tld) {
        if (!ct_alpha(c)) return false;
    }

    size_t label_start = 0;
    for (size_t i = 0; i <= domain.size(); ++i) {
        if (i == domain.size() || domain[i] == '.') {
            if (i == label_start) return false;
            label_start = i + 1;
        }
    }
    return true;
}

// Characters that may not directly precede a phone number
bool blocks_phone_start(char c) {
    return ct_alnum(c) || c == '_' || c == '-' || c == '.' || c == '+' || c == '/';
}

bool is_phone_separator(char c) {
    return c == '-' || c == '.' || c == ' ';
}

} // anonymous namespace

// ============================================================================
// EmailRule
// ============================================================================

void EmailRule::scan(std::string_view text, std::vector<Span>& out) const {
    size_t last_end = 0;

    for (size_t at = text.find('@'); at != std::string_view::npos; at = text.find('@', at + 1)) {
        if (at < last_end) continue;

        // Local part: walk left, bounded so adversarial runs stay linear
        size_t begin = at;
        while (begin > last_end && at - begin < kMaxLocalLength && ct_local(text[begin - 1])) {
            --begin;
        }
        if (begin > last_end && ct_local(text[begin - 1])) {
            continue;  // Local part longer than allowed
        }
        while (begin < at && text[begin] == '.') ++begin;
        if (begin == at) continue;

        // Domain: walk right, then drop trailing punctuation
        size_t end = at + 1;
        while (end < text.size() && end - at - 1 < kMaxDomainLength && ct_domain(text[end])) {
            ++end;
        }
        while (end > at + 1 && (text[end - 1] == '.' || text[end - 1] == '-')) --end;

        if (!valid_email_domain(text.substr(at + 1, end - at - 1))) continue;

        out.push_back({begin, end - begin});
        last_end = end;
    }
}

// ============================================================================
// PhoneRule
// ============================================================================

void PhoneRule::scan(std::string_view text, std::vector<Span>& out) const {
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        const char c = text[i];
        if (!(ct_digit(c) || c == '+' || c == '(') ||
            (i > 0 && blocks_phone_start(text[i - 1]))) {
            ++i;
            continue;
        }

        size_t p = i;
        size_t digits = 0;
        size_t end = i;
        bool overflow = false;

        if (text[p] == '+') {
            ++p;
            if (p >= n || !ct_digit(text[p])) {
                ++i;
                continue;
            }
        }

        // Digit groups, optionally parenthesized, joined by at most one separator
        while (true) {
            size_t q = p;
            const bool paren = (q < n && text[q] == '(');
            if (paren) ++q;

            const size_t group_start = q;
            while (q < n && ct_digit(text[q])) {
                ++q;
                if (++digits > max_digits) {
                    overflow = true;
                    break;
                }
            }
            if (overflow || q == group_start) break;
            if (paren) {
                if (q < n && text[q] == ')') {
                    ++q;
                } else {
                    digits -= q - group_start;
                    break;
                }
            }
            end = q;

            size_t s = q;
            if (s < n && is_phone_separator(text[s])) ++s;
            if (s < n && (ct_digit(text[s]) || text[s] == '(')) {
                p = s;
                continue;
            }
            break;
        }

        const bool bounded_end = end >= n ||
            !(ct_alnum(text[end]) || text[end] == '_' || text[end] == ':');

        if (!overflow && digits >= min_digits && bounded_end) {
            out.push_back({i, end - i});
            i = end;
        } else {
            ++i;
        }
    }
}

// ============================================================================
// UrlRule
// ============================================================================

void UrlRule::scan(std::string_view text, std::vector<Span>& out) const {
    static constexpr std::string_view kPrefixes[] = {"https://", "http://", "www."};

    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        const char lc = ct_lower(text[i]);
        if ((lc != 'h' && lc != 'w') || (i > 0 && ct_alnum(text[i - 1]))) {
            ++i;
            continue;
        }

        size_t prefix_len = 0;
        for (const auto prefix : kPrefixes) {
            if (starts_with_ci(text, i, prefix)) {
                prefix_len = prefix.size();
                break;
            }
        }
        if (prefix_len == 0) {
            ++i;
            continue;
        }

        size_t end = i + prefix_len;
        while (end < n && !ct_space(text[end]) &&
               text[end] != '"' && text[end] != '\'' && text[end] != '<' && text[end] != '>') {
            ++end;
        }
        while (end > i + prefix_len) {
            const char t = text[end - 1];
            if (t == '.' || t == ',' || t == ';' || t == ':' || t == '!' || t == '?' ||
                t == ')' || t == ']' || t == '}') {
                --end;
            } else {
                break;
            }
        }

        if (end == i + prefix_len) {
            i += prefix_len;
            continue;
        }

        out.push_back({i, end - i});
        i = end;
    }
}

// ============================================================================
// CredentialRule
// ============================================================================

void CredentialRule::scan(std::string_view text, std::vector<Span>& out) const {
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        if (!ct_token(text[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < n && ct_token(text[j])) ++j;
        if (j - i >= min_length) {
            out.push_back({i, j - i});
        }
        i = j;
    }
}

// ============================================================================
// KeywordLineRule
// ============================================================================

void KeywordLineRule::scan(std::string_view text, std::vector<Span>& out) const {
    if (keywords.empty()) return;

    const auto is_pad = [](char c) { return c == ' ' || c == '\t' || c == '\r'; };

    size_t line_start = 0;
    while (line_start <= text.size()) {
        size_t line_end = text.find('\n', line_start);
        if (line_end == std::string_view::npos) line_end = text.size();

        size_t b = line_start;
        size_t e = line_end;
        while (b < e && is_pad(text[b])) ++b;
        while (e > b && is_pad(text[e - 1])) --e;

        const auto line = text.substr(b, e - b);

        // Earliest keyword; the longer keyword wins a tie
        size_t hit = std::string_view::npos;
        size_t hit_len = 0;
        for (const auto& kw : keywords) {
            const size_t pos = find_ci(line, kw);
            if (pos == std::string_view::npos) continue;
            if (pos < hit || (pos == hit && kw.size() > hit_len)) {
                hit = pos;
                hit_len = kw.size();
            }
        }

        if (hit != std::string_view::npos) {
            if (mode == KeywordLineMode::LINE) {
                out.push_back({b, e - b});
            } else {
                size_t v = hit + hit_len;
                while (v < line.size() &&
                       (line[v] == ' ' || line[v] == '\t' || line[v] == ':' || line[v] == '=' ||
                        line[v] == '"' || line[v] == '\'' || line[v] == '`')) {
                    ++v;
                }
                size_t ve = line.size();
                while (ve > v && (line[ve - 1] == '"' || line[ve - 1] == '\'' ||
                                  line[ve - 1] == '`' || line[ve - 1] == ',' || line[ve - 1] == ';')) {
                    --ve;
                }
                if (ve > v) {
                    out.push_back({b + v, ve - v});
                }
            }
        }

        if (line_end == text.size()) break;
        line_start = line_end + 1;
    }
}

} // namespace redactor
