#include "core/ignore_rules.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace redactor {

namespace {

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) slash = path.size();
        if (slash > start) {
            parts.emplace_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return parts;
}

/// Does the single-character element at pat[pi] accept c? Sets its length.
bool element_matches(std::string_view pat, size_t pi, char c, size_t& len) {
    const auto uc = static_cast<unsigned char>(c);

    if (pat[pi] == '?') {
        len = 1;
        return true;
    }
    if (pat[pi] == '\\' && pi + 1 < pat.size()) {
        len = 2;
        return pat[pi + 1] == c;
    }
    if (pat[pi] == '[') {
        size_t i = pi + 1;
        bool negate = false;
        if (i < pat.size() && (pat[i] == '!' || pat[i] == '^')) {
            negate = true;
            ++i;
        }

        bool matched = false;
        bool first = true;
        while (i < pat.size() && (first || pat[i] != ']')) {
            first = false;
            if (pat[i] == '\\' && i + 1 < pat.size()) ++i;
            auto lo = static_cast<unsigned char>(pat[i]);
            auto hi = lo;
            if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
                hi = static_cast<unsigned char>(pat[i + 2]);
                i += 2;
            }
            if (uc >= lo && uc <= hi) matched = true;
            ++i;
        }

        if (i >= pat.size()) {
            // Unterminated class: a literal '['
            len = 1;
            return c == '[';
        }
        len = i + 1 - pi;
        return matched != negate;
    }

    len = 1;
    return pat[pi] == c;
}

// Glob match of one path component; '*' backtracks to the last star only
bool match_component(std::string_view pat, std::string_view name) {
    size_t p = 0;
    size_t n = 0;
    size_t star_p = std::string_view::npos;
    size_t star_n = 0;

    while (n < name.size()) {
        if (p < pat.size() && pat[p] == '*') {
            while (p < pat.size() && pat[p] == '*') ++p;
            star_p = p;
            star_n = n;
            continue;
        }
        size_t len = 0;
        if (p < pat.size() && element_matches(pat, p, name[n], len)) {
            p += len;
            ++n;
            continue;
        }
        if (star_p == std::string_view::npos) {
            return false;
        }
        p = star_p;
        n = ++star_n;
    }

    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

bool match_segments(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& path, size_t si) {
    if (pi == pat.size()) {
        return si == path.size();
    }
    if (pat[pi] == "**") {
        // Trailing "**" matches everything below, not the directory itself
        if (pi + 1 == pat.size()) {
            return si < path.size();
        }
        for (size_t k = si; k <= path.size(); ++k) {
            if (match_segments(pat, pi + 1, path, k)) return true;
        }
        return false;
    }
    if (si == path.size()) {
        return false;
    }
    return match_component(pat[pi], path[si]) && match_segments(pat, pi + 1, path, si + 1);
}

} // anonymous namespace

IgnoreRules IgnoreRules::parse(std::string_view content) {
    IgnoreRules rules;

    size_t start = 0;
    while (start < content.size()) {
        size_t eol = content.find('\n', start);
        if (eol == std::string_view::npos) eol = content.size();
        std::string_view line = content.substr(start, eol - start);
        start = eol + 1;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        while (!line.empty() && line.back() == ' ' &&
               !(line.size() >= 2 && line[line.size() - 2] == '\\')) {
            line.remove_suffix(1);
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }

        Pattern pattern;
        if (line.front() == '!') {
            pattern.negated = true;
            line.remove_prefix(1);
        } else if (line.starts_with("\\#") || line.starts_with("\\!")) {
            line.remove_prefix(1);
        }

        while (!line.empty() && line.back() == '/') {
            pattern.directory_only = true;
            line.remove_suffix(1);
        }
        if (line.empty()) {
            continue;
        }

        if (line.front() == '/') {
            pattern.anchored = true;
            line.remove_prefix(1);
        } else {
            pattern.anchored = line.find('/') != std::string_view::npos;
        }

        pattern.segments = split_path(line);
        if (!pattern.segments.empty()) {
            rules.patterns_.emplace_back(std::move(pattern));
        }
    }

    return rules;
}

Result<IgnoreRules> IgnoreRules::load(const std::string& root) {
    const auto path = std::filesystem::path(root) / kFileName;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<IgnoreRules>::ok(IgnoreRules{});
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Result<IgnoreRules>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot read {}", path.string()));
    }
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return Result<IgnoreRules>::ok(parse(content));
}

bool IgnoreRules::is_ignored(std::string_view relative_path, bool is_directory) const {
    const auto path = split_path(relative_path);
    if (path.empty()) {
        return false;
    }

    bool ignored = false;
    for (const auto& pattern : patterns_) {
        if (pattern.directory_only && !is_directory) {
            continue;
        }
        const bool matched = pattern.anchored
            ? match_segments(pattern.segments, 0, path, 0)
            : pattern.segments.size() == 1 && match_component(pattern.segments.front(), path.back());
        if (matched) {
            ignored = !pattern.negated;
        }
    }
    return ignored;
}

} // namespace redactor
