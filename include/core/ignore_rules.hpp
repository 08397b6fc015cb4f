#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace redactor {

/**
 * @brief .gitignore-style path filter for directory scans
 *
 * Supported pattern syntax (gitwildmatch subset):
 * - Blank lines and '#' comments are skipped; "\#" and "\!" escape
 * - '!' re-includes a path excluded by an earlier pattern
 * - Trailing '/' matches directories only
 * - A pattern containing '/' is anchored to the root; otherwise it matches
 *   the last path component at any depth
 * - '*', '?' and '[...]' within one component, '**' across components
 *
 * The last matching pattern wins. Paths are relative to the root, '/'-separated.
 */
class IgnoreRules {
public:
    static constexpr std::string_view kFileName = ".gitignore";

    IgnoreRules() = default;

    [[nodiscard]] static IgnoreRules parse(std::string_view content);

    /**
     * @brief Rules from <root>/.gitignore
     * @return Empty rules when the file does not exist, IO_ERROR if unreadable
     */
    [[nodiscard]] static Result<IgnoreRules> load(const std::string& root);

    [[nodiscard]] bool is_ignored(std::string_view relative_path, bool is_directory) const;

    [[nodiscard]] bool empty() const { return patterns_.empty(); }
    [[nodiscard]] size_t size() const { return patterns_.size(); }

private:
    struct Pattern {
        std::vector<std::string> segments;
        bool negated = false;
        bool directory_only = false;
        bool anchored = false;
    };

    std::vector<Pattern> patterns_;
};

} // namespace redactor
