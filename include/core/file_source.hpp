#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace redactor {

inline constexpr size_t kDefaultMaxInputBytes = 2ULL * 1024 * 1024;  // 2 MiB

/**
 * @brief Validated input file: identity, name and full byte content
 */
struct SourceFile {
    std::string path;       // Path as given by the caller
    std::string identity;   // Canonical absolute path
    std::string name;       // File name component
    std::string bytes;
};

/**
 * @brief Bounded, validating file reader
 *
 * Rejects inputs before any detection runs:
 * - INVALID_PATH:       missing, not a regular file, or unreadable
 * - INPUT_TOO_LARGE:    size above max_bytes (checked before reading)
 * - BINARY_UNSUPPORTED: content contains a null byte
 */
class FileSource {
public:
    explicit FileSource(size_t max_bytes = kDefaultMaxInputBytes)
        : max_bytes_(max_bytes) {}

    [[nodiscard]] Result<SourceFile> load(const std::string& path) const;

    /// Same size and binary checks for content that is already in memory
    [[nodiscard]] Result<bool> validate(std::string_view bytes) const;

    /// Canonical identity of a path, or the lexically normalized absolute path
    /// when the file does not exist
    [[nodiscard]] static std::string identity_of(const std::string& path);

    /**
     * @brief Replace a file's content atomically (sibling temp file + rename)
     *
     * Parent directories are created. A reader sees the old content or the
     * new content, never a partial write.
     * @return IO_ERROR on failure
     */
    [[nodiscard]] static Result<bool> write_atomic(const std::string& path, std::string_view content);

    [[nodiscard]] size_t max_bytes() const { return max_bytes_; }

private:
    size_t max_bytes_;
};

} // namespace redactor
