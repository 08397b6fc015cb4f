#include "core/file_source.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace redactor {

namespace fs = std::filesystem;

std::string FileSource::identity_of(const std::string& path) {
    std::error_code ec;
    auto canonical = fs::canonical(path, ec);
    if (!ec) {
        return canonical.string();
    }
    return fs::absolute(path, ec).lexically_normal().string();
}

Result<bool> FileSource::write_atomic(const std::string& path, std::string_view content) {
    std::error_code ec;
    const fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result<bool>::error(ErrorCategory::IO_ERROR,
                std::format("Cannot create directory {}: {}",
                    target.parent_path().string(), ec.message()));
        }
    }

    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Result<bool>::error(ErrorCategory::IO_ERROR,
                std::format("Cannot open {} for writing", tmp_path));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmp_path, ec);
            return Result<bool>::error(ErrorCategory::IO_ERROR,
                std::format("Write failed: {}", tmp_path));
        }
    }

    fs::rename(tmp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return Result<bool>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot replace {}: {}", path, ec.message()));
    }
    return Result<bool>::ok(true);
}

Result<bool> FileSource::validate(std::string_view bytes) const {
    if (bytes.size() > max_bytes_) {
        return Result<bool>::error(ErrorCategory::INPUT_TOO_LARGE,
            std::format("Input is {} bytes, limit is {} bytes", bytes.size(), max_bytes_));
    }
    if (bytes.find('\0') != std::string_view::npos) {
        return Result<bool>::error(ErrorCategory::BINARY_UNSUPPORTED,
            "Input contains a null byte; binary content is not supported");
    }
    return Result<bool>::ok(true);
}

Result<SourceFile> FileSource::load(const std::string& path) const {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Result<SourceFile>::error(ErrorCategory::INVALID_PATH,
            std::format("File not found: {}", path));
    }
    if (!fs::is_regular_file(status)) {
        return Result<SourceFile>::error(ErrorCategory::INVALID_PATH,
            std::format("Not a regular file: {}", path));
    }

    // Size ceiling is enforced before a single byte is read
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Result<SourceFile>::error(ErrorCategory::INVALID_PATH,
            std::format("Cannot stat {}: {}", path, ec.message()));
    }
    if (size > max_bytes_) {
        return Result<SourceFile>::error(ErrorCategory::INPUT_TOO_LARGE,
            std::format("{} is {} bytes, limit is {} bytes", path, size, max_bytes_));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<SourceFile>::error(ErrorCategory::INVALID_PATH,
            std::format("Cannot open file: {}", path));
    }

    SourceFile source;
    source.path = path;
    source.identity = identity_of(path);
    source.name = fs::path(path).filename().string();
    source.bytes.assign(std::istreambuf_iterator<char>(file),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<SourceFile>::error(ErrorCategory::INVALID_PATH,
            std::format("Read failed: {}", path));
    }

    // The file may have grown between stat and read
    auto checked = validate(source.bytes);
    if (checked.is_error()) {
        return Result<SourceFile>::error(checked.error_category(),
            std::format("{}: {}", path, checked.error_message()));
    }

    utils::log::debug(std::format("Loaded {} ({} bytes)", source.identity, source.bytes.size()));
    return Result<SourceFile>::ok(std::move(source));
}

} // namespace redactor
