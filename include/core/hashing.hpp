#pragma once

#include <string>
#include <string_view>

namespace redactor {

/**
 * @brief SHA-256 of a byte sequence as 64 lowercase hex characters
 *
 * Used for file content hashes and (truncated) value fingerprints.
 * Returns an empty string only if OpenSSL cannot allocate a digest context.
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace redactor
