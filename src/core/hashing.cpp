#include "core/hashing.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

namespace redactor {

std::string sha256_hex(std::string_view data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    return utils::to_hex(hash, hash_len);
}

} // namespace redactor
