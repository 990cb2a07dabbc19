// checksum.cpp - SHA-256 content hashing implementation
// Uses the OpenSSL EVP digest interface

#include "checksum.hpp"
#include "logger.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>

#include <fstream>
#include <memory>
#include <vector>

namespace filemover {
namespace checksum {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string to_hex(const unsigned char* data, unsigned int length) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // namespace

std::optional<std::string> sha256_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Logger::error("[Checksum] Cannot open " + path + " for hashing");
        return std::nullopt;
    }

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        Logger::error("[Checksum] Digest init failed: " + openssl_error());
        return std::nullopt;
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            Logger::error("[Checksum] Digest update failed for " + path + ": " + openssl_error());
            return std::nullopt;
        }
    }
    if (in.bad()) {
        Logger::error("[Checksum] Read error while hashing " + path);
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        Logger::error("[Checksum] Digest final failed for " + path + ": " + openssl_error());
        return std::nullopt;
    }

    return to_hex(digest, digest_len);
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        Logger::error("[Checksum] In-memory digest failed: " + openssl_error());
        return "";
    }
    return to_hex(digest, digest_len);
}

} // namespace checksum
} // namespace filemover
