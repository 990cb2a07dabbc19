// checksum.hpp - SHA-256 content hashing using OpenSSL
// Used to verify a temp copy against its source before commit

#ifndef FILEMOVER_CHECKSUM_HPP
#define FILEMOVER_CHECKSUM_HPP

#include <string>
#include <optional>
#include <cstddef>

namespace filemover {
namespace checksum {

// Hex-encoded SHA-256 of a whole file, read in CHUNK_SIZE blocks.
// Returns std::nullopt (and logs) if the file cannot be read or hashing fails.
std::optional<std::string> sha256_file(const std::string& path);

// Hex-encoded SHA-256 of an in-memory buffer
std::string sha256_hex(const std::string& data);

constexpr size_t CHUNK_SIZE = 64 * 1024;
constexpr size_t DIGEST_HEX_LENGTH = 64;

} // namespace checksum
} // namespace filemover

#endif // FILEMOVER_CHECKSUM_HPP
