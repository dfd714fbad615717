//! # Content Hashing
//!
//! SHA-256 digests used as source fingerprints. Backed by OpenSSL's EVP
//! interface; digests are rendered as 64 lower-case hex characters.

#ifndef CYFORGE_COMMON_CONTENT_HASH_HPP
#define CYFORGE_COMMON_CONTENT_HASH_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cyforge {

/// Hex-encoded SHA-256 of an in-memory buffer.
std::string hash_bytes(std::string_view data);

/// Hex-encoded SHA-256 of a file's contents, streamed in fixed-size chunks.
///
/// Returns a CacheError when the file cannot be opened or read.
Result<std::string, CacheError> hash_file(const std::filesystem::path& path);

/// Lower-case hex encoding of raw bytes.
std::string to_hex(const unsigned char* data, size_t len);

} // namespace cyforge

#endif // CYFORGE_COMMON_CONTENT_HASH_HPP
