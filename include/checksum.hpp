/**
 * @file checksum.hpp
 * @brief SHA-256 content hashing for upload verification.
 */

#ifndef ORGMIRRORBACKUP_CHECKSUM_HPP
#define ORGMIRRORBACKUP_CHECKSUM_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace omb {

/// Digest of a payload together with the number of bytes hashed.
struct ContentDigest {
  std::string sha256_hex;      ///< Lowercase hex SHA-256
  std::uint64_t size_bytes{0}; ///< Bytes consumed while hashing
};

/**
 * Hash a file by streaming it through SHA-256.
 *
 * @throws std::runtime_error When the file cannot be read or OpenSSL fails.
 */
ContentDigest sha256_file(const std::filesystem::path &path);

/// Hash an in-memory buffer.
ContentDigest sha256_bytes(const std::string &bytes);

/// Encode raw bytes as standard base64 without line breaks.
std::string base64_encode(const std::vector<unsigned char> &raw);

/**
 * Convert a hex digest to base64, the form S3 uses in checksum headers.
 *
 * @throws std::invalid_argument On odd length or non-hex characters.
 */
std::string hex_to_base64(const std::string &hex);

/**
 * Convert a base64 digest back to lowercase hex.
 *
 * @throws std::invalid_argument When @p b64 is not valid base64.
 */
std::string base64_to_hex(const std::string &b64);

} // namespace omb

#endif // ORGMIRRORBACKUP_CHECKSUM_HPP
