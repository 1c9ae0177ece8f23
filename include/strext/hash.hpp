#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strext {

enum class Algorithm { md5, sha1, sha256, sha512 };

// Digest length in bytes (16, 20, 32, 64).
std::size_t digest_size(Algorithm algo);

// Digest length rendered as hex (32, 40, 64, 128).
inline std::size_t hex_length(Algorithm algo) { return digest_size(algo) * 2; }

/**
 * Digest arbitrary bytes with the given algorithm (OpenSSL EVP).
 * Throws std::runtime_error if the EVP layer reports a failure.
 */
std::vector<std::uint8_t> digest(Algorithm algo, std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline std::vector<std::uint8_t> digest(Algorithm algo, std::string_view s) {
  return digest(algo, std::span<const std::uint8_t>(
                          reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Render bytes as lowercase hex, two digits per byte. */
std::string to_hex(std::span<const std::uint8_t> bytes);

// "md5", "sha1", "sha256", "sha512"
std::string_view algorithm_name(Algorithm algo);

// Inverse of algorithm_name; case-insensitive, accepts "sha-1" style too.
std::optional<Algorithm> parse_algorithm(std::string_view name);

} // namespace strext
