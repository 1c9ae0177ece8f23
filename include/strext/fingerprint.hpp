#pragma once
#include "strext/encoding.hpp"
#include "strext/hash.hpp"

#include <string>
#include <string_view>

namespace strext {

// How text is turned into bytes before it is digested.
enum class FingerprintEncoding {
  legacy, // MD5 over UTF-16LE, the SHA family over 7-bit ASCII
  utf8,   // every algorithm over the UTF-8 bytes
};

// Byte encoding the legacy policy uses for `algo`.
TextEncoding legacy_encoding(Algorithm algo);

/**
 * Digest `expression` and render it as lowercase hex.
 * The result has hex_length(algo) characters.
 */
std::string fingerprint(Algorithm algo, std::string_view expression,
                        FingerprintEncoding policy = FingerprintEncoding::legacy);

// Legacy-policy fingerprints (32, 40, 64 and 128 hex characters).
std::string to_md5_fingerprint(std::string_view expression);
std::string to_sha1_fingerprint(std::string_view expression);
std::string to_sha256_fingerprint(std::string_view expression);
std::string to_sha512_fingerprint(std::string_view expression);

// C-string overloads; a null pointer throws std::invalid_argument.
std::string to_md5_fingerprint(const char *expression);
std::string to_sha1_fingerprint(const char *expression);
std::string to_sha256_fingerprint(const char *expression);
std::string to_sha512_fingerprint(const char *expression);

} // namespace strext
