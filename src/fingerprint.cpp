#include "strext/fingerprint.hpp"

#include "strext/util.hpp"

namespace strext {

TextEncoding legacy_encoding(Algorithm algo) {
  return algo == Algorithm::md5 ? TextEncoding::utf16le : TextEncoding::ascii;
}

std::string fingerprint(Algorithm algo, std::string_view expression, FingerprintEncoding policy) {
  const TextEncoding enc =
      policy == FingerprintEncoding::utf8 ? TextEncoding::utf8 : legacy_encoding(algo);
  const std::vector<std::uint8_t> bytes = encode(expression, enc);
  return to_hex(digest(algo, bytes));
}

std::string to_md5_fingerprint(std::string_view expression) {
  return fingerprint(Algorithm::md5, expression);
}

std::string to_sha1_fingerprint(std::string_view expression) {
  return fingerprint(Algorithm::sha1, expression);
}

std::string to_sha256_fingerprint(std::string_view expression) {
  return fingerprint(Algorithm::sha256, expression);
}

std::string to_sha512_fingerprint(std::string_view expression) {
  return fingerprint(Algorithm::sha512, expression);
}

std::string to_md5_fingerprint(const char *expression) {
  return to_md5_fingerprint(require_text(expression, "to_md5_fingerprint"));
}

std::string to_sha1_fingerprint(const char *expression) {
  return to_sha1_fingerprint(require_text(expression, "to_sha1_fingerprint"));
}

std::string to_sha256_fingerprint(const char *expression) {
  return to_sha256_fingerprint(require_text(expression, "to_sha256_fingerprint"));
}

std::string to_sha512_fingerprint(const char *expression) {
  return to_sha512_fingerprint(require_text(expression, "to_sha512_fingerprint"));
}

} // namespace strext
