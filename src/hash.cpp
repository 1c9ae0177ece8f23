#include "strext/hash.hpp"
#include "strext/consts.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

const EVP_MD *evp_for(strext::Algorithm algo) {
  switch (algo) {
  case strext::Algorithm::md5:
    return EVP_md5();
  case strext::Algorithm::sha1:
    return EVP_sha1();
  case strext::Algorithm::sha256:
    return EVP_sha256();
  case strext::Algorithm::sha512:
    return EVP_sha512();
  }
  throw std::invalid_argument("unknown digest algorithm");
}

} // namespace

namespace strext {

std::size_t digest_size(Algorithm algo) {
  switch (algo) {
  case Algorithm::md5:
    return consts::kMd5RawLen;
  case Algorithm::sha1:
    return consts::kSha1RawLen;
  case Algorithm::sha256:
    return consts::kSha256RawLen;
  case Algorithm::sha512:
    return consts::kSha512RawLen;
  }
  throw std::invalid_argument("unknown digest algorithm");
}

std::vector<std::uint8_t> digest(Algorithm algo, std::span<const std::uint8_t> data) {
  std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
  const EVP_MD *md = evp_for(algo);

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestInit_ex(" + std::string(algorithm_name(algo)) +
                             ") failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(ctx);

  if (len != digest_size(algo)) {
    throw std::runtime_error(std::string(algorithm_name(algo)) +
                             " produced unexpected length");
  }
  out.resize(len);
  return out;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    unsigned b = bytes[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

std::string_view algorithm_name(Algorithm algo) {
  switch (algo) {
  case Algorithm::md5:
    return "md5";
  case Algorithm::sha1:
    return "sha1";
  case Algorithm::sha256:
    return "sha256";
  case Algorithm::sha512:
    return "sha512";
  }
  return "unknown";
}

std::optional<Algorithm> parse_algorithm(std::string_view name) {
  std::string key;
  key.reserve(name.size());
  for (char c : name) {
    if (c == '-' || c == '_')
      continue; // "SHA-256" == "sha256"
    key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  for (auto algo : {Algorithm::md5, Algorithm::sha1, Algorithm::sha256, Algorithm::sha512}) {
    if (key == algorithm_name(algo))
      return algo;
  }
  return std::nullopt;
}

} // namespace strext
