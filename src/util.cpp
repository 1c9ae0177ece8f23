// Shared helpers for argument checks and fingerprint shapes
#include "strext/util.hpp"

#include "strext/consts.hpp"

#include <algorithm>
#include <stdexcept>

namespace strext {

bool looks_fingerprint(std::string_view str, Algorithm algo) {
  if (str.size() != hex_length(algo)) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

std::string_view require_text(const char *text, std::string_view what) {
  if (text == nullptr) {
    throw std::invalid_argument(std::string(what) + ": null input");
  }
  return std::string_view{text};
}

namespace strutil {

std::string trim(std::string_view sv) {
  auto is_pad = [](char c) {
    return c == consts::kSpace || c == consts::kTab || c == consts::kCR;
  };
  while (!sv.empty() && is_pad(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_pad(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace strutil

} // namespace strext
