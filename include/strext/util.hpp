#pragma once
#include "strext/hash.hpp"

#include <string>
#include <string_view>

namespace strext {

// Lowercase hex of exactly hex_length(algo) characters
auto looks_fingerprint(std::string_view str, Algorithm algo) -> bool;

// Throws std::invalid_argument("<what>: null input") when `text` is null,
// otherwise views it.
auto require_text(const char *text, std::string_view what) -> std::string_view;

// String helpers
namespace strutil {
  // Strip leading/trailing spaces, tabs and CR
  std::string trim(std::string_view sv);
}

}
