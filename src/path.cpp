#include "strext/path.hpp"

#include "strext/consts.hpp"
#include "strext/encoding.hpp"
#include "strext/util.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace {

std::u32string normalized(std::u32string chars) {
  std::ranges::sort(chars);
  const auto dup = std::ranges::unique(chars);
  chars.erase(dup.begin(), dup.end());
  return chars;
}

} // namespace

namespace strext {

FileNameRules::FileNameRules(std::u32string chars) : chars_(normalized(std::move(chars))) {}

FileNameRules FileNameRules::posix() { return FileNameRules{std::u32string{U'\0', U'/'}}; }

FileNameRules FileNameRules::windows() {
  std::u32string chars{U'"', U'<', U'>', U'|', U'\0'};
  for (char32_t c = 1; c < 32; ++c)
    chars.push_back(c);
  chars += U":*?\\/";
  return FileNameRules{std::move(chars)};
}

FileNameRules FileNameRules::host() {
#if defined(_WIN32)
  return windows();
#else
  return posix();
#endif
}

bool FileNameRules::contains(char32_t cp) const {
  return std::ranges::binary_search(chars_, cp);
}

FileNameRules FileNameRules::with(std::u32string_view extra) const {
  std::u32string chars = chars_;
  chars.append(extra);
  return FileNameRules{std::move(chars)};
}

FileNameRules FileNameRules::without(std::u32string_view allowed) const {
  std::u32string chars;
  std::ranges::copy_if(chars_, std::back_inserter(chars), [&](char32_t c) {
    return allowed.find(c) == std::u32string_view::npos;
  });
  return FileNameRules{std::move(chars)};
}

bool is_valid_path_name(std::string_view expression, const FileNameRules &rules) {
  const std::u32string cps = decode_utf8(expression);
  return std::ranges::none_of(cps, [&](char32_t cp) { return rules.contains(cp); });
}

bool is_valid_virtual_path_name(std::string_view expression, const FileNameRules &rules) {
  if (!expression.starts_with(consts::kVirtualPrefix)) {
    return false;
  }
  expression.remove_prefix(consts::kVirtualPrefix.size());
  return is_valid_path_name(expression, rules);
}

bool is_valid_path_name(const char *expression, const FileNameRules &rules) {
  return is_valid_path_name(require_text(expression, "is_valid_path_name"), rules);
}

bool is_valid_virtual_path_name(const char *expression, const FileNameRules &rules) {
  return is_valid_virtual_path_name(require_text(expression, "is_valid_virtual_path_name"), rules);
}

} // namespace strext
