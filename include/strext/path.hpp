#pragma once
#include <string>
#include <string_view>

namespace strext {

/**
 * The set of characters a file name may not contain.
 *
 * Which characters are forbidden depends on the filesystem, so the set is a
 * value handed to the validators rather than a fixed list. Use the presets
 * for the common platforms, or build one directly to pin the set in tests.
 */
class FileNameRules {
public:
  FileNameRules() = default;
  explicit FileNameRules(std::u32string chars);

  // NUL and '/'
  static FileNameRules posix();
  // '"' '<' '>' '|' NUL U+0001..U+001F ':' '*' '?' '\' '/'
  static FileNameRules windows();
  // The preset matching the platform this library was built for.
  static FileNameRules host();

  [[nodiscard]] bool contains(char32_t cp) const;
  [[nodiscard]] const std::u32string &chars() const { return chars_; }

  // Copies with characters added or removed.
  [[nodiscard]] FileNameRules with(std::u32string_view extra) const;
  [[nodiscard]] FileNameRules without(std::u32string_view allowed) const;

  bool operator==(const FileNameRules &other) const = default;

private:
  std::u32string chars_; // sorted, unique
};

/**
 * True if no character of `expression` is forbidden by `rules`.
 * Path separators count too: they are forbidden in a file name on every
 * preset.
 */
bool is_valid_path_name(std::string_view expression,
                        const FileNameRules &rules = FileNameRules::host());

/**
 * True if `expression` starts with "~/" and the rest is a valid path name
 * under `rules`. Without the prefix the answer is false.
 * Nested paths such as "~/images/foo.png" need `rules.without(U"/")`.
 */
bool is_valid_virtual_path_name(std::string_view expression,
                                const FileNameRules &rules = FileNameRules::host());

// C-string overloads; a null pointer throws std::invalid_argument.
bool is_valid_path_name(const char *expression,
                        const FileNameRules &rules = FileNameRules::host());
bool is_valid_virtual_path_name(const char *expression,
                                const FileNameRules &rules = FileNameRules::host());

} // namespace strext
