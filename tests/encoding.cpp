#include "strext/encoding.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using strext::TextEncoding;

int main() {
  // Decoding
  if (strext::decode_utf8("a\xC3\xA9") != std::u32string{U'a', 0xE9}) {
    std::cerr << "decode two-byte sequence\n";
    return 1;
  }
  if (strext::decode_utf8("\xF0\x9F\x98\x80") != std::u32string{0x1F600}) {
    std::cerr << "decode four-byte sequence\n";
    return 1;
  }
  // Ill-formed input: one U+FFFD per maximal ill-formed subsequence
  if (strext::decode_utf8("\xFF") != std::u32string{0xFFFD}) {
    std::cerr << "invalid lead byte\n";
    return 1;
  }
  if (strext::decode_utf8("\xE2\x82x") != std::u32string{0xFFFD, U'x'}) {
    std::cerr << "truncated sequence\n";
    return 1;
  }
  if (strext::decode_utf8("\xC0\xAF") != std::u32string{0xFFFD, 0xFFFD}) {
    std::cerr << "overlong sequence\n";
    return 1;
  }
  if (strext::decode_utf8("\xED\xA0\x80").size() != 3) {
    std::cerr << "encoded surrogate should decode as three replacements\n";
    return 1;
  }

  // UTF-16
  if (strext::to_utf16("\xF0\x9F\x98\x80") != std::u16string{0xD83D, 0xDE00}) {
    std::cerr << "surrogate pair\n";
    return 1;
  }
  if (strext::encode("ab", TextEncoding::utf16le) !=
      std::vector<std::uint8_t>{'a', 0x00, 'b', 0x00}) {
    std::cerr << "utf16le byte order\n";
    return 1;
  }
  if (strext::encode("\xE2\x82\xAC", TextEncoding::utf16le) !=
      std::vector<std::uint8_t>{0xAC, 0x20}) {
    std::cerr << "utf16le euro sign\n";
    return 1;
  }

  // ASCII: every UTF-16 unit above 0x7F becomes '?'
  if (strext::encode("caf\xC3\xA9", TextEncoding::ascii) !=
      std::vector<std::uint8_t>{'c', 'a', 'f', '?'}) {
    std::cerr << "ascii replacement of e-acute\n";
    return 1;
  }
  if (strext::encode("\xF0\x9F\x98\x80", TextEncoding::ascii) !=
      std::vector<std::uint8_t>{'?', '?'}) {
    std::cerr << "ascii replacement of astral character\n";
    return 1;
  }
  if (strext::encode("\x7F", TextEncoding::ascii) != std::vector<std::uint8_t>{0x7F}) {
    std::cerr << "DEL is ascii\n";
    return 1;
  }

  // UTF-8 passes bytes through untouched
  if (strext::encode("\xC3\xA9\xFF", TextEncoding::utf8) !=
      std::vector<std::uint8_t>{0xC3, 0xA9, 0xFF}) {
    std::cerr << "utf8 passthrough\n";
    return 1;
  }

  // White space
  for (const char *blank : {"", " ", " \t\r\n", "\xC2\xA0", "\xE3\x80\x80", "\xE2\x80\x83"}) {
    if (!strext::is_blank(blank)) {
      std::cerr << "expected blank: '" << blank << "'\n";
      return 1;
    }
  }
  for (const char *text : {"a", " x ", "\xE2\x80\x8B", "\xC3\xA9"}) {
    if (strext::is_blank(text)) {
      std::cerr << "expected non-blank: '" << text << "'\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
