#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strext {

// Byte encodings a text can be turned into before hashing.
enum class TextEncoding {
  utf16le, // UTF-16 code units, little endian
  ascii,   // 7-bit; every UTF-16 code unit above 0x7F becomes '?'
  utf8,    // input bytes as given
};

/**
 * Decode UTF-8 into code points.
 * Each maximal ill-formed subsequence becomes one U+FFFD, so decoding
 * never fails.
 */
std::u32string decode_utf8(std::string_view text);

// UTF-8 -> UTF-16 code units (astral code points become surrogate pairs).
std::u16string to_utf16(std::string_view text);

// Encode text into the bytes of the requested encoding.
std::vector<std::uint8_t> encode(std::string_view text, TextEncoding enc);

// Unicode White_Space property.
bool is_white_space(char32_t cp);

// True if the text is empty or made only of white space.
bool is_blank(std::string_view text);

} // namespace strext
