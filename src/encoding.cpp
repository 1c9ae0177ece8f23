// UTF-8 decoding and the byte encoders used for fingerprints
#include "strext/encoding.hpp"

#include "strext/consts.hpp"

#include <algorithm>

namespace strext {

std::u32string decode_utf8(std::string_view text) {
  std::u32string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto b0 = static_cast<unsigned char>(text[i]);
    if (b0 < 0x80) {
      out.push_back(b0);
      ++i;
      continue;
    }

    // Trailing byte count and the allowed range of the first trailing byte
    // (narrowed for overlongs, surrogates and values above U+10FFFF).
    int need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    char32_t cp = 0;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
      need = 1;
      cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
      need = 2;
      cp = b0 & 0x0F;
      if (b0 == 0xE0)
        lo = 0xA0;
      else if (b0 == 0xED)
        hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
      need = 3;
      cp = b0 & 0x07;
      if (b0 == 0xF0)
        lo = 0x90;
      else if (b0 == 0xF4)
        hi = 0x8F;
    } else {
      out.push_back(consts::kReplacementChar);
      ++i;
      continue;
    }

    std::size_t j = i + 1;
    bool ok = true;
    for (int k = 0; k < need; ++k, ++j) {
      if (j >= text.size()) {
        ok = false;
        break;
      }
      const auto b = static_cast<unsigned char>(text[j]);
      if (b < lo || b > hi) {
        ok = false; // the offending byte starts the next sequence
        break;
      }
      cp = (cp << 6) | (b & 0x3F);
      lo = 0x80;
      hi = 0xBF;
    }
    out.push_back(ok ? cp : consts::kReplacementChar);
    i = j;
  }
  return out;
}

std::u16string to_utf16(std::string_view text) {
  const std::u32string cps = decode_utf8(text);
  std::u16string out;
  out.reserve(cps.size());
  for (char32_t cp : cps) {
    if (cp < 0x10000) {
      out.push_back(static_cast<char16_t>(cp));
    } else {
      cp -= 0x10000;
      out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
      out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
    }
  }
  return out;
}

std::vector<std::uint8_t> encode(std::string_view text, TextEncoding enc) {
  std::vector<std::uint8_t> out;
  switch (enc) {
  case TextEncoding::utf8:
    out.assign(reinterpret_cast<const std::uint8_t *>(text.data()),
               reinterpret_cast<const std::uint8_t *>(text.data()) + text.size());
    break;
  case TextEncoding::utf16le: {
    const std::u16string units = to_utf16(text);
    out.reserve(units.size() * 2);
    for (char16_t u : units) {
      out.push_back(static_cast<std::uint8_t>(u & 0xFF));
      out.push_back(static_cast<std::uint8_t>(u >> 8));
    }
    break;
  }
  case TextEncoding::ascii: {
    const std::u16string units = to_utf16(text);
    out.reserve(units.size());
    for (char16_t u : units) {
      out.push_back(u <= consts::kMaxAscii ? static_cast<std::uint8_t>(u)
                                           : static_cast<std::uint8_t>(consts::kAsciiReplacement));
    }
    break;
  }
  }
  return out;
}

bool is_white_space(char32_t cp) {
  switch (cp) {
  case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
  case 0x0020:
  case 0x0085:
  case 0x00A0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return true;
  default:
    return cp >= 0x2000 && cp <= 0x200A;
  }
}

bool is_blank(std::string_view text) {
  const std::u32string cps = decode_utf8(text);
  return std::ranges::all_of(cps, is_white_space);
}

} // namespace strext
