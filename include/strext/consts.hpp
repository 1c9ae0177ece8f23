#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace strext::consts {

// ——— Digest sizes (raw bytes) ———
inline constexpr std::size_t kMd5RawLen    = 16;
inline constexpr std::size_t kSha1RawLen   = 20;
inline constexpr std::size_t kSha256RawLen = 32;
inline constexpr std::size_t kSha512RawLen = 64;

// ——— Virtual paths ———
inline constexpr std::string_view kVirtualPrefix = "~/";

// ——— Text ———
inline constexpr char kAsciiReplacement = '?';
inline constexpr char32_t kReplacementChar = 0xFFFD; // U+FFFD for ill-formed UTF-8
inline constexpr char32_t kMaxAscii = 0x7F;

// ——— Settings keys ———
inline constexpr std::string_view kKeyPlatform = "platform:";
inline constexpr std::string_view kKeyForbid   = "forbid:";
inline constexpr std::string_view kKeyAllow    = "allow:";
inline constexpr std::string_view kKeyEncoding = "fingerprint-encoding:";

// ——— Common characters ———
inline constexpr char kComment = '#';
inline constexpr char kSpace   = ' ';
inline constexpr char kTab     = '\t';
inline constexpr char kCR      = '\r';

} // namespace strext::consts
