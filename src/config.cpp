#include "strext/config.hpp"

#include "strext/consts.hpp"
#include "strext/encoding.hpp"
#include "strext/util.hpp"

#include <sstream>
#include <stdexcept>

namespace {

strext::FileNameRules platform_rules(const std::string &value) {
  if (value == "host")
    return strext::FileNameRules::host();
  if (value == "posix")
    return strext::FileNameRules::posix();
  if (value == "windows")
    return strext::FileNameRules::windows();
  throw std::invalid_argument("settings: bad platform '" + value + "'");
}

strext::FingerprintEncoding encoding_policy(const std::string &value) {
  if (value == "legacy")
    return strext::FingerprintEncoding::legacy;
  if (value == "utf8")
    return strext::FingerprintEncoding::utf8;
  throw std::invalid_argument("settings: bad fingerprint-encoding '" + value + "'");
}

} // namespace

namespace strext {

auto parse_settings(std::string_view text) -> Settings {
  Settings out{};
  std::u32string forbid;
  std::u32string allow;

  std::istringstream iss{std::string(text)};
  std::string line;
  while (std::getline(iss, line)) {
    const std::string trimmed = strutil::trim(line);
    std::string_view sv{trimmed};
    if (sv.empty() || sv[0] == consts::kComment)
      continue;

    if (sv.starts_with(consts::kKeyPlatform)) {
      out.rules = platform_rules(strutil::trim(sv.substr(consts::kKeyPlatform.size())));
    } else if (sv.starts_with(consts::kKeyForbid)) {
      forbid += decode_utf8(strutil::trim(sv.substr(consts::kKeyForbid.size())));
    } else if (sv.starts_with(consts::kKeyAllow)) {
      allow += decode_utf8(strutil::trim(sv.substr(consts::kKeyAllow.size())));
    } else if (sv.starts_with(consts::kKeyEncoding)) {
      out.encoding = encoding_policy(strutil::trim(sv.substr(consts::kKeyEncoding.size())));
    }
  }

  // Overrides apply on top of the final platform regardless of line order.
  out.rules = out.rules.with(forbid).without(allow);
  return out;
}

std::string fingerprint(Algorithm algo, std::string_view expression, const Settings &settings) {
  return fingerprint(algo, expression, settings.encoding);
}

} // namespace strext
