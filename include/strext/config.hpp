#pragma once
#include "strext/fingerprint.hpp"
#include "strext/path.hpp"

#include <string>
#include <string_view>

namespace strext {

struct Settings {
  FileNameRules rules = FileNameRules::host();
  FingerprintEncoding encoding = FingerprintEncoding::legacy;
};

/**
 * Parse settings text, one "key: value" per line:
 *   platform: host | posix | windows
 *   forbid: <characters added to the platform set>
 *   allow: <characters removed from the platform set>
 *   fingerprint-encoding: legacy | utf8
 * Blank lines and '#' comments are skipped, unknown keys ignored.
 * A bad platform or encoding value throws std::invalid_argument.
 */
Settings parse_settings(std::string_view text);

// Fingerprint with the encoding policy from `settings`.
std::string fingerprint(Algorithm algo, std::string_view expression, const Settings& settings);

} // namespace strext
