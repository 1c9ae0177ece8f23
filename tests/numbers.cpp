#include "strext/numbers.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using Ints = std::vector<std::int32_t>;

int main() {
  try {
    if (strext::to_positive_integer_array("abc 12 def 345") != Ints{12, 345}) {
      std::cerr << "expected [12, 345]\n";
      return 1;
    }
    if (!strext::to_positive_integer_array("no digits here").empty()) {
      std::cerr << "expected no matches\n";
      return 1;
    }
    // Typical image request: width, height and quality in one query string
    if (strext::to_positive_integer_array("width=640&height=480&quality=85") != Ints{640, 480, 85}) {
      std::cerr << "query string extraction\n";
      return 1;
    }
    // Signs and separators split runs; zero and leading zeros are fine
    if (strext::to_positive_integer_array("-5,+7 0 007 1.25") != Ints{5, 7, 0, 7, 1, 25}) {
      std::cerr << "signs, zero or leading zeros handled wrong\n";
      return 1;
    }
    if (strext::to_positive_integer_array("2147483647") != Ints{2147483647}) {
      std::cerr << "INT32_MAX should parse\n";
      return 1;
    }
    if (strext::to_positive_integer_array("00000000000000000042") != Ints{42}) {
      std::cerr << "long zero-padded run\n";
      return 1;
    }
    // Non-ASCII text around digits
    if (strext::to_positive_integer_array("\xE7\x94\xBB\xE5\x83\x8F 3\xC3\x97" "4") != Ints{3, 4}) {
      std::cerr << "digits between multi-byte characters\n";
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "unexpected exception: " << e.what() << "\n";
    return 1;
  }

  // Blank input violates the precondition
  for (const char *blank : {"", "   ", "\t\n", "\xC2\xA0"}) {
    bool threw = false;
    try {
      (void)strext::to_positive_integer_array(blank);
    } catch (const strext::precondition_violation &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "blank input accepted: '" << blank << "'\n";
      return 1;
    }
  }

  // Overflow is an error, not a partial result
  {
    bool threw = false;
    try {
      (void)strext::to_positive_integer_array("ok 1 then 2147483648");
    } catch (const std::overflow_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "2147483648 should overflow\n";
      return 1;
    }
  }

  // Null input
  {
    bool threw = false;
    try {
      (void)strext::to_positive_integer_array(static_cast<const char *>(nullptr));
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "null input accepted\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
