#include "strext/numbers.hpp"

#include "strext/encoding.hpp"
#include "strext/util.hpp"

#include <charconv>
#include <system_error>

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // namespace

namespace strext {

std::vector<std::int32_t> to_positive_integer_array(std::string_view expression) {
  if (is_blank(expression)) {
    throw precondition_violation("to_positive_integer_array: input is empty or white space");
  }

  // UTF-8 never reuses ASCII bytes inside multi-byte sequences, so a byte
  // scan finds exactly the ASCII digit runs.
  std::vector<std::int32_t> out;
  std::size_t i = 0;
  while (i < expression.size()) {
    if (!is_digit(expression[i])) {
      ++i;
      continue;
    }
    std::size_t end = i;
    while (end < expression.size() && is_digit(expression[end]))
      ++end;

    const std::string_view run = expression.substr(i, end - i);
    std::int32_t value = 0;
    const auto [ptr, ec] = std::from_chars(run.data(), run.data() + run.size(), value);
    if (ec == std::errc::result_out_of_range) {
      throw std::overflow_error("to_positive_integer_array: '" + std::string(run) +
                                "' does not fit in a 32-bit integer");
    }
    if (ec != std::errc{} || ptr != run.data() + run.size()) {
      throw std::invalid_argument("to_positive_integer_array: cannot parse '" + std::string(run) +
                                  "'");
    }
    out.push_back(value);
    i = end;
  }
  return out;
}

std::vector<std::int32_t> to_positive_integer_array(const char *expression) {
  return to_positive_integer_array(require_text(expression, "to_positive_integer_array"));
}

} // namespace strext
