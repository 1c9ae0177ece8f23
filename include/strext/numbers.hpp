#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace strext {

// A caller handed an operation input it promises never to send
// (e.g. blank text to to_positive_integer_array).
class precondition_violation : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * Every maximal run of ASCII digits in `expression`, parsed base-10, in
 * order of appearance. Signs are not part of a run, so "-5" yields {5}.
 *
 * Throws precondition_violation when `expression` is empty or only white
 * space, and std::overflow_error when a run does not fit in int32_t.
 */
std::vector<std::int32_t> to_positive_integer_array(std::string_view expression);

// C-string overload; a null pointer throws std::invalid_argument.
std::vector<std::int32_t> to_positive_integer_array(const char *expression);

} // namespace strext
