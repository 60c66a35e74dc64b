#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace rill {

enum class sequence_errc {
  more_than_one_element = 1,
  no_elements,
};

inline const char* to_string(sequence_errc c) noexcept {
  switch (c) {
    case sequence_errc::more_than_one_element: return "sequence contains more than one element";
    case sequence_errc::no_elements:           return "sequence contains no elements";
  }
  return "unknown sequence error";
}

// Errors raised by the library itself (as opposed to producer errors,
// which travel as arbitrary std::exception_ptr).
class sequence_error : public std::runtime_error {
public:
  explicit sequence_error(sequence_errc c)
    : std::runtime_error(to_string(c)), code_(c) {}

  sequence_errc code() const noexcept { return code_; }

private:
  sequence_errc code_;
};

inline std::exception_ptr make_error(sequence_errc c) {
  return std::make_exception_ptr(sequence_error(c));
}

} // namespace rill
