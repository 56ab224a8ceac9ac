/***
 * Name: pybox::exceptions::SecurityViolation
 * Purpose: First forbidden construct found by the static security walk.
 * Inputs: Category (import, call, attribute, subscript), detail text, line
 * Outputs: Exception object whose what() is the detail text
 */
#pragma once

#include <string>

#include "pybox/exceptions/pybox_exception.h"

namespace pybox {
namespace exceptions {

enum class ViolationCategory { Import, Call, Attribute, Subscript };

const char* to_string(ViolationCategory category) noexcept;

class SecurityViolation : public PyboxException {
 public:
  SecurityViolation(ViolationCategory category, std::string detail, int line) noexcept;

  ViolationCategory category() const noexcept { return category_; }
  const std::string& detail() const noexcept { return message_; }
  int line() const noexcept { return line_; }

 private:
  ViolationCategory category_;
  int line_{0};
};

}  // namespace exceptions
}  // namespace pybox
