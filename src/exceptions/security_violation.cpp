/***
 * Name: pybox::exceptions::SecurityViolation
 * Purpose: Constructor and category naming for security violations.
 */
#include <utility>

#include "pybox/exceptions/security_violation.h"

namespace pybox::exceptions {

const char* to_string(const ViolationCategory category) noexcept {
  switch (category) {
    case ViolationCategory::Import: return "import";
    case ViolationCategory::Call: return "call";
    case ViolationCategory::Attribute: return "attribute";
    case ViolationCategory::Subscript: return "subscript";
  }
  return "unknown";
}

SecurityViolation::SecurityViolation(const ViolationCategory category, std::string detail, const int line) noexcept
    : PyboxException(std::move(detail)), category_(category), line_(line) {}

}  // namespace pybox::exceptions
