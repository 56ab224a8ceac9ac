/***
 * Name: pybox::exceptions::ParseError::ParseError
 * Purpose: Construct a syntax error with its source location.
 */
#include <utility>

#include "pybox/exceptions/parse_error.h"

namespace pybox::exceptions {

ParseError::ParseError(std::string msg, const int line, const int col) noexcept
    : PyboxException(std::move(msg)), line_(line), col_(col) {}

}  // namespace pybox::exceptions
