/***
 * Name: pybox::exceptions::ParseError
 * Purpose: Exception for malformed fragment source.
 * Inputs: Error message plus 1-based line and column of the offending token
 * Outputs: Exception object
 * Theory of Operation: what() returns the bare message; the location is kept
 *   separately so callers can format it the way they report diagnostics.
 */
#pragma once

#include "pybox/exceptions/pybox_exception.h"

namespace pybox {
namespace exceptions {

class ParseError : public PyboxException {
 public:
  ParseError(std::string msg, int line, int col) noexcept;

  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace pybox
