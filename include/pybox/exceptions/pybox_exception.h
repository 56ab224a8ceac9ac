/***
 * Name: pybox::exceptions::PyboxException
 * Purpose: Base class for all pybox exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception so generic catch sites work,
 *   but every throw inside pybox uses a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pybox {
namespace exceptions {

class PyboxException : public std::exception {
 public:
  virtual ~PyboxException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PyboxException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pybox
