/***
 * Name: pybox::exceptions::FileReadError
 * Purpose: Exception for unreadable fragment files.
 * Inputs: Error message
 * Outputs: Exception object
 */
#pragma once

#include <string>
#include <utility>

#include "pybox/exceptions/pybox_exception.h"

namespace pybox {
namespace exceptions {

class FileReadError : public PyboxException {
 public:
  explicit FileReadError(std::string msg) noexcept : PyboxException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybox
