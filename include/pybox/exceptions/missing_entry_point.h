/***
 * Name: pybox::exceptions::MissingEntryPoint
 * Purpose: Named fragment has no usable suspension-capable entry function.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyboxException.
 */
#pragma once

#include <string>
#include <utility>

#include "pybox/exceptions/pybox_exception.h"

namespace pybox {
namespace exceptions {

class MissingEntryPoint : public PyboxException {
 public:
  explicit MissingEntryPoint(std::string msg) noexcept : PyboxException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybox
