/***
 * Name: pybox::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
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

class ConfigError : public PyboxException {
 public:
  explicit ConfigError(std::string msg) noexcept : PyboxException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybox
