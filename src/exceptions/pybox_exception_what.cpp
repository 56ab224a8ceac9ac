/***
 * Name: pybox::exceptions::PyboxException::what
 * Purpose: Return the stored error message.
 * Outputs: C-string pointer valid for the lifetime of the exception
 */
#include "pybox/exceptions/pybox_exception.h"

namespace pybox::exceptions {

const char* PyboxException::what() const noexcept { return message_.c_str(); }

}  // namespace pybox::exceptions
