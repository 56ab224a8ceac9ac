/***
 * Name: pybox::json
 * Purpose: Helpers for the hand-written JSON pybox prints (metrics, execution results).
 */
#pragma once

#include <string>

namespace pybox::json {

// Escape a UTF-8 string for use inside JSON double quotes.
std::string Escape(const std::string& str);

// Shortest text that reads back as the same double; non-finite values become null.
std::string Number(double value);

}  // namespace pybox::json
