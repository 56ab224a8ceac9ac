/***
 * Name: pybox::json::Escape / pybox::json::Number
 * Purpose: String escaping and number rendering for hand-written JSON.
 * Theory of Operation: Escapes quotes, backslashes and control characters;
 *   bytes >= 0x80 pass through unchanged so UTF-8 survives.
 */
#include "observability/JsonWriter.h"

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <ios>
#include <limits>
#include <sstream>
#include <string>

namespace pybox::json {

std::string Escape(const std::string& str) {  // NOLINT(readability-function-size)
  std::string out;
  constexpr std::size_t kReservePadding = 8;
  out.reserve(str.size() + kReservePadding);
  for (const unsigned char uchar : str) {
    switch (uchar) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        constexpr unsigned char kMinPrintable = 0x20;
        if (uchar < kMinPrintable) {
          std::ostringstream hex;
          hex << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
              << static_cast<int>(uchar);
          out += hex.str();
        } else {
          out += static_cast<char>(uchar);
        }
    }
  }
  return out;
}

std::string Number(double value) {
  if (!std::isfinite(value)) return "null";
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
  std::string text = oss.str();
  // Prefer the shortest form that round-trips.
  for (int precision = 1; precision < std::numeric_limits<double>::max_digits10; ++precision) {
    std::ostringstream shorter;
    shorter << std::setprecision(precision) << value;
    if (std::stod(shorter.str()) == value) {
      text = shorter.str();
      break;
    }
  }
  if (text.find_first_of(".eE") == std::string::npos) text += ".0";
  return text;
}

}  // namespace pybox::json
