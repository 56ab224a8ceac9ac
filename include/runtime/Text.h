/***
 * Name: pybox::rt::text
 * Purpose: Code-point aware UTF-8 string helpers backed by ICU.
 * Theory of Operation:
 *   Script strings are stored as UTF-8; indexing, slicing and len() operate
 *   on code points, so callers decode to UTF-32 where positions matter.
 *   Case mapping goes through ICU's full (locale-neutral) mappings, while
 *   character classes use ICU properties. Malformed input decodes to U+FFFD.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pybox::rt::text {

std::u32string decode(std::string_view utf8);
std::string encode(std::u32string_view cps);
std::string encode(char32_t cp);
std::size_t length(std::string_view utf8);
bool isValidUtf8(std::string_view bytes);

std::string upper(std::string_view s);
std::string lower(std::string_view s);
std::string casefold(std::string_view s);
std::string swapcase(std::string_view s);
std::string title(std::string_view s);
std::string capitalize(std::string_view s);

bool isSpace(char32_t c);
bool isAlpha(char32_t c);
bool isDecimal(char32_t c);
bool isDigit(char32_t c);
bool isNumeric(char32_t c);
bool isAlnum(char32_t c);
bool isCased(char32_t c);
bool isUpperChar(char32_t c);
bool isLowerChar(char32_t c);
bool isPrintable(char32_t c);

// Whole-string predicates follow Python: empty strings are false.
bool allOf(std::string_view s, bool (*pred)(char32_t));
bool isUpper(std::string_view s);
bool isLower(std::string_view s);
bool isTitle(std::string_view s);

} // namespace pybox::rt::text
