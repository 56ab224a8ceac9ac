/***
 * Name: pybox::rt::text (implementation)
 * Purpose: UTF-8 decoding and ICU case mapping and character properties.
 */
#include "runtime/Text.h"

#include <unicode/uchar.h>
#include <unicode/ustring.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>

#include <vector>

namespace pybox::rt::text {

namespace {

using CaseMapFn = int32_t (*)(UChar*, int32_t, const UChar*, int32_t, const char*, UErrorCode*);

std::u16string toUtf16(std::string_view s) {
  UErrorCode err = U_ZERO_ERROR;
  int32_t needed = 0;
  u_strFromUTF8WithSub(nullptr, 0, &needed, s.data(), static_cast<int32_t>(s.size()), 0xFFFD, nullptr, &err);
  if (err != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(err)) { return {}; }
  err = U_ZERO_ERROR;
  std::u16string out(static_cast<std::size_t>(needed), u'\0');
  u_strFromUTF8WithSub(reinterpret_cast<UChar*>(out.data()), needed + 1, &needed, s.data(),
                       static_cast<int32_t>(s.size()), 0xFFFD, nullptr, &err);
  if (U_FAILURE(err)) { return {}; }
  out.resize(static_cast<std::size_t>(needed));
  return out;
}

std::string toUtf8(const std::u16string& s) {
  UErrorCode err = U_ZERO_ERROR;
  int32_t needed = 0;
  u_strToUTF8(nullptr, 0, &needed, reinterpret_cast<const UChar*>(s.data()), static_cast<int32_t>(s.size()), &err);
  if (err != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(err)) { return {}; }
  err = U_ZERO_ERROR;
  std::string out(static_cast<std::size_t>(needed), '\0');
  u_strToUTF8(out.data(), needed + 1, &needed, reinterpret_cast<const UChar*>(s.data()),
              static_cast<int32_t>(s.size()), &err);
  if (U_FAILURE(err)) { return {}; }
  out.resize(static_cast<std::size_t>(needed));
  return out;
}

std::string mapCase(std::string_view s, CaseMapFn fn) {
  const std::u16string src = toUtf16(s);
  UErrorCode err = U_ZERO_ERROR;
  const auto srcLen = static_cast<int32_t>(src.size());
  int32_t needed = fn(nullptr, 0, reinterpret_cast<const UChar*>(src.data()), srcLen, "", &err);
  if (err != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(err)) { return std::string(s); }
  err = U_ZERO_ERROR;
  std::u16string dst(static_cast<std::size_t>(needed), u'\0');
  needed = fn(reinterpret_cast<UChar*>(dst.data()), needed + 1, reinterpret_cast<const UChar*>(src.data()), srcLen,
              "", &err);
  if (U_FAILURE(err)) { return std::string(s); }
  dst.resize(static_cast<std::size_t>(needed));
  return toUtf8(dst);
}

int32_t foldCase(UChar* dest, int32_t cap, const UChar* src, int32_t len, const char* /*locale*/, UErrorCode* err) {
  return u_strFoldCase(dest, cap, src, len, U_FOLD_CASE_DEFAULT, err);
}

} // namespace

std::u32string decode(std::string_view utf8) {
  std::u32string out;
  out.reserve(utf8.size());
  const auto* data = reinterpret_cast<const uint8_t*>(utf8.data());
  const auto len = static_cast<int32_t>(utf8.size());
  int32_t i = 0;
  while (i < len) {
    UChar32 c = 0;
    U8_NEXT(data, i, len, c);
    out.push_back(c < 0 ? U'\uFFFD' : static_cast<char32_t>(c));
  }
  return out;
}

std::string encode(char32_t cp) {
  uint8_t buf[U8_MAX_LENGTH];
  int32_t n = 0;
  UBool failed = false;
  U8_APPEND(buf, n, U8_MAX_LENGTH, static_cast<UChar32>(cp), failed);
  if (failed) { return "\xEF\xBF\xBD"; }
  return std::string(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(n));
}

std::string encode(std::u32string_view cps) {
  std::string out;
  out.reserve(cps.size());
  for (char32_t c : cps) { out += encode(c); }
  return out;
}

std::size_t length(std::string_view utf8) {
  std::size_t n = 0;
  const auto* data = reinterpret_cast<const uint8_t*>(utf8.data());
  const auto len = static_cast<int32_t>(utf8.size());
  int32_t i = 0;
  while (i < len) {
    UChar32 c = 0;
    U8_NEXT(data, i, len, c);
    (void)c;
    ++n;
  }
  return n;
}

bool isValidUtf8(std::string_view bytes) {
  const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
  const auto len = static_cast<int32_t>(bytes.size());
  int32_t i = 0;
  while (i < len) {
    UChar32 c = 0;
    U8_NEXT(data, i, len, c);
    if (c < 0) { return false; }
  }
  return true;
}

std::string upper(std::string_view s) { return mapCase(s, &u_strToUpper); }
std::string lower(std::string_view s) { return mapCase(s, &u_strToLower); }
std::string casefold(std::string_view s) { return mapCase(s, &foldCase); }

std::string swapcase(std::string_view s) {
  std::string out;
  for (char32_t c : decode(s)) {
    if (isUpperChar(c)) {
      out += lower(encode(c));
    } else if (isLowerChar(c)) {
      out += upper(encode(c));
    } else {
      out += encode(c);
    }
  }
  return out;
}

std::string title(std::string_view s) {
  std::string out;
  bool prevCased = false;
  for (char32_t c : decode(s)) {
    if (prevCased) {
      out += lower(encode(c));
    } else {
      out += encode(static_cast<char32_t>(u_totitle(static_cast<UChar32>(c))));
    }
    prevCased = isCased(c);
  }
  return out;
}

std::string capitalize(std::string_view s) {
  const std::u32string cps = decode(s);
  if (cps.empty()) { return {}; }
  std::string out = encode(static_cast<char32_t>(u_totitle(static_cast<UChar32>(cps[0]))));
  out += lower(encode(std::u32string_view(cps).substr(1)));
  return out;
}

bool isSpace(char32_t c) { return u_isUWhiteSpace(static_cast<UChar32>(c)) != 0; }
bool isAlpha(char32_t c) { return u_isalpha(static_cast<UChar32>(c)) != 0; }
bool isDecimal(char32_t c) { return u_charType(static_cast<UChar32>(c)) == U_DECIMAL_DIGIT_NUMBER; }

bool isDigit(char32_t c) {
  const auto t = u_getIntPropertyValue(static_cast<UChar32>(c), UCHAR_NUMERIC_TYPE);
  return t == U_NT_DECIMAL || t == U_NT_DIGIT;
}

bool isNumeric(char32_t c) {
  return u_getIntPropertyValue(static_cast<UChar32>(c), UCHAR_NUMERIC_TYPE) != U_NT_NONE;
}

bool isAlnum(char32_t c) { return isAlpha(c) || isNumeric(c); }
bool isCased(char32_t c) { return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_CASED) != 0; }
bool isUpperChar(char32_t c) { return u_isUUppercase(static_cast<UChar32>(c)) != 0; }
bool isLowerChar(char32_t c) { return u_isULowercase(static_cast<UChar32>(c)) != 0; }

bool isPrintable(char32_t c) {
  if (c == U' ') { return true; }
  const auto t = u_charType(static_cast<UChar32>(c));
  switch (t) {
    case U_CONTROL_CHAR:
    case U_FORMAT_CHAR:
    case U_SURROGATE:
    case U_PRIVATE_USE_CHAR:
    case U_UNASSIGNED:
    case U_LINE_SEPARATOR:
    case U_PARAGRAPH_SEPARATOR:
    case U_SPACE_SEPARATOR:
      return false;
    default:
      return true;
  }
}

bool allOf(std::string_view s, bool (*pred)(char32_t)) {
  const std::u32string cps = decode(s);
  if (cps.empty()) { return false; }
  for (char32_t c : cps) {
    if (!pred(c)) { return false; }
  }
  return true;
}

bool isUpper(std::string_view s) {
  bool sawCased = false;
  for (char32_t c : decode(s)) {
    if (isLowerChar(c)) { return false; }
    if (isCased(c)) { sawCased = true; }
  }
  return sawCased;
}

bool isLower(std::string_view s) {
  bool sawCased = false;
  for (char32_t c : decode(s)) {
    if (isUpperChar(c)) { return false; }
    if (isCased(c)) { sawCased = true; }
  }
  return sawCased;
}

bool isTitle(std::string_view s) {
  bool sawCased = false;
  bool prevCased = false;
  for (char32_t c : decode(s)) {
    if (isUpperChar(c)) {
      if (prevCased) { return false; }
      prevCased = true;
      sawCased = true;
    } else if (isLowerChar(c)) {
      if (!prevCased) { return false; }
      prevCased = true;
      sawCased = true;
    } else {
      prevCased = false;
    }
  }
  return sawCased;
}

} // namespace pybox::rt::text
