/***
 * Name: pybox::sema::FragmentMode
 * Purpose: How a fragment is entered: a declared entry function or an ad-hoc body.
 */
#pragma once

namespace pybox::sema {

enum class FragmentMode { Named, AdHoc };

inline const char* to_string(FragmentMode mode) {
  return mode == FragmentMode::Named ? "named" : "adhoc";
}

} // namespace pybox::sema
