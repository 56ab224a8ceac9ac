#include "cli/ParseArgsInternals.h"

#include <string>

#include "pybox/exceptions/config_error.h"

namespace pybox::cli::detail {
    /***
     * Name: pybox::cli::detail::parseModeValue
     * Purpose: Map `--mode=<value>` to a FragmentMode.
     */
    sema::FragmentMode parseModeValue(const std::string_view value) {
        if (value == "named") { return sema::FragmentMode::Named; }
        if (value == "adhoc" || value == "ad-hoc") { return sema::FragmentMode::AdHoc; }
        throw exceptions::ConfigError("unknown mode '" + std::string(value) + "' (expected named or adhoc)");
    }
} // namespace pybox::cli::detail
