#include "cli/ParseArgsInternals.h"

namespace pybox::cli::detail {
    /***
     * Name: pybox::cli::detail::isFlag
     * Purpose: Match an argument against a flag and its optional short alias.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag, const std::string_view alias) {
        return arg == flag || (!alias.empty() && arg == alias);
    }
} // namespace pybox::cli::detail
