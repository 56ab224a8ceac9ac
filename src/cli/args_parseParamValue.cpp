#include "cli/ParseArgsInternals.h"

#include <cerrno>
#include <cstdlib>
#include <string>

namespace pybox::cli::detail {
    /***
     * Name: pybox::cli::detail::parseParamValue
     * Purpose: Turn `--param` text into the value the entry point receives.
     */
    sandbox::PayloadValue parseParamValue(const std::string_view value) {
        const std::string text(value);
        if (text == "True" || text == "true") { return true; }
        if (text == "False" || text == "false") { return false; }
        if (text == "None" || text == "null") { return {}; }
        if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
            return text.substr(1, text.size() - 2);
        }
        if (!text.empty()) {
            char* end = nullptr;
            errno = 0;
            const long long integer = std::strtoll(text.c_str(), &end, 10);
            if (*end == '\0' && errno == 0) { return integer; }
            errno = 0;
            const double number = std::strtod(text.c_str(), &end);
            if (*end == '\0' && errno == 0) { return number; }
        }
        return text;
    }
} // namespace pybox::cli::detail
