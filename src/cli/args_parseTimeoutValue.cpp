#include "cli/ParseArgsInternals.h"

#include <cmath>
#include <cstdlib>
#include <string>

#include "pybox/exceptions/config_error.h"

namespace pybox::cli::detail {
    /***
     * Name: pybox::cli::detail::parseTimeoutValue
     * Purpose: Parse a timeout in seconds for --timeout or PYBOX_TIMEOUT.
     */
    double parseTimeoutValue(const std::string_view value, const std::string_view source) {
        const std::string text(value);
        char* end = nullptr;
        const double seconds = text.empty() ? 0.0 : std::strtod(text.c_str(), &end);
        if (text.empty() || end == nullptr || *end != '\0' || !std::isfinite(seconds) || seconds <= 0.0) {
            throw exceptions::ConfigError(std::string(source) + ": expected a positive number of seconds, got '" +
                                          text + "'");
        }
        return seconds;
    }
} // namespace pybox::cli::detail
