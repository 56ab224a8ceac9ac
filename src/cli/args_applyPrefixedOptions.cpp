#include "cli/ParseArgsInternals.h"

#include <cerrno>
#include <cstdlib>
#include <string>

#include "pybox/exceptions/config_error.h"

namespace pybox::cli::detail {
    /***
     * Name: pybox::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options; malformed values throw ConfigError.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view modePrefix{"--mode="}; arg.rfind(modePrefix, 0) == 0) {
            out.mode = parseModeValue(arg.substr(modePrefix.size()));
            return true;
        }

        if (constexpr std::string_view entryPrefix{"--entry="}; arg.rfind(entryPrefix, 0) == 0) {
            out.entry = std::string(arg.substr(entryPrefix.size()));
            if (out.entry.empty()) { throw exceptions::ConfigError("--entry requires a function name"); }
            return true;
        }

        if (constexpr std::string_view timeoutPrefix{"--timeout="}; arg.rfind(timeoutPrefix, 0) == 0) {
            out.timeoutSeconds = parseTimeoutValue(arg.substr(timeoutPrefix.size()), "--timeout");
            return true;
        }

        if (constexpr std::string_view paramPrefix{"--param="}; arg.rfind(paramPrefix, 0) == 0) {
            const std::string_view assignment = arg.substr(paramPrefix.size());
            const std::size_t eq = assignment.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                throw exceptions::ConfigError("--param expects KEY=VALUE, got '" + std::string(assignment) + "'");
            }
            out.params.emplace_back(std::string(assignment.substr(0, eq)), parseParamValue(assignment.substr(eq + 1)));
            return true;
        }

        if (constexpr std::string_view seedPrefix{"--seed="}; arg.rfind(seedPrefix, 0) == 0) {
            const std::string text(arg.substr(seedPrefix.size()));
            char* end = nullptr;
            errno = 0;
            const unsigned long long seed = std::strtoull(text.c_str(), &end, 10);
            if (text.empty() || text[0] == '-' || *end != '\0' || errno != 0) {
                throw exceptions::ConfigError("--seed expects a non-negative integer, got '" + text + "'");
            }
            out.seed = seed;
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return true;
        }
        return false;
    }
} // namespace pybox::cli::detail
