#include "cli/ParseArgsInternals.h"

namespace pybox::cli::detail {
    /***
     * Name: pybox::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "--help", "-h")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--validate-only")) {
            out.validateOnly = true;
            return true;
        }
        if (isFlag(arg, "--json")) {
            out.json = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--verbose")) {
            out.verbose = true;
            return true;
        }
        if (isFlag(arg, "--log-lexer")) {
            out.logLexer = true;
            return true;
        }
        if (isFlag(arg, "--log-ast")) {
            out.logAst = true;
            return true;
        }
        return false;
    }
} // namespace pybox::cli::detail
