#include "cli/ParseArgs.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>
#include <string>
#include <string_view>

namespace pybox::cli {
    /***
     * Name: pybox::cli::ParseArgs
     * Purpose: Minimal CLI argument parser for pybox.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                // Everything after "--" is an input, even when it starts with '-'.
                for (int j = i + 1; j < argc; ++j) {
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                    out.inputs.emplace_back(argv[j]);
                }
                break;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::applyPrefixedOptions(arg, out)) { continue; }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pybox: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }

        if (detail::hasConflictingModes(out)) {
            std::cerr << "pybox: cannot use --metrics and --metrics-json together\n";
            return false;
        }

        return true;
    }
} // namespace pybox::cli
