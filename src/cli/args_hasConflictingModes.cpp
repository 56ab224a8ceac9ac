#include "cli/ParseArgsInternals.h"

namespace pybox::cli::detail {
    /***
     * Name: pybox::cli::detail::hasConflictingModes
     * Purpose: Reject options that ask for two renderings of the same report.
     */
    bool hasConflictingModes(const Options &opts) {
        return opts.metrics && opts.metricsJson;
    }
} // namespace pybox::cli::detail
