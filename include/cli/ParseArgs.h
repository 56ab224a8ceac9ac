#pragma once

#include "cli/Options.h"

namespace pybox::cli {

    // Parse argv into Options. Returns false on fatal parse error; malformed
    // option values throw exceptions::ConfigError.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace pybox::cli
