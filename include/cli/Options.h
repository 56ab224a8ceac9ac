#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/Payload.h"
#include "sema/FragmentMode.h"

namespace pybox::cli {

    struct Options {
        bool showHelp{false};
        bool validateOnly{false};     // --validate-only
        bool json{false};             // --json
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool verbose{false};          // --verbose
        sema::FragmentMode mode{sema::FragmentMode::AdHoc}; // --mode=named|adhoc
        std::string entry{};          // --entry=NAME
        std::optional<double> timeoutSeconds{};       // --timeout=SECONDS
        std::optional<unsigned long long> seed{};     // --seed=N
        std::vector<std::pair<std::string, sandbox::PayloadValue>> params{}; // --param=KEY=VALUE
        std::vector<std::string> inputs{};
        std::string logPath{"."};     // --log-path=<dir> (defaults to ./)
        bool logLexer{false};         // --log-lexer
        bool logAst{false};           // --log-ast
    };

} // namespace pybox::cli
