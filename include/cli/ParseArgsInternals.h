/**
 * @file
 * @brief Declarations for pybox CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "sandbox/Payload.h"
#include "sema/FragmentMode.h"

namespace pybox::cli::detail {

/** Return true if `arg` is `flag` or its short `alias` (e.g. --help / -h). */
bool isFlag(std::string_view arg, std::string_view flag, std::string_view alias = {});

/** Parse `--mode=<value>`: named or adhoc; anything else is a ConfigError. */
sema::FragmentMode parseModeValue(std::string_view value);

/** Parse a positive number of seconds; `source` names the flag or variable in errors. */
double parseTimeoutValue(std::string_view value, std::string_view source);

/** Parse a `--param` value: int, float, bool, None, or else a string (quotes stripped). */
sandbox::PayloadValue parseParamValue(std::string_view value);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Validate incompatible options (e.g., --metrics with --metrics-json). */
bool hasConflictingModes(const Options& opts);

/** Handle boolean, flag-only options like -h, --json, --metrics, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (mode, entry, timeout, param, seed, log-path). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

} // namespace pybox::cli::detail
