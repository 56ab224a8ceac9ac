/***
 * Name: pybox::sandbox::SandboxConfig / CodeSubmission
 * Purpose: Inputs of one execution: engine settings and the submitted fragment.
 * Theory of Operation:
 *   A submission is stateless and used once. Its own timeout, when given,
 *   overrides the configured one. Parameters reach a named entry point as
 *   keyword arguments, in order.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/Payload.h"
#include "sema/FragmentMode.h"

namespace pybox::sandbox {

struct SandboxConfig {
  std::chrono::duration<double> timeout{30.0};
  std::optional<unsigned long long> randomSeed;
  int maxCallDepth{100};
  std::size_t maxSequenceLength{10'000'000};

  // Throws exceptions::ConfigError for a non-positive timeout or limit.
  void check() const;
};

struct CodeSubmission {
  std::string source;
  sema::FragmentMode mode{sema::FragmentMode::AdHoc};
  std::string entryName; // expected entry point; named mode only
  std::vector<std::pair<std::string, PayloadValue>> parameters;
  std::optional<std::chrono::duration<double>> timeout;
};

// Seconds rendered the way error texts show them: "1", "0.5", "30".
std::string formatSeconds(std::chrono::duration<double> seconds);

} // namespace pybox::sandbox
