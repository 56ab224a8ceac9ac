/***
 * Name: pybox::sema::extractMetadata
 * Purpose: Read descriptive metadata from the docstring of a fragment's entry function.
 * Inputs:
 *   - source text
 * Outputs:
 *   - SkillMetadata (defaults when the source does not parse or has no docstring)
 * Theory of Operation:
 *   Uses the first `async def` found breadth-first. The first paragraph of
 *   its docstring (stopping at a "Category:" or "Stops" line) becomes the
 *   description; "Category: x" and "Stops when: a, b" lines anywhere in the
 *   docstring fill the other fields.
 */
#pragma once

#include <string>
#include <vector>

namespace pybox::sema {

struct SkillMetadata {
  std::string description;
  std::string category{"general"};
  std::vector<std::string> stopsWhen;
};

SkillMetadata extractMetadata(const std::string& source);

} // namespace pybox::sema
