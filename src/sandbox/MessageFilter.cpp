/***
 * Name: pybox::sandbox::filterMessages (impl)
 */
#include "sandbox/MessageFilter.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <unordered_set>

namespace pybox::sandbox {

namespace {

std::string_view trimmed(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])) != 0) { ++begin; }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) { --end; }
  return std::string_view(s).substr(begin, end - begin);
}

bool mentionsKill(const std::string& message) {
  std::string lower(message);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("kill") != std::string::npos || lower.find("destroy") != std::string::npos;
}

} // namespace

bool isTransientPrompt(const std::string& message) {
  const std::string_view text = trimmed(message);
  return std::any_of(kTransientPrompts.begin(), kTransientPrompts.end(),
                     [&](std::string_view prompt) { return text.substr(0, prompt.size()) == prompt; });
}

std::vector<std::string> filterMessages(const std::vector<std::string>& fresh, const std::string& current) {
  std::vector<std::string> windowed;
  if (fresh.size() > kMessageWindow) {
    const std::size_t tailStart = fresh.size() - kMessageWindow;
    std::copy_if(fresh.begin(), fresh.end(), std::back_inserter(windowed), mentionsKill);
    windowed.insert(windowed.end(), fresh.begin() + static_cast<std::ptrdiff_t>(tailStart), fresh.end());
  } else {
    windowed = fresh;
  }

  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (auto& message : windowed) {
    if (!seen.insert(message).second) { continue; }
    if (isTransientPrompt(message)) { continue; }
    out.push_back(std::move(message));
  }
  if (!current.empty() && std::find(out.begin(), out.end(), current) == out.end()) {
    out.insert(out.begin(), current);
  }
  return out;
}

} // namespace pybox::sandbox
