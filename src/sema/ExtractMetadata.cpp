/***
 * Name: pybox::sema::extractMetadata (impl)
 * Purpose: Docstring parsing for description, category and stop conditions.
 */
#include "sema/SkillMetadata.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>

#include "pybox/exceptions/parse_error.h"
#include "sema/SignatureScan.h"
#include "sema/Validator.h"

namespace pybox::sema {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool startsWith(const std::string& s, const std::string& prefix) { return s.rfind(prefix, 0) == 0; }

const std::string* docstringOf(const ast::FunctionDef& fn) {
  if (fn.body.empty() || fn.body.front()->kind != ast::NodeKind::ExprStmt) return nullptr;
  const auto& es = static_cast<const ast::ExprStmt&>(*fn.body.front());
  if (!es.value || es.value->kind != ast::NodeKind::StringLiteral) return nullptr;
  return &static_cast<const ast::StringLiteral&>(*es.value).value;
}

} // namespace

SkillMetadata extractMetadata(const std::string& source) {
  SkillMetadata meta;
  std::unique_ptr<ast::Module> mod;
  try {
    mod = validateSyntax(source);
  } catch (const exceptions::ParseError&) {
    return meta;
  }
  const auto fns = collectAsyncFunctions(*mod);
  if (fns.empty()) return meta;
  const std::string* doc = docstringOf(*fns.front());
  if (doc == nullptr || trim(*doc).empty()) return meta;

  std::vector<std::string> lines;
  {
    std::istringstream in(trim(*doc));
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
  }

  std::string description;
  for (const auto& raw : lines) {
    const std::string line = trim(raw);
    if (!line.empty() && !startsWith(line, "Category:") && !startsWith(line, "Stops")) {
      if (!description.empty()) description += " ";
      description += line;
    } else if (line.empty()) {
      if (!description.empty()) break;
    } else {
      break;
    }
  }
  meta.description = description;

  for (const auto& raw : lines) {
    const std::string line = trim(raw);
    const std::string low = lower(line);
    if (startsWith(low, "category:")) {
      meta.category = lower(trim(line.substr(line.find(':') + 1)));
    } else if (startsWith(low, "stops when:")) {
      meta.stopsWhen.clear();
      std::istringstream parts(trim(line.substr(line.find(':') + 1)));
      std::string part;
      while (std::getline(parts, part, ',')) meta.stopsWhen.push_back(trim(part));
    }
  }
  return meta;
}

} // namespace pybox::sema
