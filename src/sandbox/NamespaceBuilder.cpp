/***
 * Name: pybox::sandbox::buildNamespace (impl)
 */
#include "sandbox/NamespaceBuilder.h"

#include "runtime/Builtins.h"
#include "sandbox/DomainTypes.h"

namespace pybox::sandbox {

void buildNamespace(rt::Interpreter& interp, const rt::Value& handleProxy, const SandboxConfig& config) {
  interp.installBuiltins();

  const DomainTypes& types = domainTypes();
  interp.setGlobal(kHandleName, handleProxy);
  interp.setGlobal("Direction", types.direction);
  interp.setGlobal("Position", types.position);
  interp.setGlobal("SkillResult", types.skillResult);
  interp.setGlobal("HungerState", types.hungerState);
  interp.setGlobal("random", rt::makeRandomModule());
  interp.setGlobal("math", rt::makeMathModule());

  if (config.randomSeed) { interp.seedRandom(*config.randomSeed); }
}

std::vector<std::string> namespaceGlobals() {
  return {kHandleName, "Direction", "Position", "SkillResult", "HungerState", "random", "math"};
}

} // namespace pybox::sandbox
