/***
 * Name: pybox::rt random module
 * Purpose: The `random` module a fragment namespace gets.
 * Theory of Operation:
 *   Every function draws from the interpreter's own generator, so a sandbox
 *   configured with a seed replays the same sequence on every run and two
 *   concurrent executions never share state.
 */
#include <algorithm>
#include <random>
#include <string>
#include <utility>

#include "runtime/Builtins.h"
#include "runtime/Callable.h"
#include "runtime/Heap.h"
#include "runtime/Interpreter.h"
#include "runtime/Ops.h"
#include "runtime/ScriptError.h"
#include "runtime/detail/ArgReader.h"

namespace pybox::rt {

using detail::ArgReader;

namespace {

const BuiltinTypes& types() { return builtinTypes(); }

double unit(Interpreter& interp) { return std::uniform_real_distribution<double>(0.0, 1.0)(interp.random()); }

// Uniform integer in [0, n).
long long below(Interpreter& interp, long long n) {
  return std::uniform_int_distribution<long long>(0, n - 1)(interp.random());
}

Value randomRandom(Interpreter& interp, CallArgs& args) {
  ArgReader r("random", args);
  r.noKeywords();
  r.expect(0, 0);
  return Value::real(unit(interp));
}

Value randomSeed(Interpreter& interp, CallArgs& args) {
  ArgReader r("seed", args);
  auto a = r.argument(0, "a");
  r.finish();
  if (!a || a->isNone()) {
    interp.seedRandom(std::random_device{}());
  } else if (a->isIntegral()) {
    interp.seedRandom(static_cast<unsigned long long>(a->asInt()));
  } else {
    interp.seedRandom(static_cast<unsigned long long>(hashValue(*a)));
  }
  return Value();
}

Value randrange(Interpreter& interp, long long start, long long stop, long long step) {
  if (step == 0) { raise(types().valueError, "zero step for randrange()"); }
  const long long width = stop - start;
  long long n = 0;
  if (step > 0) {
    n = width > 0 ? (width + step - 1) / step : 0;
  } else {
    n = width < 0 ? (width + step + 1) / step : 0;
  }
  if (n <= 0) {
    raise(types().valueError, "empty range for randrange() (" + std::to_string(start) + ", " + std::to_string(stop) +
                                  ", " + std::to_string(width) + ")");
  }
  return Value::integer(start + step * below(interp, n));
}

Value randomRandrange(Interpreter& interp, CallArgs& args) {
  ArgReader r("randrange", args);
  r.noKeywords();
  r.expect(1, 3);
  if (r.count() == 1) { return randrange(interp, 0, r.integer(0), 1); }
  return randrange(interp, r.integer(0), r.integer(1), r.count() == 3 ? r.integer(2) : 1);
}

Value randomRandint(Interpreter& interp, CallArgs& args) {
  ArgReader r("randint", args);
  r.noKeywords();
  r.expect(2, 2);
  return randrange(interp, r.integer(0), checkedAdd(r.integer(1), 1), 1);
}

Value randomUniform(Interpreter& interp, CallArgs& args) {
  ArgReader r("uniform", args);
  r.noKeywords();
  r.expect(2, 2);
  const double a = r.number(0);
  const double b = r.number(1);
  return Value::real(a + (b - a) * unit(interp));
}

Value randomChoice(Interpreter& interp, CallArgs& args) {
  ArgReader r("choice", args);
  r.noKeywords();
  r.expect(1, 1);
  const long long n = length(r.at(0));
  if (n == 0) { raise(types().indexError, "Cannot choose from an empty sequence"); }
  return getItem(r.at(0), Value::integer(below(interp, n)));
}

Value randomShuffle(Interpreter& interp, CallArgs& args) {
  ArgReader r("shuffle", args);
  r.noKeywords();
  r.expect(1, 1);
  auto* list = r.at(0).as<ListObj>();
  if (list == nullptr) { raise(types().typeError, "shuffle() argument must be a list, not " + typeName(r.at(0))); }
  auto& items = list->items;
  for (std::size_t i = items.size(); i > 1; --i) {
    const auto j = static_cast<std::size_t>(below(interp, static_cast<long long>(i)));
    std::swap(items[i - 1], items[j]);
  }
  return Value();
}

Value randomSample(Interpreter& interp, CallArgs& args) {
  ArgReader r("sample", args);
  auto population = r.argument(0, "population");
  auto k = r.argument(1, "k");
  r.finish();
  if (!population || !k) { raise(types().typeError, "sample() missing required argument"); }
  ValueList pool = interp.materialize(*population);
  const long long count = detail::toInteger(*k);
  if (count < 0 || count > static_cast<long long>(pool.size())) {
    raise(types().valueError, "Sample larger than population or is negative");
  }
  ValueList out;
  for (long long i = 0; i < count; ++i) {
    const auto j = static_cast<std::size_t>(i + below(interp, static_cast<long long>(pool.size()) - i));
    std::swap(pool[static_cast<std::size_t>(i)], pool[j]);
    out.push_back(pool[static_cast<std::size_t>(i)]);
  }
  return newList(std::move(out));
}

Value randomChoices(Interpreter& interp, CallArgs& args) {
  ArgReader r("choices", args);
  auto population = r.argument(0, "population");
  auto k = r.keyword("k");
  r.finish();
  if (!population) { raise(types().typeError, "choices() missing required argument 'population'"); }
  const ValueList pool = interp.materialize(*population);
  const long long count = k ? detail::toInteger(*k) : 1;
  if (pool.empty() && count > 0) { raise(types().indexError, "Cannot choose from an empty population"); }
  Heap::checkLength(count > 0 ? static_cast<std::size_t>(count) : 0);
  ValueList out;
  for (long long i = 0; i < count; ++i) {
    out.push_back(pool[static_cast<std::size_t>(below(interp, static_cast<long long>(pool.size())))]);
  }
  return newList(std::move(out));
}

} // namespace

Value makeRandomModule() {
  auto module = make<ModuleObj>("random");
  auto add = [&](const char* name, NativeFn f) {
    module->attrs.emplace_back(name, make<BuiltinFunction>(name, std::move(f)));
  };
  add("random", randomRandom);
  add("seed", randomSeed);
  add("randint", randomRandint);
  add("randrange", randomRandrange);
  add("uniform", randomUniform);
  add("choice", randomChoice);
  add("choices", randomChoices);
  add("shuffle", randomShuffle);
  add("sample", randomSample);
  return module;
}

} // namespace pybox::rt
