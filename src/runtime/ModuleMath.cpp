/***
 * Name: pybox::rt math module
 * Purpose: The `math` module a fragment namespace gets.
 */
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>
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

Value checked(double result) {
  if (std::isnan(result)) { raise(types().valueError, "math domain error"); }
  if (std::isinf(result)) { raise(types().overflowError, "math range error"); }
  return Value::real(result);
}

// One-argument function of a real; domain errors when a finite input gives NaN.
template <double (*Fn)(double)>
Value unary(Interpreter&, CallArgs& args) {
  ArgReader r("math function", args);
  r.noKeywords();
  r.expect(1, 1);
  const double x = r.number(0);
  const double y = Fn(x);
  if (std::isnan(y) && !std::isnan(x)) { raise(types().valueError, "math domain error"); }
  if (std::isinf(y) && std::isfinite(x)) { raise(types().overflowError, "math range error"); }
  return Value::real(y);
}

double sqrtOf(double x) { return std::sqrt(x); }
double expOf(double x) { return std::exp(x); }
double sinOf(double x) { return std::sin(x); }
double cosOf(double x) { return std::cos(x); }
double tanOf(double x) { return std::tan(x); }
double asinOf(double x) { return std::asin(x); }
double acosOf(double x) { return std::acos(x); }
double atanOf(double x) { return std::atan(x); }
double fabsOf(double x) { return std::fabs(x); }
double log2Of(double x) { return x == 0.0 ? std::numeric_limits<double>::quiet_NaN() : std::log2(x); }
double log10Of(double x) { return x == 0.0 ? std::numeric_limits<double>::quiet_NaN() : std::log10(x); }
double degreesOf(double x) { return x * 180.0 / std::numbers::pi; }
double radiansOf(double x) { return x * std::numbers::pi / 180.0; }

Value toIntegral(double d, const char* what) {
  if (std::isnan(d)) { raise(types().valueError, "cannot convert float NaN to integer"); }
  if (std::isinf(d)) { raise(types().overflowError, "cannot convert float infinity to integer"); }
  if (d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
    raise(types().overflowError, std::string(what) + "() result does not fit in an int");
  }
  return Value::integer(static_cast<long long>(d));
}

template <double (*Round)(double)>
Value rounding(Interpreter&, CallArgs& args) {
  ArgReader r("math function", args);
  r.noKeywords();
  r.expect(1, 1);
  if (r.at(0).isIntegral()) { return Value::integer(r.at(0).asInt()); }
  return toIntegral(Round(r.number(0)), "math");
}

double floorOf(double x) { return std::floor(x); }
double ceilOf(double x) { return std::ceil(x); }
double truncOf(double x) { return std::trunc(x); }

Value mathLog(Interpreter&, CallArgs& args) {
  ArgReader r("log", args);
  r.noKeywords();
  r.expect(1, 2);
  const double x = r.number(0);
  if (x <= 0.0) { raise(types().valueError, "math domain error"); }
  if (r.count() == 1) { return Value::real(std::log(x)); }
  const double base = r.number(1);
  if (base <= 0.0 || base == 1.0) { raise(types().valueError, "math domain error"); }
  return Value::real(std::log(x) / std::log(base));
}

Value mathPow(Interpreter&, CallArgs& args) {
  ArgReader r("pow", args);
  r.noKeywords();
  r.expect(2, 2);
  const double x = r.number(0);
  const double y = r.number(1);
  if (x == 0.0 && y < 0.0) { raise(types().valueError, "math domain error"); }
  const double out = std::pow(x, y);
  if (std::isnan(out) && !std::isnan(x) && !std::isnan(y)) { raise(types().valueError, "math domain error"); }
  if (std::isinf(out) && std::isfinite(x) && std::isfinite(y)) { raise(types().overflowError, "math range error"); }
  return Value::real(out);
}

Value mathAtan2(Interpreter&, CallArgs& args) {
  ArgReader r("atan2", args);
  r.noKeywords();
  r.expect(2, 2);
  return Value::real(std::atan2(r.number(0), r.number(1)));
}

Value mathHypot(Interpreter&, CallArgs& args) {
  ArgReader r("hypot", args);
  r.noKeywords();
  double sum = 0.0;
  for (std::size_t i = 0; i < r.count(); ++i) {
    const double v = r.number(i);
    sum += v * v;
  }
  return Value::real(std::sqrt(sum));
}

Value mathDist(Interpreter& interp, CallArgs& args) {
  ArgReader r("dist", args);
  r.noKeywords();
  r.expect(2, 2);
  const ValueList p = interp.materialize(r.at(0));
  const ValueList q = interp.materialize(r.at(1));
  if (p.size() != q.size()) { raise(types().valueError, "both points must have the same number of dimensions"); }
  double sum = 0.0;
  for (std::size_t i = 0; i < p.size(); ++i) {
    const double d = detail::toNumber(p[i], "dist") - detail::toNumber(q[i], "dist");
    sum += d * d;
  }
  return Value::real(std::sqrt(sum));
}

Value mathGcd(Interpreter&, CallArgs& args) {
  ArgReader r("gcd", args);
  r.noKeywords();
  long long g = 0;
  for (std::size_t i = 0; i < r.count(); ++i) {
    const long long v = r.integer(i);
    if (v == std::numeric_limits<long long>::min()) { raise(types().overflowError, "int too large to convert"); }
    g = std::gcd(g, v < 0 ? -v : v);
  }
  return Value::integer(g);
}

Value mathIsclose(Interpreter&, CallArgs& args) {
  ArgReader r("isclose", args);
  auto relTol = r.keyword("rel_tol");
  auto absTol = r.keyword("abs_tol");
  r.finish();
  r.expect(2, 2);
  const double a = r.number(0);
  const double b = r.number(1);
  const double rel = relTol ? detail::toNumber(*relTol, "isclose") : 1e-09;
  const double absolute = absTol ? detail::toNumber(*absTol, "isclose") : 0.0;
  if (rel < 0.0 || absolute < 0.0) { raise(types().valueError, "tolerances must be non-negative"); }
  if (a == b) { return Value::boolean(true); }
  if (std::isinf(a) || std::isinf(b)) { return Value::boolean(false); }
  const double diff = std::fabs(b - a);
  return Value::boolean(diff <= std::fabs(rel * b) || diff <= std::fabs(rel * a) || diff <= absolute);
}

Value mathIsnan(Interpreter&, CallArgs& args) {
  ArgReader r("isnan", args);
  r.noKeywords();
  r.expect(1, 1);
  return Value::boolean(std::isnan(r.number(0)));
}

Value mathIsinf(Interpreter&, CallArgs& args) {
  ArgReader r("isinf", args);
  r.noKeywords();
  r.expect(1, 1);
  return Value::boolean(std::isinf(r.number(0)));
}

Value mathIsfinite(Interpreter&, CallArgs& args) {
  ArgReader r("isfinite", args);
  r.noKeywords();
  r.expect(1, 1);
  return Value::boolean(std::isfinite(r.number(0)));
}

Value mathFactorial(Interpreter&, CallArgs& args) {
  ArgReader r("factorial", args);
  r.noKeywords();
  r.expect(1, 1);
  const long long n = r.integer(0);
  if (n < 0) { raise(types().valueError, "factorial() not defined for negative values"); }
  long long out = 1;
  for (long long i = 2; i <= n; ++i) { out = checkedMul(out, i); }
  return Value::integer(out);
}

Value mathCopysign(Interpreter&, CallArgs& args) {
  ArgReader r("copysign", args);
  r.noKeywords();
  r.expect(2, 2);
  return Value::real(std::copysign(r.number(0), r.number(1)));
}

Value mathFsum(Interpreter& interp, CallArgs& args) {
  ArgReader r("fsum", args);
  r.noKeywords();
  r.expect(1, 1);
  // Kahan summation
  double sum = 0.0;
  double carry = 0.0;
  interp.iterate(r.at(0), [&](const Value& v) {
    const double y = detail::toNumber(v, "fsum") - carry;
    const double t = sum + y;
    carry = (t - sum) - y;
    sum = t;
    return true;
  });
  return checked(sum);
}

} // namespace

Value makeMathModule() {
  auto module = make<ModuleObj>("math");
  auto add = [&](const char* name, NativeFn f) {
    module->attrs.emplace_back(name, make<BuiltinFunction>(name, std::move(f)));
  };
  module->attrs.emplace_back("pi", Value::real(std::numbers::pi));
  module->attrs.emplace_back("e", Value::real(std::numbers::e));
  module->attrs.emplace_back("tau", Value::real(2.0 * std::numbers::pi));
  module->attrs.emplace_back("inf", Value::real(std::numeric_limits<double>::infinity()));
  module->attrs.emplace_back("nan", Value::real(std::numeric_limits<double>::quiet_NaN()));
  add("sqrt", unary<&sqrtOf>);
  add("exp", unary<&expOf>);
  add("log", mathLog);
  add("log2", unary<&log2Of>);
  add("log10", unary<&log10Of>);
  add("pow", mathPow);
  add("sin", unary<&sinOf>);
  add("cos", unary<&cosOf>);
  add("tan", unary<&tanOf>);
  add("asin", unary<&asinOf>);
  add("acos", unary<&acosOf>);
  add("atan", unary<&atanOf>);
  add("atan2", mathAtan2);
  add("hypot", mathHypot);
  add("dist", mathDist);
  add("degrees", unary<&degreesOf>);
  add("radians", unary<&radiansOf>);
  add("fabs", unary<&fabsOf>);
  add("floor", rounding<&floorOf>);
  add("ceil", rounding<&ceilOf>);
  add("trunc", rounding<&truncOf>);
  add("gcd", mathGcd);
  add("factorial", mathFactorial);
  add("copysign", mathCopysign);
  add("fsum", mathFsum);
  add("isclose", mathIsclose);
  add("isnan", mathIsnan);
  add("isinf", mathIsinf);
  add("isfinite", mathIsfinite);
  return module;
}

} // namespace pybox::rt
