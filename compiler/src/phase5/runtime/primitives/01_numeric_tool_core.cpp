#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

#if defined(ARBOR_HAS_MPFR)
#include <gmp.h>
#include <mpfr.h>
#endif

#include "phase3/evaluator_parts/internal_helpers.h"

namespace arbor {

namespace {

#if defined(ARBOR_HAS_MPFR)
// Calculator tools promise IEEE double results; MPFR at the double mantissa
// width gives correctly rounded pow/sqrt independent of the platform libm.
constexpr mpfr_prec_t kToolPrecisionBits = 53;

struct MpfrValue {
  explicit MpfrValue(mpfr_prec_t precision) {
    mpfr_init2(value, precision);
  }
  ~MpfrValue() {
    mpfr_clear(value);
  }
  MpfrValue(const MpfrValue&) = delete;
  MpfrValue& operator=(const MpfrValue&) = delete;
  mpfr_t value;
};

bool mpfr_tool_kernel_enabled() {
  // On by default; the env gate exists for comparing against libm.
  static const bool enabled = env_flag_enabled("ARBOR_MPFR_KERNEL", true);
  return enabled;
}
#endif

bool parse_numeric_text(const std::string& text, double& out) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  if (begin == end) {
    return false;
  }
  const std::string trimmed = text.substr(begin, end - begin);
  char* parse_end = nullptr;
  const double parsed = std::strtod(trimmed.c_str(), &parse_end);
  if (parse_end != trimmed.c_str() + trimmed.size()) {
    return false;
  }
  out = parsed;
  return true;
}

}  // namespace

void require_tool_arity(const std::string& tool, const std::vector<Value>& args, std::size_t arity) {
  if (args.size() != arity) {
    throw ToolInvocationError(tool + "() expects " + std::to_string(arity) + " argument(s), got " +
                              std::to_string(args.size()));
  }
}

double tool_number_arg(const std::string& tool, const std::vector<Value>& args, std::size_t index) {
  const auto& arg = args.at(index);
  if (arg.is_number()) {
    return arg.number();
  }
  double parsed = 0.0;
  if (arg.kind == Value::Kind::String && parse_numeric_text(arg.string_value, parsed)) {
    return parsed;
  }
  throw ToolInvocationError(tool + "() argument " + std::to_string(index + 1) + " must be numeric, got " +
                            value_kind_name(arg.kind));
}

double numeric_power(double base, double exponent) {
#if defined(ARBOR_HAS_MPFR)
  if (mpfr_tool_kernel_enabled()) {
    MpfrValue lhs(kToolPrecisionBits);
    MpfrValue rhs(kToolPrecisionBits);
    MpfrValue result(kToolPrecisionBits);
    mpfr_set_d(lhs.value, base, MPFR_RNDN);
    mpfr_set_d(rhs.value, exponent, MPFR_RNDN);
    mpfr_pow(result.value, lhs.value, rhs.value, MPFR_RNDN);
    return mpfr_get_d(result.value, MPFR_RNDN);
  }
#endif
  return std::pow(base, exponent);
}

double numeric_sqrt(double value) {
#if defined(ARBOR_HAS_MPFR)
  if (mpfr_tool_kernel_enabled()) {
    MpfrValue operand(kToolPrecisionBits);
    MpfrValue result(kToolPrecisionBits);
    mpfr_set_d(operand.value, value, MPFR_RNDN);
    mpfr_sqrt(result.value, operand.value, MPFR_RNDN);
    return mpfr_get_d(result.value, MPFR_RNDN);
  }
#endif
  return std::sqrt(value);
}

const char* numeric_backend_name() {
#if defined(ARBOR_HAS_MPFR)
  if (mpfr_tool_kernel_enabled()) {
    return "mpfr";
  }
#endif
  return "libm";
}

}  // namespace arbor
