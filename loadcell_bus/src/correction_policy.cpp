#include "loadcell_bus/correction_policy.h"

#include <cmath>

#include "loadcell_bus/loadcell_exception.h"

namespace loadcell_bus {

namespace {

// 실측 보정 데이터로 구한 기본 곡선
constexpr double kDefaultLinearSlope = 0.990527;
constexpr double kDefaultLinearIntercept = -2.990644;
constexpr double kDefaultQuadA = 0.002174112;
constexpr double kDefaultQuadB = 0.381139;
constexpr double kDefaultQuadC = 26.526635;

void RequireFinite_(double v) {
  if (!std::isfinite(v)) {
    throw LoadCellException(ResultCode::kInvalidArgument,
                            "correction coefficient must be finite");
  }
}

} // namespace

CorrectionPolicy::CorrectionPolicy(Kind kind, double a, double b, double c)
    : kind_(kind), coeff_{{a, b, c}} {
  RequireFinite_(a);
  RequireFinite_(b);
  RequireFinite_(c);
}

CorrectionPolicy CorrectionPolicy::Linear(double slope, double intercept) {
  return CorrectionPolicy(Kind::kLinear, 0.0, slope, intercept);
}

CorrectionPolicy CorrectionPolicy::Quadratic(double a, double b, double c) {
  return CorrectionPolicy(Kind::kQuadratic, a, b, c);
}

CorrectionPolicy
CorrectionPolicy::FromName(const std::string &name,
                           const std::vector<double> &coefficients) {
  if (name.empty() || name == "identity" || name == "none")
    return Identity();

  if (name == "linear") {
    if (coefficients.empty())
      return Linear(kDefaultLinearSlope, kDefaultLinearIntercept);
    if (coefficients.size() != 2) {
      throw LoadCellException(ResultCode::kInvalidArgument,
                              "linear correction needs 2 coefficients");
    }
    return Linear(coefficients[0], coefficients[1]);
  }

  if (name == "quadratic") {
    if (coefficients.empty())
      return Quadratic(kDefaultQuadA, kDefaultQuadB, kDefaultQuadC);
    if (coefficients.size() != 3) {
      throw LoadCellException(ResultCode::kInvalidArgument,
                              "quadratic correction needs 3 coefficients");
    }
    return Quadratic(coefficients[0], coefficients[1], coefficients[2]);
  }

  throw LoadCellException(ResultCode::kInvalidArgument,
                          "unknown correction: " + name);
}

double CorrectionPolicy::Apply(double grams) const noexcept {
  switch (kind_) {
  case Kind::kIdentity:
    return grams;
  case Kind::kLinear:
    return coeff_[1] * grams + coeff_[2];
  case Kind::kQuadratic:
    return coeff_[0] * grams * grams + coeff_[1] * grams + coeff_[2];
  }
  return grams;
}

const char *CorrectionPolicy::Name() const noexcept {
  switch (kind_) {
  case Kind::kIdentity:
    return "identity";
  case Kind::kLinear:
    return "linear";
  case Kind::kQuadratic:
    return "quadratic";
  }
  return "identity";
}

} // namespace loadcell_bus
