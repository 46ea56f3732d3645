#ifndef LOADCELL_BUS_CORRECTION_POLICY_H_
#define LOADCELL_BUS_CORRECTION_POLICY_H_

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace loadcell_bus {

/**
 * @brief zero/scale 보정 이후 적용하는 경험식 보정 곡선.
 *
 * Identity  : y = x
 * Linear    : y = slope * x + intercept
 * Quadratic : y = a * x^2 + b * x + c
 *
 * 계수는 항상 (a, b, c) 로 저장하며 Linear 는 (0, slope, intercept) 이다.
 */
class CorrectionPolicy {
public:
  enum class Kind : std::uint8_t { kIdentity = 0, kLinear, kQuadratic };

  CorrectionPolicy() = default;

  static CorrectionPolicy Identity() { return CorrectionPolicy(); }
  static CorrectionPolicy Linear(double slope, double intercept);
  static CorrectionPolicy Quadratic(double a, double b, double c);

  /**
   * @brief ROS 파라미터("identity"|"linear"|"quadratic" + 계수) 로부터 생성.
   * 계수가 비어 있으면 장비 실측으로 구한 기본 곡선을 사용한다.
   * @throw LoadCellException(kInvalidArgument) 이름/계수 개수 불일치
   */
  static CorrectionPolicy FromName(const std::string &name,
                                   const std::vector<double> &coefficients);

  double Apply(double grams) const noexcept;

  Kind GetKind() const noexcept { return kind_; }
  const std::array<double, 3> &Coefficients() const noexcept { return coeff_; }
  const char *Name() const noexcept;

  bool operator==(const CorrectionPolicy &rhs) const noexcept {
    return kind_ == rhs.kind_ && coeff_ == rhs.coeff_;
  }
  bool operator!=(const CorrectionPolicy &rhs) const noexcept {
    return !(*this == rhs);
  }

private:
  CorrectionPolicy(Kind kind, double a, double b, double c);

  Kind kind_ = Kind::kIdentity;
  std::array<double, 3> coeff_{{0.0, 1.0, 0.0}};
};

} // namespace loadcell_bus

#endif // LOADCELL_BUS_CORRECTION_POLICY_H_
