#pragma once

// ============================================================================
// LMSR 成本函数
// ============================================================================
// C(qy, qn) = b * ln(e^(qy/b) + e^(qn/b))
//           = max + b * ln(1 + e^((min - max)/b))     (只对非正数求 exp)
// p_yes     = 1 / (1 + e^((qn - qy)/b))
// 所有量均为 WAD (18 位小数)

#include "../core/amount.hpp"
#include "../core/wad_math.hpp"

namespace lmsr {

// |x| 超过该值时价格直接饱和到 0 / 1
inline const Amount SATURATION = Amount(130) * units::WAD;

inline Amount cost(const Amount &q_yes, const Amount &q_no, const Amount &b) {
  const Amount &hi = q_yes >= q_no ? q_yes : q_no;
  const Amount &lo = q_yes >= q_no ? q_no : q_yes;
  Amount e = wad::exp((lo - hi) * units::WAD / b);
  return hi + b * wad::ln(units::WAD + e) / units::WAD;
}

inline Amount price_yes(const Amount &q_yes, const Amount &q_no, const Amount &b) {
  Amount x = (q_yes - q_no) * units::WAD / b;
  if (x > SATURATION)
    return units::WAD;
  if (x < -SATURATION)
    return 0;

  Amount p;
  if (x >= 0) {
    Amount e = wad::exp(-x);
    p = units::WAD * units::WAD / (units::WAD + e);
  } else {
    Amount e = wad::exp(x);
    p = e * units::WAD / (units::WAD + e);
  }
  if (p < 0)
    return 0;
  if (p > units::WAD)
    return units::WAD;
  return p;
}

inline Amount price_no(const Amount &q_yes, const Amount &q_no, const Amount &b) {
  return units::WAD - price_yes(q_yes, q_no, b);
}

} // namespace lmsr
