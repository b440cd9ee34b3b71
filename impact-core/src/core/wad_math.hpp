#pragma once

// ============================================================================
// WAD 定点数学 (1.0 = 1e18)
// ============================================================================
// exp: 区间缩减 x = k*ln2 + r, |r| <= ln2/2, 泰勒展开
// ln:  规约到 [1, 2), 再用 atanh 级数 ln(y) = 2*atanh((y-1)/(y+1))
// 中间计算在 1e36 精度下进行, 结果截断回 1e18

#include <stdexcept>

#include <boost/multiprecision/cpp_int.hpp>

#include "amount.hpp"

namespace wad {

inline const Amount SCALE36("1000000000000000000000000000000000000");
inline const Amount LN2_36("693147180559945309417232121458176568");
inline const Amount LN2("693147180559945309");

// e^130 * 1e18 仍在 int256 范围内
inline const Amount MAX_EXP_INPUT = Amount(130) * units::WAD;
// e^-60 远小于 1e-18
inline const Amount MIN_EXP_INPUT = Amount(-60) * units::WAD;

inline Amount mul(const Amount &a, const Amount &b) { return a * b / units::WAD; }

inline Amount div(const Amount &a, const Amount &b) {
  if (b == 0)
    throw std::domain_error("wad::div by zero");
  return a * units::WAD / b;
}

inline Amount pow2(int n) { return boost::multiprecision::pow(Amount(2), static_cast<unsigned>(n)); }

inline Amount exp(const Amount &x) {
  if (x > MAX_EXP_INPUT)
    throw std::overflow_error("wad::exp input out of range");
  if (x < MIN_EXP_INPUT)
    return 0;

  Amount x36 = x * units::WAD;
  Amount half = LN2_36 / 2;
  int k = ((x36 >= 0 ? x36 + half : x36 - half) / LN2_36).convert_to<int>();
  Amount r = x36 - Amount(k) * LN2_36;

  Amount sum = SCALE36;
  Amount term = SCALE36;
  for (int n = 1; n < 64; ++n) {
    term = term * r / (Amount(n) * SCALE36);
    if (term == 0)
      break;
    sum += term;
  }

  if (k >= 0) {
    if (k <= 100)
      return sum * pow2(k) / units::WAD;
    return (sum / units::WAD) * pow2(k);
  }
  return sum / (units::WAD * pow2(-k));
}

inline Amount ln(const Amount &x) {
  if (x <= 0)
    throw std::domain_error("wad::ln of non-positive value");

  Amount m = x;
  int k = 0;
  // 大输入先折半, x * 1e18 不能超出 int256
  while (m > SCALE36) {
    m /= 2;
    ++k;
  }
  Amount y = m * units::WAD;
  const Amount two = SCALE36 * 2;
  while (y >= two) {
    y /= 2;
    ++k;
  }
  while (y < SCALE36) {
    y *= 2;
    --k;
  }

  Amount z = (y - SCALE36) * SCALE36 / (y + SCALE36);
  Amount z2 = z * z / SCALE36;
  Amount sum = 0;
  Amount term = z;
  for (int n = 0; term != 0 && n < 128; ++n) {
    sum += term / (2 * n + 1);
    term = term * z2 / SCALE36;
  }

  return (Amount(k) * LN2_36 + 2 * sum) / units::WAD;
}

} // namespace wad
