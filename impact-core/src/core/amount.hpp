#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json.hpp>

// ============================================================================
// Amount - 256 位定点整数
// ============================================================================
// collateral: 6 位小数 (1 USDC = 1e6)
// bond / outcome shares / LMSR b: 18 位小数 (1.0 = 1e18)
// checked 后端: 溢出抛 std::overflow_error, 不会回绕
using Amount = boost::multiprecision::checked_int256_t;

namespace units {

inline const Amount WAD("1000000000000000000");
inline const Amount USDC("1000000");
// 1e18 share -> 1e6 collateral
inline const Amount WAD_TO_USDC("1000000000000");

inline Amount parse(const std::string &s) {
  size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;
  if (s.size() == start || s.size() - start > 77)
    throw std::invalid_argument("invalid amount: '" + s + "'");
  for (size_t i = start; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9')
      throw std::invalid_argument("invalid amount: '" + s + "'");
  }
  return Amount(s.c_str());
}

inline Amount usdc(int64_t whole) { return Amount(whole) * USDC; }
inline Amount wad(int64_t whole) { return Amount(whole) * WAD; }

// 非负数向上取整除法
inline Amount ceil_div(const Amount &a, const Amount &b) {
  if (a <= 0)
    return 0;
  return (a + b - 1) / b;
}

} // namespace units

namespace nlohmann {

// 金额统一以十进制字符串进出 JSON, 入参也接受整数
template <> struct adl_serializer<Amount> {
  static void to_json(json &j, const Amount &a) { j = a.str(); }

  static void from_json(const json &j, Amount &a) {
    if (j.is_string()) {
      a = units::parse(j.get<std::string>());
    } else if (j.is_number_unsigned()) {
      a = Amount(j.get<uint64_t>());
    } else if (j.is_number_integer()) {
      a = Amount(j.get<int64_t>());
    } else {
      throw std::invalid_argument("amount must be a decimal string or integer");
    }
  }
};

} // namespace nlohmann
