#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace credit {

using uint128_t = boost::multiprecision::uint128_t;

// Basis-point denominator shared by ratios, fees and APRs.
inline constexpr std::uint64_t kBpsDenominator = 10000;

// 365-day year; leap seconds and leap years are not modelled.
inline constexpr std::uint64_t kSecondsPerYear = 365ULL * 86400ULL;

// -----------------------------------------------------------------------------
// mul_div(a, b, denominator)
// -----------------------------------------------------------------------------
//
// @brief  floor(a * b / denominator) without intermediate overflow.
//
// @details
// The product is formed in a Boost.Multiprecision 128-bit integer, so any
// pair of 64-bit operands multiplies exactly. Only the final quotient is
// narrowed back to 64 bits; if it does not fit, std::overflow_error is
// thrown rather than silently wrapping.
//
// @throws std::domain_error    denominator == 0
// @throws std::overflow_error  quotient > UINT64_MAX
// -----------------------------------------------------------------------------
inline std::uint64_t mul_div(std::uint64_t a, std::uint64_t b,
                             std::uint64_t denominator) {
  if (denominator == 0) {
    throw std::domain_error("mul_div: zero denominator");
  }
  uint128_t product;
  boost::multiprecision::multiply(product, a, b);
  const uint128_t quotient = product / denominator;
  if (quotient > std::numeric_limits<std::uint64_t>::max()) {
    throw std::overflow_error("mul_div: result exceeds 64 bits");
  }
  return static_cast<std::uint64_t>(quotient);
}

// Same as mul_div() but rounds the quotient up.
inline std::uint64_t mul_div_ceil(std::uint64_t a, std::uint64_t b,
                                  std::uint64_t denominator) {
  if (denominator == 0) {
    throw std::domain_error("mul_div_ceil: zero denominator");
  }
  uint128_t product;
  boost::multiprecision::multiply(product, a, b);
  uint128_t quotient = product / denominator;
  if (product % denominator != 0) {
    ++quotient;
  }
  if (quotient > std::numeric_limits<std::uint64_t>::max()) {
    throw std::overflow_error("mul_div_ceil: result exceeds 64 bits");
  }
  return static_cast<std::uint64_t>(quotient);
}

// Basis-point share of an amount, truncated.
inline std::uint64_t bps_of(std::uint64_t amount, std::uint64_t bps) {
  return mul_div(amount, bps, kBpsDenominator);
}

}  // namespace credit
