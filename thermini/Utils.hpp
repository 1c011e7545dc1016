#ifndef THERMINI_UTILS_HPP_
#define THERMINI_UTILS_HPP_

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>

namespace thermini {

template<typename Scalar_>
bool IsFinite(Scalar_ value) {
  return std::isfinite(value);
}

template<typename Scalar_>
bool IsPositive(Scalar_ value) {
  return std::isfinite(value) && value > Scalar_(0.0);
}

template<typename Scalar_>
Scalar_ Clamp(Scalar_ value, Scalar_ low, Scalar_ high) {
  return std::max(low, std::min(high, value));
}

template<typename Scalar_>
Scalar_ ValueOr(const std::optional<Scalar_>& value, Scalar_ fallback) {
  return (value && std::isfinite(*value)) ? *value : fallback;
}

template<typename Scalar_>
Scalar_ FractionToPpm(Scalar_ fraction) {
  return fraction * Scalar_(1.0e6);
}

// Replace Unicode subscript digits (U+2080..U+2089) with ASCII digits
inline std::string NormalizeFormula(const std::string& formula) {
  std::string out;
  out.reserve(formula.size());
  for (std::size_t i = 0; i < formula.size(); ++i) {
    const auto c0 = static_cast<unsigned char>(formula[i]);
    if (c0 == 0xE2 && i + 2 < formula.size()) {
      const auto c1 = static_cast<unsigned char>(formula[i + 1]);
      const auto c2 = static_cast<unsigned char>(formula[i + 2]);
      if (c1 == 0x82 && c2 >= 0x80 && c2 <= 0x89) {
        out.push_back(static_cast<char>('0' + (c2 - 0x80)));
        i += 2;
        continue;
      }
    }
    out.push_back(formula[i]);
  }
  return out;
}

} // namespace thermini

#endif // THERMINI_UTILS_HPP_
