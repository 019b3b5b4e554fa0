#include "../../include/option/fixed_point.hpp"

#include <limits>

namespace option {

std::optional<Amount> mulDivDown(Amount a, Amount b, Amount d) {
  if (d == 0) {
    return std::nullopt;
  }
  unsigned __int128 product =
      static_cast<unsigned __int128>(a) * static_cast<unsigned __int128>(b);
  unsigned __int128 quotient = product / d;
  if (quotient > std::numeric_limits<Amount>::max()) {
    return std::nullopt;
  }
  return static_cast<Amount>(quotient);
}

std::optional<Amount> requiredPayment(Amount unit_amount,
                                      Amount strike_price) {
  return mulDivDown(unit_amount, strike_price, PRICE_SCALE);
}

std::optional<Amount> checkedAdd(Amount a, Amount b) {
  if (a > std::numeric_limits<Amount>::max() - b) {
    return std::nullopt;
  }
  return a + b;
}

} // namespace option
