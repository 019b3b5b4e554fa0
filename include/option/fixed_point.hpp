#pragma once

#include "types.hpp"
#include <optional>

namespace option {

// Strike prices are collateral base units per option unit, times PRICE_SCALE.
constexpr Amount PRICE_SCALE = 100'000'000;

// a * b / d in 128-bit arithmetic, truncated toward zero. Empty when the
// quotient does not fit in an Amount or d is zero.
std::optional<Amount> mulDivDown(Amount a, Amount b, Amount d);

// Payment owed for exercising unit_amount units at strike_price.
std::optional<Amount> requiredPayment(Amount unit_amount, Amount strike_price);

std::optional<Amount> checkedAdd(Amount a, Amount b);

} // namespace option
