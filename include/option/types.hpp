#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace option {

using Amount = std::uint64_t;
using Timestamp = std::int64_t; // seconds since the Unix epoch
using Address = std::string;

// Seconds before expiration during which exercise is allowed.
constexpr Timestamp WINDOW = 24 * 60 * 60;

enum class CollateralKind { NATIVE, FOREIGN_ASSET };

enum class Status : uint8_t {
  OK = 0,
  UNAUTHORIZED,
  ALREADY_EXPIRED,
  NOT_YET_EXPIRABLE,
  NOT_IN_EXERCISE_WINDOW,
  INSUFFICIENT_UNIT_BALANCE,
  INSUFFICIENT_PAYMENT,
  AMOUNT_MISMATCH,
  ZERO_AMOUNT,
  UNSUPPORTED,
  TRANSFER_FAILED,
  REENTRANT_CALL,
  ARITHMETIC_OVERFLOW,
  INVALID_PARAMETERS
};

const char *toString(Status status);
const char *toString(CollateralKind kind);
std::optional<CollateralKind> parseCollateralKind(const std::string &name);

struct InstrumentParams {
  std::string name;
  std::string symbol;
  Address issuer;
  Amount strike_price{0}; // scaled by PRICE_SCALE
  Timestamp expiration{0};
  CollateralKind collateral{CollateralKind::NATIVE};
};

struct InstrumentInfo {
  std::string name;
  std::string symbol;
  Amount strike_price;
  Timestamp expiration;
  Amount total_supply;
  Amount collateral_held;
  bool expired;
  bool can_exercise;
};

// Exercise is allowed in [expiration - WINDOW, expiration], both ends
// inclusive.
inline bool isExercisable(Timestamp now, Timestamp expiration) {
  return now >= expiration - WINDOW && now <= expiration;
}

} // namespace option
