#include "../../include/option/types.hpp"

namespace option {

const char *toString(Status status) {
  switch (status) {
  case Status::OK:
    return "OK";
  case Status::UNAUTHORIZED:
    return "UNAUTHORIZED";
  case Status::ALREADY_EXPIRED:
    return "ALREADY_EXPIRED";
  case Status::NOT_YET_EXPIRABLE:
    return "NOT_YET_EXPIRABLE";
  case Status::NOT_IN_EXERCISE_WINDOW:
    return "NOT_IN_EXERCISE_WINDOW";
  case Status::INSUFFICIENT_UNIT_BALANCE:
    return "INSUFFICIENT_UNIT_BALANCE";
  case Status::INSUFFICIENT_PAYMENT:
    return "INSUFFICIENT_PAYMENT";
  case Status::AMOUNT_MISMATCH:
    return "AMOUNT_MISMATCH";
  case Status::ZERO_AMOUNT:
    return "ZERO_AMOUNT";
  case Status::UNSUPPORTED:
    return "UNSUPPORTED";
  case Status::TRANSFER_FAILED:
    return "TRANSFER_FAILED";
  case Status::REENTRANT_CALL:
    return "REENTRANT_CALL";
  case Status::ARITHMETIC_OVERFLOW:
    return "ARITHMETIC_OVERFLOW";
  case Status::INVALID_PARAMETERS:
    return "INVALID_PARAMETERS";
  }
  return "UNKNOWN";
}

const char *toString(CollateralKind kind) {
  switch (kind) {
  case CollateralKind::NATIVE:
    return "native";
  case CollateralKind::FOREIGN_ASSET:
    return "foreign_asset";
  }
  return "unknown";
}

std::optional<CollateralKind> parseCollateralKind(const std::string &name) {
  if (name == "native") {
    return CollateralKind::NATIVE;
  }
  if (name == "foreign_asset") {
    return CollateralKind::FOREIGN_ASSET;
  }
  return std::nullopt;
}

} // namespace option
