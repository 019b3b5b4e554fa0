#pragma once

#include "types.hpp"
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <variant>

namespace option {

struct Issued {
  Address issuer;
  Amount amount;
};

struct Exercised {
  Address holder;
  Amount unit_amount;
  Amount collateral_released;
  Amount payment_taken;
};

struct Expired {
  Address issuer;
  Amount collateral_swept;
};

using EventPayload = std::variant<Issued, Exercised, Expired>;

// Notification record emitted after a mutating call commits.
struct Event {
  uint64_t sequence;
  Timestamp timestamp;
  EventPayload payload;
};

using EventCallback = std::function<void(const Event &)>;

const char *eventName(const Event &event);
nlohmann::json toJson(const Event &event);

} // namespace option
