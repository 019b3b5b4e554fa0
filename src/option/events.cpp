#include "../../include/option/events.hpp"

namespace option {

namespace {

struct NameVisitor {
  const char *operator()(const Issued &) const { return "Issued"; }
  const char *operator()(const Exercised &) const { return "Exercised"; }
  const char *operator()(const Expired &) const { return "Expired"; }
};

struct JsonVisitor {
  nlohmann::json operator()(const Issued &e) const {
    return {{"issuer", e.issuer}, {"amount", e.amount}};
  }
  nlohmann::json operator()(const Exercised &e) const {
    return {{"holder", e.holder},
            {"unit_amount", e.unit_amount},
            {"collateral_released", e.collateral_released},
            {"payment_taken", e.payment_taken}};
  }
  nlohmann::json operator()(const Expired &e) const {
    return {{"issuer", e.issuer}, {"collateral_swept", e.collateral_swept}};
  }
};

} // namespace

const char *eventName(const Event &event) {
  return std::visit(NameVisitor{}, event.payload);
}

nlohmann::json toJson(const Event &event) {
  return {{"sequence", event.sequence},
          {"timestamp", event.timestamp},
          {"event", eventName(event)},
          {"data", std::visit(JsonVisitor{}, event.payload)}};
}

} // namespace option
