#pragma once

#include "clock.hpp"
#include "events.hpp"
#include "types.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

namespace escrow {
class ValueTransport;
} // namespace escrow

namespace option {

class UnsupportedCollateral : public std::runtime_error {
public:
  explicit UnsupportedCollateral(CollateralKind kind);
};

// Collateral-backed call option with a single issuance. Owns the unit
// ledger, the escrow account and the issuer policy of one instrument.
//
// issue/exercise/expire run under one instrument-wide lock for their whole
// duration, outbound transfers included. Internal state is always updated
// before value leaves the escrow, and a failed transfer reverts every
// change made by the call. A mutating call entered from inside another one
// on the same thread (a transport calling back in) is rejected with
// REENTRANT_CALL.
class CallOption {
public:
  // Throws std::invalid_argument for bad parameters and
  // UnsupportedCollateral for a non-native collateral kind.
  CallOption(InstrumentParams params,
             std::shared_ptr<escrow::ValueTransport> transport,
             std::shared_ptr<Clock> clock);
  ~CallOption();

  CallOption(const CallOption &) = delete;
  CallOption &operator=(const CallOption &) = delete;

  // Non-throwing factory. On failure out is left empty and the status says
  // why.
  static Status create(InstrumentParams params,
                       std::shared_ptr<escrow::ValueTransport> transport,
                       std::shared_ptr<Clock> clock,
                       std::unique_ptr<CallOption> &out);

  // Lifecycle
  Status issue(const Address &caller, Amount amount, Amount deposited_value);
  Status exercise(const Address &caller, Amount unit_amount,
                  Amount paid_value);
  Status expire(const Address &caller);

  // Unit transfers between holders. These take the instrument lock too, so
  // a recipient cannot move units in the middle of another call.
  Status transfer(const Address &caller, const Address &to, Amount amount);
  Status approve(const Address &caller, const Address &spender,
                 Amount amount);
  Status transferFrom(const Address &caller, const Address &from,
                      const Address &to, Amount amount);

  // Queries
  std::optional<Amount> quote(Amount unit_amount) const;
  InstrumentInfo info() const;
  Amount balance() const;
  Amount balanceOf(const Address &holder) const;
  Amount allowance(const Address &owner, const Address &spender) const;
  bool isExercisable(Timestamp now) const;
  bool isExpired() const;
  bool checkInvariant() const;

  const InstrumentParams &getParams() const;
  Timestamp getCreationTime() const;

  // Notifications
  size_t subscribe(EventCallback callback);
  void unsubscribe(size_t subscription_id);
  std::vector<Event> events() const;

private:
  class Impl;
  Impl *_pimpl;
};

} // namespace option
