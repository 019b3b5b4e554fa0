#include "../../include/option/call_option.hpp"
#include "../../include/access/access_policy.hpp"
#include "../../include/escrow/escrow.hpp"
#include "../../include/ledger/balance_ledger.hpp"
#include "../../include/option/fixed_point.hpp"

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <thread>

namespace option {

namespace {

Status validateParams(const InstrumentParams &params,
                      const escrow::ValueTransport *transport,
                      const Clock *clock) {
  if (params.collateral != CollateralKind::NATIVE) {
    return Status::UNSUPPORTED;
  }
  if (!transport || !clock || params.issuer.empty() ||
      params.strike_price == 0 || params.expiration <= clock->now()) {
    return Status::INVALID_PARAMETERS;
  }
  return Status::OK;
}

InstrumentParams checkedParams(InstrumentParams params,
                               const escrow::ValueTransport *transport,
                               const Clock *clock) {
  switch (validateParams(params, transport, clock)) {
  case Status::OK:
    return params;
  case Status::UNSUPPORTED:
    throw UnsupportedCollateral(params.collateral);
  default:
    break;
  }

  if (!transport) {
    throw std::invalid_argument("Value transport is required");
  }
  if (!clock) {
    throw std::invalid_argument("Clock is required");
  }
  if (params.issuer.empty()) {
    throw std::invalid_argument("Issuer address must not be empty");
  }
  if (params.strike_price == 0) {
    throw std::invalid_argument("Strike price must be positive");
  }
  throw std::invalid_argument("Expiration must be after creation time");
}

} // namespace

UnsupportedCollateral::UnsupportedCollateral(CollateralKind kind)
    : std::runtime_error(std::string("Unsupported collateral kind: ") +
                         toString(kind)) {}

class CallOption::Impl {
public:
  Impl(InstrumentParams params,
       std::shared_ptr<escrow::ValueTransport> transport,
       std::shared_ptr<Clock> clock)
      : _params(checkedParams(std::move(params), transport.get(),
                              clock.get())),
        _created(clock->now()), _clock(std::move(clock)),
        _policy(_params.issuer), _ledger(_params.name, _params.symbol),
        _escrow(std::move(transport)) {}

  // Serialises mutating calls on this instrument and detects re-entry from
  // the thread that already holds the lock.
  class CallGuard {
  public:
    explicit CallGuard(Impl &impl) : _impl(impl) {
      if (_impl._call_owner.load() == std::this_thread::get_id()) {
        _reentrant = true;
        return;
      }
      _lock = std::unique_lock<std::mutex>(_impl._call_mutex);
      _impl._call_owner.store(std::this_thread::get_id());
    }

    ~CallGuard() {
      if (!_reentrant) {
        _impl._call_owner.store(std::thread::id());
      }
    }

    CallGuard(const CallGuard &) = delete;
    CallGuard &operator=(const CallGuard &) = delete;

    bool isReentrant() const { return _reentrant; }

  private:
    Impl &_impl;
    std::unique_lock<std::mutex> _lock;
    bool _reentrant{false};
  };

  bool expired() const {
    std::shared_lock<std::shared_mutex> lock(_state_mutex);
    return _expired;
  }

  Status issueLocked(const Address &caller, Amount amount, Amount deposited,
                     Timestamp now, std::optional<Event> &event) {
    if (!_policy.isIssuer(caller)) {
      return Status::UNAUTHORIZED;
    }
    // Reserved for foreign-asset collateral.
    if (_params.collateral != CollateralKind::NATIVE) {
      return Status::UNSUPPORTED;
    }
    if (expired()) {
      return Status::ALREADY_EXPIRED;
    }
    if (amount == 0) {
      return Status::ZERO_AMOUNT;
    }
    if (deposited != amount) {
      return Status::AMOUNT_MISMATCH;
    }

    escrow::Escrow::Journal journal(_escrow);
    if (!journal.deposit(deposited)) {
      return Status::ARITHMETIC_OVERFLOW;
    }

    {
      std::unique_lock<std::shared_mutex> lock(_state_mutex);
      if (!checkedAdd(_collateral_held, amount) ||
          !_ledger.mint(caller, amount)) {
        return Status::ARITHMETIC_OVERFLOW;
      }
      _collateral_held += amount;
    }

    journal.commit();
    event = record(now, Issued{caller, amount});
    return Status::OK;
  }

  Status exerciseLocked(const Address &caller, Amount unit_amount,
                        Amount paid, Timestamp now,
                        std::optional<Event> &event) {
    if (expired()) {
      return Status::ALREADY_EXPIRED;
    }
    if (!option::isExercisable(now, _params.expiration)) {
      return Status::NOT_IN_EXERCISE_WINDOW;
    }
    if (unit_amount == 0) {
      return Status::ZERO_AMOUNT;
    }
    if (_ledger.balanceOf(caller) < unit_amount) {
      return Status::INSUFFICIENT_UNIT_BALANCE;
    }
    auto required = requiredPayment(unit_amount, _params.strike_price);
    if (!required) {
      return Status::ARITHMETIC_OVERFLOW;
    }
    if (paid < *required) {
      return Status::INSUFFICIENT_PAYMENT;
    }

    escrow::Escrow::Journal journal(_escrow);
    if (!journal.deposit(paid)) {
      return Status::ARITHMETIC_OVERFLOW;
    }

    // Revoke the claim before any value leaves the escrow.
    {
      std::unique_lock<std::shared_mutex> lock(_state_mutex);
      if (!_ledger.burn(caller, unit_amount)) {
        return Status::INSUFFICIENT_UNIT_BALANCE;
      }
      _collateral_held -= unit_amount;
    }

    Amount refund = paid - *required;
    if (!journal.release(caller, refund) ||
        !journal.release(caller, unit_amount)) {
      journal.rollback();
      std::unique_lock<std::shared_mutex> lock(_state_mutex);
      // The burn above freed this much supply, so the mint cannot fail.
      if (!_ledger.mint(caller, unit_amount)) {
        std::cerr << "[" << _params.symbol << "] failed to restore "
                  << unit_amount << " units to " << caller << std::endl;
        throw std::logic_error("Unit restore failed during rollback");
      }
      _collateral_held += unit_amount;
      return Status::TRANSFER_FAILED;
    }

    journal.commit();
    event = record(now, Exercised{caller, unit_amount, unit_amount, *required});
    return Status::OK;
  }

  Status expireLocked(const Address &caller, Timestamp now,
                      std::optional<Event> &event) {
    if (!_policy.isIssuer(caller)) {
      return Status::UNAUTHORIZED;
    }
    if (expired()) {
      return Status::ALREADY_EXPIRED;
    }
    if (now < _params.expiration) {
      return Status::NOT_YET_EXPIRABLE;
    }

    Amount swept = 0;
    {
      std::unique_lock<std::shared_mutex> lock(_state_mutex);
      swept = _collateral_held;
      _collateral_held = 0;
      _expired = true;
    }

    escrow::Escrow::Journal journal(_escrow);
    if (!journal.release(_policy.getIssuer(), swept)) {
      std::unique_lock<std::shared_mutex> lock(_state_mutex);
      _collateral_held = swept;
      _expired = false;
      return Status::TRANSFER_FAILED;
    }

    journal.commit();
    event = record(now, Expired{_policy.getIssuer(), swept});
    return Status::OK;
  }

  Event record(Timestamp now, EventPayload payload) {
    std::lock_guard<std::mutex> lock(_events_mutex);
    _events.push_back(Event{++_last_sequence, now, std::move(payload)});
    return _events.back();
  }

  // Runs after the call lock is released.
  Status finish(const char *operation, const Address &caller, Status status,
                const std::optional<Event> &event) {
    if (status != Status::OK) {
      std::cerr << "[" << _params.symbol << "] " << operation << " by "
                << caller << " rejected: " << toString(status) << std::endl;
      return status;
    }

    std::clog << "[" << _params.symbol << "] " << operation << " by "
              << caller << " committed" << std::endl;

    if (event) {
      publish(*event);
    }
    return status;
  }

  void publish(const Event &event) {
    std::vector<EventCallback> callbacks;
    {
      std::lock_guard<std::mutex> lock(_subscribers_mutex);
      callbacks.reserve(_subscribers.size());
      for (const auto &[_, callback] : _subscribers) {
        callbacks.push_back(callback);
      }
    }

    for (const auto &callback : callbacks) {
      try {
        callback(event);
      } catch (const std::exception &e) {
        std::cerr << "[" << _params.symbol << "] subscriber failed on "
                  << eventName(event) << ": " << e.what() << std::endl;
      }
    }
  }

  const InstrumentParams _params;
  const Timestamp _created;
  std::shared_ptr<Clock> _clock;
  access::AccessPolicy _policy;
  ledger::BalanceLedger _ledger;
  escrow::Escrow _escrow;

  // Instrument state
  bool _expired{false};
  Amount _collateral_held{0};
  mutable std::shared_mutex _state_mutex;

  std::mutex _call_mutex;
  std::atomic<std::thread::id> _call_owner{};

  std::vector<Event> _events;
  uint64_t _last_sequence{0};
  mutable std::mutex _events_mutex;

  std::map<size_t, EventCallback> _subscribers;
  size_t _next_subscription{0};
  std::mutex _subscribers_mutex;
};

CallOption::CallOption(InstrumentParams params,
                       std::shared_ptr<escrow::ValueTransport> transport,
                       std::shared_ptr<Clock> clock)
    : _pimpl(new Impl(std::move(params), std::move(transport),
                      std::move(clock))) {
  std::clog << "[" << _pimpl->_params.symbol << "] created: issuer "
            << _pimpl->_params.issuer << ", strike "
            << _pimpl->_params.strike_price << "/" << PRICE_SCALE
            << ", expires " << _pimpl->_params.expiration << std::endl;
}

CallOption::~CallOption() { delete _pimpl; }

Status CallOption::create(InstrumentParams params,
                          std::shared_ptr<escrow::ValueTransport> transport,
                          std::shared_ptr<Clock> clock,
                          std::unique_ptr<CallOption> &out) {
  out.reset();
  Status status = validateParams(params, transport.get(), clock.get());
  if (status != Status::OK) {
    return status;
  }

  try {
    out = std::make_unique<CallOption>(std::move(params), std::move(transport),
                                       std::move(clock));
  } catch (const std::invalid_argument &e) {
    // The clock moved past expiration between the two checks.
    std::cerr << "Instrument creation failed: " << e.what() << std::endl;
    return Status::INVALID_PARAMETERS;
  }
  return Status::OK;
}

Status CallOption::issue(const Address &caller, Amount amount,
                         Amount deposited_value) {
  Status status;
  std::optional<Event> event;
  {
    Impl::CallGuard guard(*_pimpl);
    if (guard.isReentrant()) {
      status = Status::REENTRANT_CALL;
    } else {
      status = _pimpl->issueLocked(caller, amount, deposited_value,
                                   _pimpl->_clock->now(), event);
    }
  }
  return _pimpl->finish("issue", caller, status, event);
}

Status CallOption::exercise(const Address &caller, Amount unit_amount,
                            Amount paid_value) {
  Status status;
  std::optional<Event> event;
  {
    Impl::CallGuard guard(*_pimpl);
    if (guard.isReentrant()) {
      status = Status::REENTRANT_CALL;
    } else {
      status = _pimpl->exerciseLocked(caller, unit_amount, paid_value,
                                      _pimpl->_clock->now(), event);
    }
  }
  return _pimpl->finish("exercise", caller, status, event);
}

Status CallOption::expire(const Address &caller) {
  Status status;
  std::optional<Event> event;
  {
    Impl::CallGuard guard(*_pimpl);
    if (guard.isReentrant()) {
      status = Status::REENTRANT_CALL;
    } else {
      status = _pimpl->expireLocked(caller, _pimpl->_clock->now(), event);
    }
  }
  return _pimpl->finish("expire", caller, status, event);
}

Status CallOption::transfer(const Address &caller, const Address &to,
                            Amount amount) {
  Impl::CallGuard guard(*_pimpl);
  if (guard.isReentrant()) {
    return Status::REENTRANT_CALL;
  }
  if (!_pimpl->_ledger.transfer(caller, to, amount)) {
    return Status::INSUFFICIENT_UNIT_BALANCE;
  }
  return Status::OK;
}

Status CallOption::approve(const Address &caller, const Address &spender,
                           Amount amount) {
  Impl::CallGuard guard(*_pimpl);
  if (guard.isReentrant()) {
    return Status::REENTRANT_CALL;
  }
  _pimpl->_ledger.approve(caller, spender, amount);
  return Status::OK;
}

Status CallOption::transferFrom(const Address &caller, const Address &from,
                                const Address &to, Amount amount) {
  Impl::CallGuard guard(*_pimpl);
  if (guard.isReentrant()) {
    return Status::REENTRANT_CALL;
  }
  switch (_pimpl->_ledger.transferFrom(caller, from, to, amount)) {
  case ledger::TransferResult::OK:
    return Status::OK;
  case ledger::TransferResult::INSUFFICIENT_ALLOWANCE:
    return Status::UNAUTHORIZED;
  case ledger::TransferResult::INSUFFICIENT_BALANCE:
    break;
  }
  return Status::INSUFFICIENT_UNIT_BALANCE;
}

std::optional<Amount> CallOption::quote(Amount unit_amount) const {
  return requiredPayment(unit_amount, _pimpl->_params.strike_price);
}

InstrumentInfo CallOption::info() const {
  Timestamp now = _pimpl->_clock->now();
  std::shared_lock<std::shared_mutex> lock(_pimpl->_state_mutex);

  InstrumentInfo snapshot{};
  snapshot.name = _pimpl->_params.name;
  snapshot.symbol = _pimpl->_params.symbol;
  snapshot.strike_price = _pimpl->_params.strike_price;
  snapshot.expiration = _pimpl->_params.expiration;
  snapshot.total_supply = _pimpl->_ledger.totalSupply();
  snapshot.collateral_held = _pimpl->_collateral_held;
  snapshot.expired = _pimpl->_expired;
  snapshot.can_exercise =
      option::isExercisable(now, _pimpl->_params.expiration) &&
      !_pimpl->_expired;
  return snapshot;
}

Amount CallOption::balance() const { return _pimpl->_escrow.holdings(); }

Amount CallOption::balanceOf(const Address &holder) const {
  return _pimpl->_ledger.balanceOf(holder);
}

Amount CallOption::allowance(const Address &owner,
                             const Address &spender) const {
  return _pimpl->_ledger.allowance(owner, spender);
}

bool CallOption::isExercisable(Timestamp now) const {
  return option::isExercisable(now, _pimpl->_params.expiration);
}

bool CallOption::isExpired() const { return _pimpl->expired(); }

// Units left outstanding after expiry are unbacked; the sweep zeroes the
// collateral counter.
bool CallOption::checkInvariant() const {
  std::shared_lock<std::shared_mutex> lock(_pimpl->_state_mutex);
  if (_pimpl->_expired) {
    return _pimpl->_collateral_held == 0;
  }
  return _pimpl->_collateral_held == _pimpl->_ledger.totalSupply();
}

const InstrumentParams &CallOption::getParams() const {
  return _pimpl->_params;
}

Timestamp CallOption::getCreationTime() const { return _pimpl->_created; }

size_t CallOption::subscribe(EventCallback callback) {
  std::lock_guard<std::mutex> lock(_pimpl->_subscribers_mutex);
  size_t id = ++_pimpl->_next_subscription;
  _pimpl->_subscribers[id] = std::move(callback);
  return id;
}

void CallOption::unsubscribe(size_t subscription_id) {
  std::lock_guard<std::mutex> lock(_pimpl->_subscribers_mutex);
  _pimpl->_subscribers.erase(subscription_id);
}

std::vector<Event> CallOption::events() const {
  std::lock_guard<std::mutex> lock(_pimpl->_events_mutex);
  return _pimpl->_events;
}

} // namespace option
