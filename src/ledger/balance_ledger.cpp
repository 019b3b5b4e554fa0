#include "../../include/ledger/balance_ledger.hpp"

#include <limits>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace ledger {

class BalanceLedger::Impl {
public:
  Impl(std::string name, std::string symbol)
      : _name(std::move(name)), _symbol(std::move(symbol)) {}

  // Caller holds the write lock.
  bool moveUnits(const std::string &from, const std::string &to,
                 uint64_t amount) {
    auto from_it = _balances.find(from);
    if (from_it == _balances.end() || from_it->second < amount) {
      return false;
    }
    if (from == to || amount == 0) {
      return true;
    }
    // Balances are bounded by total supply, so the credit cannot overflow.
    from_it->second -= amount;
    if (from_it->second == 0) {
      _balances.erase(from_it);
    }
    _balances[to] += amount;
    return true;
  }

  std::string _name;
  std::string _symbol;
  std::unordered_map<std::string, uint64_t> _balances; // holder -> units
  std::map<std::pair<std::string, std::string>, uint64_t>
      _allowances; // (owner, spender) -> units
  uint64_t _total_supply{0};
  mutable std::shared_mutex _ledger_mutex;
};

BalanceLedger::BalanceLedger(std::string name, std::string symbol)
    : _pimpl(new Impl(std::move(name), std::move(symbol))) {}

BalanceLedger::~BalanceLedger() { delete _pimpl; }

const std::string &BalanceLedger::getName() const { return _pimpl->_name; }

const std::string &BalanceLedger::getSymbol() const {
  return _pimpl->_symbol;
}

// One unit is backed by one base unit of collateral.
uint8_t BalanceLedger::getDecimals() const { return 0; }

bool BalanceLedger::mint(const std::string &to, uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);

  if (_pimpl->_total_supply >
      std::numeric_limits<uint64_t>::max() - amount) {
    return false;
  }
  if (amount == 0) {
    return true;
  }
  _pimpl->_total_supply += amount;
  _pimpl->_balances[to] += amount;
  return true;
}

bool BalanceLedger::burn(const std::string &from, uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);

  auto it = _pimpl->_balances.find(from);
  if (amount == 0) {
    return true;
  }
  if (it == _pimpl->_balances.end() || it->second < amount) {
    return false;
  }
  it->second -= amount;
  if (it->second == 0) {
    _pimpl->_balances.erase(it);
  }
  _pimpl->_total_supply -= amount;
  return true;
}

bool BalanceLedger::transfer(const std::string &from, const std::string &to,
                             uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);
  if (amount == 0) {
    return true;
  }
  return _pimpl->moveUnits(from, to, amount);
}

void BalanceLedger::approve(const std::string &owner,
                            const std::string &spender, uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);

  auto key = std::make_pair(owner, spender);
  if (amount == 0) {
    _pimpl->_allowances.erase(key);
  } else {
    _pimpl->_allowances[key] = amount;
  }
}

TransferResult BalanceLedger::transferFrom(const std::string &spender,
                                           const std::string &from,
                                           const std::string &to,
                                           uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);

  if (amount == 0) {
    return TransferResult::OK;
  }

  auto it = _pimpl->_allowances.find(std::make_pair(from, spender));
  if (it == _pimpl->_allowances.end() || it->second < amount) {
    return TransferResult::INSUFFICIENT_ALLOWANCE;
  }
  if (!_pimpl->moveUnits(from, to, amount)) {
    return TransferResult::INSUFFICIENT_BALANCE;
  }

  it->second -= amount;
  if (it->second == 0) {
    _pimpl->_allowances.erase(it);
  }
  return TransferResult::OK;
}

uint64_t BalanceLedger::balanceOf(const std::string &holder) const {
  std::shared_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);
  if (auto it = _pimpl->_balances.find(holder);
      it != _pimpl->_balances.end()) {
    return it->second;
  }
  return 0;
}

uint64_t BalanceLedger::allowance(const std::string &owner,
                                  const std::string &spender) const {
  std::shared_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);
  auto it = _pimpl->_allowances.find(std::make_pair(owner, spender));
  if (it != _pimpl->_allowances.end()) {
    return it->second;
  }
  return 0;
}

uint64_t BalanceLedger::totalSupply() const {
  std::shared_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);
  return _pimpl->_total_supply;
}

std::vector<std::string> BalanceLedger::holders() const {
  std::shared_lock<std::shared_mutex> lock(_pimpl->_ledger_mutex);

  std::vector<std::string> result;
  result.reserve(_pimpl->_balances.size());

  for (const auto &[holder, _] : _pimpl->_balances) {
    result.push_back(holder);
  }

  return result;
}

} // namespace ledger
