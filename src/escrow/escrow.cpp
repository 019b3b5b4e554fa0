#include "../../include/escrow/escrow.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>

namespace escrow {

Escrow::Escrow(std::shared_ptr<ValueTransport> transport)
    : _transport(std::move(transport)) {
  if (!_transport) {
    throw std::invalid_argument("Escrow requires a value transport");
  }
}

Escrow::~Escrow() = default;

bool Escrow::deposit(uint64_t amount) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_holdings > std::numeric_limits<uint64_t>::max() - amount) {
    return false;
  }
  _holdings += amount;
  return true;
}

bool Escrow::release(const std::string &to, uint64_t amount) {
  if (amount == 0) {
    return true;
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_holdings < amount) {
      return false;
    }
    // Debit before the transport runs so that a recipient calling back in
    // sees the reduced holdings.
    _holdings -= amount;
  }

  bool delivered = false;
  try {
    delivered = _transport->send(to, amount);
  } catch (const std::exception &e) {
    std::cerr << "Escrow transfer to " << to << " threw: " << e.what()
              << std::endl;
    delivered = false;
  }

  if (!delivered) {
    std::lock_guard<std::mutex> lock(_mutex);
    _holdings += amount;
  }
  return delivered;
}

uint64_t Escrow::holdings() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _holdings;
}

void Escrow::reverseDeposit(uint64_t amount) {
  std::lock_guard<std::mutex> lock(_mutex);
  _holdings -= amount;
}

void Escrow::reverseRelease(const std::string &to, uint64_t amount) {
  try {
    _transport->reclaim(to, amount);
  } catch (const std::exception &e) {
    std::cerr << "Escrow reclaim from " << to << " threw: " << e.what()
              << std::endl;
  }
  std::lock_guard<std::mutex> lock(_mutex);
  _holdings += amount;
}

Escrow::Journal::Journal(Escrow &escrow) : _escrow(escrow) {}

Escrow::Journal::~Journal() {
  if (!_committed) {
    rollback();
  }
}

bool Escrow::Journal::deposit(uint64_t amount) {
  if (amount == 0) {
    return true;
  }
  if (!_escrow.deposit(amount)) {
    return false;
  }
  _entries.push_back({false, std::string(), amount});
  return true;
}

bool Escrow::Journal::release(const std::string &to, uint64_t amount) {
  if (amount == 0) {
    return true;
  }
  if (!_escrow.release(to, amount)) {
    return false;
  }
  _entries.push_back({true, to, amount});
  return true;
}

void Escrow::Journal::commit() {
  _entries.clear();
  _committed = true;
}

void Escrow::Journal::rollback() {
  // Newest first
  for (auto it = _entries.rbegin(); it != _entries.rend(); ++it) {
    if (it->outbound) {
      _escrow.reverseRelease(it->counterparty, it->amount);
    } else {
      _escrow.reverseDeposit(it->amount);
    }
  }
  _entries.clear();
}

} // namespace escrow
