#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ledger {

// Outcome of a delegated transfer.
enum class TransferResult { OK, INSUFFICIENT_ALLOWANCE, INSUFFICIENT_BALANCE };

// Fungible unit ledger. Every call keeps sum(balances) == totalSupply().
class BalanceLedger {
public:
  BalanceLedger(std::string name, std::string symbol);
  ~BalanceLedger();

  BalanceLedger(const BalanceLedger &) = delete;
  BalanceLedger &operator=(const BalanceLedger &) = delete;

  // Metadata
  const std::string &getName() const;
  const std::string &getSymbol() const;
  uint8_t getDecimals() const;

  // Supply management
  bool mint(const std::string &to, uint64_t amount);
  bool burn(const std::string &from, uint64_t amount);

  // Holder transfers
  bool transfer(const std::string &from, const std::string &to,
                uint64_t amount);
  void approve(const std::string &owner, const std::string &spender,
               uint64_t amount);
  // The allowance is checked first; neither side changes on failure.
  TransferResult transferFrom(const std::string &spender, const std::string &from,
                    const std::string &to, uint64_t amount);

  // Queries
  uint64_t balanceOf(const std::string &holder) const;
  uint64_t allowance(const std::string &owner,
                     const std::string &spender) const;
  uint64_t totalSupply() const;
  std::vector<std::string> holders() const;

private:
  class Impl;
  Impl *_pimpl;
};

} // namespace ledger
