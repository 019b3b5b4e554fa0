#pragma once

#include "value_transport.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace escrow {

// Pooled collateral account. The only component that moves value out.
class Escrow {
public:
  explicit Escrow(std::shared_ptr<ValueTransport> transport);
  ~Escrow();

  Escrow(const Escrow &) = delete;
  Escrow &operator=(const Escrow &) = delete;

  // Accepts value accompanying a call. Fails only if holdings would
  // overflow.
  bool deposit(uint64_t amount);

  // Attempts an outbound transfer. Never throws; a failed or throwing
  // transport leaves holdings untouched and returns false.
  bool release(const std::string &to, uint64_t amount);

  uint64_t holdings() const;

  // Records the deposits and releases of one call and reverses them on
  // destruction unless commit() was called.
  class Journal {
  public:
    explicit Journal(Escrow &escrow);
    ~Journal();

    Journal(const Journal &) = delete;
    Journal &operator=(const Journal &) = delete;

    bool deposit(uint64_t amount);
    bool release(const std::string &to, uint64_t amount);
    void commit();
    void rollback();

  private:
    struct Entry {
      bool outbound;
      std::string counterparty;
      uint64_t amount;
    };

    Escrow &_escrow;
    std::vector<Entry> _entries;
    bool _committed{false};
  };

private:
  void reverseDeposit(uint64_t amount);
  void reverseRelease(const std::string &to, uint64_t amount);

  std::shared_ptr<ValueTransport> _transport;
  uint64_t _holdings{0};
  mutable std::mutex _mutex;
};

} // namespace escrow
