#pragma once

#include "types.hpp"
#include <atomic>

namespace option {

class Clock {
public:
  virtual ~Clock() = default;
  virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
  Timestamp now() const override;
};

// Clock that only moves when told to. Used by tests and scripted replays.
class ManualClock : public Clock {
public:
  explicit ManualClock(Timestamp start) : _now(start) {}

  Timestamp now() const override { return _now.load(); }
  void set(Timestamp now) { _now.store(now); }
  void advance(Timestamp seconds) { _now.fetch_add(seconds); }

private:
  std::atomic<Timestamp> _now;
};

} // namespace option
