#pragma once
#include <cstdint>

namespace tr {

using TimeMs = std::int64_t;

// Source of "now" in milliseconds. Only differences are meaningful.
class Clock {
public:
  virtual ~Clock() = default;
  virtual TimeMs nowMs() const = 0;
};

// Monotonic wall clock for the live client.
class SteadyClock : public Clock {
public:
  TimeMs nowMs() const override;
};

// Virtual time, advanced explicitly by tests.
class ManualClock : public Clock {
public:
  explicit ManualClock(TimeMs start = 0) : now_(start) {}

  TimeMs nowMs() const override { return now_; }
  void setNow(TimeMs t) { now_ = t; }
  void advance(TimeMs ms) { now_ += ms; }

private:
  TimeMs now_;
};

} // namespace tr
