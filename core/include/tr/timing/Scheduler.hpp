#pragma once
#include "tr/timing/Clock.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace tr {

using TimerId = std::uint64_t;

inline constexpr TimerId kNoTimer = 0;

// Single-threaded one-shot timer queue on top of an injectable Clock.
// Nothing fires on its own: the owner calls runDue() from its event loop
// (or after advancing a ManualClock in tests).
class Scheduler {
public:
  explicit Scheduler(const Clock& clock) : clock_(clock) {}

  // Arm a timer firing delayMs from now. Never returns kNoTimer.
  TimerId schedule(TimeMs delayMs, std::function<void()> callback);

  // Returns false if the timer already fired or was cancelled.
  bool cancel(TimerId id);

  bool isPending(TimerId id) const;
  std::size_t pendingCount() const { return timers_.size(); }

  // Fire every timer whose deadline is <= now, earliest first (ties in
  // scheduling order). Callbacks may schedule or cancel. Returns fired count.
  std::size_t runDue();

  // Milliseconds until the next deadline (0 if overdue), -1 if idle.
  TimeMs msUntilNext() const;

  TimeMs nowMs() const { return clock_.nowMs(); }
  const Clock& clock() const { return clock_; }

private:
  struct Timer {
    TimerId id;
    TimeMs deadline;
    std::function<void()> callback;
  };

  const Clock& clock_;
  std::vector<Timer> timers_;  // unordered; queues stay tiny
  TimerId nextId_{1};
};

} // namespace tr
