#include "tr/timing/Scheduler.hpp"

#include <chrono>
#include <utility>

namespace tr {

TimeMs SteadyClock::nowMs() const {
  auto now = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

TimerId Scheduler::schedule(TimeMs delayMs, std::function<void()> callback) {
  if (delayMs < 0) delayMs = 0;
  Timer t;
  t.id = nextId_++;
  t.deadline = clock_.nowMs() + delayMs;
  t.callback = std::move(callback);
  timers_.push_back(std::move(t));
  return timers_.back().id;
}

bool Scheduler::cancel(TimerId id) {
  for (auto it = timers_.begin(); it != timers_.end(); ++it) {
    if (it->id == id) {
      timers_.erase(it);
      return true;
    }
  }
  return false;
}

bool Scheduler::isPending(TimerId id) const {
  if (id == kNoTimer) return false;
  for (const auto& t : timers_) {
    if (t.id == id) return true;
  }
  return false;
}

std::size_t Scheduler::runDue() {
  std::size_t fired = 0;

  for (;;) {
    const TimeMs now = clock_.nowMs();

    // Earliest due timer; ids grow monotonically so they break ties.
    auto due = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->deadline > now) continue;
      if (due == timers_.end() ||
          it->deadline < due->deadline ||
          (it->deadline == due->deadline && it->id < due->id)) {
        due = it;
      }
    }
    if (due == timers_.end()) break;

    // Remove before invoking: the callback may touch the queue.
    std::function<void()> cb = std::move(due->callback);
    timers_.erase(due);
    ++fired;
    if (cb) cb();
  }

  return fired;
}

TimeMs Scheduler::msUntilNext() const {
  if (timers_.empty()) return -1;
  TimeMs earliest = timers_.front().deadline;
  for (const auto& t : timers_) {
    if (t.deadline < earliest) earliest = t.deadline;
  }
  TimeMs wait = earliest - clock_.nowMs();
  return wait < 0 ? 0 : wait;
}

} // namespace tr
