// D2.1 — Scheduler on a manual clock
// Tests: deadline ordering, cancel, re-entrant scheduling from callbacks,
//        msUntilNext.

#include "tr/timing/Clock.hpp"
#include "tr/timing/Scheduler.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: nothing fires before its deadline ---
  {
    tr::ManualClock clock(1000);
    tr::Scheduler sched(clock);
    int fired = 0;
    tr::TimerId id = sched.schedule(180, [&] { fired++; });

    requireTrue(id != tr::kNoTimer, "valid id");
    requireTrue(sched.isPending(id), "pending after schedule");

    clock.setNow(1179);
    requireTrue(sched.runDue() == 0, "not due at 179ms");
    requireTrue(fired == 0, "no fire at 179ms");

    clock.setNow(1180);
    requireTrue(sched.runDue() == 1, "due at 180ms");
    requireTrue(fired == 1, "fired once");
    requireTrue(!sched.isPending(id), "not pending after fire");

    requireTrue(sched.runDue() == 0, "one-shot");
    std::printf("  Deadline PASS\n");
  }

  // --- Test 2: earliest first, ties in scheduling order ---
  {
    tr::ManualClock clock;
    tr::Scheduler sched(clock);
    std::string order;
    sched.schedule(30, [&] { order += 'c'; });
    sched.schedule(10, [&] { order += 'a'; });
    sched.schedule(20, [&] { order += 'b'; });
    sched.schedule(20, [&] { order += 'B'; });

    clock.advance(100);
    requireTrue(sched.runDue() == 4, "all four fire");
    requireTrue(order == "abBc", "deadline order with stable ties");
    std::printf("  Ordering PASS\n");
  }

  // --- Test 3: cancel ---
  {
    tr::ManualClock clock;
    tr::Scheduler sched(clock);
    int fired = 0;
    tr::TimerId a = sched.schedule(50, [&] { fired += 1; });
    tr::TimerId b = sched.schedule(50, [&] { fired += 10; });

    requireTrue(sched.cancel(a), "cancel pending");
    requireTrue(!sched.cancel(a), "second cancel is a no-op");
    requireTrue(!sched.cancel(tr::kNoTimer), "cancel kNoTimer");

    clock.advance(50);
    sched.runDue();
    requireTrue(fired == 10, "only b fired");
    requireTrue(!sched.cancel(b), "cannot cancel fired timer");
    std::printf("  Cancel PASS\n");
  }

  // --- Test 4: callbacks may schedule and cancel ---
  {
    tr::ManualClock clock;
    tr::Scheduler sched(clock);
    std::vector<int> log;
    tr::TimerId victim = tr::kNoTimer;

    sched.schedule(10, [&] {
      log.push_back(1);
      sched.cancel(victim);
      sched.schedule(0, [&] { log.push_back(3); });
    });
    victim = sched.schedule(10, [&] { log.push_back(2); });

    clock.advance(10);
    sched.runDue();
    requireTrue(log.size() == 2, "victim cancelled, zero-delay child ran");
    requireTrue(log[0] == 1 && log[1] == 3, "child runs in same pass");
    requireTrue(sched.pendingCount() == 0, "queue drained");
    std::printf("  Re-entrancy PASS\n");
  }

  // --- Test 5: msUntilNext ---
  {
    tr::ManualClock clock;
    tr::Scheduler sched(clock);
    requireTrue(sched.msUntilNext() == -1, "idle");

    sched.schedule(3000, [] {});
    sched.schedule(180, [] {});
    requireTrue(sched.msUntilNext() == 180, "earliest deadline");

    clock.advance(500);
    requireTrue(sched.msUntilNext() == 0, "overdue clamps to 0");
    sched.runDue();
    requireTrue(sched.msUntilNext() == 2500, "remaining timer");
    std::printf("  msUntilNext PASS\n");
  }

  std::printf("D2.1 scheduler: ALL PASS\n");
  return 0;
}
