// D4.1 — Tap disambiguation on virtual time
// Tests: lone tap fires at +180ms, double tap fires immediately with no
//        single click, third tap starts a new pair, two-finger tap blocks
//        trailing taps for 500ms.

#include "tr/command/Command.hpp"
#include "tr/gesture/TapDisambiguator.hpp"
#include "tr/timing/Clock.hpp"
#include "tr/timing/Scheduler.hpp"

#include <cstdio>
#include <cstdlib>
#include <limits>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

struct Rig {
  tr::ManualClock clock;
  tr::Scheduler sched{clock};
  std::vector<tr::Command> clicks;
  tr::TapDisambiguator taps{sched, [this](const tr::Command& c) { clicks.push_back(c); }};

  void advanceTo(tr::TimeMs t) {
    clock.setNow(t);
    sched.runDue();
  }
  tr::TapOutcome tapAt(tr::TimeMs t) {
    advanceTo(t);
    return taps.onTap(t);
  }
  void twoFingerTapAt(tr::TimeMs t) {
    advanceTo(t);
    taps.onTwoFingerTap(t);
  }
  std::size_t count(const tr::Command& c) const {
    std::size_t n = 0;
    for (const auto& x : clicks) if (x == c) n++;
    return n;
  }
};

static const tr::Command kSingle = tr::Command::click(tr::MouseButton::Left, 1);
static const tr::Command kDouble = tr::Command::click(tr::MouseButton::Left, 2);
static const tr::Command kRight = tr::Command::click(tr::MouseButton::Right, 1);

int main() {
  // --- Test 1: lone tap fires at 180ms and not before ---
  {
    Rig r;
    requireTrue(r.tapAt(0) == tr::TapOutcome::Pending, "first tap pending");
    requireTrue(r.taps.hasPendingSingleTap(), "timer armed");

    r.advanceTo(179);
    requireTrue(r.clicks.empty(), "nothing at 179ms");

    r.advanceTo(180);
    requireTrue(r.clicks.size() == 1 && r.clicks[0] == kSingle, "single click at 180ms");
    requireTrue(!r.taps.hasPendingSingleTap(), "timer consumed");

    r.advanceTo(10000);
    requireTrue(r.clicks.size() == 1, "exactly one click");
    std::printf("  Lone tap PASS\n");
  }

  // --- Test 2: double tap ---
  {
    Rig r;
    r.tapAt(0);
    requireTrue(r.tapAt(100) == tr::TapOutcome::DoubleClick, "second tap pairs");
    requireTrue(r.clicks.size() == 1 && r.clicks[0] == kDouble, "double click at 100ms");
    requireTrue(!r.taps.hasPendingSingleTap(), "pending single cancelled");

    r.advanceTo(5000);
    requireTrue(r.count(kSingle) == 0, "no single click for the pair");
    requireTrue(r.count(kDouble) == 1, "one double click");
    std::printf("  Double tap PASS\n");
  }

  // --- Test 3: third rapid tap is not paired with the second ---
  {
    Rig r;
    r.tapAt(0);
    r.tapAt(100);                       // double
    requireTrue(r.tapAt(150) == tr::TapOutcome::Pending, "third tap starts over");
    r.advanceTo(329);
    requireTrue(r.count(kSingle) == 0, "not yet");
    r.advanceTo(330);
    requireTrue(r.count(kDouble) == 1 && r.count(kSingle) == 1, "double then single");
    std::printf("  Triple tap PASS\n");
  }

  // --- Test 4: taps 180ms apart are two singles ---
  {
    Rig r;
    r.tapAt(0);
    requireTrue(r.tapAt(180) == tr::TapOutcome::Pending, "outside window");
    r.advanceTo(360);
    requireTrue(r.count(kSingle) == 2, "two single clicks");
    requireTrue(r.count(kDouble) == 0, "no double");
    std::printf("  Window edge PASS\n");
  }

  // --- Test 5: two-finger tap is immediate and blocks trailing tap ---
  {
    Rig r;
    r.twoFingerTapAt(0);
    requireTrue(r.clicks.size() == 1 && r.clicks[0] == kRight, "right click at once");

    requireTrue(r.tapAt(200) == tr::TapOutcome::Blocked, "tap at 200ms blocked");
    r.advanceTo(2000);
    requireTrue(r.clicks.size() == 1, "no left click for blocked tap");

    requireTrue(r.tapAt(2499) == tr::TapOutcome::Pending, "long after: normal");
    std::printf("  Two-finger block PASS\n");
  }

  // --- Test 6: block window edge ---
  {
    Rig r;
    r.twoFingerTapAt(1000);
    requireTrue(r.tapAt(1499) == tr::TapOutcome::Blocked, "499ms blocked");
    requireTrue(r.tapAt(1500) == tr::TapOutcome::Pending, "500ms allowed");
    r.advanceTo(1680);
    requireTrue(r.count(kSingle) == 1, "single after window");
    std::printf("  Block edge PASS\n");
  }

  // --- Test 7: blocked tap does not disturb a pending single ---
  {
    Rig r;
    r.tapAt(0);
    r.twoFingerTapAt(50);
    requireTrue(r.tapAt(100) == tr::TapOutcome::Blocked, "blocked");
    requireTrue(r.taps.hasPendingSingleTap(), "first tap still pending");
    r.advanceTo(180);
    requireTrue(r.count(kRight) == 1 && r.count(kSingle) == 1, "right then single");
    requireTrue(r.count(kDouble) == 0, "no double");
    std::printf("  Blocked keeps pending PASS\n");
  }

  // --- Test 8: two-finger taps never debounce each other ---
  {
    Rig r;
    r.twoFingerTapAt(0);
    r.twoFingerTapAt(10);
    requireTrue(r.count(kRight) == 2, "both right clicks");
    requireTrue(r.taps.state().lastTwoFingerTapTimestamp == 10, "timestamp updated");
    std::printf("  Repeated right click PASS\n");
  }

  // --- Test 9: destruction cancels pending timer ---
  {
    tr::ManualClock clock;
    tr::Scheduler sched(clock);
    int fired = 0;
    {
      tr::TapDisambiguator taps(sched, [&](const tr::Command&) { fired++; });
      taps.onTap(0);
      requireTrue(sched.pendingCount() == 1, "armed");
    }
    requireTrue(sched.pendingCount() == 0, "cancelled on destruction");
    clock.advance(500);
    sched.runDue();
    requireTrue(fired == 0, "never fired");
    std::printf("  Destruction PASS\n");
  }

  // --- Test 10: timestamps near the top of the range ---
  {
    Rig r;
    const tr::TimeMs t0 = std::numeric_limits<tr::TimeMs>::max() - 10000;
    requireTrue(r.tapAt(t0) == tr::TapOutcome::Pending, "first tap far from the sentinel");
    requireTrue(r.tapAt(t0 + 100) == tr::TapOutcome::DoubleClick, "double tap");
    r.twoFingerTapAt(t0 + 1000);
    requireTrue(r.tapAt(t0 + 1200) == tr::TapOutcome::Blocked, "block window");
    requireTrue(r.tapAt(t0 + 1500) == tr::TapOutcome::Pending, "block window over");
    r.advanceTo(t0 + 1680);
    requireTrue(r.count(kDouble) == 1 && r.count(kRight) == 1 && r.count(kSingle) == 1,
                "one of each");
    std::printf("  Test 10 (large timestamps): PASS\n");
  }

  std::printf("D4.1 tap_disambiguator: ALL PASS\n");
  return 0;
}
