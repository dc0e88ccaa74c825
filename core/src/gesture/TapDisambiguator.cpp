#include "tr/gesture/TapDisambiguator.hpp"

#include <cstdint>
#include <cstdio>
#include <utility>

namespace tr {

// True when t falls less than window after then. Never overflows: an
// unset timestamp matches nothing and a timestamp ahead of t always matches.
static bool within(TimeMs t, TimeMs then, TimeMs window) {
  if (then == kNeverMs) return false;
  if (t < then) return true;
  return static_cast<std::uint64_t>(t) - static_cast<std::uint64_t>(then) <
         static_cast<std::uint64_t>(window);
}

TapDisambiguator::TapDisambiguator(Scheduler& scheduler, CommandSink sink)
    : scheduler_(scheduler), sink_(std::move(sink)) {}

TapDisambiguator::~TapDisambiguator() { cancelPending(); }

TapOutcome TapDisambiguator::onTap(TimeMs t) {
  if (within(t, state_.lastTwoFingerTapTimestamp, config_.twoFingerBlockMs)) {
    std::fprintf(stderr, "[TapDisambiguator] tap blocked (too soon after two finger tap)\n");
    return TapOutcome::Blocked;
  }

  if (within(t, state_.lastTapTimestamp, config_.doubleTapIntervalMs) &&
      hasPendingSingleTap()) {
    cancelPending();
    state_.lastTapTimestamp = kNeverMs;  // a third tap starts a new pair
    std::fprintf(stderr, "[TapDisambiguator] double tap - double left click\n");
    if (sink_) sink_(Command::click(MouseButton::Left, 2));
    return TapOutcome::DoubleClick;
  }

  cancelPending();
  state_.pendingSingleTap = scheduler_.schedule(config_.doubleTapIntervalMs, [this] {
    state_.pendingSingleTap = kNoTimer;
    std::fprintf(stderr, "[TapDisambiguator] single tap - left click\n");
    if (sink_) sink_(Command::click(MouseButton::Left, 1));
  });
  state_.lastTapTimestamp = t;
  return TapOutcome::Pending;
}

void TapDisambiguator::onTwoFingerTap(TimeMs t) {
  state_.lastTwoFingerTapTimestamp = t;
  std::fprintf(stderr, "[TapDisambiguator] two finger tap - right click\n");
  if (sink_) sink_(Command::click(MouseButton::Right, 1));
}

bool TapDisambiguator::hasPendingSingleTap() const {
  return scheduler_.isPending(state_.pendingSingleTap);
}

void TapDisambiguator::cancelPending() {
  if (state_.pendingSingleTap != kNoTimer) {
    scheduler_.cancel(state_.pendingSingleTap);
    state_.pendingSingleTap = kNoTimer;
  }
}

} // namespace tr
