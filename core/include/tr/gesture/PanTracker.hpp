#pragma once
#include "tr/command/Command.hpp"

#include <vector>

namespace tr {

struct PanState {
  bool active{false};
  int pointerCount{0};
  double lastDeltaX{0}, lastDeltaY{0};  // cumulative offset at previous event
  double scrollAccumulator{0};          // two-pointer pans only
};

// Pan state machine: Idle -> Panning -> Idle.
// One pointer moves the cursor, two pointers scroll, anything else is ignored.
class PanTracker {
public:
  void onPanStart(int pointerCount, double cumDx, double cumDy);

  // Appends produced commands to out. Ignored while Idle.
  void onPanMove(double cumDx, double cumDy, double sensitivity,
                 std::vector<Command>& out);

  // End and cancel both reset every field.
  void onPanEnd();
  void onPanCancel() { onPanEnd(); }

  bool isActive() const { return state_.active; }
  const PanState& state() const { return state_; }

private:
  PanState state_;
};

// Largest per-event move on one axis; bigger steps are clamped.
inline constexpr int kMaxMoveStep = 100000;

// Scale and round one axis of a move delta (halves round up). Non-finite
// results become 0.
int scaleMoveAxis(double delta, double sensitivity);

} // namespace tr
