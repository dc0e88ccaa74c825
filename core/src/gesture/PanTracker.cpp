#include "tr/gesture/PanTracker.hpp"
#include "tr/gesture/ScrollQuantizer.hpp"

#include <cmath>
#include <utility>

namespace tr {

int scaleMoveAxis(double delta, double sensitivity) {
  double v = std::floor(delta * sensitivity + 0.5);
  if (!std::isfinite(v)) return 0;
  if (v > kMaxMoveStep) return kMaxMoveStep;
  if (v < -kMaxMoveStep) return -kMaxMoveStep;
  return static_cast<int>(v);
}

void PanTracker::onPanStart(int pointerCount, double cumDx, double cumDy) {
  state_.active = true;
  state_.pointerCount = pointerCount;
  state_.lastDeltaX = cumDx;
  state_.lastDeltaY = cumDy;
  state_.scrollAccumulator = 0;
}

void PanTracker::onPanMove(double cumDx, double cumDy, double sensitivity,
                           std::vector<Command>& out) {
  if (!state_.active) return;

  // The source reports offsets from gesture start; only send the new part.
  double dx = cumDx - state_.lastDeltaX;
  double dy = cumDy - state_.lastDeltaY;
  state_.lastDeltaX = cumDx;
  state_.lastDeltaY = cumDy;

  if (state_.pointerCount == 1) {
    int mx = scaleMoveAxis(dx, sensitivity);
    int my = scaleMoveAxis(dy, sensitivity);
    if (mx != 0 || my != 0) out.push_back(Command::move(mx, my));
  } else if (state_.pointerCount == 2) {
    ScrollQuantizeResult q = quantizeScroll(state_.scrollAccumulator, dy);
    state_.scrollAccumulator = q.accumulator;
    for (auto& c : q.units) out.push_back(std::move(c));
  }
}

void PanTracker::onPanEnd() {
  state_ = PanState{};
}

} // namespace tr
