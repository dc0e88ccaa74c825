#include "tr/gesture/ScrollQuantizer.hpp"

#include <cmath>

namespace tr {

ScrollQuantizeResult quantizeScroll(double accumulator, double incrementalDy,
                                    double threshold) {
  ScrollQuantizeResult r;
  if (!std::isfinite(accumulator)) accumulator = 0;
  if (!std::isfinite(incrementalDy)) incrementalDy = 0;
  double acc = accumulator + incrementalDy;
  double mag = std::fabs(acc);

  if (mag < threshold) {
    r.accumulator = acc;
    return r;
  }

  double whole = std::floor(mag / threshold);
  int units = whole > kMaxScrollUnits ? kMaxScrollUnits : static_cast<int>(whole);
  int direction = acc > 0 ? -1 : 1;
  double sign = acc > 0 ? 1.0 : -1.0;

  r.units.reserve(static_cast<std::size_t>(units));
  for (int i = 0; i < units; i++) {
    r.units.push_back(Command::scrollUnit(direction));
  }
  r.accumulator = std::fmod(mag, threshold) * sign;
  return r;
}

} // namespace tr
