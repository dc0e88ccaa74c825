#pragma once
#include "tr/command/Command.hpp"

#include <vector>

namespace tr {

// Pan pixels of two-finger travel per scroll tick. Not sensitivity-scaled.
inline constexpr double kScrollThreshold = 20.0;

// Most ScrollUnits one call emits; travel beyond that is discarded.
inline constexpr int kMaxScrollUnits = 1000;

struct ScrollQuantizeResult {
  double accumulator{0};        // remainder carried to the next call
  std::vector<Command> units;   // ScrollUnit commands, all the same direction
};

// Adds dy to the accumulator and converts every whole threshold into one
// ScrollUnit. Positive travel (swipe down) scrolls down, i.e. direction -1.
// The remainder keeps the sign of the pre-quantization accumulator.
// A non-finite dy is ignored; a non-finite accumulator restarts from 0.
ScrollQuantizeResult quantizeScroll(double accumulator, double incrementalDy,
                                    double threshold = kScrollThreshold);

} // namespace tr
