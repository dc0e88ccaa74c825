#pragma once
#include "tr/timing/Clock.hpp"

#include <cstdint>

namespace tr {

// Primitives produced by the external gesture source.
enum class GestureEventType : std::uint8_t {
  PanStart = 0, PanMove, PanEnd, PanCancel, Tap, TwoFingerTap
};

struct GestureEvent {
  GestureEventType type{GestureEventType::PanMove};
  int pointerCount{0};             // pan-start: fingers on the surface
  double deltaX{0}, deltaY{0};     // pan: cumulative offset from gesture start
  TimeMs timestampMs{0};
  bool hasTimestamp{false};        // false: consumer stamps with its clock
};

const char* gestureEventName(GestureEventType type);

} // namespace tr
