#include "tr/gesture/GestureEvent.hpp"

namespace tr {

const char* gestureEventName(GestureEventType type) {
  switch (type) {
    case GestureEventType::PanStart:     return "panstart";
    case GestureEventType::PanMove:      return "panmove";
    case GestureEventType::PanEnd:       return "panend";
    case GestureEventType::PanCancel:    return "pancancel";
    case GestureEventType::Tap:          return "tap";
    case GestureEventType::TwoFingerTap: return "twofingertap";
  }
  return "unknown";
}

} // namespace tr
