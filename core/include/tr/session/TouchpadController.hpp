#pragma once
#include "tr/command/Command.hpp"
#include "tr/config/Settings.hpp"
#include "tr/gesture/GestureEvent.hpp"
#include "tr/gesture/PanTracker.hpp"
#include "tr/gesture/TapDisambiguator.hpp"
#include "tr/timing/Scheduler.hpp"

#include <cstdint>
#include <string>

namespace tr {

class TransportSession;

enum class TextSendOutcome : std::uint8_t {
  Sent = 0,
  Empty,     // blank input, nothing sent
  Rejected   // not connected; the UI alerts the user
};

// The one controller object: owns gesture state, reads the sensitivity,
// and routes every produced command to the session. Construct once at
// startup; the session, scheduler and store must outlive it.
class TouchpadController {
public:
  TouchpadController(TransportSession& session, Scheduler& scheduler,
                     SettingsStore& store);

  TouchpadController(const TouchpadController&) = delete;
  TouchpadController& operator=(const TouchpadController&) = delete;

  // Load the persisted sensitivity. Falls back to the default on error.
  SettingsLoadResult loadSettings();

  // Single dispatch point for gesture primitives.
  void handleGesture(const GestureEvent& ev);

  TextSendOutcome sendText(const std::string& text, bool appendEnter);
  bool sendKey(const std::string& name);

  // UI slider: clamps into range, applies immediately, persists.
  void setMoveFactor(double v);
  double moveFactor() const { return settings_.moveFactor; }

  const PanState& panState() const { return pan_.state(); }
  const TapState& tapState() const { return taps_.state(); }
  TapDisambiguator& taps() { return taps_; }

  std::uint64_t sentCount() const { return sent_; }
  std::uint64_t droppedCount() const { return dropped_; }

private:
  void dispatch(const Command& cmd);

  TransportSession& session_;
  Scheduler& scheduler_;
  SettingsStore& store_;
  TouchpadSettings settings_;
  PanTracker pan_;
  TapDisambiguator taps_;

  std::uint64_t sent_{0};
  std::uint64_t dropped_{0};
};

} // namespace tr
