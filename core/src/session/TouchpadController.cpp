#include "tr/session/TouchpadController.hpp"
#include "tr/command/CommandCodec.hpp"
#include "tr/transport/TransportSession.hpp"

#include <cstdio>
#include <vector>

namespace tr {

TouchpadController::TouchpadController(TransportSession& session,
                                       Scheduler& scheduler,
                                       SettingsStore& store)
    : session_(session),
      scheduler_(scheduler),
      store_(store),
      taps_(scheduler, [this](const Command& c) { dispatch(c); }) {}

SettingsLoadResult TouchpadController::loadSettings() {
  SettingsLoadResult r = tr::loadSettings(store_);
  settings_ = r.settings;
  return r;
}

void TouchpadController::handleGesture(const GestureEvent& ev) {
  const TimeMs t = ev.hasTimestamp ? ev.timestampMs : scheduler_.nowMs();

  switch (ev.type) {
    case GestureEventType::PanStart:
      pan_.onPanStart(ev.pointerCount, ev.deltaX, ev.deltaY);
      std::fprintf(stderr, "[TouchpadController] pan start with %d finger(s)\n",
                   ev.pointerCount);
      break;

    case GestureEventType::PanMove: {
      std::vector<Command> out;
      pan_.onPanMove(ev.deltaX, ev.deltaY, settings_.moveFactor, out);
      for (const auto& c : out) dispatch(c);
      break;
    }

    case GestureEventType::PanEnd:
      if (pan_.isActive()) std::fprintf(stderr, "[TouchpadController] pan end\n");
      pan_.onPanEnd();
      break;

    case GestureEventType::PanCancel:
      if (pan_.isActive()) std::fprintf(stderr, "[TouchpadController] pan cancel\n");
      pan_.onPanCancel();
      break;

    // Taps recognized during a pan are misreads of the pan itself.
    case GestureEventType::Tap:
      if (pan_.isActive()) return;
      taps_.onTap(t);
      break;

    case GestureEventType::TwoFingerTap:
      if (pan_.isActive()) return;
      taps_.onTwoFingerTap(t);
      break;
  }
}

TextSendOutcome TouchpadController::sendText(const std::string& text, bool appendEnter) {
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return TextSendOutcome::Empty;
  }

  Command cmd = Command::textInput(appendEnter ? text + "\n" : text);
  if (!session_.send(cmd)) {
    ++dropped_;
    std::fprintf(stderr, "[TouchpadController] not connected to server, cannot send text\n");
    return TextSendOutcome::Rejected;
  }
  ++sent_;
  return TextSendOutcome::Sent;
}

bool TouchpadController::sendKey(const std::string& name) {
  if (!session_.send(Command::key(name))) {
    ++dropped_;
    std::fprintf(stderr, "[TouchpadController] warning: not connected, cannot send key: %s\n",
                 name.c_str());
    return false;
  }
  ++sent_;
  if (!isKnownKeyName(name)) {
    std::fprintf(stderr, "[TouchpadController] warning: receiver does not map key: %s\n",
                 name.c_str());
  } else {
    std::fprintf(stderr, "[TouchpadController] function key pressed: %s\n", name.c_str());
  }
  return true;
}

void TouchpadController::setMoveFactor(double v) {
  settings_.moveFactor = clampMoveFactor(v);
  saveSettings(store_, settings_);
}

void TouchpadController::dispatch(const Command& cmd) {
  if (session_.send(cmd)) {
    ++sent_;
    return;
  }
  ++dropped_;
  std::fprintf(stderr, "[TouchpadController] warning: not ready, message not sent: %s\n",
               encodeCommand(cmd).c_str());
}

} // namespace tr
