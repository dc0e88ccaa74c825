// D7.1 — stdin gesture/UI line parser

#include "tr/gesture/GestureEvent.hpp"
#include "tr/input/InputLine.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireReject(const std::string& line, const char* msg) {
  tr::InputLine in;
  std::string err;
  if (tr::parseInputLine(line, in, err) || err.empty()) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  tr::InputLine in;
  std::string err;

  // pan lifecycle
  requireTrue(tr::parseInputLine(R"({"type":"panstart","pointers":2,"dx":5,"dy":-1.5})", in, err),
              "panstart parses");
  requireTrue(in.kind == tr::InputLineKind::Gesture, "gesture kind");
  requireTrue(in.gesture.type == tr::GestureEventType::PanStart, "panstart type");
  requireTrue(in.gesture.pointerCount == 2, "pointers");
  requireTrue(in.gesture.deltaX == 5.0 && in.gesture.deltaY == -1.5, "cumulative offsets");
  requireTrue(!in.gesture.hasTimestamp, "no timestamp");

  requireTrue(tr::parseInputLine(R"({"type":"panmove","dx":12,"dy":3,"t":1700})", in, err),
              "panmove parses");
  requireTrue(in.gesture.type == tr::GestureEventType::PanMove, "panmove type");
  requireTrue(in.gesture.hasTimestamp && in.gesture.timestampMs == 1700, "timestamp");

  requireTrue(tr::parseInputLine(R"({"type":"pancancel"})", in, err), "pancancel parses");
  requireTrue(in.gesture.type == tr::GestureEventType::PanCancel, "pancancel type");
  requireTrue(tr::parseInputLine(R"({"type":"panend"})", in, err), "panend parses");
  std::printf("  Pan lines PASS\n");

  // taps
  requireTrue(tr::parseInputLine(R"({"type":"tap","t":42})", in, err), "tap parses");
  requireTrue(in.gesture.type == tr::GestureEventType::Tap && in.gesture.timestampMs == 42, "tap");
  requireTrue(tr::parseInputLine(R"({"type":"twofingertap"})", in, err), "twofingertap parses");
  requireTrue(in.gesture.type == tr::GestureEventType::TwoFingerTap, "twofingertap");
  requireTrue(std::string(tr::gestureEventName(in.gesture.type)) == "twofingertap", "name");
  std::printf("  Tap lines PASS\n");

  // UI actions
  requireTrue(tr::parseInputLine(R"({"type":"text","text":"héllo","enter":true})", in, err),
              "text parses");
  requireTrue(in.kind == tr::InputLineKind::Text && in.text == "héllo" && in.appendEnter,
              "text fields");
  requireTrue(tr::parseInputLine(R"({"type":"text","text":"x"})", in, err), "text no enter");
  requireTrue(!in.appendEnter, "enter defaults off");

  requireTrue(tr::parseInputLine(R"({"type":"key","name":"PageUp"})", in, err), "key parses");
  requireTrue(in.kind == tr::InputLineKind::Key && in.text == "PageUp", "key fields");

  requireTrue(tr::parseInputLine(R"({"type":"sensitivity","value":2.4})", in, err),
              "sensitivity parses");
  requireTrue(in.kind == tr::InputLineKind::Sensitivity && std::fabs(in.value - 2.4) < 1e-9,
              "sensitivity value");
  std::printf("  UI lines PASS\n");

  // rejects
  requireReject("", "empty line");
  requireReject("[1]", "array");
  requireReject(R"({"dx":1})", "no type");
  requireReject(R"({"type":"swipe"})", "unknown type");
  requireReject(R"({"type":"panstart"})", "panstart without pointers");
  requireReject(R"({"type":"text"})", "text without text");
  requireReject(R"({"type":"key","name":5})", "numeric key name");
  requireReject(R"({"type":"sensitivity","value":"2"})", "string sensitivity");
  requireReject(R"({"type":"panmove","dx":1e300,"dy":0})", "huge dx");
  requireReject(R"({"type":"panstart","pointers":1,"dx":0,"dy":-2e6})", "huge dy");
  requireReject(R"({"type":"tap","t":1e30})", "huge timestamp");
  requireReject(R"({"type":"tap","t":-5})", "negative timestamp");
  requireReject(R"({"type":"twofingertap","t":4611686018427387904})", "timestamp past the cap");
  std::printf("  Rejects PASS\n");

  // bounds are inclusive
  requireTrue(tr::parseInputLine(R"({"type":"panmove","dx":1000000,"dy":-1000000})", in, err),
              "offset at the bound");
  requireTrue(tr::parseInputLine(R"({"type":"tap","t":0})", in, err) && in.gesture.hasTimestamp,
              "t = 0");
  std::printf("  Bounds PASS\n");

  std::printf("D7.1 input_line: ALL PASS\n");
  return 0;
}
