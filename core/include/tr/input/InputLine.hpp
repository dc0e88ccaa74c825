#pragma once
#include "tr/gesture/GestureEvent.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace tr {

// One line of the client's stdin protocol (newline-delimited JSON):
//   {"type":"panstart","pointers":1,"dx":0,"dy":0}   panmove / panend / pancancel
//   {"type":"tap"}  {"type":"twofingertap"}          optional "t": timestamp ms
//   {"type":"text","text":"hello","enter":true}
//   {"type":"key","name":"Escape"}
//   {"type":"sensitivity","value":2.0}
// Lines carrying offsets or timestamps outside these bounds are rejected.
inline constexpr double kMaxInputOffset = 1e6;
inline constexpr TimeMs kMaxInputTimestampMs = std::numeric_limits<TimeMs>::max() / 4;

enum class InputLineKind : std::uint8_t { Gesture = 0, Text, Key, Sensitivity };

struct InputLine {
  InputLineKind kind{InputLineKind::Gesture};
  GestureEvent gesture;     // Gesture
  std::string text;         // Text content / Key name
  bool appendEnter{false};  // Text
  double value{0};          // Sensitivity
};

// Returns false and fills error on malformed input.
bool parseInputLine(const std::string& json, InputLine& out, std::string& error);

} // namespace tr
