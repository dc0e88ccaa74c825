#pragma once
#include <cstdint>
#include <string>

namespace tr {

enum class CommandKind : std::uint8_t {
  Move = 0, ScrollUnit, Click, Text, Key
};

enum class MouseButton : std::uint8_t { Left = 0, Right };

// Remote-input command. Only the fields of the active kind are meaningful.
struct Command {
  CommandKind kind{CommandKind::Move};
  int dx{0}, dy{0};                        // Move
  int direction{0};                        // ScrollUnit: -1 or +1
  MouseButton button{MouseButton::Left};   // Click
  int count{0};                            // Click: 1 or 2
  std::string text;                        // Text content / Key name

  static Command move(int dx, int dy);
  static Command scrollUnit(int direction);
  static Command click(MouseButton button, int count);
  static Command textInput(std::string content);
  static Command key(std::string name);
};

bool operator==(const Command& a, const Command& b);
inline bool operator!=(const Command& a, const Command& b) { return !(a == b); }

} // namespace tr
