#include "tr/command/Command.hpp"

#include <utility>

namespace tr {

Command Command::move(int dx, int dy) {
  Command c;
  c.kind = CommandKind::Move;
  c.dx = dx;
  c.dy = dy;
  return c;
}

Command Command::scrollUnit(int direction) {
  Command c;
  c.kind = CommandKind::ScrollUnit;
  c.direction = direction;
  return c;
}

Command Command::click(MouseButton button, int count) {
  Command c;
  c.kind = CommandKind::Click;
  c.button = button;
  c.count = count;
  return c;
}

Command Command::textInput(std::string content) {
  Command c;
  c.kind = CommandKind::Text;
  c.text = std::move(content);
  return c;
}

Command Command::key(std::string name) {
  Command c;
  c.kind = CommandKind::Key;
  c.text = std::move(name);
  return c;
}

bool operator==(const Command& a, const Command& b) {
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case CommandKind::Move:
      return a.dx == b.dx && a.dy == b.dy;
    case CommandKind::ScrollUnit:
      return a.direction == b.direction;
    case CommandKind::Click:
      return a.button == b.button && a.count == b.count;
    case CommandKind::Text:
    case CommandKind::Key:
      return a.text == b.text;
  }
  return false;
}

} // namespace tr
