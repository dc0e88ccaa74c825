#include "tr/command/CommandCodec.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <utility>

namespace tr {

std::string encodeCommand(const Command& cmd) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartArray();
  switch (cmd.kind) {
    case CommandKind::Move:
      w.String("m");
      w.Int(cmd.dx);
      w.Int(cmd.dy);
      break;
    case CommandKind::ScrollUnit:
      w.String("w");
      w.Int(cmd.direction);
      break;
    case CommandKind::Click:
      w.String("b");
      w.String(cmd.button == MouseButton::Right ? "r" : "l");
      w.Int(cmd.count);
      break;
    case CommandKind::Text:
      w.String("t");
      w.String(cmd.text.c_str(), static_cast<rapidjson::SizeType>(cmd.text.size()));
      break;
    case CommandKind::Key:
      w.String("k");
      w.String(cmd.text.c_str(), static_cast<rapidjson::SizeType>(cmd.text.size()));
      break;
  }
  w.EndArray();

  return sb.GetString();
}

// -------------------- decoding --------------------

static DecodeResult fail(const std::string& code, const std::string& message) {
  DecodeResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

static DecodeResult success(Command cmd) {
  DecodeResult r;
  r.ok = true;
  r.command = std::move(cmd);
  return r;
}

DecodeResult decodeCommand(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str(), jsonText.size());

  if (d.HasParseError()) {
    return fail("BAD_MESSAGE", "decodeCommand: invalid JSON");
  }
  return decodeCommand(d);
}

DecodeResult decodeCommand(const rapidjson::Value& arr) {
  if (!arr.IsArray()) {
    return fail("BAD_MESSAGE", "Message is not an array");
  }
  if (arr.Empty()) {
    return fail("EMPTY_MESSAGE", "Empty message array");
  }
  if (!arr[0].IsString()) {
    return fail("BAD_MESSAGE", "Invalid command type");
  }

  const std::string op = arr[0].GetString();
  const rapidjson::SizeType n = arr.Size();

  if (op == "m") {
    if (n < 3) return fail("BAD_ARGUMENT", "Invalid mouse move message");
    if (!arr[1].IsInt()) return fail("BAD_ARGUMENT", "Invalid dx");
    if (!arr[2].IsInt()) return fail("BAD_ARGUMENT", "Invalid dy");
    return success(Command::move(arr[1].GetInt(), arr[2].GetInt()));
  }

  if (op == "w") {
    if (n < 2) return fail("BAD_ARGUMENT", "Invalid wheel message");
    if (!arr[1].IsInt()) return fail("BAD_ARGUMENT", "Invalid wheel direction");
    int dir = arr[1].GetInt();
    if (dir != 1 && dir != -1) {
      return fail("BAD_ARGUMENT", "Wheel direction must be -1 or 1");
    }
    return success(Command::scrollUnit(dir));
  }

  if (op == "b") {
    if (n < 3) return fail("BAD_ARGUMENT", "Invalid button click message");
    if (!arr[1].IsString()) return fail("BAD_ARGUMENT", "Invalid button type");
    if (!arr[2].IsUint()) return fail("BAD_ARGUMENT", "Invalid click count");

    const std::string btn = arr[1].GetString();
    MouseButton button;
    if (btn == "l") button = MouseButton::Left;
    else if (btn == "r") button = MouseButton::Right;
    else return fail("BAD_ARGUMENT", "Unknown button type: " + btn);

    unsigned count = arr[2].GetUint();
    if (count != 1 && count != 2) {
      return fail("BAD_ARGUMENT", "Click count must be 1 or 2");
    }
    return success(Command::click(button, static_cast<int>(count)));
  }

  if (op == "t") {
    if (n < 2) return fail("BAD_ARGUMENT", "Invalid text message");
    if (!arr[1].IsString()) return fail("BAD_ARGUMENT", "Invalid text content");
    return success(Command::textInput(
        std::string(arr[1].GetString(), arr[1].GetStringLength())));
  }

  if (op == "k") {
    if (n < 2) return fail("BAD_ARGUMENT", "Invalid key press message");
    if (!arr[1].IsString()) return fail("BAD_ARGUMENT", "Invalid key name");
    return success(Command::key(arr[1].GetString()));
  }

  if (op == "ping") {
    DecodeResult r;
    r.ok = true;
    r.isPing = true;
    return r;
  }

  return fail("UNKNOWN_COMMAND", "Unknown command: " + op);
}

bool isKnownKeyName(const std::string& name) {
  return name == "Escape" || name == "PageUp" || name == "PageDown" ||
         name == "Delete" || name == "Return";
}

} // namespace tr
