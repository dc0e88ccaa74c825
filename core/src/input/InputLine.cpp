#include "tr/input/InputLine.hpp"

#include <rapidjson/document.h>

#include <cmath>

namespace tr {

static double numberOr(const rapidjson::Value& obj, const char* key, double fallback) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsNumber()) return fallback;
  return it->value.GetDouble();
}

static bool offsetInRange(double v) {
  return std::isfinite(v) && std::fabs(v) <= kMaxInputOffset;
}

static bool gestureTypeFromName(const std::string& name, GestureEventType& out) {
  if (name == "panstart")     { out = GestureEventType::PanStart;     return true; }
  if (name == "panmove")      { out = GestureEventType::PanMove;      return true; }
  if (name == "panend")       { out = GestureEventType::PanEnd;       return true; }
  if (name == "pancancel")    { out = GestureEventType::PanCancel;    return true; }
  if (name == "tap")          { out = GestureEventType::Tap;          return true; }
  if (name == "twofingertap") { out = GestureEventType::TwoFingerTap; return true; }
  return false;
}

bool parseInputLine(const std::string& json, InputLine& out, std::string& error) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError() || !doc.IsObject()) {
    error = "invalid JSON object";
    return false;
  }

  auto typeIt = doc.FindMember("type");
  if (typeIt == doc.MemberEnd() || !typeIt->value.IsString()) {
    error = "missing string field: type";
    return false;
  }
  const std::string type = typeIt->value.GetString();

  out = InputLine{};

  if (type == "text") {
    auto it = doc.FindMember("text");
    if (it == doc.MemberEnd() || !it->value.IsString()) {
      error = "text: missing string field: text";
      return false;
    }
    out.kind = InputLineKind::Text;
    out.text.assign(it->value.GetString(), it->value.GetStringLength());
    auto enter = doc.FindMember("enter");
    out.appendEnter = enter != doc.MemberEnd() && enter->value.IsBool() &&
                      enter->value.GetBool();
    return true;
  }

  if (type == "key") {
    auto it = doc.FindMember("name");
    if (it == doc.MemberEnd() || !it->value.IsString()) {
      error = "key: missing string field: name";
      return false;
    }
    out.kind = InputLineKind::Key;
    out.text = it->value.GetString();
    return true;
  }

  if (type == "sensitivity") {
    auto it = doc.FindMember("value");
    if (it == doc.MemberEnd() || !it->value.IsNumber()) {
      error = "sensitivity: missing numeric field: value";
      return false;
    }
    out.kind = InputLineKind::Sensitivity;
    out.value = it->value.GetDouble();
    return true;
  }

  GestureEventType gt;
  if (!gestureTypeFromName(type, gt)) {
    error = "unknown type: " + type;
    return false;
  }

  out.kind = InputLineKind::Gesture;
  out.gesture.type = gt;
  out.gesture.deltaX = numberOr(doc, "dx", 0.0);
  out.gesture.deltaY = numberOr(doc, "dy", 0.0);
  if (!offsetInRange(out.gesture.deltaX) || !offsetInRange(out.gesture.deltaY)) {
    error = type + ": dx/dy out of range";
    return false;
  }

  if (gt == GestureEventType::PanStart) {
    auto it = doc.FindMember("pointers");
    if (it == doc.MemberEnd() || !it->value.IsInt()) {
      error = "panstart: missing integer field: pointers";
      return false;
    }
    out.gesture.pointerCount = it->value.GetInt();
  }

  auto tIt = doc.FindMember("t");
  if (tIt != doc.MemberEnd() && tIt->value.IsNumber()) {
    const double t = tIt->value.GetDouble();
    if (!(t >= 0) || t > static_cast<double>(kMaxInputTimestampMs)) {
      error = type + ": t out of range";
      return false;
    }
    out.gesture.timestampMs = static_cast<TimeMs>(t);
    out.gesture.hasTimestamp = true;
  }
  return true;
}

} // namespace tr
