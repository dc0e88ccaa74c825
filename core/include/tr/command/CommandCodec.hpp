#pragma once
#include "tr/command/Command.hpp"

#include <string>

#include <rapidjson/document.h>

namespace tr {

// Wire format: one JSON array per message, first element is the op code.
//   ["m", dx, dy]   ["w", dir]   ["b", "l"|"r", count]   ["t", text]   ["k", name]
// The receiver also accepts ["ping"] as a heartbeat.

// Encode a command as its wire tuple.
std::string encodeCommand(const Command& cmd);

struct DecodeError {
  std::string code;     // e.g. "BAD_ARGUMENT"
  std::string message;  // human text
};

struct DecodeResult {
  bool ok{true};
  bool isPing{false};   // heartbeat, carries no command
  DecodeError err{};
  Command command{};
};

// Parse and validate a wire message.
DecodeResult decodeCommand(const std::string& jsonText);
DecodeResult decodeCommand(const rapidjson::Value& arr);

// Key names the receiver maps to physical keys.
bool isKnownKeyName(const std::string& name);

} // namespace tr
