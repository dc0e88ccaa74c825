#include "tr/config/Settings.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace tr {

// -------------------- MemorySettingsStore --------------------

bool MemorySettingsStore::get(const std::string& key, std::string& out) const {
  auto it = values_.find(key);
  if (it == values_.end()) return false;
  out = it->second;
  return true;
}

bool MemorySettingsStore::set(const std::string& key, const std::string& value) {
  values_[key] = value;
  return true;
}

// -------------------- JsonFileSettingsStore --------------------

JsonFileSettingsStore::JsonFileSettingsStore(std::string path)
    : path_(std::move(path)) {}

bool JsonFileSettingsStore::get(const std::string& key, std::string& out) const {
  std::map<std::string, std::string> values;
  if (!readAll(values)) return false;
  auto it = values.find(key);
  if (it == values.end()) return false;
  out = it->second;
  return true;
}

bool JsonFileSettingsStore::set(const std::string& key, const std::string& value) {
  std::map<std::string, std::string> values;
  readAll(values);  // start fresh if the file is missing or unreadable
  values[key] = value;
  return writeAll(values);
}

bool JsonFileSettingsStore::readAll(std::map<std::string, std::string>& out) const {
  std::FILE* f = std::fopen(path_.c_str(), "rb");
  if (!f) return false;

  std::string text;
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) text.append(buf, n);
  std::fclose(f);

  rapidjson::Document doc;
  doc.Parse(text.c_str(), text.size());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "[JsonFileSettingsStore] could not parse %s\n", path_.c_str());
    return false;
  }

  for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
    const std::string key = it->name.GetString();
    if (it->value.IsString()) {
      out[key] = std::string(it->value.GetString(), it->value.GetStringLength());
    } else if (it->value.IsNumber()) {
      out[key] = formatMoveFactor(it->value.GetDouble());
    } else {
      // Kept as JSON text so parsing fails visibly on load.
      rapidjson::StringBuffer sb;
      rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
      it->value.Accept(writer);
      out[key] = sb.GetString();
    }
  }
  return true;
}

bool JsonFileSettingsStore::writeAll(const std::map<std::string, std::string>& values) const {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  for (const auto& kv : values) {
    doc.AddMember(rapidjson::Value(kv.first.c_str(), alloc),
                  rapidjson::Value(kv.second.c_str(), alloc), alloc);
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);

  std::FILE* f = std::fopen(path_.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "[JsonFileSettingsStore] cannot write %s\n", path_.c_str());
    return false;
  }
  std::size_t len = sb.GetSize();
  bool ok = std::fwrite(sb.GetString(), 1, len, f) == len;
  ok = (std::fclose(f) == 0) && ok;
  return ok;
}

// -------------------- load / save --------------------

bool parseMoveFactor(const std::string& text, double& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str()) return false;
  while (*end == ' ' || *end == '\t' || *end == '\n') end++;
  if (*end != '\0') return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

double clampMoveFactor(double v) {
  if (!std::isfinite(v)) return kDefaultMoveFactor;
  if (v < kMinMoveFactor) return kMinMoveFactor;
  if (v > kMaxMoveFactor) return kMaxMoveFactor;
  return v;
}

SettingsLoadResult loadSettings(const SettingsStore& store) {
  SettingsLoadResult r;

  std::string raw;
  if (!store.get(kMoveFactorKey, raw)) {
    r.err.code = "CONFIG_MISSING";
    r.err.message = "no stored moveFactor, using default";
    std::fprintf(stderr, "[Settings] loaded defaults (moveFactor=%s)\n",
                 formatMoveFactor(r.settings.moveFactor).c_str());
    return r;
  }

  double v = 0;
  if (!parseMoveFactor(raw, v) || v < kMinMoveFactor || v > kMaxMoveFactor) {
    r.ok = false;
    r.err.code = "CONFIG_READ_ERROR";
    r.err.message = "stored moveFactor '" + raw + "' is not a number in [0.5, 3.0]";
    std::fprintf(stderr, "[Settings] warning: %s, using default %s\n",
                 r.err.message.c_str(),
                 formatMoveFactor(kDefaultMoveFactor).c_str());
    return r;
  }

  r.settings.moveFactor = v;
  std::fprintf(stderr, "[Settings] loaded moveFactor=%s\n", formatMoveFactor(v).c_str());
  return r;
}

bool saveSettings(SettingsStore& store, const TouchpadSettings& settings) {
  const std::string value = formatMoveFactor(settings.moveFactor);
  if (!store.set(kMoveFactorKey, value)) {
    std::fprintf(stderr, "[Settings] warning: could not save moveFactor=%s\n", value.c_str());
    return false;
  }
  std::fprintf(stderr, "[Settings] saved moveFactor=%s\n", value.c_str());
  return true;
}

std::string formatMoveFactor(double v) {
  char buf[32];
  // Fewest digits that read back as the same double.
  for (int precision = 6; precision <= 17; precision++) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
    if (std::strtod(buf, nullptr) == v) break;
  }
  return buf;
}

} // namespace tr
