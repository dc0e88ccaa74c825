#pragma once
#include <map>
#include <string>

namespace tr {

inline constexpr double kDefaultMoveFactor = 1.8;
inline constexpr double kMinMoveFactor = 0.5;
inline constexpr double kMaxMoveFactor = 3.0;

// Storage key of the pointer sensitivity.
inline constexpr const char* kMoveFactorKey = "moveFactor";

struct TouchpadSettings {
  double moveFactor{kDefaultMoveFactor};
};

struct SettingsError {
  std::string code;     // "CONFIG_READ_ERROR" or "CONFIG_MISSING"
  std::string message;
};

struct SettingsLoadResult {
  bool ok{true};               // false: settings hold the defaults
  SettingsError err{};
  TouchpadSettings settings{};
};

// External key-value store. Values are strings, as a browser's storage keeps them.
class SettingsStore {
public:
  virtual ~SettingsStore() = default;
  virtual bool get(const std::string& key, std::string& out) const = 0;
  virtual bool set(const std::string& key, const std::string& value) = 0;
};

class MemorySettingsStore : public SettingsStore {
public:
  bool get(const std::string& key, std::string& out) const override;
  bool set(const std::string& key, const std::string& value) override;

private:
  std::map<std::string, std::string> values_;
};

// Flat JSON object file, e.g. {"moveFactor":"1.8"}. Numeric members are
// accepted on read. Every set() rewrites the whole file.
class JsonFileSettingsStore : public SettingsStore {
public:
  explicit JsonFileSettingsStore(std::string path);

  bool get(const std::string& key, std::string& out) const override;
  bool set(const std::string& key, const std::string& value) override;

  const std::string& path() const { return path_; }

private:
  bool readAll(std::map<std::string, std::string>& out) const;
  bool writeAll(const std::map<std::string, std::string>& values) const;

  std::string path_;
};

// Parse a stored sensitivity. The whole string must be a finite number.
bool parseMoveFactor(const std::string& text, double& out);

// Clamp into [0.5, 3.0]. NaN and infinities give the default.
double clampMoveFactor(double v);

// Read once at startup. A missing value yields defaults with ok=true and
// code CONFIG_MISSING; malformed or out-of-range values yield defaults with
// ok=false and code CONFIG_READ_ERROR.
SettingsLoadResult loadSettings(const SettingsStore& store);

bool saveSettings(SettingsStore& store, const TouchpadSettings& settings);

// Shortest decimal form that parses back to v exactly, e.g. "1.8".
std::string formatMoveFactor(double v);

} // namespace tr
