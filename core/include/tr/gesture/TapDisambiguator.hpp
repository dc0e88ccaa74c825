#pragma once
#include "tr/command/Command.hpp"
#include "tr/timing/Scheduler.hpp"

#include <cstdint>
#include <functional>
#include <limits>

namespace tr {

// "No tap seen yet"; far enough back that no window matches it.
inline constexpr TimeMs kNeverMs = std::numeric_limits<TimeMs>::min() / 2;

struct TapTimingConfig {
  TimeMs doubleTapIntervalMs{180};  // second tap within this = double click
  TimeMs twoFingerBlockMs{500};     // taps this soon after a right click are dropped
};

struct TapState {
  TimeMs lastTapTimestamp{kNeverMs};
  TimeMs lastTwoFingerTapTimestamp{kNeverMs};
  TimerId pendingSingleTap{kNoTimer};
};

enum class TapOutcome : std::uint8_t {
  Blocked = 0,   // trailing tap after a two-finger tap
  Pending,       // single click armed, fires after the double-tap window
  DoubleClick    // emitted immediately
};

// Resolves single vs double tap, and suppresses the stray single tap that
// follows a two-finger tap. Commands go to the sink, possibly from a timer.
class TapDisambiguator {
public:
  using CommandSink = std::function<void(const Command&)>;

  TapDisambiguator(Scheduler& scheduler, CommandSink sink);
  ~TapDisambiguator();

  TapDisambiguator(const TapDisambiguator&) = delete;
  TapDisambiguator& operator=(const TapDisambiguator&) = delete;

  void setConfig(const TapTimingConfig& cfg) { config_ = cfg; }
  const TapTimingConfig& config() const { return config_; }

  TapOutcome onTap(TimeMs t);
  void onTwoFingerTap(TimeMs t);

  bool hasPendingSingleTap() const;
  const TapState& state() const { return state_; }

private:
  void cancelPending();

  Scheduler& scheduler_;
  CommandSink sink_;
  TapTimingConfig config_;
  TapState state_;
};

} // namespace tr
