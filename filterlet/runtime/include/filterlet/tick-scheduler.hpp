#pragma once

#include <cstddef>
#include <functional>
#include <span>

#include "filterlet/log.hpp"
#include "filterlet/timedef.hpp"
#include "filterlet/vector.hpp"

namespace filterlet {

struct TickEntry {
  SysTimePoint lastFired;
  Millis period;
  std::function<void()> callback;
};

// Collects the periodic callbacks registered while the configuration is parsed.
// The staged entries are moved into the TickScheduler of the plugin at start, which leaves the registry empty.
class TickRegistry {
 public:
  // Stage a callback executed every 'period'. The period should be a multiple of kTickGranularity, a smaller period
  // is executed at the granularity cadence.
  // Throws std::invalid_argument if 'period' is not positive or if 'callback' is empty.
  void registerTick(Millis period, std::function<void()> callback);

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  // Moves out the staged entries and clears the registry.
  [[nodiscard]] vector<TickEntry> release() noexcept;

 private:
  vector<TickEntry> _entries;
};

// Fires periodic callbacks from the host tick signal.
// Entries are evaluated in registration order. Callbacks are invoked synchronously, so a slow callback delays the
// evaluation of the following entries of the same tick. A callback throwing a std::exception is logged to 'logger' and
// does not prevent the following entries from firing.
class TickScheduler {
 public:
  // Install 'entries', replacing any previous ones. Their last fired time is set to 'now'.
  void arm(vector<TickEntry> entries, SysTimePoint now);

  // Evaluate all entries at 'now', and fire the ones whose period has elapsed since their last firing.
  // Returns the number of callbacks fired, including the ones that threw.
  std::size_t onTick(SysTimePoint now, Logger& logger);

  [[nodiscard]] std::span<const TickEntry> entries() const noexcept { return {_entries.data(), _entries.size()}; }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

 private:
  vector<TickEntry> _entries;
};

}  // namespace filterlet
