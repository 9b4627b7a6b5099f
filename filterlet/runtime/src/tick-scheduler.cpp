#include "filterlet/tick-scheduler.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <stdexcept>
#include <utility>

#include "filterlet/log.hpp"

namespace filterlet {

void TickRegistry::registerTick(Millis period, std::function<void()> callback) {
  if (period <= Millis::zero()) {
    log::critical("tick period must be positive, got {} ms", period.count());
    throw std::invalid_argument("tick period must be positive");
  }
  if (!callback) {
    throw std::invalid_argument("tick callback must not be empty");
  }
  _entries.push_back(TickEntry{SysTimePoint{}, period, std::move(callback)});
}

vector<TickEntry> TickRegistry::release() noexcept { return std::exchange(_entries, {}); }

void TickScheduler::arm(vector<TickEntry> entries, SysTimePoint now) {
  _entries = std::move(entries);
  for (TickEntry& entry : _entries) {
    entry.lastFired = now;
  }
}

std::size_t TickScheduler::onTick(SysTimePoint now, Logger& logger) {
  std::size_t nbFired = 0;
  for (TickEntry& entry : _entries) {
    if (now - entry.lastFired >= entry.period) {
      entry.lastFired = now;
      ++nbFired;
      try {
        entry.callback();
      } catch (const std::exception& ex) {
        logger.error("tick callback with period {} ms threw: {}", entry.period.count(), ex.what());
      }
    }
  }
  return nbFired;
}

}  // namespace filterlet
