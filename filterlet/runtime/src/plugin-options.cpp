#include "filterlet/plugin-options.hpp"

#include <functional>
#include <utility>

#include "filterlet/host-constants.hpp"

namespace filterlet {

void ParseContext::registerTick(Millis period, std::function<void()> callback) {
  if (period.count() % kTickGranularity.count() != 0) {
    _logger.warn("tick period {} ms is not a multiple of {} ms, it will not be honored precisely", period.count(),
                 kTickGranularity.count());
  }
  _tickRegistry.registerTick(period, std::move(callback));
}

}  // namespace filterlet
