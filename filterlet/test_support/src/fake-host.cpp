#include "filterlet/fake-host.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace filterlet::test {

HostStatus FakeHost::getPluginConfiguration(std::string& out) {
  if (pluginConfigStatus == HostStatus::Ok) {
    out = pluginConfig;
  }
  return pluginConfigStatus;
}

HostStatus FakeHost::setTickPeriod(Millis period) {
  if (tickPeriodStatus == HostStatus::Ok) {
    tickPeriod = period;
  }
  return tickPeriodStatus;
}

HostStatus FakeHost::setEffectiveContext(std::uint32_t contextId) {
  effectiveContextId = contextId;
  return HostStatus::Ok;
}

HostStatus FakeHost::getProperty(std::string_view name, std::string& out) {
  if (propertyReadStatus != HostStatus::Ok) {
    return propertyReadStatus;
  }
  const auto it = _properties.find(name);
  if (it == _properties.end()) {
    return HostStatus::NotFound;
  }
  out = it->second;
  return HostStatus::Ok;
}

HostStatus FakeHost::setProperty(std::string_view name, std::string_view value) {
  if (std::ranges::find(rejectedProperties, name) != rejectedProperties.end()) {
    return HostStatus::InternalFailure;
  }
  _properties.insert_or_assign(std::string(name), std::string(value));
  return HostStatus::Ok;
}

HostStatus FakeHost::getHeader(Direction direction, std::string_view name, std::string& out) {
  const HeaderMap& headers = _headers[static_cast<std::size_t>(direction)];
  const auto it = headers.find(name);
  if (it == headers.end()) {
    return HostStatus::NotFound;
  }
  out = it->second;
  return HostStatus::Ok;
}

HostStatus FakeHost::getBody(Direction direction, std::size_t start, std::size_t size, std::string& out) {
  const BodyState& state = body(direction);
  if (state.readStatus != HostStatus::Ok) {
    return state.readStatus;
  }
  if (start > state.buffer.size()) {
    return HostStatus::BadArgument;
  }
  out = state.buffer.substr(start, size);
  return HostStatus::Ok;
}

HostStatus FakeHost::replaceBody(Direction direction, std::string_view newBody) {
  BodyState& state = body(direction);
  if (state.replaceStatus != HostStatus::Ok) {
    return state.replaceStatus;
  }
  state.buffer.assign(newBody);
  ++state.replaceCount;
  return HostStatus::Ok;
}

void FakeHost::setHeader(Direction direction, std::string_view name, std::string_view value) {
  _headers[static_cast<std::size_t>(direction)].insert_or_assign(std::string(name), std::string(value));
}

const std::string* FakeHost::findProperty(std::string_view name) const {
  const auto it = _properties.find(name);
  return it == _properties.end() ? nullptr : &it->second;
}

void FakeHost::beginBodySignal(Direction direction, std::string_view chunk) {
  BodyState& state = body(direction);
  if (!state.paused) {
    state.buffer.clear();
  }
  state.buffer.append(chunk);
}

void FakeHost::endBodySignal(Direction direction, Action action) {
  BodyState& state = body(direction);
  state.paused = action == Action::Pause;
  if (!state.paused) {
    state.forwarded.append(state.buffer);
    state.buffer.clear();
  }
}

}  // namespace filterlet::test
