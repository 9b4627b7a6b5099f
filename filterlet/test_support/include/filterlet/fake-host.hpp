#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "filterlet/action.hpp"
#include "filterlet/host.hpp"
#include "filterlet/plugin-runtime.hpp"
#include "filterlet/timedef.hpp"
#include "filterlet/vector.hpp"

namespace filterlet::test {

// In memory host emulating the proxy side of the runtime.
//
// Body buffering follows the proxy behavior: each body signal exposes the newly received chunk, unless the previous
// signal of the same direction paused, in which case the new chunk is appended to the buffered bytes.
// When a signal continues, the buffered bytes (possibly replaced by the extension) are forwarded upstream.
class FakeHost : public IHost {
 public:
  struct BodyState {
    std::string buffer;     // bytes currently visible to the extension
    std::string forwarded;  // bytes released by the host
    bool paused{false};
    HostStatus readStatus{HostStatus::Ok};
    HostStatus replaceStatus{HostStatus::Ok};
    std::size_t replaceCount{};
  };

  FakeHost() = default;

  explicit FakeHost(std::string_view pluginConfig) : pluginConfig(pluginConfig) {}

  HostStatus getPluginConfiguration(std::string& out) override;

  HostStatus setTickPeriod(Millis period) override;

  [[nodiscard]] SysTimePoint now() const override { return _now; }

  HostStatus setEffectiveContext(std::uint32_t contextId) override;

  HostStatus getProperty(std::string_view name, std::string& out) override;

  HostStatus setProperty(std::string_view name, std::string_view value) override;

  HostStatus getHeader(Direction direction, std::string_view name, std::string& out) override;

  HostStatus getBody(Direction direction, std::size_t start, std::size_t size, std::string& out) override;

  HostStatus replaceBody(Direction direction, std::string_view body) override;

  void advance(Millis duration) noexcept { _now += duration; }

  void setHeader(Direction direction, std::string_view name, std::string_view value);

  // Returns nullptr if the property is not set.
  [[nodiscard]] const std::string* findProperty(std::string_view name) const;

  [[nodiscard]] BodyState& body(Direction direction) noexcept { return _bodies[static_cast<std::size_t>(direction)]; }

  // To be called before delivering a body signal carrying 'chunk'.
  void beginBodySignal(Direction direction, std::string_view chunk);

  // To be called with the action returned by the extension for a body signal.
  void endBodySignal(Direction direction, Action action);

  std::string pluginConfig;
  HostStatus pluginConfigStatus{HostStatus::Ok};
  HostStatus tickPeriodStatus{HostStatus::Ok};
  Millis tickPeriod{};
  std::uint32_t effectiveContextId{};
  vector<std::string> rejectedProperties;  // names for which setProperty fails
  HostStatus propertyReadStatus{HostStatus::Ok};

 private:
  using HeaderMap = std::map<std::string, std::string, std::less<>>;

  SysTimePoint _now{SysClock::now()};
  std::map<std::string, std::string, std::less<>> _properties;
  HeaderMap _headers[2];
  BodyState _bodies[2];
};

// Deliver one body chunk of exchange 'contextId' to 'runtime', with the host side buffering around it.
template <class Config>
Action SendBody(FakeHost& host, PluginRuntime<Config>& runtime, std::uint32_t contextId, Direction direction,
                std::string_view chunk, bool endOfStream) {
  host.beginBodySignal(direction, chunk);
  const Action action = direction == Direction::Request
                            ? runtime.onRequestBody(contextId, chunk.size(), endOfStream)
                            : runtime.onResponseBody(contextId, chunk.size(), endOfStream);
  host.endBodySignal(direction, action);
  return action;
}

}  // namespace filterlet::test
