#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "filterlet/action.hpp"
#include "filterlet/timedef.hpp"

namespace filterlet {

// Status of a call made into the host.
enum class HostStatus : std::uint8_t {
  Ok,
  NotFound,
  BadArgument,
  Unimplemented,
  InternalFailure,
};

[[nodiscard]] std::string_view HostStatusStr(HostStatus status) noexcept;

// Interface to the proxy hosting the extension.
//
// The runtime never talks to the proxy ABI directly. Every call goes through this interface, which makes it possible
// to bind the runtime to a concrete ABI (proxy-wasm or another one) and to drive it from unit tests.
//
// Calls relate to the exchange whose signal is being delivered, unless setEffectiveContext was called with another id.
// Implementations are not required to be thread safe: the runtime is single threaded.
class IHost {
 public:
  virtual ~IHost() = default;

  // Raw plugin configuration bytes. Returns NotFound if the proxy has no configuration for this plugin.
  virtual HostStatus getPluginConfiguration(std::string& out) = 0;

  // Ask the host to deliver tick signals at the given period.
  virtual HostStatus setTickPeriod(Millis period) = 0;

  // Current time, as reported by the host.
  [[nodiscard]] virtual SysTimePoint now() const = 0;

  // Make subsequent calls relate to the exchange with the given id.
  virtual HostStatus setEffectiveContext(std::uint32_t contextId) = 0;

  // Property access (filter state). Returns NotFound if the property does not exist.
  virtual HostStatus getProperty(std::string_view name, std::string& out) = 0;

  virtual HostStatus setProperty(std::string_view name, std::string_view value) = 0;

  // Header lookup by lower-case name. Returns NotFound if absent.
  virtual HostStatus getHeader(Direction direction, std::string_view name, std::string& out) = 0;

  // Read 'size' bytes of the body buffered for 'direction', starting at 'start'.
  virtual HostStatus getBody(Direction direction, std::size_t start, std::size_t size, std::string& out) = 0;

  // Replace the body currently buffered for 'direction' (the current chunk when streaming).
  virtual HostStatus replaceBody(Direction direction, std::string_view body) = 0;
};

}  // namespace filterlet
