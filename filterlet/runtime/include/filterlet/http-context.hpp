#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "filterlet/action.hpp"
#include "filterlet/attribute-propagator.hpp"
#include "filterlet/host-constants.hpp"
#include "filterlet/host.hpp"
#include "filterlet/log.hpp"
#include "filterlet/value.hpp"

namespace filterlet {

template <class Config>
class Exchange;

// Per exchange state exposed to extension callbacks.
//
// It holds the user context and user attribute maps and the body delivery mode of each direction. The body flags are
// initialized from the registered callbacks and may be changed by the extension at any phase:
//   - dontRead*Body: the body of this direction is not delivered to the extension anymore
//   - buffer*Body: the whole body callback is used even if a streaming callback is registered
class HttpContext {
 public:
  // Body delivery mode of one direction.
  struct BodyMode {
    bool needBody{false};
    bool streaming{false};
  };

  HttpContext(IHost& host, Logger& logger, std::uint32_t contextId, BodyMode requestMode, BodyMode responseMode)
      : _host(host),
        _logger(logger),
        _contextId(contextId),
        _directions{DirectionState{requestMode, 0}, DirectionState{responseMode, 0}} {}

  HttpContext(const HttpContext&) = delete;
  HttpContext(HttpContext&&) = delete;
  HttpContext& operator=(const HttpContext&) = delete;
  HttpContext& operator=(HttpContext&&) = delete;

  ~HttpContext() = default;

  [[nodiscard]] std::uint32_t contextId() const noexcept { return _contextId; }

  // Request pseudo headers. They are empty if the host does not provide them.
  [[nodiscard]] std::string scheme() const { return requestHeader(header::Scheme); }
  [[nodiscard]] std::string host() const { return requestHeader(header::Authority); }
  [[nodiscard]] std::string path() const { return requestHeader(header::Path); }
  [[nodiscard]] std::string method() const { return requestHeader(header::Method); }

  // Per exchange user storage, shared between the phases of this exchange.
  void setContext(std::string_view key, Value value);

  // Returns nullptr if 'key' is not set.
  [[nodiscard]] const Value* getContext(std::string_view key) const noexcept;

  // Returns 'defaultValue' if 'key' is not set or does not hold a bool.
  [[nodiscard]] bool getBoolContext(std::string_view key, bool defaultValue) const noexcept;

  // Returns 'defaultValue' if 'key' is not set or does not hold a string.
  // The returned view is valid until the key is modified.
  [[nodiscard]] std::string_view getStringContext(std::string_view key, std::string_view defaultValue) const noexcept;

  // User attributes, accumulated for export to the access log or the trace span.
  void setUserAttribute(std::string_view key, Value value);

  [[nodiscard]] const Value* getUserAttribute(std::string_view key) const noexcept;

  [[nodiscard]] const ValueMap& userAttributes() const noexcept { return _userAttributes; }

  // Merge the user attributes into the 'custom_log' property.
  AttributeExportStatus writeUserAttributeToLog() { return writeUserAttributeToLogWithKey(property::CustomLog); }

  // Merge the user attributes into the property 'key', for instance 'ai_log'.
  AttributeExportStatus writeUserAttributeToLogWithKey(std::string_view key) {
    return MergeAttributesIntoLog(_host, key, _userAttributes, _logger);
  }

  // Write each user attribute as a trace span tag. Returns the number of attributes written.
  std::size_t writeUserAttributeToTrace() { return WriteAttributesToTrace(_host, _userAttributes, _logger); }

  // The request body will not be delivered, even if a request body callback is registered.
  void dontReadRequestBody() noexcept { state(Direction::Request).mode.needBody = false; }

  // The response body will not be delivered, even if a response body callback is registered.
  void dontReadResponseBody() noexcept { state(Direction::Response).mode.needBody = false; }

  // Deliver the whole request body at once, even if a streaming request body callback is registered.
  void bufferRequestBody() noexcept { state(Direction::Request).mode.streaming = false; }

  // Deliver the whole response body at once, even if a streaming response body callback is registered.
  void bufferResponseBody() noexcept { state(Direction::Response).mode.streaming = false; }

  // If a request header is changed in the request headers phase, the proxy computes the route again.
  // Call this before any header modification to keep the current route.
  void disableReroute();

  // Maximum size of the buffered request body. It affects the memory usage of the gateway.
  void setRequestBodyBufferLimit(std::uint32_t size) { setBufferLimit(property::DecoderBufferLimit, "request", size); }

  // Maximum size of the buffered response body. It affects the memory usage of the gateway.
  void setResponseBodyBufferLimit(std::uint32_t size) {
    setBufferLimit(property::EncoderBufferLimit, "response", size);
  }

  [[nodiscard]] bool needBody(Direction direction) const noexcept { return state(direction).mode.needBody; }

  [[nodiscard]] bool streamingBody(Direction direction) const noexcept { return state(direction).mode.streaming; }

 private:
  template <class Config>
  friend class Exchange;

  struct DirectionState {
    BodyMode mode;
    // Number of body bytes received so far when the whole body is buffered.
    std::size_t bufferedBodySize;
  };

  [[nodiscard]] DirectionState& state(Direction direction) noexcept {
    return _directions[static_cast<std::size_t>(direction)];
  }

  [[nodiscard]] const DirectionState& state(Direction direction) const noexcept {
    return _directions[static_cast<std::size_t>(direction)];
  }

  [[nodiscard]] std::string requestHeader(std::string_view name) const;

  void setBufferLimit(std::string_view propertyName, std::string_view direction, std::uint32_t size);

  IHost& _host;
  Logger& _logger;
  std::uint32_t _contextId;
  DirectionState _directions[2];
  ValueMap _userContext;
  ValueMap _userAttributes;
};

}  // namespace filterlet
