#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include "filterlet/action.hpp"
#include "filterlet/host-constants.hpp"
#include "filterlet/host.hpp"
#include "filterlet/http-context.hpp"
#include "filterlet/plugin-options.hpp"
#include "filterlet/plugin.hpp"
#include "filterlet/request-info.hpp"

namespace filterlet {

// State machine of one request / response exchange.
//
// The configuration is resolved in the request headers phase. If no configuration applies, the exchange stays
// unmatched: all the following phases let the traffic through without invoking any callback.
// Body signals are handled independently for each direction, either by streaming each chunk to the streaming callback,
// or by pausing the host until the last chunk and delivering the whole body at once.
//
// The host delivers one signal at a time for a given exchange, in order.
template <class Config>
class Exchange {
 public:
  enum class State : std::uint8_t {
    Created,    // no signal processed yet
    Matched,    // a configuration applies
    Unmatched,  // no configuration applies, pass through
    Done,       // stream done received
  };

  Exchange(const Plugin<Config>& plugin, std::uint32_t contextId)
      : _plugin(plugin),
        _context(plugin.host(), plugin.logger(), contextId,
                 InitialBodyMode(plugin.hooks().onRequestBody, plugin.hooks().onStreamingRequestBody),
                 InitialBodyMode(plugin.hooks().onResponseBody, plugin.hooks().onStreamingResponseBody)) {}

  Action onRequestHeaders([[maybe_unused]] std::size_t numHeaders, [[maybe_unused]] bool endOfStream) {
    if (_state != State::Created) {
      return Action::Continue;
    }
    IHost& host = _plugin.host();
    propagateRequestId(host);

    _config = _plugin.ruleMatcher().resolve(ReadRequestMetadata(host));
    if (!_config) {
      _state = State::Unmatched;
      return Action::Continue;
    }
    _state = State::Matched;
    if (IsBinaryBody(host, Direction::Request)) {
      _context.dontReadRequestBody();
    }
    const auto& onRequestHeaders = _plugin.hooks().onRequestHeaders;
    if (!onRequestHeaders) {
      return Action::Continue;
    }
    return invokeHeaders(onRequestHeaders, Direction::Request);
  }

  Action onRequestBody(std::size_t bodySize, bool endOfStream) {
    const auto& hooks = _plugin.hooks();
    return onBody(Direction::Request, bodySize, endOfStream, hooks.onStreamingRequestBody, hooks.onRequestBody);
  }

  Action onResponseHeaders([[maybe_unused]] std::size_t numHeaders, [[maybe_unused]] bool endOfStream) {
    if (!matched()) {
      return Action::Continue;
    }
    if (IsBinaryBody(_plugin.host(), Direction::Response)) {
      _context.dontReadResponseBody();
    }
    const auto& onResponseHeaders = _plugin.hooks().onResponseHeaders;
    if (!onResponseHeaders) {
      return Action::Continue;
    }
    return invokeHeaders(onResponseHeaders, Direction::Response);
  }

  Action onResponseBody(std::size_t bodySize, bool endOfStream) {
    const auto& hooks = _plugin.hooks();
    return onBody(Direction::Response, bodySize, endOfStream, hooks.onStreamingResponseBody, hooks.onResponseBody);
  }

  // Invokes the stream done callback at most once.
  void onStreamDone() {
    const bool wasMatched = matched();
    _state = State::Done;
    const auto& onStreamDone = _plugin.hooks().onStreamDone;
    if (!wasMatched || !onStreamDone) {
      return;
    }
    try {
      onStreamDone(_context, *_config, _plugin.logger());
    } catch (const std::exception& ex) {
      _plugin.logger().error("stream done callback threw: {}", ex.what());
    }
  }

  [[nodiscard]] HttpContext& context() noexcept { return _context; }

  [[nodiscard]] const HttpContext& context() const noexcept { return _context; }

  // The resolved configuration, or nullptr if the exchange is not matched (yet).
  [[nodiscard]] const Config* config() const noexcept { return _config.get(); }

  [[nodiscard]] State state() const noexcept { return _state; }

 private:
  static HttpContext::BodyMode InitialBodyMode(const BodyFunc<Config>& onBody,
                                               const StreamingBodyFunc<Config>& onStreamingBody) {
    return {static_cast<bool>(onBody) || static_cast<bool>(onStreamingBody), static_cast<bool>(onStreamingBody)};
  }

  // Any signal other than the request headers one received on a fresh exchange means that the request headers phase
  // was missed: the exchange will never be matched.
  [[nodiscard]] bool matched() noexcept {
    if (_state == State::Created) {
      _state = State::Unmatched;
    }
    return _state == State::Matched;
  }

  void propagateRequestId(IHost& host) {
    std::string requestId;
    if (host.getHeader(Direction::Request, header::RequestId, requestId) != HostStatus::Ok) {
      return;
    }
    const HostStatus status = host.setProperty(property::RequestId, requestId);
    if (status != HostStatus::Ok) {
      _plugin.logger().debug("failed to set {}: {}", property::RequestId, HostStatusStr(status));
    }
  }

  Action invokeHeaders(const HeadersFunc<Config>& onHeaders, Direction direction) {
    try {
      return onHeaders(_context, *_config, _plugin.logger());
    } catch (const std::exception& ex) {
      _plugin.logger().error("{} headers callback threw: {}", DirectionStr(direction), ex.what());
      return Action::Continue;
    }
  }

  Action onBody(Direction direction, std::size_t bodySize, bool endOfStream,
                const StreamingBodyFunc<Config>& onStreamingBody, const BodyFunc<Config>& onWholeBody) {
    if (!matched() || !_context.needBody(direction)) {
      return Action::Continue;
    }
    IHost& host = _plugin.host();
    Logger& logger = _plugin.logger();

    if (onStreamingBody && _context.streamingBody(direction)) {
      std::string chunk;
      const HostStatus readStatus = host.getBody(direction, 0, bodySize, chunk);
      if (readStatus != HostStatus::Ok) {
        logger.warn("get {} body chunk failed: {}", DirectionStr(direction), HostStatusStr(readStatus));
        return Action::Continue;
      }
      std::string modifiedChunk;
      try {
        modifiedChunk = onStreamingBody(_context, *_config, chunk, endOfStream, logger);
      } catch (const std::exception& ex) {
        logger.error("streaming {} body callback threw: {}", DirectionStr(direction), ex.what());
        return Action::Continue;
      }
      const HostStatus replaceStatus = host.replaceBody(direction, modifiedChunk);
      if (replaceStatus != HostStatus::Ok) {
        logger.warn("replace {} body chunk failed: {}", DirectionStr(direction), HostStatusStr(replaceStatus));
      }
      return Action::Continue;
    }

    if (onWholeBody) {
      std::size_t& bufferedBodySize = _context.state(direction).bufferedBodySize;
      bufferedBodySize += bodySize;
      if (!endOfStream) {
        return Action::Pause;
      }
      std::string body;
      const HostStatus readStatus = host.getBody(direction, 0, bufferedBodySize, body);
      if (readStatus != HostStatus::Ok) {
        logger.warn("get {} body failed: {}", DirectionStr(direction), HostStatusStr(readStatus));
        return Action::Continue;
      }
      try {
        return onWholeBody(_context, *_config, body, logger);
      } catch (const std::exception& ex) {
        logger.error("{} body callback threw: {}", DirectionStr(direction), ex.what());
        return Action::Continue;
      }
    }
    return Action::Continue;
  }

  const Plugin<Config>& _plugin;
  HttpContext _context;
  std::shared_ptr<const Config> _config;
  State _state{State::Created};
};

}  // namespace filterlet
