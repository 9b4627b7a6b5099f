#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "filterlet/action.hpp"
#include "filterlet/http-context.hpp"
#include "filterlet/json-codec.hpp"
#include "filterlet/log.hpp"
#include "filterlet/rule-matcher.hpp"
#include "filterlet/tick-scheduler.hpp"
#include "filterlet/timedef.hpp"

namespace filterlet {

// Handed to the configuration parsers. It gives access to the plugin logger and stages periodic callbacks, which
// become active once the plugin has successfully started.
class ParseContext {
 public:
  ParseContext(Logger& logger, TickRegistry& tickRegistry) noexcept : _logger(logger), _tickRegistry(tickRegistry) {}

  [[nodiscard]] Logger& log() const noexcept { return _logger; }

  // Register 'callback' to be executed every 'period'. 'period' should be a multiple of 100 ms.
  void registerTick(Millis period, std::function<void()> callback);

 private:
  Logger& _logger;
  TickRegistry& _tickRegistry;
};

template <class Config>
using ParseConfigFunc = std::function<void(const Json& json, Config& config, ParseContext& ctx)>;

template <class Config>
using ParseOverrideConfigFunc =
    std::function<void(const Json& json, const Config& global, Config& config, ParseContext& ctx)>;

template <class Config>
using HeadersFunc = std::function<Action(HttpContext& ctx, const Config& config, Logger& log)>;

template <class Config>
using BodyFunc = std::function<Action(HttpContext& ctx, const Config& config, std::string_view body, Logger& log)>;

// Returns the bytes forwarded in place of 'chunk'.
template <class Config>
using StreamingBodyFunc = std::function<std::string(HttpContext& ctx, const Config& config, std::string_view chunk,
                                                    bool isLastChunk, Logger& log)>;

template <class Config>
using StreamDoneFunc = std::function<void(HttpContext& ctx, const Config& config, Logger& log)>;

// Optional callbacks of a plugin. The runtime behavior depends on which ones are set.
template <class Config>
struct PluginHooks {
  ParseConfigFunc<Config> parseConfig;
  ParseOverrideConfigFunc<Config> parseOverrideConfig;
  HeadersFunc<Config> onRequestHeaders;
  BodyFunc<Config> onRequestBody;
  StreamingBodyFunc<Config> onStreamingRequestBody;
  HeadersFunc<Config> onResponseHeaders;
  BodyFunc<Config> onResponseBody;
  StreamingBodyFunc<Config> onStreamingResponseBody;
  StreamDoneFunc<Config> onStreamDone;
};

// Registration of the callbacks of a plugin.
//
// Example:
//   PluginOptions<MyConfig> options;
//   options.parseConfigBy(ParseMyConfig).processRequestHeadersBy(OnRequestHeaders);
//   Plugin<MyConfig> plugin(host, "my-plugin", std::move(options));
template <class Config>
class PluginOptions {
 public:
  // Required unless Config is an empty type.
  PluginOptions& parseConfigBy(ParseConfigFunc<Config> parseConfig) {
    hooks.parseConfig = std::move(parseConfig);
    return *this;
  }

  // 'parseOverrideConfig' parses rule configurations, relative to the global configuration parsed by 'parseConfig'.
  PluginOptions& parseOverrideConfigBy(ParseConfigFunc<Config> parseConfig,
                                       ParseOverrideConfigFunc<Config> parseOverrideConfig) {
    hooks.parseConfig = std::move(parseConfig);
    hooks.parseOverrideConfig = std::move(parseOverrideConfig);
    return *this;
  }

  PluginOptions& processRequestHeadersBy(HeadersFunc<Config> func) {
    hooks.onRequestHeaders = std::move(func);
    return *this;
  }

  // The whole request body is delivered once the last chunk is received.
  PluginOptions& processRequestBodyBy(BodyFunc<Config> func) {
    hooks.onRequestBody = std::move(func);
    return *this;
  }

  // Each request body chunk is delivered as it is received. Takes precedence over processRequestBodyBy.
  PluginOptions& processStreamingRequestBodyBy(StreamingBodyFunc<Config> func) {
    hooks.onStreamingRequestBody = std::move(func);
    return *this;
  }

  PluginOptions& processResponseHeadersBy(HeadersFunc<Config> func) {
    hooks.onResponseHeaders = std::move(func);
    return *this;
  }

  // The whole response body is delivered once the last chunk is received.
  PluginOptions& processResponseBodyBy(BodyFunc<Config> func) {
    hooks.onResponseBody = std::move(func);
    return *this;
  }

  // Each response body chunk is delivered as it is received. Takes precedence over processResponseBodyBy.
  PluginOptions& processStreamingResponseBodyBy(StreamingBodyFunc<Config> func) {
    hooks.onStreamingResponseBody = std::move(func);
    return *this;
  }

  PluginOptions& processStreamDoneBy(StreamDoneFunc<Config> func) {
    hooks.onStreamDone = std::move(func);
    return *this;
  }

  // Replace the default logger, named after the plugin.
  PluginOptions& withLogger(LoggerPtr pLogger) {
    logger = std::move(pLogger);
    return *this;
  }

  // Replace the default rule matcher.
  PluginOptions& withRuleMatcher(std::unique_ptr<IRuleMatcher<Config>> pRuleMatcher) {
    ruleMatcher = std::move(pRuleMatcher);
    return *this;
  }

  PluginHooks<Config> hooks;
  LoggerPtr logger;
  std::unique_ptr<IRuleMatcher<Config>> ruleMatcher;
};

}  // namespace filterlet
