#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "filterlet/action.hpp"
#include "filterlet/host-constants.hpp"
#include "filterlet/host.hpp"
#include "filterlet/json-codec.hpp"
#include "filterlet/log.hpp"
#include "filterlet/plugin-options.hpp"
#include "filterlet/rule-matcher.hpp"
#include "filterlet/tick-scheduler.hpp"

namespace filterlet {

// Plugin wide context, one per extension instance.
//
// It owns the callbacks registered by the extension, the rule set built from the plugin configuration and the periodic
// callbacks. It is shared by all the live exchanges of the instance and does not change after a successful start,
// except for the tick timestamps.
template <class Config>
class Plugin {
 public:
  // Throws std::invalid_argument if no configuration parser is registered while Config is not an empty type.
  Plugin(IHost& host, std::string_view name, PluginOptions<Config> options)
      : _host(host),
        _name(name),
        _logger(options.logger ? std::move(options.logger) : MakeNamedLogger(name)),
        _hooks(std::move(options.hooks)),
        _ruleMatcher(options.ruleMatcher ? std::move(options.ruleMatcher)
                                         : std::make_unique<RuleMatcher<Config>>()) {
    if (!_hooks.parseConfig) {
      if constexpr (!std::is_empty_v<Config>) {
        _logger->critical("the configuration parser is missing in the plugin options");
        throw std::invalid_argument("the configuration parser is missing in the plugin options");
      }
      _hasCustomConfig = false;
      _hooks.parseConfig = []([[maybe_unused]] const Json& json, [[maybe_unused]] Config& config,
                              [[maybe_unused]] ParseContext& ctx) {};
    }
  }

  Plugin(const Plugin&) = delete;
  Plugin(Plugin&&) = delete;
  Plugin& operator=(const Plugin&) = delete;
  Plugin& operator=(Plugin&&) = delete;

  ~Plugin() = default;

  // Read the plugin configuration from the host, build the rule set and arm the tick timer if periodic callbacks were
  // registered while parsing. On failure the host is expected to discard this instance.
  StartStatus onStart() {
    std::string rawConfig;
    const HostStatus status = _host.getPluginConfiguration(rawConfig);
    if (status != HostStatus::Ok && status != HostStatus::NotFound) {
      _logger->critical("error reading plugin configuration: {}", HostStatusStr(status));
      return StartStatus::Failed;
    }
    if (status == HostStatus::NotFound) {
      rawConfig.clear();
    }

    Json json;
    if (rawConfig.empty()) {
      if (_hasCustomConfig) {
        _logger->warn("config is empty, but a configuration parser is registered");
      }
      json.data = Json::object_t{};
    } else {
      std::string errorMsg;
      if (!ParseJson(rawConfig, json, &errorMsg)) {
        _logger->warn("the plugin configuration is not a valid json: {} ({})", rawConfig, errorMsg);
        return StartStatus::Failed;
      }
    }

    // Periodic callbacks registered by the parsers are staged here, they are only installed if the start succeeds.
    TickRegistry tickRegistry;
    ParseContext parseContext(*_logger, tickRegistry);

    typename IRuleMatcher<Config>::GlobalParser applyGlobal = [this, &parseContext](const Json& js, Config& cfg) {
      _hooks.parseConfig(js, cfg, parseContext);
    };
    typename IRuleMatcher<Config>::OverrideParser applyOverride;
    if (_hooks.parseOverrideConfig) {
      applyOverride = [this, &parseContext](const Json& js, const Config& global, Config& cfg) {
        _hooks.parseOverrideConfig(js, global, cfg, parseContext);
      };
    }

    try {
      _ruleMatcher->build(json, applyGlobal, applyOverride, *_logger);
    } catch (const std::exception& ex) {
      _logger->warn("parse rule config failed: {}", ex.what());
      return StartStatus::Failed;
    }

    if (!tickRegistry.empty()) {
      const HostStatus tickStatus = _host.setTickPeriod(kTickGranularity);
      if (tickStatus != HostStatus::Ok) {
        _logger->error("setting tick period failed, tick callbacks will not take effect: {}",
                       HostStatusStr(tickStatus));
        return StartStatus::Failed;
      }
      _tickScheduler.arm(tickRegistry.release(), _host.now());
    }
    return StartStatus::Ok;
  }

  // Host tick signal, delivered every kTickGranularity.
  void onTick() { _tickScheduler.onTick(_host.now(), *_logger); }

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] Logger& logger() const noexcept { return *_logger; }

  [[nodiscard]] IHost& host() const noexcept { return _host; }

  [[nodiscard]] const PluginHooks<Config>& hooks() const noexcept { return _hooks; }

  [[nodiscard]] const IRuleMatcher<Config>& ruleMatcher() const noexcept { return *_ruleMatcher; }

  [[nodiscard]] const TickScheduler& tickScheduler() const noexcept { return _tickScheduler; }

  // False if the configuration parser was substituted because Config is an empty type.
  [[nodiscard]] bool hasCustomConfig() const noexcept { return _hasCustomConfig; }

 private:
  IHost& _host;
  std::string _name;
  LoggerPtr _logger;
  PluginHooks<Config> _hooks;
  std::unique_ptr<IRuleMatcher<Config>> _ruleMatcher;
  TickScheduler _tickScheduler;
  bool _hasCustomConfig{true};
};

}  // namespace filterlet
