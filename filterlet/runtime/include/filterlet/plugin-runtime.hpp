#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>

#include "filterlet/action.hpp"
#include "filterlet/exchange.hpp"
#include "filterlet/plugin.hpp"

namespace filterlet {

// Entry point of the host signals for one plugin instance.
// It creates the exchange of a context id on its first signal and drops it after the stream done signal.
template <class Config>
class PluginRuntime {
 public:
  explicit PluginRuntime(Plugin<Config>& plugin) noexcept : _plugin(plugin) {}

  StartStatus onStart() { return _plugin.onStart(); }

  void onTick() { _plugin.onTick(); }

  Action onRequestHeaders(std::uint32_t contextId, std::size_t numHeaders, bool endOfStream) {
    return exchange(contextId).onRequestHeaders(numHeaders, endOfStream);
  }

  Action onRequestBody(std::uint32_t contextId, std::size_t bodySize, bool endOfStream) {
    return exchange(contextId).onRequestBody(bodySize, endOfStream);
  }

  Action onResponseHeaders(std::uint32_t contextId, std::size_t numHeaders, bool endOfStream) {
    return exchange(contextId).onResponseHeaders(numHeaders, endOfStream);
  }

  Action onResponseBody(std::uint32_t contextId, std::size_t bodySize, bool endOfStream) {
    return exchange(contextId).onResponseBody(bodySize, endOfStream);
  }

  // Last signal of an exchange. The exchange is destroyed afterwards.
  void onStreamDone(std::uint32_t contextId) {
    const auto it = _exchanges.find(contextId);
    if (it == _exchanges.end()) {
      return;
    }
    it->second->onStreamDone();
    _exchanges.erase(it);
  }

  // The host tore down the exchange without stream done signal (client disconnection for instance).
  void onExchangeDropped(std::uint32_t contextId) { _exchanges.erase(contextId); }

  // Returns nullptr if no exchange is alive for 'contextId'.
  [[nodiscard]] Exchange<Config>* findExchange(std::uint32_t contextId) noexcept {
    const auto it = _exchanges.find(contextId);
    return it == _exchanges.end() ? nullptr : it->second.get();
  }

  [[nodiscard]] std::size_t nbLiveExchanges() const noexcept { return _exchanges.size(); }

  [[nodiscard]] Plugin<Config>& plugin() noexcept { return _plugin; }

 private:
  // The map entry is only inserted once the exchange is fully constructed.
  Exchange<Config>& exchange(std::uint32_t contextId) {
    auto it = _exchanges.find(contextId);
    if (it == _exchanges.end()) {
      it = _exchanges.emplace(contextId, std::make_unique<Exchange<Config>>(_plugin, contextId)).first;
    }
    return *it->second;
  }

  Plugin<Config>& _plugin;
  std::unordered_map<std::uint32_t, std::unique_ptr<Exchange<Config>>> _exchanges;
};

}  // namespace filterlet
