#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "filterlet/json-codec.hpp"
#include "filterlet/log.hpp"
#include "filterlet/request-info.hpp"
#include "filterlet/vector.hpp"

namespace filterlet {

// Selects the configuration applying to an exchange from its request metadata.
template <class Config>
class IRuleMatcher {
 public:
  // Parse 'json' into a configuration. Throws on invalid input.
  using GlobalParser = std::function<void(const Json& json, Config& config)>;

  // Parse 'json' into a configuration, relative to the global one. Throws on invalid input.
  using OverrideParser = std::function<void(const Json& json, const Config& global, Config& config)>;

  virtual ~IRuleMatcher() = default;

  // Build the rule set from the raw plugin configuration.
  // 'applyOverride' may be empty, in which case rule configurations are parsed with 'applyGlobal'.
  // Throws on failure, in which case the previous rule set is kept. Diagnostics are written to 'logger'.
  virtual void build(const Json& raw, const GlobalParser& applyGlobal, const OverrideParser& applyOverride,
                     Logger& logger) = 0;

  // Returns the configuration applying to a request, or nullptr if none applies.
  [[nodiscard]] virtual std::shared_ptr<const Config> resolve(const RequestMetadata& metadata) const = 0;
};

// Match conditions of a rule. Within one kind, any entry may match. All non-empty kinds must match.
class RuleMatchCriteria {
 public:
  static constexpr std::string_view kRulesKey = "_rules_";
  static constexpr std::string_view kMatchRouteKey = "_match_route_";
  static constexpr std::string_view kMatchDomainKey = "_match_domain_";
  static constexpr std::string_view kMatchServiceKey = "_match_service_";
  static constexpr std::string_view kMatchPathKey = "_match_path_";

  // Read the match keys of a rule object.
  // Throws std::invalid_argument if a match key is not an array of strings.
  static RuleMatchCriteria Parse(const Json& rule, Logger& logger);

  // Tells whether no condition is set.
  [[nodiscard]] bool empty() const noexcept {
    return _routes.empty() && _domains.empty() && _services.empty() && _paths.empty();
  }

  [[nodiscard]] bool matches(const RequestMetadata& metadata) const noexcept;

 private:
  vector<std::string> _routes;
  vector<std::string> _domains;   // '*.example.com' and 'example.*' wildcards are supported
  vector<std::string> _services;
  vector<std::string> _paths;     // a trailing '*' makes it a prefix
};

// Tells whether 'host' (port excluded) matches 'pattern'.
[[nodiscard]] bool DomainMatches(std::string_view pattern, std::string_view host) noexcept;

// Tells whether 'path' (query string excluded) matches 'pattern'.
[[nodiscard]] bool PathMatches(std::string_view pattern, std::string_view path) noexcept;

// Default rule matcher, reading the gateway plugin configuration layout:
//
//   {
//     "global_key": "...",              <- global configuration (all keys except '_rules_')
//     "_rules_": [
//       {"_match_domain_": ["*.example.com"], "key": "..."},
//       {"_match_route_": ["route-a"], "key": "..."}
//     ]
//   }
//
// Rules are evaluated in order, the first matching one wins. Otherwise the global configuration applies if there is
// one, otherwise the exchange is not matched. An empty configuration enables the plugin globally.
template <class Config>
class RuleMatcher final : public IRuleMatcher<Config> {
 public:
  using typename IRuleMatcher<Config>::GlobalParser;
  using typename IRuleMatcher<Config>::OverrideParser;

  void build(const Json& raw, const GlobalParser& applyGlobal, const OverrideParser& applyOverride,
             Logger& logger) override {
    static const Json::object_t kEmptyObject;

    const auto* pObj = std::get_if<Json::object_t>(&raw.data);
    if (pObj == nullptr && !std::holds_alternative<std::nullptr_t>(raw.data)) {
      throw std::invalid_argument("plugin configuration should be a JSON object");
    }
    const Json::object_t& obj = pObj == nullptr ? kEmptyObject : *pObj;

    std::shared_ptr<Config> global;
    vector<Rule> rules;

    if (obj.empty()) {
      // enable globally for empty config
      global = std::make_shared<Config>();
      applyGlobal(raw, *global);
      commit(std::move(global), std::move(rules));
      return;
    }

    const Json::array_t* pRules = nullptr;
    auto keyCount = obj.size();
    if (const auto it = obj.find(RuleMatchCriteria::kRulesKey); it != obj.end()) {
      pRules = std::get_if<Json::array_t>(&it->second.data);
      if (pRules == nullptr) {
        throw std::invalid_argument("'_rules_' should be an array");
      }
      --keyCount;
    }

    std::string globalConfigError;
    if (keyCount > 0) {
      auto parsed = std::make_shared<Config>();
      try {
        applyGlobal(raw, *parsed);
        global = std::move(parsed);
      } catch (const std::exception& ex) {
        logger.warn("global configuration is ignored: {}", ex.what());
        globalConfigError = ex.what();
      }
    }

    if (pRules == nullptr || pRules->empty()) {
      if (!global) {
        throw std::invalid_argument("parse config failed, no valid rules; global config parse error: " +
                                    globalConfigError);
      }
      commit(std::move(global), std::move(rules));
      return;
    }

    static const Config kZeroConfig{};
    for (const Json& ruleJson : *pRules) {
      auto config = std::make_shared<Config>();
      if (applyOverride) {
        applyOverride(ruleJson, global ? *global : kZeroConfig, *config);
      } else {
        applyGlobal(ruleJson, *config);
      }
      RuleMatchCriteria criteria = RuleMatchCriteria::Parse(ruleJson, logger);
      if (criteria.empty()) {
        throw std::invalid_argument(
            "at least one of '_match_route_', '_match_domain_', '_match_service_' and '_match_path_' should be set in "
            "a rule");
      }
      rules.push_back(Rule{std::move(criteria), std::move(config)});
    }
    commit(std::move(global), std::move(rules));
  }

  [[nodiscard]] std::shared_ptr<const Config> resolve(const RequestMetadata& metadata) const override {
    for (const Rule& rule : _rules) {
      if (rule.criteria.matches(metadata)) {
        return rule.config;
      }
    }
    return _global;
  }

  [[nodiscard]] bool hasGlobalConfig() const noexcept { return _global != nullptr; }

  [[nodiscard]] std::size_t nbRules() const noexcept { return _rules.size(); }

 private:
  struct Rule {
    RuleMatchCriteria criteria;
    std::shared_ptr<const Config> config;
  };

  void commit(std::shared_ptr<const Config> global, vector<Rule> rules) noexcept {
    _global = std::move(global);
    _rules = std::move(rules);
  }

  std::shared_ptr<const Config> _global;
  vector<Rule> _rules;
};

}  // namespace filterlet
