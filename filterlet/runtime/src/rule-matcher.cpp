#include "filterlet/rule-matcher.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "filterlet/log.hpp"

namespace filterlet {

namespace {

void ParseStringArray(const Json& rule, std::string_view key, vector<std::string>& out, Logger& logger) {
  const Json* pMember = FindMember(rule, key);
  if (pMember == nullptr) {
    return;
  }
  const auto* pArray = std::get_if<Json::array_t>(&pMember->data);
  if (pArray == nullptr) {
    logger.critical("rule key '{}' should be an array of strings", key);
    throw std::invalid_argument("rule match key should be an array of strings");
  }
  for (const Json& elem : *pArray) {
    const auto* pStr = std::get_if<std::string>(&elem.data);
    if (pStr == nullptr) {
      logger.critical("rule key '{}' should only contain strings", key);
      throw std::invalid_argument("rule match key should be an array of strings");
    }
    out.push_back(*pStr);
  }
}

std::string_view StripPort(std::string_view host) noexcept {
  if (host.starts_with('[')) {
    // IPv6 literal, [::1]:8080
    const auto closingPos = host.find(']');
    return closingPos == std::string_view::npos ? host : host.substr(0, closingPos + 1U);
  }
  const auto colonPos = host.rfind(':');
  if (colonPos == std::string_view::npos) {
    return host;
  }
  const std::string_view port = host.substr(colonPos + 1U);
  if (port.empty() || !std::ranges::all_of(port, [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    return host;
  }
  return host.substr(0, colonPos);
}

}  // namespace

RuleMatchCriteria RuleMatchCriteria::Parse(const Json& rule, Logger& logger) {
  RuleMatchCriteria criteria;
  ParseStringArray(rule, kMatchRouteKey, criteria._routes, logger);
  ParseStringArray(rule, kMatchDomainKey, criteria._domains, logger);
  ParseStringArray(rule, kMatchServiceKey, criteria._services, logger);
  ParseStringArray(rule, kMatchPathKey, criteria._paths, logger);
  return criteria;
}

bool RuleMatchCriteria::matches(const RequestMetadata& metadata) const noexcept {
  if (empty()) {
    return false;
  }
  if (!_routes.empty() && std::ranges::find(_routes, metadata.routeName) == _routes.end()) {
    return false;
  }
  if (!_services.empty() && std::ranges::find(_services, metadata.serviceName) == _services.end()) {
    return false;
  }
  if (!_domains.empty() && std::ranges::none_of(_domains, [&](const std::string& pattern) {
        return DomainMatches(pattern, metadata.host);
      })) {
    return false;
  }
  if (!_paths.empty() &&
      std::ranges::none_of(_paths, [&](const std::string& pattern) { return PathMatches(pattern, metadata.path); })) {
    return false;
  }
  return true;
}

bool DomainMatches(std::string_view pattern, std::string_view host) noexcept {
  host = StripPort(host);
  if (pattern.starts_with('*')) {
    return host.ends_with(pattern.substr(1U));
  }
  if (pattern.ends_with('*')) {
    return host.starts_with(pattern.substr(0, pattern.size() - 1U));
  }
  return host == pattern;
}

bool PathMatches(std::string_view pattern, std::string_view path) noexcept {
  path = path.substr(0, path.find('?'));
  if (pattern.ends_with('*')) {
    return path.starts_with(pattern.substr(0, pattern.size() - 1U));
  }
  return path == pattern;
}

}  // namespace filterlet
