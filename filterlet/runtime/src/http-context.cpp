#include "filterlet/http-context.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "filterlet/host-constants.hpp"
#include "filterlet/request-info.hpp"

namespace filterlet {

void HttpContext::setContext(std::string_view key, Value value) {
  _userContext.insert_or_assign(std::string(key), std::move(value));
}

const Value* HttpContext::getContext(std::string_view key) const noexcept {
  const auto it = _userContext.find(key);
  return it == _userContext.end() ? nullptr : &it->second;
}

bool HttpContext::getBoolContext(std::string_view key, bool defaultValue) const noexcept {
  const Value* pValue = getContext(key);
  if (pValue == nullptr) {
    return defaultValue;
  }
  const bool* pBool = pValue->asBool();
  return pBool == nullptr ? defaultValue : *pBool;
}

std::string_view HttpContext::getStringContext(std::string_view key, std::string_view defaultValue) const noexcept {
  const Value* pValue = getContext(key);
  if (pValue == nullptr) {
    return defaultValue;
  }
  const std::string* pStr = pValue->asString();
  return pStr == nullptr ? defaultValue : std::string_view(*pStr);
}

void HttpContext::setUserAttribute(std::string_view key, Value value) {
  _userAttributes.insert_or_assign(std::string(key), std::move(value));
}

const Value* HttpContext::getUserAttribute(std::string_view key) const noexcept {
  const auto it = _userAttributes.find(key);
  return it == _userAttributes.end() ? nullptr : &it->second;
}

void HttpContext::disableReroute() {
  const HostStatus status = _host.setProperty(property::ClearRouteCache, "off");
  if (status != HostStatus::Ok) {
    _logger.warn("failed to disable reroute: {}", HostStatusStr(status));
  }
}

void HttpContext::setBufferLimit(std::string_view propertyName, std::string_view direction, std::uint32_t size) {
  _logger.info("set {} body buffer limit: {}", direction, size);
  const HostStatus status = _host.setProperty(propertyName, std::to_string(size));
  if (status != HostStatus::Ok) {
    _logger.warn("failed to set {} body buffer limit: {}", direction, HostStatusStr(status));
  }
}

std::string HttpContext::requestHeader(std::string_view name) const {
  // Extension code may call this outside of a signal of this exchange (from a tick callback for instance).
  const HostStatus status = _host.setEffectiveContext(_contextId);
  if (status != HostStatus::Ok) {
    _logger.debug("failed to set effective context {}: {}", _contextId, HostStatusStr(status));
  }
  return HeaderOrEmpty(_host, Direction::Request, name);
}

}  // namespace filterlet
