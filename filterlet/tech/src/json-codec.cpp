#include "filterlet/json-codec.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace filterlet {

bool ParseJson(std::string_view text, Json& out, std::string* errorMsg) {
  // glaze expects a null terminated buffer
  std::string buffer(text);
  const auto ec = glz::read_json(out, buffer);
  if (ec) {
    if (errorMsg != nullptr) {
      *errorMsg = glz::format_error(ec, buffer);
    }
    return false;
  }
  return true;
}

bool ParseRawJsonObject(std::string_view text, RawJsonObject& out) {
  std::string buffer(text);
  return !glz::read_json(out, buffer);
}

std::string JsonEscape(std::string_view raw) {
  std::string quoted = glz::write_json(raw).value_or(std::string{});
  if (quoted.size() < 2U) {
    return {};
  }
  return quoted.substr(1U, quoted.size() - 2U);
}

std::optional<std::string> JsonUnescape(std::string_view escaped) {
  std::string buffer;
  buffer.reserve(escaped.size() + 2U);
  buffer.push_back('"');
  buffer.append(escaped);
  buffer.push_back('"');

  std::string unescaped;
  const auto ec = glz::read_json(unescaped, buffer);
  if (ec) {
    return std::nullopt;
  }
  return unescaped;
}

bool IsJsonObject(const Json& json) noexcept { return std::holds_alternative<Json::object_t>(json.data); }

const Json* FindMember(const Json& json, std::string_view key) noexcept {
  const auto* pObj = std::get_if<Json::object_t>(&json.data);
  if (pObj == nullptr) {
    return nullptr;
  }
  const auto it = pObj->find(key);
  return it == pObj->end() ? nullptr : &it->second;
}

std::optional<std::string_view> StringMember(const Json& json, std::string_view key) noexcept {
  const Json* pMember = FindMember(json, key);
  if (pMember == nullptr) {
    return std::nullopt;
  }
  const auto* pStr = std::get_if<std::string>(&pMember->data);
  if (pStr == nullptr) {
    return std::nullopt;
  }
  return std::string_view(*pStr);
}

}  // namespace filterlet
