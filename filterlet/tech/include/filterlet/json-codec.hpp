#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace filterlet {

// Generic JSON document, as produced by parsing the plugin configuration or a log property.
using Json = glz::generic;

// JSON value kept as its exact text. Numbers are not converted, so integers above 2^53 survive a read / write cycle.
using RawJson = glz::raw_json;

// JSON object whose member values are kept as their exact text.
using RawJsonObject = std::map<std::string, RawJson, std::less<>>;

/// Serialize a C++ object to JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

// Parses 'text' into 'out'. On failure, returns false and, if 'errorMsg' is not null, stores a human readable
// description of the error in it. 'out' is unspecified on failure.
[[nodiscard]] bool ParseJson(std::string_view text, Json& out, std::string* errorMsg = nullptr);

// Parses the JSON object 'text' into 'out', keeping the member values verbatim.
// Returns false if 'text' is not a valid JSON object.
[[nodiscard]] bool ParseRawJsonObject(std::string_view text, RawJsonObject& out);

// Escapes 'raw' the way it would appear inside a JSON string literal, without the surrounding quotes.
// Example: {"a":"1"} -> {\"a\":\"1\"}
[[nodiscard]] std::string JsonEscape(std::string_view raw);

// Inverse of JsonEscape. Returns std::nullopt if 'escaped' is not a valid JSON string body.
[[nodiscard]] std::optional<std::string> JsonUnescape(std::string_view escaped);

[[nodiscard]] bool IsJsonObject(const Json& json) noexcept;

// Returns a pointer to the member 'key' of 'json', or nullptr if 'json' is not an object or has no such member.
[[nodiscard]] const Json* FindMember(const Json& json, std::string_view key) noexcept;

// Returns the string value of member 'key', or std::nullopt if absent or not a string.
[[nodiscard]] std::optional<std::string_view> StringMember(const Json& json, std::string_view key) noexcept;

}  // namespace filterlet
