#include "filterlet/value.hpp"

#include <format>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "filterlet/json-codec.hpp"

namespace filterlet {

std::string Value::toString() const {
  switch (type()) {
    case Type::Null:
      return {};
    case Type::Bool:
      return *asBool() ? "true" : "false";
    case Type::Int:
      return std::to_string(*asInt());
    case Type::Double:
      return std::format("{}", *asDouble());
    case Type::String:
      return *asString();
    default:
      return toJsonText();
  }
}

std::string Value::toJsonText() const {
  switch (type()) {
    case Type::Null:
      return "null";
    case Type::Bool:
      return *asBool() ? "true" : "false";
    case Type::Int:
      return std::to_string(*asInt());
    case Type::Double:
      return SerializeToJson(*asDouble());
    case Type::String:
      return SerializeToJson(*asString());
    case Type::Array: {
      std::vector<RawJson> array;
      array.reserve(asArray()->size());
      for (const Value& elem : *asArray()) {
        array.push_back(RawJson{elem.toJsonText()});
      }
      return SerializeToJson(array);
    }
    case Type::Object: {
      RawJsonObject object;
      for (const auto& [key, elem] : *asObject()) {
        object.emplace(key, RawJson{elem.toJsonText()});
      }
      return SerializeToJson(object);
    }
  }
  return "null";
}

Json Value::toJson() const {
  Json json;
  switch (type()) {
    case Type::Null:
      json.data = nullptr;
      break;
    case Type::Bool:
      json.data = *asBool();
      break;
    case Type::Int:
      json.data = static_cast<double>(*asInt());
      break;
    case Type::Double:
      json.data = *asDouble();
      break;
    case Type::String:
      json.data = *asString();
      break;
    case Type::Array: {
      Json::array_t array;
      array.reserve(asArray()->size());
      for (const Value& elem : *asArray()) {
        array.push_back(elem.toJson());
      }
      json.data = std::move(array);
      break;
    }
    case Type::Object: {
      Json::object_t object;
      for (const auto& [key, elem] : *asObject()) {
        object.emplace(key, elem.toJson());
      }
      json.data = std::move(object);
      break;
    }
  }
  return json;
}

Value Value::FromJson(const Json& json) {
  return std::visit(
      [](const auto& val) -> Value {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, Json::array_t>) {
          Array array;
          array.reserve(val.size());
          for (const Json& elem : val) {
            array.push_back(FromJson(elem));
          }
          return array;
        } else if constexpr (std::is_same_v<T, Json::object_t>) {
          Object object;
          for (const auto& [key, elem] : val) {
            object.emplace(key, FromJson(elem));
          }
          return object;
        } else {
          return Value(val);
        }
      },
      json.data);
}

bool Value::operator==(const Value& other) const noexcept { return _data == other._data; }

}  // namespace filterlet
