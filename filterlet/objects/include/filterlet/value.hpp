#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "filterlet/json-codec.hpp"

namespace filterlet {

// Value stored by extensions in the per-exchange context and user attribute maps.
// It is a closed set of JSON-like kinds, so that attributes can always be exported to the access log.
class Value {
 public:
  using Array = std::vector<Value>;
  using Object = std::map<std::string, Value, std::less<>>;

  enum class Type : std::uint8_t { Null, Bool, Int, Double, String, Array, Object };

  Value() noexcept = default;

  Value(std::nullptr_t) noexcept {}

  Value(bool value) noexcept : _data(value) {}

  // Throws std::out_of_range for unsigned values above INT64_MAX.
  template <std::integral T>
    requires(!std::same_as<T, bool>)
  Value(T value) : _data(static_cast<int64_t>(value)) {
    if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
      if (value > static_cast<T>(std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("unsigned integer value does not fit in a signed 64 bits integer");
      }
    }
  }

  Value(double value) noexcept : _data(value) {}

  Value(const char* value) : _data(std::string(value)) {}

  Value(std::string_view value) : _data(std::string(value)) {}

  Value(std::string value) noexcept : _data(std::move(value)) {}

  Value(Array value) noexcept : _data(std::move(value)) {}

  Value(Object value) noexcept : _data(std::move(value)) {}

  [[nodiscard]] Type type() const noexcept { return static_cast<Type>(_data.index()); }

  [[nodiscard]] bool isNull() const noexcept { return type() == Type::Null; }

  // Typed accessors. They return nullptr if the value holds another kind.
  [[nodiscard]] const bool* asBool() const noexcept { return std::get_if<bool>(&_data); }
  [[nodiscard]] const int64_t* asInt() const noexcept { return std::get_if<int64_t>(&_data); }
  [[nodiscard]] const double* asDouble() const noexcept { return std::get_if<double>(&_data); }
  [[nodiscard]] const std::string* asString() const noexcept { return std::get_if<std::string>(&_data); }
  [[nodiscard]] const Array* asArray() const noexcept { return std::get_if<Array>(&_data); }
  [[nodiscard]] const Object* asObject() const noexcept { return std::get_if<Object>(&_data); }

  // Human readable form, used for trace span tags.
  //   - strings are returned verbatim
  //   - booleans are 'true' / 'false'
  //   - numbers use their shortest round trip representation
  //   - null is the empty string
  //   - arrays and objects are compact JSON
  [[nodiscard]] std::string toString() const;

  // Compact JSON text. Integers are written exactly.
  [[nodiscard]] std::string toJsonText() const;

  // Conversion to a glaze generic JSON value. Integers are converted to doubles, prefer toJsonText for export.
  [[nodiscard]] Json toJson() const;

  // Conversion from a glaze generic JSON value. JSON numbers become doubles.
  [[nodiscard]] static Value FromJson(const Json& json);

  bool operator==(const Value& other) const noexcept;

 private:
  std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array, Object> _data{nullptr};
};

// Map type of the per-exchange context and user attribute storage.
using ValueMap = std::map<std::string, Value, std::less<>>;

}  // namespace filterlet
