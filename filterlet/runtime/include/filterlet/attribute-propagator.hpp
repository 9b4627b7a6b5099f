#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "filterlet/host.hpp"
#include "filterlet/log.hpp"
#include "filterlet/value.hpp"

namespace filterlet {

enum class AttributeExportStatus : std::uint8_t {
  Ok,
  MalformedPriorValue,  // the existing property could not be parsed, it was left untouched
  HostFailure,          // the property could not be read or written
};

// Merge 'attributes' into the JSON object stored in the property 'key'.
//
// The property transport only carries string values, so the JSON object is stored escaped, as the body of a JSON
// string literal:
//   {\"field1\":\"value1\",\"field2\":2}
// The prior value is unescaped once, parsed, overlaid with 'attributes' (last write wins) then serialized and escaped
// back. Repeated merges of the same attributes give the same property value.
// An absent or empty property is treated as an empty object.
AttributeExportStatus MergeAttributesIntoLog(IHost& host, std::string_view key, const ValueMap& attributes,
                                             Logger& logger);

// Write each attribute as a distinct 'trace_span_tag.<key>' property.
// Attributes whose string form is empty, or that the host refuses, are logged and skipped.
// Returns the number of attributes written.
std::size_t WriteAttributesToTrace(IHost& host, const ValueMap& attributes, Logger& logger);

}  // namespace filterlet
