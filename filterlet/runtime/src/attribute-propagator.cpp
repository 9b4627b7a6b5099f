#include "filterlet/attribute-propagator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "filterlet/host-constants.hpp"
#include "filterlet/json-codec.hpp"

namespace filterlet {

namespace {

// Parse an escaped JSON object, as stored in a log property. Member values are kept verbatim.
std::optional<RawJsonObject> ParseEscapedObject(std::string_view escaped) {
  const auto unescaped = JsonUnescape(escaped);
  if (!unescaped) {
    return std::nullopt;
  }
  RawJsonObject obj;
  if (!ParseRawJsonObject(*unescaped, obj)) {
    return std::nullopt;
  }
  return obj;
}

}  // namespace

AttributeExportStatus MergeAttributesIntoLog(IHost& host, std::string_view key, const ValueMap& attributes,
                                             Logger& logger) {
  std::string prior;
  const HostStatus readStatus = host.getProperty(key, prior);
  if (readStatus != HostStatus::Ok && readStatus != HostStatus::NotFound) {
    logger.warn("failed to read {}: {}", key, HostStatusStr(readStatus));
    return AttributeExportStatus::HostFailure;
  }

  RawJsonObject merged;
  if (readStatus == HostStatus::Ok && !prior.empty()) {
    auto parsed = ParseEscapedObject(prior);
    if (!parsed) {
      logger.warn("unable to parse prior value of {}, it is left unchanged: {}", key, prior);
      return AttributeExportStatus::MalformedPriorValue;
    }
    merged = std::move(*parsed);
  }

  for (const auto& [attrKey, attrValue] : attributes) {
    merged.insert_or_assign(attrKey, RawJson{attrValue.toJsonText()});
  }

  const std::string escaped = JsonEscape(SerializeToJson(merged));

  const HostStatus writeStatus = host.setProperty(key, escaped);
  if (writeStatus != HostStatus::Ok) {
    logger.warn("failed to set {} in filter state, raw is {}: {}", key, escaped, HostStatusStr(writeStatus));
    return AttributeExportStatus::HostFailure;
  }
  return AttributeExportStatus::Ok;
}

std::size_t WriteAttributesToTrace(IHost& host, const ValueMap& attributes, Logger& logger) {
  std::size_t nbWritten = 0;
  std::string tag;
  for (const auto& [attrKey, attrValue] : attributes) {
    tag.assign(property::TraceSpanTagPrefix);
    tag.append(attrKey);

    const std::string tagValue = attrValue.toString();
    if (tagValue.empty()) {
      logger.warn("failed to set trace attribute {}: value is empty", tag);
      continue;
    }
    const HostStatus status = host.setProperty(tag, tagValue);
    if (status != HostStatus::Ok) {
      logger.warn("failed to set trace attribute {}: {}, error: {}", tag, tagValue, HostStatusStr(status));
      continue;
    }
    ++nbWritten;
  }
  return nbWritten;
}

}  // namespace filterlet
