#pragma once

#include <string>
#include <string_view>

#include "filterlet/action.hpp"
#include "filterlet/host.hpp"

namespace filterlet {

// Request attributes used to select the configuration applying to an exchange.
struct RequestMetadata {
  std::string host;         // ':authority' header, port included
  std::string path;         // ':path' header, query string included
  std::string routeName;    // 'route_name' property
  std::string serviceName;  // 'cluster_name' property
};

// Read the metadata of the current request from the host. Missing values are left empty.
[[nodiscard]] RequestMetadata ReadRequestMetadata(IHost& host);

// Tells whether a body with the given content type and content encoding header values is binary.
// Such bodies are not delivered to extensions, to avoid copying costly payloads across the host boundary.
[[nodiscard]] bool IsBinaryContent(std::string_view contentType, std::string_view contentEncoding) noexcept;

// Same as IsBinaryContent, reading the header values of 'direction' from the host.
[[nodiscard]] bool IsBinaryBody(IHost& host, Direction direction);

// Value of a header, or an empty string if the header is absent or cannot be read.
[[nodiscard]] std::string HeaderOrEmpty(IHost& host, Direction direction, std::string_view name);

// Value of a property, or an empty string if the property is absent or cannot be read.
[[nodiscard]] std::string PropertyOrEmpty(IHost& host, std::string_view name);

}  // namespace filterlet
