#include "filterlet/request-info.hpp"

#include <string>
#include <string_view>

#include "filterlet/host-constants.hpp"

namespace filterlet {

std::string HeaderOrEmpty(IHost& host, Direction direction, std::string_view name) {
  std::string value;
  if (host.getHeader(direction, name, value) != HostStatus::Ok) {
    value.clear();
  }
  return value;
}

std::string PropertyOrEmpty(IHost& host, std::string_view name) {
  std::string value;
  if (host.getProperty(name, value) != HostStatus::Ok) {
    value.clear();
  }
  return value;
}

RequestMetadata ReadRequestMetadata(IHost& host) {
  RequestMetadata metadata;
  metadata.host = HeaderOrEmpty(host, Direction::Request, header::Authority);
  metadata.path = HeaderOrEmpty(host, Direction::Request, header::Path);
  metadata.routeName = PropertyOrEmpty(host, property::RouteName);
  metadata.serviceName = PropertyOrEmpty(host, property::ClusterName);
  return metadata;
}

bool IsBinaryContent(std::string_view contentType, std::string_view contentEncoding) noexcept {
  return contentType.contains("octet-stream") || contentType.contains("grpc") || !contentEncoding.empty();
}

bool IsBinaryBody(IHost& host, Direction direction) {
  return IsBinaryContent(HeaderOrEmpty(host, direction, header::ContentType),
                         HeaderOrEmpty(host, direction, header::ContentEncoding));
}

}  // namespace filterlet
