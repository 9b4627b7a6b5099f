#include "filterlet/host.hpp"

#include <string_view>

namespace filterlet {

std::string_view HostStatusStr(HostStatus status) noexcept {
  switch (status) {
    case HostStatus::Ok:
      return "ok";
    case HostStatus::NotFound:
      return "not found";
    case HostStatus::BadArgument:
      return "bad argument";
    case HostStatus::Unimplemented:
      return "unimplemented";
    case HostStatus::InternalFailure:
      return "internal failure";
    default:
      return "unknown";
  }
}

}  // namespace filterlet
