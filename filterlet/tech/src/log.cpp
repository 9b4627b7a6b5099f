#include "filterlet/log.hpp"

#include <string>
#include <string_view>

namespace filterlet {

LoggerPtr MakeNamedLogger(std::string_view name) { return log::default_logger()->clone(std::string(name)); }

}  // namespace filterlet
