#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/logger.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <memory>
#include <string_view>

namespace filterlet {

namespace log = spdlog;

// Logger handed to every extension callback. There is one per plugin instance, named after the extension.
using Logger = spdlog::logger;

using LoggerPtr = std::shared_ptr<spdlog::logger>;

// Returns a new logger stamped with the given extension name.
// It shares the sinks and level of the spdlog default logger, so applications configure output in one place.
[[nodiscard]] LoggerPtr MakeNamedLogger(std::string_view name);

}  // namespace filterlet
