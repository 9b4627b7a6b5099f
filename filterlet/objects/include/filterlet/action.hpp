#pragma once

#include <cstdint>
#include <string_view>

namespace filterlet {

// Direction of the traffic for a phase signal.
enum class Direction : std::uint8_t { Request, Response };

// Value returned to the host for each header or body signal.
enum class Action : std::uint8_t {
  Continue,  // let the filter chain proceed
  Pause,     // stop iteration, the host will buffer and resume on the next signal
};

// Outcome of the plugin start transition.
enum class StartStatus : std::uint8_t { Ok, Failed };

constexpr std::string_view DirectionStr(Direction direction) {
  return direction == Direction::Request ? "request" : "response";
}

constexpr std::string_view ActionStr(Action action) { return action == Action::Continue ? "continue" : "pause"; }

}  // namespace filterlet
