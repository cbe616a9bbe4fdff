#pragma once

#include <cstdint>
#include <string_view>

namespace soundscribe::recording {

enum class SessionState : std::uint8_t {
  kActive     = 0,
  kFinalizing = 1,
  kComplete   = 2,
};

constexpr bool IsTerminal(SessionState state) {
  return state == SessionState::kComplete;
}

// Strictly forward, one step at a time.
constexpr bool CanTransition(SessionState from, SessionState to) {
  if (IsTerminal(from)) {
    return false;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kActive:
      return "ACTIVE";
    case SessionState::kFinalizing:
      return "FINALIZING";
    case SessionState::kComplete:
      return "COMPLETE";
  }
  return "UNKNOWN";
}

} // namespace soundscribe::recording
