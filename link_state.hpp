#pragma once
#include <cstdint>

namespace hrstream {

enum class LinkState : uint8_t {
  Disconnected = 0,
  Connecting = 1,
  Connected = 2,
  ReconnectPending = 3
};

inline const char* to_str(LinkState s) {
  switch (s) {
    case LinkState::Disconnected:     return "Disconnected";
    case LinkState::Connecting:       return "Connecting";
    case LinkState::Connected:        return "Connected";
    case LinkState::ReconnectPending: return "ReconnectPending";
    default: return "UNKNOWN";
  }
}

// Connection lifecycle without any I/O. At most one reconnect is ever
// pending: lost() only asks for a timer on the transition into
// ReconnectPending.
class LinkStateMachine {
public:
  LinkState state() const { return state_; }
  bool halted() const { return halted_; }

  // Disconnected/ReconnectPending -> Connecting.
  bool begin_connect();
  // Connecting -> Connected.
  bool opened();
  // Connect failure or close. True if the caller must schedule a reconnect.
  bool lost();
  // Shutdown: -> Disconnected and never reconnect again.
  void halt();

private:
  LinkState state_{LinkState::Disconnected};
  bool halted_{false};
};

} // namespace hrstream
