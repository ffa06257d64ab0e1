#include "link_state.hpp"

namespace hrstream {

bool LinkStateMachine::begin_connect() {
  if (halted_) return false;
  if (state_ != LinkState::Disconnected && state_ != LinkState::ReconnectPending) return false;
  state_ = LinkState::Connecting;
  return true;
}

bool LinkStateMachine::opened() {
  if (halted_ || state_ != LinkState::Connecting) return false;
  state_ = LinkState::Connected;
  return true;
}

bool LinkStateMachine::lost() {
  if (halted_) {
    state_ = LinkState::Disconnected;
    return false;
  }
  if (state_ == LinkState::ReconnectPending) return false;
  state_ = LinkState::ReconnectPending;
  return true;
}

void LinkStateMachine::halt() {
  halted_ = true;
  state_ = LinkState::Disconnected;
}

} // namespace hrstream
