#include "core/node/node_state.hpp"

namespace mural {

std::string connectivity_to_string(Connectivity connectivity) {
  return connectivity == Connectivity::Offline ? "offline" : "online";
}

}  // namespace mural
