#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace mural {

// One framed request/response over a fresh TCP connection. The whole
// exchange (resolve, connect, write, read) shares a single deadline.
Result tcp_exchange(std::string_view address, std::string_view request,
                    std::chrono::milliseconds timeout, std::string& out_response);

}  // namespace mural
