#pragma once

#include <memory>
#include <string_view>

#include <spdlog/logger.h>

namespace mural::log {

// Named `mural.<node_id>`; created on first use and shared afterwards.
std::shared_ptr<spdlog::logger> node_logger(std::string_view node_id);

// Accepts trace, debug, info, warn, error, critical, off. Returns false on
// an unknown name and leaves the level unchanged.
bool set_level(std::string_view level_name);

}  // namespace mural::log
