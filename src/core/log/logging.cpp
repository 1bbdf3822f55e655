#include "core/log/logging.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "core/util/canonical.hpp"

namespace mural::log {
namespace {

std::mutex& registry_mutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

std::shared_ptr<spdlog::logger> node_logger(std::string_view node_id) {
  const std::string name = "mural." + (node_id.empty() ? std::string{"local"} : std::string{node_id});

  std::lock_guard lock(registry_mutex());
  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  auto logger = spdlog::stdout_color_mt(name);
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
  return logger;
}

bool set_level(std::string_view level_name) {
  const std::string normalized = util::lowercase_copy(util::trim_copy(level_name));
  const auto level = spdlog::level::from_str(normalized);
  if (level == spdlog::level::off && normalized != "off") {
    return false;
  }
  spdlog::set_level(level);
  return true;
}

}  // namespace mural::log
