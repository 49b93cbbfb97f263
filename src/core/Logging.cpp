#include "core/Logging.hpp"

#include <spdlog/spdlog.h>

namespace pkgstore {

void initLogging(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  // from_str maps anything unknown to off
  if (lvl == spdlog::level::off && level != "off") {
    spdlog::warn("Unknown log level '{}', using info", level);
    lvl = spdlog::level::info;
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(lvl);
}

} // namespace pkgstore
