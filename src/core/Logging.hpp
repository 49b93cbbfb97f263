#pragma once
#include <string>

namespace pkgstore {

// Sets the global spdlog level ("trace".."critical", "off") and pattern.
// Unknown names fall back to info.
void initLogging(const std::string& level);

} // namespace pkgstore
