#pragma once
#include <string>

namespace cfgval::logging {

// Installs the console logger as spdlog default and sets the level.
// level: trace, debug, info, warning, error or critical.
void init_spdlog(const std::string &level);

} // namespace cfgval::logging
