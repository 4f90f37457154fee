#ifndef MIRAGE_LOGGING_H
#define MIRAGE_LOGGING_H

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace Mirage {

// Process-wide engine logger ("mirage"), created on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts trace|debug|info|warn|error|critical|off. Unknown names leave the level unchanged
// and return false.
bool set_log_level(const std::string& level_name);

} // namespace Mirage

#endif
