#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace Mirage {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, []() {
        instance = spdlog::get("mirage");
        if (!instance) {
            instance = spdlog::stderr_color_mt("mirage");
            instance->set_level(spdlog::level::info);
            instance->flush_on(spdlog::level::warn);
        }
    });
    return instance;
}

bool set_log_level(const std::string& level_name) {
    spdlog::level::level_enum level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && level_name != "off") {
        logger()->warn("unknown log level '{}'", level_name);
        return false;
    }
    logger()->set_level(level);
    return true;
}

} // namespace Mirage
