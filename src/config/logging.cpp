#include "ironq/config.hpp"
#include <spdlog/spdlog.h>

namespace ironq {

void configure_logging(const std::string& level) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("[ironq] Unknown log level \"{}\", using info", level);
        return;
    }
    spdlog::set_level(parsed);
}

} // namespace ironq
