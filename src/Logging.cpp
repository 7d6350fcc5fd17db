#include "gitpass/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gitpass {

std::shared_ptr<spdlog::logger> logger() {
    auto log = spdlog::get(LOGGER_NAME);
    if (!log) {
        log = spdlog::stderr_color_mt(LOGGER_NAME);
        log->set_pattern("%^%l%$:%n: %v");
        log->set_level(spdlog::level::warn);
    }
    return log;
}

void setup_logging(bool debug) {
    logger()->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
}

} // namespace gitpass
