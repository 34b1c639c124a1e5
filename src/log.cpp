#include "unicsv/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace unicsv {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto log = std::make_shared<spdlog::logger>("unicsv", sink);
        log->set_level(spdlog::level::warn);
        log->set_pattern("[%n] [%l] %v");
        return log;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace unicsv
