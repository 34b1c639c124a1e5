#ifndef UNICSV_LOG_H
#define UNICSV_LOG_H

#include <spdlog/spdlog.h>

#include <memory>

namespace unicsv {

/// Library logger named "unicsv", writing to stderr. Defaults to warn level.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace unicsv

#endif  // UNICSV_LOG_H
