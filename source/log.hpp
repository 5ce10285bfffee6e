#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace sigsys {

// Shared library logger named "sigsys". Created on first use (stderr, level warn)
// unless the application already registered a logger under that name.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace sigsys
