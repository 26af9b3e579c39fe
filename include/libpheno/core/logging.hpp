#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace pheno::log {

inline constexpr const char* kLoggerName = "libpheno";

// Library logger. Uses a logger registered under "libpheno" by the host
// application if there is one, otherwise creates a stdout logger.
std::shared_ptr<spdlog::logger> logger();

} // namespace pheno::log
