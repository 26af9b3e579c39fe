#include "libpheno/core/logging.hpp"

#include <spdlog/sinks/stdout_sinks.h>

#include <mutex>

namespace pheno::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mtx;
    std::lock_guard<std::mutex> lock(mtx);

    auto lg = spdlog::get(kLoggerName);
    if (!lg) {
        lg = spdlog::stdout_logger_mt(kLoggerName);
    }
    return lg;
}

} // namespace pheno::log
