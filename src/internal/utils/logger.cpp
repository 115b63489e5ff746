// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Logger Implementation                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/utils/logger.hpp"
#include "chartdb/config.hpp"

#include <spdlog/spdlog.h>

#include <string_view>

namespace chartdb::log {

namespace {

enum class Level { Debug, Info, Warn, Error };

// Messages go to whatever spdlog default logger the host installed.
void log_impl(Level level, std::string_view message) {
#if CHARTDB_ENABLE_LOGGING
    auto logger = spdlog::default_logger();
    if (!logger) {
        return;
    }

    switch (level) {
        case Level::Debug:
            logger->debug(message);
            break;
        case Level::Info:
            logger->info(message);
            break;
        case Level::Warn:
            logger->warn(message);
            break;
        case Level::Error:
            logger->error(message);
            break;
    }
#else
    (void)level;
    (void)message;
#endif
}

} // anonymous namespace

void debug(std::string_view message) {
    log_impl(Level::Debug, message);
}

void info(std::string_view message) {
    log_impl(Level::Info, message);
}

void warn(std::string_view message) {
    log_impl(Level::Warn, message);
}

void error(std::string_view message) {
    log_impl(Level::Error, message);
}

} // namespace chartdb::log
