#include "logging.hpp"

#include "config.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace arb {

namespace {

std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

spdlog::level::level_enum parseLevel(const std::string& value) {
    if (value == "trace") {
        return spdlog::level::trace;
    }
    if (value == "debug") {
        return spdlog::level::debug;
    }
    if (value == "warn") {
        return spdlog::level::warn;
    }
    if (value == "err" || value == "error") {
        return spdlog::level::err;
    }
    if (value == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

Logger createLogger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(loggerMutex());
    if (auto existing = spdlog::get(tag)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(tag);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

void configureLogging() {
    auto level = parseLevel(readEnv("ARB_LOG_LEVEL").value_or("info"));
    spdlog::set_level(level);
}

} // namespace arb
