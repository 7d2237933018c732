#pragma once

#include <memory>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace arb {

using Logger = std::shared_ptr<spdlog::logger>;

/**
 * Provide the logger for a subsystem, creating it on first use.
 * @param tag - subsystem name ("resolver", "audit", "tournament", ...)
 */
Logger createLogger(const std::string& tag);

/**
 * Apply the global level from ARB_LOG_LEVEL (trace, debug, info, warn, err,
 * off). Unknown or missing values fall back to info.
 */
void configureLogging();

} // namespace arb
