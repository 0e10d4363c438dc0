#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ramm {

// Sets the global level and pattern for every component logger.
// Throws ConfigError for an unknown level name.
void init_logging(const std::string& level);

// Named logger ("engine", "router", "orders", "session", "backtest"),
// created on first use. Safe to call from any thread.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

} // namespace ramm
