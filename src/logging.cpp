#include "common/logging.hpp"
#include "config/engine_config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace ramm {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

std::mutex& registry_mutex() {
    static std::mutex m;
    return m;
}

} // anonymous namespace

void init_logging(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        throw ConfigError("unknown log level '" + level + "'");
    }
    spdlog::set_pattern(kPattern);
    spdlog::set_level(lvl);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(name);
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::get_level());
    return logger;
}

} // namespace ramm
