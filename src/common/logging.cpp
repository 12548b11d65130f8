#include "common/logging.hpp"

#include <map>

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& level) {
    const static auto log_level_map = std::map<std::string, spdlog::level::level_enum>{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    auto it = log_level_map.find(level);
    if (it == log_level_map.end()) {
        return std::nullopt;
    }
    return it->second;
}

void initLogging(const Config& config) {
    auto log_level = config.getOr("node_config", "log_level", std::string("info"));
    auto level_enum = parseLogLevel(log_level);
    if (!level_enum) {
        spdlog::warn("Logging: unknown log level '{}', fallback to info", log_level);
        level_enum = spdlog::level::info; // 默认 info 级别
    }
    spdlog::set_level(*level_enum);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}
