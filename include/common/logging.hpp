#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#include <optional>
#include <string>
#include <spdlog/spdlog.h>

#include "common/config.hpp"

// 日志级别字符串 -> spdlog 枚举，未知字符串返回 nullopt
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& level);

// 按 node_config.log_level 初始化默认 logger 的级别和格式
void initLogging(const Config& config);
