#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <string>

class Config {
public:
    // 从文件加载
    explicit Config(const std::string& filePath);

    // 从 YAML 文本加载，主要给测试用
    static Config fromString(const std::string& yamlText);

    bool has(const std::string& parentKey, const std::string& key) const;

    // 基本类型读取，缺失或类型错误时抛 std::runtime_error
    int         getInt   (const std::string& parentKey,
                          const std::string& key) const;
    std::string getString(const std::string& parentKey,
                          const std::string& key) const;

    // 带默认值：键不存在时返回 def，存在但类型错误仍然抛异常
    int         getOr(const std::string& parentKey,
                      const std::string& key,
                      int def) const;
    std::string getOr(const std::string& parentKey,
                      const std::string& key,
                      const std::string& def) const;

private:
    explicit Config(YAML::Node root) : root_(std::move(root)) {}

    YAML::Node root_;
};
