#include "common/config.hpp"
#include <stdexcept>

Config::Config(const std::string& filePath)
{
    try {
        root_ = YAML::LoadFile(filePath);
        spdlog::info("Config: loaded configuration from {}", filePath);
    } catch (const YAML::BadFile& e) {
        spdlog::error("Config: failed to load configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot open file: " + filePath);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: failed to parse configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot parse file: " + filePath);
    }
}

Config Config::fromString(const std::string& yamlText)
{
    try {
        return Config(YAML::Load(yamlText));
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: failed to parse configuration text: {}", e.what());
        throw std::runtime_error(std::string("Config: cannot parse text: ") + e.what());
    }
}

bool Config::has(const std::string& parentKey,
                 const std::string& key) const
{
    // 用 const 节点查询，避免 operator[] 往树里插入空节点
    const YAML::Node& root = root_;
    if (!root.IsMap()) return false;
    const YAML::Node parent = root[parentKey];
    if (!parent || !parent.IsMap()) return false;
    return static_cast<bool>(parent[key]);
}

int Config::getInt(const std::string& parentKey,
                   const std::string& key) const
{
    try {
        return root_[parentKey][key].as<int>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding int [{}][{}]: {}", parentKey, key, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

std::string Config::getString(const std::string& parentKey,
                              const std::string& key) const
{
    try {
        return root_[parentKey][key].as<std::string>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding string [{}][{}]: {}", parentKey, key, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

int Config::getOr(const std::string& parentKey,
                  const std::string& key,
                  int def) const
{
    if (!has(parentKey, key)) return def;
    return getInt(parentKey, key);
}

std::string Config::getOr(const std::string& parentKey,
                          const std::string& key,
                          const std::string& def) const
{
    if (!has(parentKey, key)) return def;
    return getString(parentKey, key);
}
