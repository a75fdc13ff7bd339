#include "common/config.hpp"

#include <algorithm>

Config::Config(const std::string& filePath)
{
    try {
        root_ = YAML::LoadFile(filePath);
    } catch (const YAML::BadFile& e) {
        spdlog::error("Config: failed to load configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot open file: " + filePath);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: {} is not valid yaml: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot parse file: " + filePath);
    }
    spdlog::info("Config: loaded configuration from {}", filePath);
}

Config Config::fromString(const std::string& yamlText)
{
    try {
        return Config(YAML::Load(yamlText));
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(std::string("Config: cannot parse yaml: ") + e.what());
    }
}

Config& Config::instance(const std::string& path)
{
    // 首次调用时 path 决定加载哪个文件，之后的参数被忽略
    static Config c = [&path] {
        if (path.empty()) {
            throw std::runtime_error("Config path not provided on first call");
        }
        return Config(path);
    }();
    return c;
}

bool Config::has(const std::string& section, const std::string& key) const
{
    const YAML::Node parent = root_[section];
    if (!parent || !parent.IsMap()) return false;
    const YAML::Node node = parent[key];
    return node && !node.IsNull();
}

std::vector<std::string> Config::unknownKeys(const std::string& section,
                                             std::initializer_list<const char*> known) const
{
    std::vector<std::string> unknown;
    const YAML::Node parent = root_[section];
    if (!parent || !parent.IsMap()) return unknown;

    for (const auto& kv : parent) {
        auto key = kv.first.as<std::string>();
        bool ok = std::any_of(known.begin(), known.end(),
                              [&key](const char* k) { return key == k; });
        if (!ok) {
            spdlog::warn("Config: unknown key [{}][{}] ignored", section, key);
            unknown.push_back(std::move(key));
        }
    }
    return unknown;
}

std::runtime_error Config::badValue(const std::string& section,
                                    const std::string& key,
                                    const YAML::Exception& e)
{
    spdlog::error("Config: error decoding [{}][{}]: {}", section, key, e.what());
    return std::runtime_error("Config: missing or bad type for [" + section + "][" + key + "]");
}
