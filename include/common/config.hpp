#pragma once
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <functional>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

// YAML 配置，两级键：[段][键]
class Config {
public:
    explicit Config(const std::string& filePath);

    // 测试和命令行缺省配置使用
    static Config fromString(const std::string& yamlText);

    // 进程级配置，首次调用必须给出路径
    static Config& instance(const std::string& path = "");

    bool has(const std::string& section, const std::string& key) const;

    // 段内出现未知键时打 warn，返回未知键列表
    std::vector<std::string> unknownKeys(const std::string& section,
                                         std::initializer_list<const char*> known) const;

    // 缺失或类型不符抛 std::runtime_error
    template <typename T>
    T get(const std::string& section, const std::string& key) const {
        try {
            return root_[section][key].as<T>();
        } catch (const YAML::Exception& e) {
            throw badValue(section, key, e);
        }
    }

    int         getInt   (const std::string& s, const std::string& k) const { return get<int>(s, k); }
    double      getDouble(const std::string& s, const std::string& k) const { return get<double>(s, k); }
    bool        getBool  (const std::string& s, const std::string& k) const { return get<bool>(s, k); }
    std::string getString(const std::string& s, const std::string& k) const { return get<std::string>(s, k); }

    // 缺失时返回默认值，存在但类型不符仍然抛
    template <typename T>
    T getOr(const std::string& section, const std::string& key, T fallback) const {
        return has(section, key) ? get<T>(section, key) : fallback;
    }

    template <typename T>
    std::vector<T> getArray(const std::string& section, const std::string& key) const {
        return get<std::vector<T>>(section, key);
    }

    // 逐个元素自定义解码
    template <typename T>
    std::vector<T> getArray(const std::string& section,
                            const std::string& key,
                            std::function<T(const YAML::Node&)> decoder) const
    {
        try {
            const YAML::Node list = root_[section][key];
            if (!list.IsSequence()) {
                throw YAML::Exception(YAML::Mark::null_mark(), "not a sequence");
            }
            std::vector<T> out;
            out.reserve(list.size());
            for (const auto& node : list) out.push_back(decoder(node));
            return out;
        } catch (const YAML::Exception& e) {
            throw badValue(section, key, e);
        }
    }

private:
    explicit Config(YAML::Node root) : root_(std::move(root)) {}

    static std::runtime_error badValue(const std::string& section,
                                       const std::string& key,
                                       const YAML::Exception& e);

    YAML::Node root_;
};
