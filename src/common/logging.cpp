#include "common/logging.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace {
const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
} // namespace

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    const static auto log_level_map = std::map<std::string, spdlog::level::level_enum>{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = log_level_map.find(lower);
    if (it == log_level_map.end()) {
        return spdlog::level::info; // 默认 info 级别
    }
    return it->second;
}

void initLogging(const Config& config) {
    config.unknownKeys("log_config", {"log_level", "pattern"});
    auto log_level = config.getOr<std::string>("log_config", "log_level", "info");
    auto pattern   = config.getOr<std::string>("log_config", "pattern", kDefaultPattern);

    spdlog::set_level(parseLogLevel(log_level));
    spdlog::set_pattern(pattern);
    spdlog::debug("Logging: level={} pattern={}", log_level, pattern);
}
