#pragma once

#include <string>
#include <spdlog/spdlog.h>

#include "common/config.hpp"

// 日志名到级别的映射，未知名称返回 info
spdlog::level::level_enum parseLogLevel(const std::string& name);

// 按 log_config 初始化全局日志级别和格式
void initLogging(const Config& config);
