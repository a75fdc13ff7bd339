#pragma once

#include <exception>
#include <string>
#include <vector>

// 作业体失败时捕获的信息：error 为最外层异常的“类型: 消息”，
// traceback 额外包含上下文和嵌套异常链
struct FailureInfo {
    std::string              error;
    std::string              traceback;
    std::vector<std::string> chain;
};

// context 作为 traceback 首行
FailureInfo captureFailure(std::exception_ptr ep, const std::string& context);

std::string demangle(const char* mangled);
