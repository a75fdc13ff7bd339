#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// 调度器自身的错误分类，作业体抛出的异常只会以 JobFailure 的形式重新暴露
enum class SchedulerErrc : std::uint8_t {
    NotFound,           // 未知 ID
    InvalidArgument,    // deferred 计算附带了参数 / 非法 ID
    AlreadyScheduled,   // ID 冲突
    NotFinished,        // 作业尚未完成就读取结果
    Timeout,            // wait 超时
    JobFailure          // 作业体自身失败
};

const char* to_string(SchedulerErrc code);

class SchedulerError : public std::runtime_error {
public:
    SchedulerError(SchedulerErrc code, const std::string& message);

    SchedulerErrc code() const noexcept { return code_; }

private:
    SchedulerErrc code_;
};

// getResult 作用于 failed 作业时抛出，携带捕获到的错误信息
class JobFailureError : public SchedulerError {
public:
    JobFailureError(std::string error, std::string traceback);

    const std::string& error() const noexcept { return error_; }
    const std::string& traceback() const noexcept { return traceback_; }

private:
    std::string error_;
    std::string traceback_;
};
