#pragma once

#include <chrono>
#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

// ULID 格式的作业 ID：48 位毫秒时间戳 + 80 位随机数，Crockford Base32 编码，共 26 个字符
// 同一进程内生成的 ID 严格递增，字符串序即生成序
class JobId {
public:
    static constexpr std::size_t kLength = 26;

    JobId() = default;

    // 生成新 ID（线程安全）
    static JobId generate();

    // 解析外部传入的字符串，大小写不敏感；非法时返回 nullopt
    static std::optional<JobId> parse(const std::string& text);

    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }

    // 解码时间戳部分
    std::chrono::system_clock::time_point timestamp() const;

    friend bool operator==(const JobId&, const JobId&) = default;
    friend auto operator<=>(const JobId&, const JobId&) = default;

private:
    explicit JobId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const JobId& id) {
    return os << id.str();
}

template <>
struct std::hash<JobId> {
    std::size_t operator()(const JobId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};
