#include "scheduler/job_id.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <mutex>
#include <random>

namespace {

constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// 16 字节 = 6 字节时间戳（大端） + 10 字节随机数
using Bytes = std::array<std::uint8_t, 16>;

int decodeChar(char c) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (int i = 0; i < 32; ++i) {
        if (kAlphabet[i] == c) return i;
    }
    return -1;
}

// 130 位编码空间，最高 2 位补零
std::string encode(const Bytes& bytes) {
    std::string out(JobId::kLength, '0');
    for (std::size_t i = 0; i < JobId::kLength; ++i) {
        int v = 0;
        for (int k = 0; k < 5; ++k) {
            int bit = static_cast<int>(i) * 5 + k - 2;
            int b = 0;
            if (bit >= 0) b = (bytes[bit / 8] >> (7 - bit % 8)) & 1;
            v = (v << 1) | b;
        }
        out[i] = kAlphabet[v];
    }
    return out;
}

std::uint64_t timestampOf(const Bytes& bytes) {
    std::uint64_t ms = 0;
    for (int i = 0; i < 6; ++i) ms = (ms << 8) | bytes[i];
    return ms;
}

class Generator {
public:
    Generator() : rng_(std::random_device{}()) {}

    Bytes next() {
        std::lock_guard lg(mtx_);
        auto now = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());

        // 同一毫秒内（或时钟回拨）沿用上次时间戳并递增随机部分，保证单调
        if (now <= lastMs_ && started_) {
            if (!increment()) {
                ++lastMs_;
                fillRandom();
            }
        } else {
            lastMs_ = now;
            fillRandom();
        }
        started_ = true;

        Bytes out{};
        for (int i = 0; i < 6; ++i) {
            out[i] = static_cast<std::uint8_t>(lastMs_ >> (8 * (5 - i)));
        }
        for (int i = 0; i < 10; ++i) out[6 + i] = random_[i];
        return out;
    }

private:
    void fillRandom() {
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& b : random_) b = static_cast<std::uint8_t>(dist(rng_));
    }

    // 80 位大端自增，溢出返回 false
    bool increment() {
        for (int i = 9; i >= 0; --i) {
            if (++random_[i] != 0) return true;
        }
        return false;
    }

    std::mutex mtx_;
    std::mt19937_64 rng_;
    std::array<std::uint8_t, 10> random_{};
    std::uint64_t lastMs_ = 0;
    bool started_ = false;
};

Generator& generator() {
    static Generator gen;
    return gen;
}

} // namespace

JobId JobId::generate() {
    return JobId(encode(generator().next()));
}

std::optional<JobId> JobId::parse(const std::string& text) {
    if (text.size() != kLength) return std::nullopt;
    std::string normalized(kLength, '0');
    for (std::size_t i = 0; i < kLength; ++i) {
        int v = decodeChar(text[i]);
        if (v < 0) return std::nullopt;
        // 首字符只能承载 3 位有效数据
        if (i == 0 && v > 7) return std::nullopt;
        normalized[i] = kAlphabet[v];
    }
    return JobId(std::move(normalized));
}

std::chrono::system_clock::time_point JobId::timestamp() const {
    if (value_.size() != kLength) return {};
    Bytes bytes{};
    for (std::size_t i = 0; i < kLength; ++i) {
        int v = decodeChar(value_[i]);
        for (int k = 0; k < 5; ++k) {
            int bit = static_cast<int>(i) * 5 + k - 2;
            if (bit < 0) continue;
            if ((v >> (4 - k)) & 1) {
                bytes[bit / 8] |= static_cast<std::uint8_t>(1u << (7 - bit % 8));
            }
        }
    }
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(timestampOf(bytes)));
}
