#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

#include "scheduler/cancel_token.hpp"

// 计数信号量，限制同时运行的作业体数量。
// 通过 shared_ptr 持有；调整并发上限时换一个新实例，旧许可仍归还给旧实例
class ConcurrencyLimiter : public std::enable_shared_from_this<ConcurrencyLimiter> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // 等待许可期间检查取消的间隔
    static constexpr auto kCancelPollInterval = std::chrono::milliseconds{10};

    // RAII 许可，析构时归还，恰好一次；默认构造的空许可代表“不限流”
    class Permit {
    public:
        Permit() = default;
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : owner_(std::move(other.owner_)) {}
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::move(other.owner_);
            }
            return *this;
        }

        Permit(const Permit&)            = delete;
        Permit& operator=(const Permit&) = delete;

        bool held() const noexcept { return owner_ != nullptr; }

        void release() noexcept {
            if (owner_) {
                owner_->release();
                owner_.reset();
            }
        }

    private:
        friend class ConcurrencyLimiter;
        explicit Permit(std::shared_ptr<ConcurrencyLimiter> owner) : owner_(std::move(owner)) {}
        std::shared_ptr<ConcurrencyLimiter> owner_;
    };

    static std::shared_ptr<ConcurrencyLimiter> create(std::size_t capacity);

    // 只能经 create() 构造
    ConcurrencyLimiter(PrivateTag, std::size_t capacity);

    // 阻塞直到拿到许可；令牌被取消则返回 nullopt
    std::optional<Permit> acquire(const CancelToken& token);
    std::optional<Permit> tryAcquire();

    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t inUse() const;

private:
    void release() noexcept;

    const std::size_t       capacity_;
    std::size_t             inUse_ = 0;
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
};
