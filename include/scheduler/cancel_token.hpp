#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// 作业观察到取消时抛出。
// 不继承 std::exception，作业体里的 catch (const std::exception&) 不会把它吞掉
struct JobCanceled {};

// 协作式取消令牌，拷贝共享同一状态
class CancelToken {
public:
    CancelToken() : state_(std::make_shared<State>()) {}

    bool cancelled() const noexcept {
        std::lock_guard lg(state_->mtx);
        return state_->cancelled;
    }

    // 幂等，返回是否是第一次请求
    bool requestCancel() const noexcept {
        {
            std::lock_guard lg(state_->mtx);
            if (state_->cancelled) return false;
            state_->cancelled = true;
        }
        state_->cv.notify_all();
        return true;
    }

    void throwIfCancelled() const {
        if (cancelled()) throw JobCanceled{};
    }

    // 取消时提前醒来并抛 JobCanceled
    template <typename Rep, typename Period>
    void sleepFor(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock lk(state_->mtx);
        if (state_->cv.wait_for(lk, d, [this] { return state_->cancelled; })) {
            throw JobCanceled{};
        }
    }

    // 等到被取消或超时，返回是否已取消；不抛异常
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock lk(state_->mtx);
        return state_->cv.wait_for(lk, d, [this] { return state_->cancelled; });
    }

private:
    struct State {
        mutable std::mutex      mtx;
        std::condition_variable cv;
        bool                    cancelled = false;
    };
    std::shared_ptr<State> state_;
};

// 作业体内部可用的线程局部辅助函数，只在 worker 执行作业期间有效
namespace this_job {

// 当前线程正在执行的作业令牌，不在作业中时为 nullptr
const CancelToken* token() noexcept;

bool cancelRequested() noexcept;
void checkCancel();
void sleepFor(std::chrono::milliseconds d);

// worker 执行作业时设置线程局部令牌，离开作用域恢复
class ScopedToken {
public:
    explicit ScopedToken(const CancelToken& token) noexcept;
    ~ScopedToken();

    ScopedToken(const ScopedToken&)            = delete;
    ScopedToken& operator=(const ScopedToken&) = delete;

private:
    const CancelToken* previous_;
};

} // namespace this_job
