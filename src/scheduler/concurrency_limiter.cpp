#include "scheduler/concurrency_limiter.hpp"

#include <stdexcept>

ConcurrencyLimiter::ConcurrencyLimiter(PrivateTag, std::size_t capacity)
    : capacity_(capacity) {}

std::shared_ptr<ConcurrencyLimiter> ConcurrencyLimiter::create(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("ConcurrencyLimiter: capacity must be positive");
    }
    return std::make_shared<ConcurrencyLimiter>(PrivateTag{}, capacity);
}

std::optional<ConcurrencyLimiter::Permit> ConcurrencyLimiter::acquire(const CancelToken& token) {
    std::unique_lock lk(mtx_);
    while (inUse_ >= capacity_) {
        if (token.cancelled()) return std::nullopt;
        cv_.wait_for(lk, kCancelPollInterval);
    }
    if (token.cancelled()) return std::nullopt;
    ++inUse_;
    return Permit(shared_from_this());
}

std::optional<ConcurrencyLimiter::Permit> ConcurrencyLimiter::tryAcquire() {
    std::lock_guard lg(mtx_);
    if (inUse_ >= capacity_) return std::nullopt;
    ++inUse_;
    return Permit(shared_from_this());
}

std::size_t ConcurrencyLimiter::inUse() const {
    std::lock_guard lg(mtx_);
    return inUse_;
}

void ConcurrencyLimiter::release() noexcept {
    {
        std::lock_guard lg(mtx_);
        if (inUse_ > 0) --inUse_;
    }
    cv_.notify_one();
}
