#include "scheduler/cancel_token.hpp"

#include <thread>

namespace this_job {

namespace {
thread_local const CancelToken* g_current = nullptr;
} // namespace

const CancelToken* token() noexcept {
    return g_current;
}

bool cancelRequested() noexcept {
    return g_current != nullptr && g_current->cancelled();
}

void checkCancel() {
    if (g_current) g_current->throwIfCancelled();
}

void sleepFor(std::chrono::milliseconds d) {
    if (g_current) {
        g_current->sleepFor(d);
    } else {
        std::this_thread::sleep_for(d);
    }
}

ScopedToken::ScopedToken(const CancelToken& token) noexcept
    : previous_(g_current) {
    g_current = &token;
}

ScopedToken::~ScopedToken() {
    g_current = previous_;
}

} // namespace this_job
