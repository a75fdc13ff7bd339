#pragma once

#include <any>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "scheduler/cancel_token.hpp"
#include "scheduler/scheduler_error.hpp"

// 作业返回值统一用 std::any 承载，void 作业为空值
using JobResult = std::any;

// 提交时归一化后的执行体
using JobThunk = std::function<JobResult(const CancelToken&)>;

enum class TargetKind {
    Callable,        // 普通同步函数，在线程池中执行
    AsyncCallable,   // 返回 std::future / std::shared_future 的函数，在 worker 上等待其结果
    Deferred         // 已经构造好的 future（例如 std::async(std::launch::deferred, ...)）
};

const char* to_string(TargetKind kind);

struct JobTarget {
    TargetKind kind{TargetKind::Callable};
    JobThunk   thunk;
};

namespace detail {

template <typename T>
struct is_future : std::false_type {};
template <typename R>
struct is_future<std::future<R>> : std::true_type {};
template <typename R>
struct is_future<std::shared_future<R>> : std::true_type {};

template <typename T>
inline constexpr bool is_future_v = is_future<std::decay_t<T>>::value;

// 第一个参数接受 CancelToken 的函数会拿到作业令牌
template <typename F, typename... Args>
inline constexpr bool wants_token_v = std::is_invocable_v<F&, const CancelToken&, Args&...>;

template <typename F, typename... Args>
struct bound_result {
    using type = std::conditional_t<wants_token_v<F, Args...>,
                                    std::invoke_result<F&, const CancelToken&, Args&...>,
                                    std::invoke_result<F&, Args&...>>;
};

template <typename F, typename... Args>
using bound_result_t = typename bound_result<F, Args...>::type::type;

template <typename Fut>
JobResult awaitFuture(Fut& fut) {
    using R = decltype(fut.get());
    if constexpr (std::is_void_v<R>) {
        fut.get();
        return {};
    } else {
        return JobResult(std::decay_t<R>(fut.get()));
    }
}

template <typename R>
JobResult toResult(R&& value) {
    if constexpr (is_future_v<R>) {
        auto fut = std::forward<R>(value);
        return awaitFuture(fut);
    } else {
        return JobResult(std::forward<R>(value));
    }
}

template <typename F, typename... Args>
JobResult invokeBound(F& fn, const CancelToken& token, Args&... args) {
    if constexpr (wants_token_v<F, Args...>) {
        if constexpr (std::is_void_v<bound_result_t<F, Args...>>) {
            std::invoke(fn, token, args...);
            return {};
        } else {
            return toResult(std::invoke(fn, token, args...));
        }
    } else {
        if constexpr (std::is_void_v<bound_result_t<F, Args...>>) {
            std::invoke(fn, args...);
            return {};
        } else {
            return toResult(std::invoke(fn, args...));
        }
    }
}

} // namespace detail

// 把三种形态的作业目标归一化为 JobTarget。
// deferred future 带参数属于误用，在提交时同步抛出 InvalidArgument
template <typename Target, typename... Args>
JobTarget makeJobTarget(Target&& target, Args&&... args) {
    using T = std::decay_t<Target>;

    if constexpr (detail::is_future_v<T>) {
        if constexpr (sizeof...(Args) > 0) {
            throw SchedulerError(SchedulerErrc::InvalidArgument,
                                 "arguments are not supported when the target is a deferred computation");
        } else {
            // std::function 要求可拷贝，future 放进 shared_ptr
            auto fut = std::make_shared<T>(std::forward<Target>(target));
            return JobTarget{TargetKind::Deferred,
                             [fut](const CancelToken&) { return detail::awaitFuture(*fut); }};
        }
    } else {
        static_assert(std::is_invocable_v<T&, std::decay_t<Args>&...>
                          || std::is_invocable_v<T&, const CancelToken&, std::decay_t<Args>&...>,
                      "job target must be callable with the bound arguments");

        using R = detail::bound_result_t<T, std::decay_t<Args>...>;
        constexpr auto kind = detail::is_future_v<R> ? TargetKind::AsyncCallable : TargetKind::Callable;

        auto bound = std::make_shared<std::tuple<T, std::decay_t<Args>...>>(
            std::forward<Target>(target), std::forward<Args>(args)...);
        return JobTarget{kind, [bound](const CancelToken& token) {
            return std::apply(
                [&token](auto& fn, auto&... a) { return detail::invokeBound(fn, token, a...); },
                *bound);
        }};
    }
}
