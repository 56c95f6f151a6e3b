#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <fmt/format.h>

namespace mds::concurrency {

// Runs fn on its own detached thread and waits at most `limit` for it; a
// non-positive limit waits forever. On expiry throws E and abandons the call,
// so fn must own everything it touches.
template <typename E, typename Fn>
std::invoke_result_t<Fn> withDeadline(const std::chrono::milliseconds limit, const std::string& what, Fn&& fn) {
    using R = std::invoke_result_t<Fn>;
    if (limit.count() <= 0) return fn();

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto result = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (result.wait_for(limit) == std::future_status::timeout)
        throw E(fmt::format("{} timed out after {}ms", what, limit.count()));

    return result.get();
}

}
