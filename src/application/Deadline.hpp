/**
 * @file Deadline.hpp
 * @brief Runs a blocking external call with an upper bound on the caller's wait.
 */

#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace schedsync::application {

/**
 * @brief Invokes @p fn and waits at most @p timeout for its result.
 *
 * The call runs on a detached thread so a stuck provider never pins the
 * caller; whatever the callable captures (permits, shared collaborators) stays
 * alive until the call really returns. A zero timeout runs inline.
 *
 * @throws TimeoutError(what + " timed out") when the deadline passes.
 * Exceptions thrown by @p fn propagate unchanged.
 */
template <typename TimeoutError, typename F>
auto RunWithDeadline(F&& fn, std::chrono::milliseconds timeout, const std::string& what) -> decltype(fn()) {
    using Result = decltype(fn());
    if (timeout.count() <= 0) {
        return fn();
    }

    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();

    std::thread([promise, call = std::forward<F>(fn)]() mutable {
        try {
            promise->set_value(call());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        throw TimeoutError(what + " timed out after " + std::to_string(timeout.count()) + " ms");
    }
    return future.get();
}

} // namespace schedsync::application
