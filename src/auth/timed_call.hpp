#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <fmt/format.h>

// Run fn on a worker thread and wait at most `timeout` for it. On timeout
// the worker is abandoned (detached) and a Timeout error is returned; it
// finishes or stays blocked on its own without holding up the caller.
// Anything fn needs must be owned by the closure, not borrowed.
template <typename T>
Result<T> run_with_timeout(std::function<Result<T>()> fn,
                           std::chrono::milliseconds timeout,
                           const std::string& what) {
    auto promise = std::make_shared<std::promise<Result<T>>>();
    std::future<Result<T>> future = promise->get_future();

    std::thread worker([promise, fn = std::move(fn)]() {
        try {
            promise->set_value(fn());
        } catch (const std::exception& e) {
            promise->set_value(Result<T>::Err(ErrorKind::Storage, e.what()));
        }
    });
    worker.detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        return Result<T>::Err(ErrorKind::Timeout,
            fmt::format("{} timed out after {}ms", what, timeout.count()));
    }
    return future.get();
}
