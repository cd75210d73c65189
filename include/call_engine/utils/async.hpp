#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>

namespace call_engine::utils {

void run_async(std::function<void()> task);

// Runs task on a detached worker and waits at most timeout for it. An empty
// optional means the deadline passed; the late result is dropped. Exceptions
// thrown by task are rethrown to the caller.
template <typename T>
std::optional<T> call_with_deadline(std::function<T()> task,
                                    std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();
    run_async([task = std::move(task), promise]() {
        try {
            promise->set_value(task());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

}
