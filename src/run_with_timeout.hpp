#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

// ---------------------------------------------------------------------------
// TimeoutError — raised when a bounded call misses its deadline
// ---------------------------------------------------------------------------
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// run_with_timeout — run fn on a worker thread, wait at most timeout_ms.
//
// The worker is detached so a hung provider never blocks the caller; fn must
// therefore only capture state it co-owns (values or shared_ptr). Exceptions
// thrown by fn are rethrown in the caller. Expiry throws TimeoutError.
// ---------------------------------------------------------------------------
template <typename T>
T run_with_timeout(std::function<T()> fn, int timeout_ms, const std::string& what) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> future = promise->get_future();

    std::thread worker([promise, fn = std::move(fn)]() {
        try {
            if constexpr (std::is_void_v<T>) {
                fn();
                promise->set_value();
            } else {
                promise->set_value(fn());
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    worker.detach();

    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        throw TimeoutError(what + " exceeded " + std::to_string(timeout_ms) + " ms");
    }
    return future.get();
}

// ---------------------------------------------------------------------------
// Deadline — cooperative budget for multi-step synchronous work
// ---------------------------------------------------------------------------
class Deadline {
public:
    explicit Deadline(int budget_ms)
        : budget_ms_(budget_ms),
          expires_at_(std::chrono::steady_clock::now() + std::chrono::milliseconds(budget_ms)) {}

    int remaining_ms() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            expires_at_ - std::chrono::steady_clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    }

    bool expired() const { return std::chrono::steady_clock::now() >= expires_at_; }

    void check(const std::string& step) const {
        if (expired()) {
            throw TimeoutError(step + ": budget of " + std::to_string(budget_ms_) + " ms exhausted");
        }
    }

private:
    int budget_ms_;
    std::chrono::steady_clock::time_point expires_at_;
};
