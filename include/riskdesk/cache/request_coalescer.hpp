// include/riskdesk/cache/request_coalescer.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include "riskdesk/core/error.hpp"

namespace riskdesk {

/**
 * @brief Caller-side limits of one request
 *
 * timeout bounds how long the caller waits on a fetch another caller started;
 * unset means the engine default. Setting *cancelled abandons the wait.
 */
struct RequestContext {
    std::optional<std::chrono::milliseconds> timeout;
    std::shared_ptr<std::atomic<bool>> cancelled;

    bool is_cancelled() const {
        return cancelled && cancelled->load(std::memory_order_acquire);
    }

    static RequestContext with_timeout(std::chrono::milliseconds timeout) {
        RequestContext ctx;
        ctx.timeout = timeout;
        return ctx;
    }

    static RequestContext cancellable(std::shared_ptr<std::atomic<bool>> flag) {
        RequestContext ctx;
        ctx.cancelled = std::move(flag);
        return ctx;
    }
};

/**
 * @class RequestCoalescer
 * @brief Single flight execution of identical concurrent requests
 *
 * The first caller for a key starts the work on a worker thread; every
 * caller, the first included, then waits for the shared outcome. A caller
 * that times out or is cancelled leaves, the work carries on for the others.
 * The key is released as soon as the work completes, so a later call runs
 * again. Destruction waits for running work.
 */
template <typename T>
class RequestCoalescer {
public:
    explicit RequestCoalescer(std::chrono::milliseconds default_timeout = std::chrono::seconds(30))
        : default_timeout_(default_timeout) {}

    ~RequestCoalescer() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() { return running_ == 0; });
    }

    RequestCoalescer(const RequestCoalescer&) = delete;
    RequestCoalescer& operator=(const RequestCoalescer&) = delete;

    /**
     * @brief Start or join the work registered under a key
     * @param work Copied, it may outlive this call
     * @return The work's outcome, or TIMEOUT_ERROR / CANCELLED for a caller
     *         that stopped waiting
     */
    Result<T> run(const std::string& key, std::function<Result<T>()> work,
                  const RequestContext& ctx = {}) {
        if (ctx.is_cancelled()) {
            return make_error<T>(ErrorCode::CANCELLED, "Request cancelled: " + key,
                                 "RequestCoalescer");
        }

        std::shared_future<Outcome> shared;
        std::shared_ptr<std::promise<Outcome>> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = in_flight_.find(key);
            if (it != in_flight_.end()) {
                shared = it->second;
                ++joined_;
            } else {
                promise = std::make_shared<std::promise<Outcome>>();
                shared = promise->get_future().share();
                in_flight_.emplace(key, shared);
                ++running_;
            }
        }

        if (promise) {
            start(key, std::move(work), promise);
        }
        return wait(key, shared, ctx);
    }

    /**
     * @brief Keys currently being worked on
     */
    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_.size();
    }

    /**
     * @brief Calls that joined a running request instead of starting one
     */
    size_t joined() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return joined_;
    }

private:
    struct Outcome {
        std::optional<T> value;
        std::shared_ptr<const RiskDeskError> error;
    };

    static constexpr std::chrono::milliseconds POLL_INTERVAL{10};

    static Result<T> to_result(const Outcome& outcome) {
        if (outcome.error) {
            return Result<T>(outcome.error->clone());
        }
        return Result<T>(*outcome.value);
    }

    void start(const std::string& key, std::function<Result<T>()> work,
               const std::shared_ptr<std::promise<Outcome>>& promise) {
        try {
            std::thread([this, key, work = std::move(work), promise]() {
                execute(key, work, *promise);
            }).detach();
        } catch (const std::system_error& e) {
            Outcome outcome;
            outcome.error = std::make_shared<RiskDeskError>(
                ErrorCode::UNKNOWN_ERROR,
                "Could not start shared request: " + std::string(e.what()), "RequestCoalescer");
            finish(key, outcome, *promise);
        }
    }

    void execute(const std::string& key, const std::function<Result<T>()>& work,
                 std::promise<Outcome>& promise) {
        Outcome outcome;
        try {
            auto result = work();
            if (result.is_ok()) {
                outcome.value = result.value();
            } else {
                outcome.error = result.error()->clone();
            }
        } catch (const std::exception& e) {
            outcome.error = std::make_shared<RiskDeskError>(
                ErrorCode::UNKNOWN_ERROR, "Shared request failed: " + std::string(e.what()),
                "RequestCoalescer");
        }
        finish(key, outcome, promise);
    }

    void finish(const std::string& key, const Outcome& outcome, std::promise<Outcome>& promise) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_value(outcome);

        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
        idle_.notify_all();
    }

    Result<T> wait(const std::string& key, const std::shared_future<Outcome>& shared,
                   const RequestContext& ctx) {
        auto timeout = ctx.timeout.value_or(default_timeout_);
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            if (ctx.is_cancelled()) {
                return make_error<T>(ErrorCode::CANCELLED, "Request cancelled: " + key,
                                     "RequestCoalescer");
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return make_error<T>(ErrorCode::TIMEOUT_ERROR,
                                     "Timed out waiting for shared request: " + key,
                                     "RequestCoalescer");
            }
            auto slice = std::min<std::chrono::steady_clock::duration>(POLL_INTERVAL,
                                                                       deadline - now);
            if (shared.wait_for(slice) == std::future_status::ready) {
                return to_result(shared.get());
            }
        }
    }

    std::chrono::milliseconds default_timeout_;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::unordered_map<std::string, std::shared_future<Outcome>> in_flight_;
    size_t joined_{0};
    size_t running_{0};
};

}  // namespace riskdesk
