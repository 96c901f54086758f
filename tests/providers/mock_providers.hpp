// mock_providers.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "riskdesk/providers/http_client.hpp"
#include "riskdesk/providers/quote_provider.hpp"

namespace riskdesk {
namespace testing {

/**
 * @brief Scripted QuoteProvider with call counters
 *
 * Serves bars registered with set_history. A configured failure applies to
 * every call until cleared. An optional delay widens race windows in
 * concurrency tests.
 */
class MockQuoteProvider : public QuoteProvider {
public:
    explicit MockQuoteProvider(std::string name = "mock") : name_(std::move(name)) {}

    std::string name() const override {
        return name_;
    }

    Result<std::vector<PriceBar>> fetch_history(const std::string& symbol,
                                                const DateRange& range) override {
        history_calls_++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_ranges_.push_back(range);
        }
        pause();

        std::lock_guard<std::mutex> lock(mutex_);
        if (throw_on_call_) {
            throw std::runtime_error("provider exploded");
        }
        if (failure_) {
            return make_status_error<std::vector<PriceBar>>(*failure_, "Scripted failure", name_,
                                                            retry_after_);
        }
        auto it = history_.find(symbol);
        if (it == history_.end()) {
            return make_error<std::vector<PriceBar>>(ErrorCode::NOT_FOUND,
                                                     "Unknown symbol " + symbol, name_);
        }
        std::vector<PriceBar> out;
        for (const auto& bar : it->second) {
            if (range.contains(bar.date)) {
                out.push_back(bar);
            }
        }
        return Result<std::vector<PriceBar>>(std::move(out));
    }

    Result<PriceBar> fetch_quote(const std::string& symbol) override {
        quote_calls_++;
        pause();

        std::lock_guard<std::mutex> lock(mutex_);
        if (throw_on_call_) {
            throw std::runtime_error("provider exploded");
        }
        if (failure_) {
            return make_status_error<PriceBar>(*failure_, "Scripted failure", name_,
                                               retry_after_);
        }
        auto it = quotes_.find(symbol);
        if (it == quotes_.end()) {
            return make_error<PriceBar>(ErrorCode::NOT_FOUND, "Unknown symbol " + symbol, name_);
        }
        return Result<PriceBar>(it->second);
    }

    void set_history(const std::string& symbol, std::vector<PriceBar> bars) {
        std::lock_guard<std::mutex> lock(mutex_);
        history_[symbol] = std::move(bars);
    }

    void set_quote(const std::string& symbol, const PriceBar& quote) {
        std::lock_guard<std::mutex> lock(mutex_);
        quotes_[symbol] = quote;
    }

    void fail_with(ErrorCode code, std::optional<long> retry_after = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = code;
        retry_after_ = retry_after;
    }

    void clear_failure() {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_.reset();
        retry_after_.reset();
    }

    void set_throw(bool value) {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_on_call_ = value;
    }

    void set_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    size_t history_calls() const {
        return history_calls_.load();
    }

    size_t quote_calls() const {
        return quote_calls_.load();
    }

    std::vector<DateRange> requested_ranges() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_ranges_;
    }

    void reset_counters() {
        history_calls_ = 0;
        quote_calls_ = 0;
        std::lock_guard<std::mutex> lock(mutex_);
        requested_ranges_.clear();
    }

private:
    void pause() {
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delay = delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }

    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<PriceBar>> history_;
    std::map<std::string, PriceBar> quotes_;
    std::optional<ErrorCode> failure_;
    std::optional<long> retry_after_;
    bool throw_on_call_{false};
    std::chrono::milliseconds delay_{0};
    std::vector<DateRange> requested_ranges_;
    std::atomic<size_t> history_calls_{0};
    std::atomic<size_t> quote_calls_{0};
};

/**
 * @brief HttpTransport replaying canned responses in order
 *
 * When the queue is empty the last response is repeated.
 */
class FakeHttpTransport : public HttpTransport {
public:
    Result<HttpResponse> get(const std::string& url, const std::vector<std::string>& headers,
                             std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        urls_.push_back(url);
        last_timeout_ = timeout;
        (void)headers;

        if (!queue_.empty()) {
            last_ = queue_.front();
            queue_.pop_front();
        }
        if (!last_) {
            return make_error<HttpResponse>(ErrorCode::TRANSIENT_ERROR, "No scripted response",
                                            "FakeHttpTransport");
        }
        if (last_->network_failure) {
            return make_error<HttpResponse>(ErrorCode::TRANSIENT_ERROR, "Connection refused",
                                            "FakeHttpTransport");
        }
        return Result<HttpResponse>(last_->response);
    }

    void respond(long status, std::string body, std::optional<long> retry_after = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        Scripted scripted;
        scripted.response.status = status;
        scripted.response.body = std::move(body);
        scripted.response.retry_after_seconds = retry_after;
        queue_.push_back(std::move(scripted));
    }

    void fail_network() {
        std::lock_guard<std::mutex> lock(mutex_);
        Scripted scripted;
        scripted.network_failure = true;
        queue_.push_back(std::move(scripted));
    }

    std::vector<std::string> urls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_.size();
    }

private:
    struct Scripted {
        HttpResponse response;
        bool network_failure{false};
    };

    mutable std::mutex mutex_;
    std::deque<Scripted> queue_;
    std::optional<Scripted> last_;
    std::vector<std::string> urls_;
    std::chrono::milliseconds last_timeout_{0};
};

}  // namespace testing
}  // namespace riskdesk
