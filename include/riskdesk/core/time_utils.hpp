#pragma once

#include <time.h>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include "riskdesk/core/types.hpp"

namespace riskdesk {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Truncate a timestamp to 00:00:00 UTC of its day
 */
inline Timestamp floor_to_day(Timestamp ts) {
    return std::chrono::floor<Days>(ts);
}

inline Timestamp next_day(Timestamp day) {
    return day + Days(1);
}

inline Timestamp previous_day(Timestamp day) {
    return day - Days(1);
}

/**
 * @brief Build a UTC day from calendar fields
 * Uses the days-from-civil algorithm so no timezone state is touched
 */
inline Timestamp make_date(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const int64_t days = static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
    return Timestamp(Days(days));
}

/**
 * @brief Parse YYYY-MM-DD into a UTC day
 * @return Parsed day, or nullopt if the text is not a valid date
 */
inline std::optional<Timestamp> parse_date(const std::string& text) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1) {
        return std::nullopt;
    }
    const int year = tm.tm_year + 1900;
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int last_day = days_in_month[tm.tm_mon] + (tm.tm_mon == 1 && leap ? 1 : 0);
    if (tm.tm_mday > last_day) {
        return std::nullopt;
    }
    return make_date(year, static_cast<unsigned>(tm.tm_mon + 1),
                     static_cast<unsigned>(tm.tm_mday));
}

/**
 * @brief Format a timestamp as YYYY-MM-DD (UTC)
 */
inline std::string format_date(Timestamp ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info;
    safe_gmtime(&time_t, &time_info);
    std::ostringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%d");
    return ss.str();
}

/**
 * @brief Format a timestamp as YYYY-MM-DD HH:MM:SS (UTC)
 */
inline std::string format_timestamp(Timestamp ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm time_info;
    safe_gmtime(&time_t, &time_info);
    std::ostringstream ss;
    ss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

inline int64_t to_epoch_seconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Source of the current time
 * Injected into every component that applies TTLs so tests can move time
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = std::chrono::system_clock::now()) : now_(start) {}

    Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(Timestamp ts) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = ts;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> by) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<Timestamp::duration>(by);
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

}  // namespace core
}  // namespace riskdesk
