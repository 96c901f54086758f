// include/riskdesk/cache/keyed_mutex.hpp
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace riskdesk {

/**
 * @brief Fixed pool of mutexes selected by key hash
 *
 * Two keys may share a stripe, so a thread must never hold two stripes at once.
 */
class KeyedMutex {
public:
    explicit KeyedMutex(size_t stripes = 64) : mutexes_(stripes == 0 ? 1 : stripes) {}

    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    std::mutex& for_key(const std::string& key) {
        return mutexes_[std::hash<std::string>{}(key) % mutexes_.size()];
    }

    size_t stripes() const {
        return mutexes_.size();
    }

private:
    std::vector<std::mutex> mutexes_;
};

}  // namespace riskdesk
