#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wdi {

/**
 * @brief Run-wide memo of type id -> transitive superclass chain
 *
 * Single-flight: concurrent requests for an uncached type wait on the one
 * in-flight lookup and all receive its result. Failed lookups are cached as
 * empty chains, so each type reaches the remote service at most once per run.
 */
class SuperclassCache {
public:
    using Lookup = std::function<std::vector<std::string>(const std::string&)>;

    explicit SuperclassCache(Lookup lookup);

    SuperclassCache(const SuperclassCache&) = delete;
    SuperclassCache& operator=(const SuperclassCache&) = delete;

    /**
     * @brief Superclass chain of `type_id`, resolving it on first use
     */
    std::vector<std::string> get(const std::string& type_id);

    size_t size() const;
    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }

private:
    using Chain = std::vector<std::string>;

    Lookup lookup_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<Chain>> entries_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace wdi
