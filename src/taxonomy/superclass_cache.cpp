#include "taxonomy/superclass_cache.hpp"
#include "util/logger.hpp"
#include <stdexcept>

namespace wdi {

SuperclassCache::SuperclassCache(Lookup lookup) : lookup_(std::move(lookup)) {
    if (!lookup_) {
        throw std::invalid_argument("SuperclassCache requires a lookup function");
    }
}

std::vector<std::string> SuperclassCache::get(const std::string& type_id) {
    std::promise<Chain> promise;
    std::shared_future<Chain> pending;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(type_id);
        if (it != entries_.end()) {
            hits_++;
            pending = it->second;
        } else {
            misses_++;
            entries_.emplace(type_id, promise.get_future().share());
        }
    }

    if (pending.valid()) {
        return pending.get();
    }

    Chain chain;
    try {
        chain = lookup_(type_id);
    } catch (const std::exception& e) {
        Logger::warn("Superclass lookup for " + type_id + " threw: " + e.what());
        chain.clear();
    }
    promise.set_value(chain);
    return chain;
}

size_t SuperclassCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace wdi
