#include "tessera/catalog/attribute_cache.hpp"

namespace tessera::catalog {

using tessera::core::LayerId;

AttributeCache::AttributeCache(u32 capacity) noexcept : capacity_(capacity) {}

bool AttributeCache::get(const LayerId& layer, AttributeKind kind, std::vector<u8>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(Key{layer, kind});
    if (it == entries_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    if (out) {
        *out = it->second;
    }
    return true;
}

void AttributeCache::put(const LayerId& layer, AttributeKind kind, std::vector<u8> payload) {
    if (capacity_ == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Key key{layer, kind};
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = std::move(payload);
        return;
    }

    while (entries_.size() >= capacity_ && !order_.empty()) {
        entries_.erase(order_.front());
        order_.pop_front();
    }
    order_.push_back(key);
    entries_.emplace(std::move(key), std::move(payload));
}

void AttributeCache::invalidate(const LayerId& layer) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (u32 i = 0; i < kAttributeKindCount; ++i) {
        entries_.erase(Key{layer, static_cast<AttributeKind>(i)});
    }
    // Keep order_ in step with entries_.
    std::deque<Key> kept;
    for (Key& k : order_) {
        if (k.first != layer) {
            kept.push_back(std::move(k));
        }
    }
    order_.swap(kept);
}

void AttributeCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    order_.clear();
}

void AttributeCache::reset(u32 capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    order_.clear();
    capacity_ = capacity;
}

std::size_t AttributeCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace tessera::catalog
