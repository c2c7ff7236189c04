#pragma once

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "tessera/catalog/metadata.hpp"
#include "tessera/core/types.hpp"

namespace tessera::catalog {
    using u64 = tessera::core::u64;

    inline constexpr u32 kDefaultCacheCapacity = 1024;

    // Bounded map of verified attribute payloads keyed by (layer, attribute).
    // Oldest entries are evicted first once capacity is reached; capacity 0
    // disables caching. Safe to call from any thread.
    class AttributeCache {
    public:
        explicit AttributeCache(u32 capacity = kDefaultCacheCapacity) noexcept;

        [[nodiscard]] bool get(const tessera::core::LayerId& layer, AttributeKind kind, std::vector<u8>* out) const;
        void put(const tessera::core::LayerId& layer, AttributeKind kind, std::vector<u8> payload);
        void invalidate(const tessera::core::LayerId& layer);
        void clear();
        // Empties the cache and applies a new bound.
        void reset(u32 capacity);

        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] u32 capacity() const noexcept { return capacity_; }
        [[nodiscard]] u64 hits() const noexcept { return hits_.load(std::memory_order_relaxed); }
        [[nodiscard]] u64 misses() const noexcept { return misses_.load(std::memory_order_relaxed); }

    private:
        using Key = std::pair<tessera::core::LayerId, AttributeKind>;

        u32 capacity_;
        mutable std::mutex mutex_;
        std::map<Key, std::vector<u8>> entries_;
        std::deque<Key> order_;   // insertion order of entries_
        mutable std::atomic<u64> hits_{0};
        mutable std::atomic<u64> misses_{0};
    };

} // namespace tessera::catalog
