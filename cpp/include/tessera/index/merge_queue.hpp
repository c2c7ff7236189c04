#pragma once

#include <cstddef>
#include <set>
#include <vector>

#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"

namespace tessera::index {
    using i64 = tessera::core::i64;
    using IndexRange = tessera::core::IndexRange;

    // Ranges closer than this are scanned as one.
    inline constexpr i64 kDefaultMergeFudge = 1;

    // Collects inclusive index ranges and coalesces them into the smallest
    // sorted set of disjoint scan ranges. Output depends only on the
    // multiset pushed, never on push order.
    class MergeQueue {
    public:
        explicit MergeQueue(i64 fudge = kDefaultMergeFudge) noexcept;

        // Invalid when r.start > r.end or the queue was built with a negative fudge.
        [[nodiscard]] tessera::core::Status push(IndexRange r) noexcept;

        [[nodiscard]] std::size_t size() const noexcept { return ranges_.size(); }
        [[nodiscard]] bool empty() const noexcept { return ranges_.empty(); }
        void clear() noexcept { ranges_.clear(); }

        // Merged ranges, ascending by start. Leaves the queue untouched.
        [[nodiscard]] tessera::core::Status to_ranges(std::vector<IndexRange>* out) const noexcept;

    private:
        struct ByEnd {
            bool operator()(const IndexRange& a, const IndexRange& b) const noexcept {
                if (a.end != b.end) return a.end < b.end;
                return a.start < b.start;
            }
        };

        std::set<IndexRange, ByEnd> ranges_;
        i64 fudge_;
    };

    // One-shot merge of ranges[0..count).
    [[nodiscard]] tessera::core::Status merge_ranges(const IndexRange* ranges,
                                                     std::size_t count,
                                                     std::vector<IndexRange>* out,
                                                     i64 fudge = kDefaultMergeFudge) noexcept;

    [[nodiscard]] tessera::core::Status merge_ranges(const std::vector<IndexRange>& ranges,
                                                     std::vector<IndexRange>* out,
                                                     i64 fudge = kDefaultMergeFudge) noexcept;

} // namespace tessera::index
