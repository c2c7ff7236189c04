#include "tessera/index/merge_queue.hpp"

#include <algorithm>

namespace tessera::index {

using namespace tessera::core;

namespace {
    // true when a range ending at `end` reaches within fudge of `start`.
    // end <= start's run end is guaranteed by the sweep order.
    [[nodiscard]] bool reaches(i64 end, i64 start, i64 fudge) noexcept {
        if (end >= start) {
            return true;
        }
        // start - end without signed overflow; the true gap always fits in u64.
        const u64 gap = static_cast<u64>(start) - static_cast<u64>(end);
        return gap <= static_cast<u64>(fudge);
    }
}

MergeQueue::MergeQueue(i64 fudge) noexcept : fudge_(fudge) {}

Status MergeQueue::push(IndexRange r) noexcept {
    if (r.start > r.end || fudge_ < 0) {
        return make_status(StatusDomain::Index, StatusCode::Invalid);
    }
    ranges_.insert(r);
    return ok_status();
}

Status MergeQueue::to_ranges(std::vector<IndexRange>* out) const noexcept {
    if (!out || fudge_ < 0) {
        return make_status(StatusDomain::Index, StatusCode::Invalid);
    }
    out->clear();
    if (ranges_.empty()) {
        return ok_status();
    }

    // Sweep from the highest end down. Every later range ends no higher than
    // the current run, so it either reaches the run's start (and may extend
    // it leftwards) or opens a new run strictly to the left.
    auto it = ranges_.rbegin();
    IndexRange run = *it;
    for (++it; it != ranges_.rend(); ++it) {
        if (reaches(it->end, run.start, fudge_)) {
            run.start = std::min(run.start, it->start);
        } else {
            out->push_back(run);
            run = *it;
        }
    }
    out->push_back(run);

    std::reverse(out->begin(), out->end());
    return ok_status();
}

Status merge_ranges(const IndexRange* ranges, std::size_t count, std::vector<IndexRange>* out, i64 fudge) noexcept {
    if (!out || (count > 0 && !ranges)) {
        return make_status(StatusDomain::Index, StatusCode::Invalid);
    }

    MergeQueue q(fudge);
    for (std::size_t i = 0; i < count; ++i) {
        Status s = q.push(ranges[i]);
        if (!is_ok(s)) {
            out->clear();
            return s;
        }
    }
    return q.to_ranges(out);
}

Status merge_ranges(const std::vector<IndexRange>& ranges, std::vector<IndexRange>* out, i64 fudge) noexcept {
    return merge_ranges(ranges.data(), ranges.size(), out, fudge);
}

} // namespace tessera::index
