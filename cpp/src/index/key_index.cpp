#include "tessera/index/key_index.hpp"
#include "tessera/index/curves.hpp"
#include "tessera/core/keys.hpp"

#include <algorithm>
#include <limits>

namespace tessera::index {

using namespace tessera::core;

namespace {
    constexpr u64 kIndexSpace = u64{1} << 63;  // number of non-negative i64 values

    [[nodiscard]] u64 span_u64(i64 lo, i64 hi) noexcept {
        // hi - lo for hi >= lo without signed overflow.
        return static_cast<u64>(hi) - static_cast<u64>(lo);
    }

    [[nodiscard]] u64 local_col(const KeyIndex& ix, i32 col) noexcept {
        return span_u64(ix.key_space.min.col, col);
    }

    [[nodiscard]] u64 local_row(const KeyIndex& ix, i32 row) noexcept {
        return span_u64(ix.key_space.min.row, row);
    }

    [[nodiscard]] u64 local_bin(const KeyIndex& ix, i64 instant) noexcept {
        return span_u64(ix.key_space.min.instant, instant) / static_cast<u64>(ix.temporal_resolution);
    }

    [[nodiscard]] u32 dims_of(KeyIndexKind kind) noexcept {
        return kind == KeyIndexKind::ZCurve3 ? 3u : 2u;
    }

    // Spatial strategies ignore the time axis: widen bounds' instants to the
    // key space so clipping only looks at col/row.
    [[nodiscard]] KeyBounds project(const KeyIndex& ix, KeyBounds b) noexcept {
        if (key_index_is_spatial(ix.kind)) {
            b.min.instant = ix.key_space.min.instant;
            b.max.instant = ix.key_space.max.instant;
        }
        return b;
    }

    // Collects ascending ranges, joining a range to the previous one when at
    // most gap indices lie between them. gap starts at 0 (touching ranges
    // only) and doubles whenever the list reaches kMaxIndexRanges.
    struct RangeSink {
        std::vector<IndexRange>* out;
        u64 gap{0};

        [[nodiscard]] bool joins(i64 start) const noexcept {
            return !out->empty() && static_cast<u64>(start - out->back().end) <= gap + 1;
        }

        void add(i64 start, i64 end) {
            if (joins(start)) {
                out->back().end = end;
                return;
            }
            out->push_back(IndexRange{start, end});
            if (out->size() >= kMaxIndexRanges) {
                coarsen();
            }
        }

        void coarsen() {
            while (out->size() > kMaxIndexRanges / 2) {
                gap = gap == 0 ? 1 : gap * 2;
                std::size_t w = 0;
                for (std::size_t i = 1; i < out->size(); ++i) {
                    if (static_cast<u64>((*out)[i].start - (*out)[w].end) <= gap + 1) {
                        (*out)[w].end = (*out)[i].end;
                    } else {
                        (*out)[++w] = (*out)[i];
                    }
                }
                out->resize(w + 1);
            }
        }
    };

    // Recursive descent over aligned curve cells. Children of a cell occupy
    // consecutive, equally sized index blocks, so visiting them in order
    // emits ranges in ascending order.
    struct CurveDecomposer {
        const KeyIndex& ix;
        u32 dims;
        u64 lo[3];
        u64 hi[3];
        RangeSink sink;

        void emit(u64 start, u64 end) {
            sink.add(static_cast<i64>(start), static_cast<i64>(end));
        }

        void origin(u64 d0, u32 k, u64* o) const noexcept {
            u32 x = 0;
            u32 y = 0;
            u32 t = 0;
            switch (ix.kind) {
                case KeyIndexKind::ZCurve2:
                    z2_decode(d0, &x, &y);
                    break;
                case KeyIndexKind::Hilbert2: {
                    // Any cell of the block decodes inside the block's square.
                    hilbert2_decode(ix.bits, d0, &x, &y);
                    const u32 mask = ~((u32{1} << k) - 1);
                    x &= mask;
                    y &= mask;
                    break;
                }
                case KeyIndexKind::ZCurve3:
                    z3_decode(d0, &x, &y, &t);
                    break;
                case KeyIndexKind::RowMajor:
                    break;
            }
            o[0] = x;
            o[1] = y;
            o[2] = t;
        }

        void visit(u64 d0, u32 k, u32 depth) {
            u64 o[3];
            origin(d0, k, o);
            const u64 side = u64{1} << k;

            bool contained = true;
            for (u32 i = 0; i < dims; ++i) {
                const u64 first = o[i];
                const u64 last = o[i] + side - 1;
                if (first > hi[i] || last < lo[i]) {
                    return;
                }
                if (first < lo[i] || last > hi[i]) {
                    contained = false;
                }
            }

            const u64 span = u64{1} << (dims * k);
            if (contained || k == 0 || (ix.max_depth != 0 && depth >= ix.max_depth)) {
                emit(d0, d0 + span - 1);
                return;
            }
            // Once the sink is coarsened, a small cell that would be joined
            // anyway is taken whole instead of descended.
            if (sink.gap != 0 && span <= sink.gap + 1 && sink.joins(static_cast<i64>(d0))) {
                emit(d0, d0 + span - 1);
                return;
            }

            const u64 step = u64{1} << (dims * (k - 1));
            const u64 children = u64{1} << dims;
            for (u64 c = 0; c < children; ++c) {
                visit(d0 + c * step, k - 1, depth + 1);
            }
        }
    };

    void row_major_ranges(const KeyIndex& ix, const KeyBounds& q, std::vector<IndexRange>* out) {
        const i64 width = static_cast<i64>(span_u64(ix.key_space.min.col, ix.key_space.max.col) + 1);
        const i64 c0 = static_cast<i64>(local_col(ix, q.min.col));
        const i64 c1 = static_cast<i64>(local_col(ix, q.max.col));
        const i64 r0 = static_cast<i64>(local_row(ix, q.min.row));
        const i64 r1 = static_cast<i64>(local_row(ix, q.max.row));

        if (c0 == 0 && c1 == width - 1) {
            out->push_back(IndexRange{r0 * width, r1 * width + c1});
            return;
        }

        RangeSink sink{out};
        for (i64 r = r0; r <= r1; ++r) {
            sink.add(r * width + c0, r * width + c1);
        }
    }
}

const char* key_index_kind_name(KeyIndexKind kind) noexcept {
    switch (kind) {
        case KeyIndexKind::RowMajor: return "row-major";
        case KeyIndexKind::ZCurve2: return "zorder";
        case KeyIndexKind::Hilbert2: return "hilbert";
        case KeyIndexKind::ZCurve3: return "zorder-spacetime";
    }
    return "unknown";
}

bool key_index_kind_valid(u8 raw) noexcept {
    return raw >= static_cast<u8>(KeyIndexKind::RowMajor) && raw <= static_cast<u8>(KeyIndexKind::ZCurve3);
}

bool key_index_is_spatial(KeyIndexKind kind) noexcept {
    return kind != KeyIndexKind::ZCurve3;
}

Status key_index_create(const KeyIndexMethod& method, const KeyBounds& key_space, KeyIndex* out) noexcept {
    if (!out || !key_index_kind_valid(static_cast<u8>(method.kind))) {
        return make_status(StatusDomain::Index, StatusCode::Invalid);
    }
    if (!bounds_valid(key_space)) {
        return make_status(StatusDomain::Index, StatusCode::InvalidBounds);
    }

    KeyIndex ix{};
    ix.kind = method.kind;
    ix.key_space = key_space;
    ix.max_depth = method.max_depth;

    const u64 width = span_u64(key_space.min.col, key_space.max.col) + 1;
    const u64 height = span_u64(key_space.min.row, key_space.max.row) + 1;

    switch (method.kind) {
        case KeyIndexKind::RowMajor:
            if (width > kIndexSpace / height) {
                return make_status(StatusDomain::Index, StatusCode::Unsupported);
            }
            ix.bits = 0;
            break;
        case KeyIndexKind::ZCurve2:
        case KeyIndexKind::Hilbert2: {
            const u32 bits = bits_for_extent(std::max(width, height));
            const u32 limit = method.kind == KeyIndexKind::ZCurve2 ? kZ2MaxBits : kHilbert2MaxBits;
            if (bits > limit) {
                return make_status(StatusDomain::Index, StatusCode::Unsupported);
            }
            ix.bits = bits;
            break;
        }
        case KeyIndexKind::ZCurve3: {
            if (method.temporal_resolution <= 0) {
                return make_status(StatusDomain::Index, StatusCode::Invalid);
            }
            ix.temporal_resolution = method.temporal_resolution;
            const u64 last_bin = span_u64(key_space.min.instant, key_space.max.instant) /
                                 static_cast<u64>(method.temporal_resolution);
            if (last_bin == std::numeric_limits<u64>::max()) {
                return make_status(StatusDomain::Index, StatusCode::Unsupported);
            }
            const u64 bins = last_bin + 1;
            const u32 bits = bits_for_extent(std::max({width, height, bins}));
            if (bits > kZ3MaxBits) {
                return make_status(StatusDomain::Index, StatusCode::Unsupported);
            }
            ix.bits = bits;
            break;
        }
    }

    *out = ix;
    return ok_status();
}

KeyIndexMethod key_index_method(const KeyIndex& index) noexcept {
    return KeyIndexMethod{index.kind, index.temporal_resolution, index.max_depth};
}

bool key_index_covers(const KeyIndex& index, const KeyBounds& bounds) noexcept {
    return bounds_valid(bounds) && bounds_contains(index.key_space, project(index, bounds));
}

Status key_index_to_index(const KeyIndex& index, const GridKey& key, i64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Index, StatusCode::Invalid);
    }
    if (!key_index_covers(index, KeyBounds{key, key})) {
        return make_status(StatusDomain::Index, StatusCode::Invalid);
    }

    const u64 x = local_col(index, key.col);
    const u64 y = local_row(index, key.row);

    switch (index.kind) {
        case KeyIndexKind::RowMajor: {
            const u64 width = span_u64(index.key_space.min.col, index.key_space.max.col) + 1;
            *out = static_cast<i64>(y * width + x);
            return ok_status();
        }
        case KeyIndexKind::ZCurve2:
            *out = static_cast<i64>(z2_encode(static_cast<u32>(x), static_cast<u32>(y)));
            return ok_status();
        case KeyIndexKind::Hilbert2:
            *out = static_cast<i64>(hilbert2_encode(index.bits, static_cast<u32>(x), static_cast<u32>(y)));
            return ok_status();
        case KeyIndexKind::ZCurve3: {
            const u64 t = local_bin(index, key.instant);
            *out = static_cast<i64>(z3_encode(static_cast<u32>(x), static_cast<u32>(y), static_cast<u32>(t)));
            return ok_status();
        }
    }
    return make_status(StatusDomain::Index, StatusCode::Invalid);
}

Status key_index_ranges(const KeyIndex& index, const KeyBounds& bounds, std::vector<IndexRange>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Index, StatusCode::Invalid);
    }
    out->clear();
    if (!bounds_valid(bounds)) {
        return make_status(StatusDomain::Index, StatusCode::InvalidBounds);
    }

    KeyBounds q{};
    if (!bounds_intersect(index.key_space, project(index, bounds), &q)) {
        return ok_status();
    }

    if (index.kind == KeyIndexKind::RowMajor) {
        row_major_ranges(index, q, out);
        return ok_status();
    }

    CurveDecomposer d{index, dims_of(index.kind), {}, {}, RangeSink{out}};
    d.lo[0] = local_col(index, q.min.col);
    d.hi[0] = local_col(index, q.max.col);
    d.lo[1] = local_row(index, q.min.row);
    d.hi[1] = local_row(index, q.max.row);
    if (index.kind == KeyIndexKind::ZCurve3) {
        d.lo[2] = local_bin(index, q.min.instant);
        d.hi[2] = local_bin(index, q.max.instant);
    } else {
        d.lo[2] = 0;
        d.hi[2] = 0;
    }

    d.visit(0, index.bits, 0);
    return ok_status();
}

} // namespace tessera::index
