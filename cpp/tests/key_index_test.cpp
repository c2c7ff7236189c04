#include <algorithm>
#include <limits>
#include <random>
#include <set>
#include <vector>

#include <gtest/gtest.h>

#include "tessera/core/keys.hpp"
#include "tessera/index/key_index.hpp"

using namespace tessera::core;
using namespace tessera::index;

namespace {
    KeyBounds box(i32 c0, i32 r0, i32 c1, i32 r1) {
        return KeyBounds{spatial_key(c0, r0), spatial_key(c1, r1)};
    }

    KeyIndex make_index(KeyIndexKind kind, const KeyBounds& space, i64 resolution = 0, u32 max_depth = 0) {
        KeyIndexMethod m{};
        m.kind = kind;
        m.temporal_resolution = resolution;
        m.max_depth = max_depth;
        KeyIndex ix{};
        EXPECT_TRUE(is_ok(key_index_create(m, space, &ix)));
        return ix;
    }

    std::vector<GridKey> keys_in(const KeyBounds& b, i64 instant_step = 1) {
        std::vector<GridKey> keys;
        for (i64 t = b.min.instant; t <= b.max.instant; t += instant_step) {
            for (i32 r = b.min.row; r <= b.max.row; ++r) {
                for (i32 c = b.min.col; c <= b.max.col; ++c) {
                    keys.push_back(space_time_key(c, r, t));
                }
            }
        }
        return keys;
    }

    bool in_ranges(const std::vector<IndexRange>& ranges, i64 v) {
        auto it = std::upper_bound(ranges.begin(), ranges.end(), v,
                                   [](i64 x, const IndexRange& r) { return x < r.start; });
        if (it == ranges.begin()) return false;
        --it;
        return it->start <= v && v <= it->end;
    }

    void expect_sorted_disjoint(const std::vector<IndexRange>& ranges) {
        for (size_t i = 0; i < ranges.size(); ++i) {
            EXPECT_LE(ranges[i].start, ranges[i].end);
            if (i > 0) {
                EXPECT_GT(ranges[i].start, ranges[i - 1].end);
            }
        }
    }

    // Checks soundness over every key of the space. With exact set, also
    // checks that no key outside the query falls inside a returned range.
    void check_query(const KeyIndex& ix, const KeyBounds& query, bool exact) {
        std::vector<IndexRange> ranges;
        ASSERT_TRUE(is_ok(key_index_ranges(ix, query, &ranges)));
        expect_sorted_disjoint(ranges);

        const i64 step = ix.kind == KeyIndexKind::ZCurve3 ? 1 : ix.key_space.max.instant - ix.key_space.min.instant + 1;
        for (const GridKey& k : keys_in(ix.key_space, step)) {
            i64 v = 0;
            ASSERT_TRUE(is_ok(key_index_to_index(ix, k, &v)));
            const bool wanted = bounds_contains(query, k) ||
                                (key_index_is_spatial(ix.kind) &&
                                 bounds_contains(box(query.min.col, query.min.row, query.max.col, query.max.row),
                                                 spatial_key(k.col, k.row)));
            if (wanted) {
                EXPECT_TRUE(in_ranges(ranges, v)) << "missed key (" << k.col << ", " << k.row << ", " << k.instant << ")";
            } else if (exact) {
                EXPECT_FALSE(in_ranges(ranges, v)) << "extra key (" << k.col << ", " << k.row << ", " << k.instant << ")";
            }
        }
    }

    const KeyIndexKind kSpatialKinds[] = {KeyIndexKind::RowMajor, KeyIndexKind::ZCurve2, KeyIndexKind::Hilbert2};
}

// ============================================================================
// Construction
// ============================================================================

TEST(KeyIndex, CreateRejectsInvertedKeySpace) {
    KeyIndex ix{};
    const Status s = key_index_create(KeyIndexMethod{}, box(5, 0, 4, 0), &ix);
    EXPECT_EQ(s.code, StatusCode::InvalidBounds);
    EXPECT_EQ(s.domain, StatusDomain::Index);
}

TEST(KeyIndex, CreateRejectsNonPositiveTemporalResolution) {
    KeyIndexMethod m{KeyIndexKind::ZCurve3, 0, 0};
    KeyIndex ix{};
    EXPECT_EQ(key_index_create(m, box(0, 0, 3, 3), &ix).code, StatusCode::Invalid);
    m.temporal_resolution = -10;
    EXPECT_EQ(key_index_create(m, box(0, 0, 3, 3), &ix).code, StatusCode::Invalid);
}

TEST(KeyIndex, CreateRejectsUnaddressableSpace) {
    const i32 lo = std::numeric_limits<i32>::min();
    const i32 hi = std::numeric_limits<i32>::max();
    KeyIndex ix{};

    EXPECT_EQ(key_index_create({KeyIndexKind::RowMajor, 0, 0}, box(lo, lo, hi, hi), &ix).code, StatusCode::Unsupported);
    EXPECT_EQ(key_index_create({KeyIndexKind::ZCurve2, 0, 0}, box(lo, 0, hi, 0), &ix).code, StatusCode::Unsupported);
    EXPECT_EQ(key_index_create({KeyIndexKind::Hilbert2, 0, 0}, box(0, lo, 0, hi), &ix).code, StatusCode::Unsupported);
    EXPECT_EQ(key_index_create({KeyIndexKind::ZCurve3, 1, 0},
                               KeyBounds{space_time_key(0, 0, 0), space_time_key(0, 0, i64{1} << 40)}, &ix).code,
              StatusCode::Unsupported);

    // Half the column range still fits a curve.
    EXPECT_TRUE(is_ok(key_index_create({KeyIndexKind::ZCurve2, 0, 0}, box(0, 0, hi, hi), &ix)));
    EXPECT_EQ(ix.bits, 31u);
}

TEST(KeyIndex, CreateRejectsFullInstantRange) {
    const i64 lo = std::numeric_limits<i64>::min();
    const i64 hi = std::numeric_limits<i64>::max();
    const KeyBounds space{space_time_key(0, 0, lo), space_time_key(1, 1, hi)};
    KeyIndex ix{};

    EXPECT_EQ(key_index_create({KeyIndexKind::ZCurve3, 1, 0}, space, &ix).code, StatusCode::Unsupported);
    EXPECT_EQ(key_index_create({KeyIndexKind::ZCurve3, 2, 0}, space, &ix).code, StatusCode::Unsupported);
}

TEST(KeyIndex, FullInstantRangeWithCoarseBins) {
    const i64 lo = std::numeric_limits<i64>::min();
    const i64 hi = std::numeric_limits<i64>::max();
    const i64 resolution = i64{1} << 62;
    const KeyIndex ix = make_index(KeyIndexKind::ZCurve3, KeyBounds{space_time_key(0, 0, lo), space_time_key(1, 1, hi)},
                                   resolution);
    EXPECT_EQ(ix.bits, 2u);

    // One key per time bin, all distinct.
    std::set<i64> seen;
    for (i64 bin = 0; bin < 4; ++bin) {
        const GridKey k = space_time_key(1, 0, static_cast<i64>(static_cast<u64>(lo) + static_cast<u64>(bin) * (u64{1} << 62)));
        i64 v = 0;
        ASSERT_TRUE(is_ok(key_index_to_index(ix, k, &v)));
        EXPECT_TRUE(seen.insert(v).second);

        std::vector<IndexRange> ranges;
        ASSERT_TRUE(is_ok(key_index_ranges(ix, KeyBounds{k, k}, &ranges)));
        ASSERT_EQ(ranges.size(), 1u);
        EXPECT_TRUE(in_ranges(ranges, v));
    }
}

TEST(KeyIndex, MethodRoundTrips) {
    const KeyIndex ix = make_index(KeyIndexKind::ZCurve3, KeyBounds{space_time_key(0, 0, 0), space_time_key(7, 7, 99)},
                                   10, 4);
    const KeyIndexMethod m = key_index_method(ix);
    EXPECT_EQ(m.kind, KeyIndexKind::ZCurve3);
    EXPECT_EQ(m.temporal_resolution, 10);
    EXPECT_EQ(m.max_depth, 4u);
    EXPECT_STREQ(key_index_kind_name(m.kind), "zorder-spacetime");
}

TEST(KeyIndex, KindValidity) {
    EXPECT_FALSE(key_index_kind_valid(0));
    EXPECT_TRUE(key_index_kind_valid(1));
    EXPECT_TRUE(key_index_kind_valid(4));
    EXPECT_FALSE(key_index_kind_valid(5));
}

// ============================================================================
// Key mapping
// ============================================================================

TEST(KeyIndex, RowMajorLayout) {
    const KeyIndex ix = make_index(KeyIndexKind::RowMajor, box(10, 20, 14, 22));
    i64 v = -1;
    ASSERT_TRUE(is_ok(key_index_to_index(ix, spatial_key(10, 20), &v)));
    EXPECT_EQ(v, 0);
    ASSERT_TRUE(is_ok(key_index_to_index(ix, spatial_key(14, 20), &v)));
    EXPECT_EQ(v, 4);
    ASSERT_TRUE(is_ok(key_index_to_index(ix, spatial_key(12, 21), &v)));
    EXPECT_EQ(v, 7);
}

TEST(KeyIndex, MappingIsCollisionFree) {
    const KeyBounds space = box(-4, -3, 5, 6);
    for (KeyIndexKind kind : kSpatialKinds) {
        const KeyIndex ix = make_index(kind, space);
        std::set<i64> seen;
        for (const GridKey& k : keys_in(space)) {
            i64 v = -1;
            ASSERT_TRUE(is_ok(key_index_to_index(ix, k, &v)));
            EXPECT_GE(v, 0);
            EXPECT_TRUE(seen.insert(v).second) << key_index_kind_name(kind);
        }
    }

    const KeyBounds st{space_time_key(0, 0, 1000), space_time_key(3, 2, 1059)};
    const KeyIndex ix = make_index(KeyIndexKind::ZCurve3, st, 20);
    std::set<i64> seen;
    for (const GridKey& k : keys_in(st, 20)) {
        i64 v = -1;
        ASSERT_TRUE(is_ok(key_index_to_index(ix, k, &v)));
        EXPECT_TRUE(seen.insert(v).second);
    }
}

TEST(KeyIndex, SpatialKindsIgnoreInstant) {
    const KeyIndex ix = make_index(KeyIndexKind::ZCurve2, box(0, 0, 7, 7));
    i64 a = -1;
    i64 b = -2;
    ASSERT_TRUE(is_ok(key_index_to_index(ix, spatial_key(3, 5), &a)));
    ASSERT_TRUE(is_ok(key_index_to_index(ix, space_time_key(3, 5, 12345), &b)));
    EXPECT_EQ(a, b);
}

TEST(KeyIndex, TimeBinsShareAnIndex) {
    const KeyIndex ix = make_index(KeyIndexKind::ZCurve3, KeyBounds{space_time_key(0, 0, 0), space_time_key(3, 3, 99)},
                                   10);
    i64 a = -1;
    i64 b = -2;
    i64 c = -3;
    ASSERT_TRUE(is_ok(key_index_to_index(ix, space_time_key(1, 1, 20), &a)));
    ASSERT_TRUE(is_ok(key_index_to_index(ix, space_time_key(1, 1, 29), &b)));
    ASSERT_TRUE(is_ok(key_index_to_index(ix, space_time_key(1, 1, 30), &c)));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(KeyIndex, KeyOutsideSpaceIsInvalid) {
    for (KeyIndexKind kind : kSpatialKinds) {
        const KeyIndex ix = make_index(kind, box(0, 0, 3, 3));
        i64 v = 0;
        EXPECT_EQ(key_index_to_index(ix, spatial_key(4, 0), &v).code, StatusCode::Invalid);
        EXPECT_EQ(key_index_to_index(ix, spatial_key(0, -1), &v).code, StatusCode::Invalid);
    }
}

// ============================================================================
// Decomposition
// ============================================================================

TEST(KeyIndex, RangesRejectInvertedQuery) {
    const KeyIndex ix = make_index(KeyIndexKind::Hilbert2, box(0, 0, 15, 15));
    std::vector<IndexRange> out = {{1, 2}};
    const Status s = key_index_ranges(ix, box(4, 4, 3, 5), &out);
    EXPECT_EQ(s.code, StatusCode::InvalidBounds);
    EXPECT_TRUE(out.empty());
}

TEST(KeyIndex, DisjointQueryGivesNoRanges) {
    for (KeyIndexKind kind : kSpatialKinds) {
        const KeyIndex ix = make_index(kind, box(0, 0, 15, 15));
        std::vector<IndexRange> out;
        ASSERT_TRUE(is_ok(key_index_ranges(ix, box(20, 0, 30, 5), &out)));
        EXPECT_TRUE(out.empty()) << key_index_kind_name(kind);
    }
}

TEST(KeyIndex, FullSpaceIsOneRange) {
    for (KeyIndexKind kind : kSpatialKinds) {
        const KeyIndex ix = make_index(kind, box(0, 0, 7, 7));
        std::vector<IndexRange> out;
        ASSERT_TRUE(is_ok(key_index_ranges(ix, box(0, 0, 7, 7), &out)));
        ASSERT_EQ(out.size(), 1u) << key_index_kind_name(kind);
        EXPECT_EQ(out[0], (IndexRange{0, 63}));
    }
}

TEST(KeyIndex, DegenerateQueryIsSinglePoint) {
    const KeyBounds space = box(-5, -5, 10, 12);
    for (KeyIndexKind kind : kSpatialKinds) {
        const KeyIndex ix = make_index(kind, space);
        const GridKey k = spatial_key(3, -2);
        i64 v = -1;
        ASSERT_TRUE(is_ok(key_index_to_index(ix, k, &v)));

        std::vector<IndexRange> out;
        ASSERT_TRUE(is_ok(key_index_ranges(ix, KeyBounds{k, k}, &out)));
        ASSERT_EQ(out.size(), 1u) << key_index_kind_name(kind);
        EXPECT_EQ(out[0], (IndexRange{v, v}));
    }
}

TEST(KeyIndex, ZeroExtentKeySpace) {
    const GridKey k = space_time_key(42, -7, 500);
    const KeyBounds space{k, k};
    const KeyIndex indexes[] = {
        make_index(KeyIndexKind::RowMajor, space),
        make_index(KeyIndexKind::ZCurve2, space),
        make_index(KeyIndexKind::Hilbert2, space),
        make_index(KeyIndexKind::ZCurve3, space, 60),
    };
    for (const KeyIndex& ix : indexes) {
        i64 v = -1;
        ASSERT_TRUE(is_ok(key_index_to_index(ix, k, &v)));
        std::vector<IndexRange> out;
        ASSERT_TRUE(is_ok(key_index_ranges(ix, space, &out)));
        ASSERT_EQ(out.size(), 1u);
        EXPECT_EQ(out[0], (IndexRange{v, v}));
    }
}

TEST(KeyIndex, RowMajorFullWidthIsOneRange) {
    const KeyIndex ix = make_index(KeyIndexKind::RowMajor, box(0, 0, 9, 9));
    std::vector<IndexRange> out;
    ASSERT_TRUE(is_ok(key_index_ranges(ix, box(0, 2, 9, 4), &out)));
    EXPECT_EQ(out, (std::vector<IndexRange>{{20, 49}}));

    ASSERT_TRUE(is_ok(key_index_ranges(ix, box(1, 2, 3, 4), &out)));
    EXPECT_EQ(out, (std::vector<IndexRange>{{21, 23}, {31, 33}, {41, 43}}));
}

TEST(KeyIndex, QueryIsClippedToKeySpace) {
    const KeyIndex ix = make_index(KeyIndexKind::RowMajor, box(0, 0, 9, 9));
    std::vector<IndexRange> out;
    ASSERT_TRUE(is_ok(key_index_ranges(ix, box(-100, 8, 100, 100), &out)));
    EXPECT_EQ(out, (std::vector<IndexRange>{{80, 99}}));
}

TEST(KeyIndex, ExactDecompositionOverEverySubrectangle) {
    const KeyBounds space = box(-3, 2, 6, 8);
    for (KeyIndexKind kind : kSpatialKinds) {
        const KeyIndex ix = make_index(kind, space);
        for (i32 c0 = -4; c0 <= 7; c0 += 2) {
            for (i32 c1 = c0; c1 <= 7; c1 += 3) {
                for (i32 r0 = 1; r0 <= 9; r0 += 2) {
                    for (i32 r1 = r0; r1 <= 9; r1 += 3) {
                        check_query(ix, box(c0, r0, c1, r1), true);
                    }
                }
            }
        }
    }
}

TEST(KeyIndex, SpaceTimeDecompositionIsSound) {
    const KeyBounds space{space_time_key(0, 0, 0), space_time_key(5, 4, 79)};
    const KeyIndex ix = make_index(KeyIndexKind::ZCurve3, space, 10);

    std::mt19937 rng(99);
    std::uniform_int_distribution<i32> col(0, 5);
    std::uniform_int_distribution<i32> row(0, 4);
    std::uniform_int_distribution<i64> when(0, 79);
    for (int i = 0; i < 40; ++i) {
        GridKey a = space_time_key(col(rng), row(rng), when(rng));
        GridKey b = space_time_key(col(rng), row(rng), when(rng));
        KeyBounds q{};
        q.min = space_time_key(std::min(a.col, b.col), std::min(a.row, b.row), std::min(a.instant, b.instant));
        q.max = space_time_key(std::max(a.col, b.col), std::max(a.row, b.row), std::max(a.instant, b.instant));
        check_query(ix, q, false);
    }

    // Bin-aligned queries decompose exactly.
    check_query(ix, KeyBounds{space_time_key(1, 1, 20), space_time_key(4, 3, 49)}, true);
}

TEST(KeyIndex, DepthCapTradesTightnessForFewerRanges) {
    const KeyBounds space = box(0, 0, 63, 63);
    const KeyBounds query = box(3, 5, 40, 37);
    const KeyIndex exact = make_index(KeyIndexKind::ZCurve2, space);
    const KeyIndex capped = make_index(KeyIndexKind::ZCurve2, space, 0, 2);

    std::vector<IndexRange> fine;
    std::vector<IndexRange> coarse;
    ASSERT_TRUE(is_ok(key_index_ranges(exact, query, &fine)));
    ASSERT_TRUE(is_ok(key_index_ranges(capped, query, &coarse)));
    EXPECT_LT(coarse.size(), fine.size());

    check_query(capped, query, false);
    check_query(exact, query, true);
}

TEST(KeyIndex, RandomQueriesAreSound) {
    const KeyBounds space = box(-20, -20, 43, 30);
    std::mt19937 rng(7);
    std::uniform_int_distribution<i32> col(-25, 48);
    std::uniform_int_distribution<i32> row(-25, 35);
    for (KeyIndexKind kind : kSpatialKinds) {
        const KeyIndex ix = make_index(kind, space, 0, 3);
        for (int i = 0; i < 15; ++i) {
            const i32 a = col(rng);
            const i32 b = col(rng);
            const i32 c = row(rng);
            const i32 d = row(rng);
            check_query(ix, box(std::min(a, b), std::min(c, d), std::max(a, b), std::max(c, d)), false);
        }
    }
}

// ============================================================================
// Large decompositions
// ============================================================================

TEST(KeyIndex, TallThinQueryStaysWithinRangeLimit) {
    const i32 height = 1 << 20;
    const KeyBounds space = box(0, 0, 1, height - 1);
    const KeyBounds query = box(0, 0, 0, height - 1);

    for (KeyIndexKind kind : kSpatialKinds) {
        const KeyIndex ix = make_index(kind, space);
        std::vector<IndexRange> ranges;
        ASSERT_TRUE(is_ok(key_index_ranges(ix, query, &ranges)));
        ASSERT_FALSE(ranges.empty());
        EXPECT_LE(ranges.size(), kMaxIndexRanges) << key_index_kind_name(kind);
        expect_sorted_disjoint(ranges);

        for (i32 r = 0; r < height; r += 997) {
            i64 v = 0;
            ASSERT_TRUE(is_ok(key_index_to_index(ix, spatial_key(0, r), &v)));
            EXPECT_TRUE(in_ranges(ranges, v)) << key_index_kind_name(kind) << " missed row " << r;
        }
        i64 last = 0;
        ASSERT_TRUE(is_ok(key_index_to_index(ix, spatial_key(0, height - 1), &last)));
        EXPECT_TRUE(in_ranges(ranges, last)) << key_index_kind_name(kind);
    }
}

TEST(KeyIndex, SmallQueriesAreNotCoarsened) {
    // A column of 1000 rows stays one range per row under row-major.
    const KeyIndex ix = make_index(KeyIndexKind::RowMajor, box(0, 0, 9, 999));
    std::vector<IndexRange> ranges;
    ASSERT_TRUE(is_ok(key_index_ranges(ix, box(4, 0, 4, 999), &ranges)));
    ASSERT_EQ(ranges.size(), 1000u);
    EXPECT_EQ(ranges[1].start, 14);
    EXPECT_EQ(ranges[1].end, 14);
}
