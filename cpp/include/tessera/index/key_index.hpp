#pragma once

#include <cstddef>
#include <type_traits>
#include <vector>

#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"

namespace tessera::index {
    using u8 = tessera::core::u8;
    using u32 = tessera::core::u32;
    using i64 = tessera::core::i64;
    using GridKey = tessera::core::GridKey;
    using KeyBounds = tessera::core::KeyBounds;
    using IndexRange = tessera::core::IndexRange;

    // Persisted with the layer; values must stay stable.
    enum class KeyIndexKind : u8 {
        RowMajor = 1,
        ZCurve2 = 2,
        Hilbert2 = 3,
        ZCurve3 = 4,
    };

    // Most ranges key_index_ranges returns. Past it, ranges separated by
    // small gaps are joined: the result still covers the query but also
    // spans keys outside it.
    inline constexpr std::size_t kMaxIndexRanges = std::size_t{1} << 16;

    // How a writer asks for a key index. The key space comes from the data.
    struct KeyIndexMethod {
        KeyIndexKind kind{KeyIndexKind::ZCurve2};
        i64 temporal_resolution{0};   // ZCurve3 only: instant units per time bin
        u32 max_depth{0};             // curve descent cap below the root; 0 = exact
    };

    // Immutable once created. key_space, kind and parameters fully determine
    // the mapping, so a persisted KeyIndex reproduces the writer's indexing.
    struct KeyIndex {
        KeyIndexKind kind{KeyIndexKind::ZCurve2};
        KeyBounds key_space{};
        i64 temporal_resolution{0};
        u32 bits{0};                  // per-dimension curve bits (0 for RowMajor)
        u32 max_depth{0};
    };

    [[nodiscard]] const char* key_index_kind_name(KeyIndexKind kind) noexcept;
    [[nodiscard]] bool key_index_kind_valid(u8 raw) noexcept;
    [[nodiscard]] bool key_index_is_spatial(KeyIndexKind kind) noexcept;

    // Builds the index covering key_space.
    // - InvalidBounds when key_space has min > max on an axis
    // - Invalid when ZCurve3 has temporal_resolution <= 0
    // - Unsupported when the key space is too large for the strategy
    [[nodiscard]] tessera::core::Status key_index_create(const KeyIndexMethod& method,
                                                         const KeyBounds& key_space,
                                                         KeyIndex* out) noexcept;

    [[nodiscard]] KeyIndexMethod key_index_method(const KeyIndex& index) noexcept;

    // true when every key in bounds is addressable by index.
    [[nodiscard]] bool key_index_covers(const KeyIndex& index, const KeyBounds& bounds) noexcept;

    // Position of key in the index space. Invalid when the key lies outside
    // the key space.
    [[nodiscard]] tessera::core::Status key_index_to_index(const KeyIndex& index,
                                                           const GridKey& key,
                                                           i64* out) noexcept;

    // Index intervals covering every key in bounds, ascending and disjoint,
    // at most kMaxIndexRanges of them. Bounds are clipped to the key space;
    // disjoint bounds give an empty list.
    // InvalidBounds when bounds has min > max on an axis.
    [[nodiscard]] tessera::core::Status key_index_ranges(const KeyIndex& index,
                                                         const KeyBounds& bounds,
                                                         std::vector<IndexRange>* out) noexcept;

    static_assert(std::is_trivially_copyable_v<KeyIndexMethod>);
    static_assert(std::is_trivially_copyable_v<KeyIndex>);
    static_assert(std::is_standard_layout_v<KeyIndex>);

} // namespace tessera::index
