#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <type_traits>
#include <compare>

namespace tessera::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i32 = std::int32_t;
    using i64 = std::int64_t;

    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    // Grid cell key. Spatial layers leave instant at 0.
    // Ordered by (instant, row, col) so sorted output is stable.
    struct GridKey {
        i32 col{0};
        i32 row{0};
        i64 instant{0};

        friend constexpr bool operator==(const GridKey&, const GridKey&) noexcept = default;
        friend constexpr auto operator<=>(const GridKey& a, const GridKey& b) noexcept {
            if (auto c = a.instant <=> b.instant; c != 0) return c;
            if (auto c = a.row <=> b.row; c != 0) return c;
            return a.col <=> b.col;
        }
    };

    [[nodiscard]] constexpr GridKey spatial_key(i32 col, i32 row) noexcept {
        return GridKey{col, row, 0};
    }

    [[nodiscard]] constexpr GridKey space_time_key(i32 col, i32 row, i64 instant) noexcept {
        return GridKey{col, row, instant};
    }

    // Inclusive axis-aligned region; valid when min <= max on every component.
    struct KeyBounds {
        GridKey min{};
        GridKey max{};
        friend constexpr bool operator==(const KeyBounds&, const KeyBounds&) noexcept = default;
    };

    // Inclusive interval of the one-dimensional index space.
    struct IndexRange {
        i64 start{0};
        i64 end{0};
        friend constexpr bool operator==(IndexRange, IndexRange) noexcept = default;
    };

    struct LayerId {
        std::string name;
        u32 zoom{0};

        friend bool operator==(const LayerId&, const LayerId&) = default;
        friend auto operator<=>(const LayerId&, const LayerId&) = default;
    };

    static_assert(std::is_trivially_copyable_v<GridKey>);
    static_assert(std::is_trivially_copyable_v<KeyBounds>);
    static_assert(std::is_trivially_copyable_v<IndexRange>);
    static_assert(std::is_standard_layout_v<GridKey>);
    static_assert(std::is_standard_layout_v<KeyBounds>);
    static_assert(std::is_standard_layout_v<IndexRange>);

} // namespace tessera::core
