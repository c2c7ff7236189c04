#pragma once

#include "tessera/core/types.hpp"

namespace tessera::index {
    using u32 = tessera::core::u32;
    using u64 = tessera::core::u64;

    // Widest per-dimension coordinate each curve can address while the
    // index still fits a non-negative i64.
    inline constexpr u32 kZ2MaxBits = 31;
    inline constexpr u32 kZ3MaxBits = 21;
    inline constexpr u32 kHilbert2MaxBits = 31;

    // Morton (Z-order) interleaving. x occupies the lowest bit of each group.
    [[nodiscard]] u64 z2_encode(u32 x, u32 y) noexcept;
    void z2_decode(u64 z, u32* x, u32* y) noexcept;

    [[nodiscard]] u64 z3_encode(u32 x, u32 y, u32 t) noexcept;
    void z3_decode(u64 z, u32* x, u32* y, u32* t) noexcept;

    // Hilbert curve over a 2^order x 2^order grid.
    [[nodiscard]] u64 hilbert2_encode(u32 order, u32 x, u32 y) noexcept;
    void hilbert2_decode(u32 order, u64 d, u32* x, u32* y) noexcept;

    // Smallest b such that 2^b >= extent (0 for extent <= 1).
    [[nodiscard]] constexpr u32 bits_for_extent(u64 extent) noexcept {
        u32 b = 0;
        while (b < 64 && (u64{1} << b) < extent) {
            ++b;
        }
        return b;
    }

} // namespace tessera::index
