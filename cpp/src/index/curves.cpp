#include "tessera/index/curves.hpp"

#include <utility>

namespace tessera::index {

namespace {
    // Spread the low 32 bits of v so bit i lands at bit 2i.
    [[nodiscard]] u64 split2(u64 v) noexcept {
        v &= 0xffffffffull;
        v = (v | (v << 16)) & 0x0000ffff0000ffffull;
        v = (v | (v << 8)) & 0x00ff00ff00ff00ffull;
        v = (v | (v << 4)) & 0x0f0f0f0f0f0f0f0full;
        v = (v | (v << 2)) & 0x3333333333333333ull;
        v = (v | (v << 1)) & 0x5555555555555555ull;
        return v;
    }

    [[nodiscard]] u32 combine2(u64 v) noexcept {
        v &= 0x5555555555555555ull;
        v = (v | (v >> 1)) & 0x3333333333333333ull;
        v = (v | (v >> 2)) & 0x0f0f0f0f0f0f0f0full;
        v = (v | (v >> 4)) & 0x00ff00ff00ff00ffull;
        v = (v | (v >> 8)) & 0x0000ffff0000ffffull;
        v = (v | (v >> 16)) & 0x00000000ffffffffull;
        return static_cast<u32>(v);
    }

    // Spread the low 21 bits of v so bit i lands at bit 3i.
    [[nodiscard]] u64 split3(u64 v) noexcept {
        v &= 0x1fffffull;
        v = (v | (v << 32)) & 0x001f00000000ffffull;
        v = (v | (v << 16)) & 0x001f0000ff0000ffull;
        v = (v | (v << 8)) & 0x100f00f00f00f00full;
        v = (v | (v << 4)) & 0x10c30c30c30c30c3ull;
        v = (v | (v << 2)) & 0x1249249249249249ull;
        return v;
    }

    [[nodiscard]] u32 combine3(u64 v) noexcept {
        v &= 0x1249249249249249ull;
        v = (v | (v >> 2)) & 0x10c30c30c30c30c3ull;
        v = (v | (v >> 4)) & 0x100f00f00f00f00full;
        v = (v | (v >> 8)) & 0x001f0000ff0000ffull;
        v = (v | (v >> 16)) & 0x001f00000000ffffull;
        v = (v | (v >> 32)) & 0x00000000001fffffull;
        return static_cast<u32>(v);
    }

    void hilbert_rotate(u64 n, u64* x, u64* y, u64 rx, u64 ry) noexcept {
        if (ry == 0) {
            if (rx == 1) {
                *x = n - 1 - *x;
                *y = n - 1 - *y;
            }
            std::swap(*x, *y);
        }
    }
}

u64 z2_encode(u32 x, u32 y) noexcept {
    return split2(x) | (split2(y) << 1);
}

void z2_decode(u64 z, u32* x, u32* y) noexcept {
    if (x) *x = combine2(z);
    if (y) *y = combine2(z >> 1);
}

u64 z3_encode(u32 x, u32 y, u32 t) noexcept {
    return split3(x) | (split3(y) << 1) | (split3(t) << 2);
}

void z3_decode(u64 z, u32* x, u32* y, u32* t) noexcept {
    if (x) *x = combine3(z);
    if (y) *y = combine3(z >> 1);
    if (t) *t = combine3(z >> 2);
}

u64 hilbert2_encode(u32 order, u32 x, u32 y) noexcept {
    if (order == 0) {
        return 0;
    }
    const u64 n = u64{1} << order;
    u64 px = x & (n - 1);
    u64 py = y & (n - 1);
    u64 d = 0;
    for (u64 s = n / 2; s > 0; s /= 2) {
        const u64 rx = (px & s) ? 1 : 0;
        const u64 ry = (py & s) ? 1 : 0;
        d += s * s * ((3 * rx) ^ ry);
        hilbert_rotate(n, &px, &py, rx, ry);
    }
    return d;
}

void hilbert2_decode(u32 order, u64 d, u32* x, u32* y) noexcept {
    const u64 n = u64{1} << order;
    u64 t = d;
    u64 px = 0;
    u64 py = 0;
    for (u64 s = 1; s < n; s *= 2) {
        const u64 rx = 1 & (t / 2);
        const u64 ry = 1 & (t ^ rx);
        hilbert_rotate(s, &px, &py, rx, ry);
        px += s * rx;
        py += s * ry;
        t /= 4;
    }
    if (x) *x = static_cast<u32>(px);
    if (y) *y = static_cast<u32>(py);
}

} // namespace tessera::index
