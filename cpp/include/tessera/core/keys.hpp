#pragma once

#include <algorithm>
#include <cstddef>

#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"

namespace tessera::core {

    [[nodiscard]] constexpr bool bounds_valid(const KeyBounds& b) noexcept {
        return b.min.col <= b.max.col && b.min.row <= b.max.row && b.min.instant <= b.max.instant;
    }

    [[nodiscard]] constexpr bool bounds_is_point(const KeyBounds& b) noexcept {
        return b.min == b.max;
    }

    [[nodiscard]] constexpr bool bounds_contains(const KeyBounds& b, const GridKey& k) noexcept {
        return k.col >= b.min.col && k.col <= b.max.col &&
               k.row >= b.min.row && k.row <= b.max.row &&
               k.instant >= b.min.instant && k.instant <= b.max.instant;
    }

    // true when inner lies entirely within outer.
    [[nodiscard]] constexpr bool bounds_contains(const KeyBounds& outer, const KeyBounds& inner) noexcept {
        return bounds_contains(outer, inner.min) && bounds_contains(outer, inner.max);
    }

    // Writes the overlap of a and b to out; false (out untouched) when disjoint.
    [[nodiscard]] constexpr bool bounds_intersect(const KeyBounds& a, const KeyBounds& b, KeyBounds* out) noexcept {
        KeyBounds r{};
        r.min.col = std::max(a.min.col, b.min.col);
        r.min.row = std::max(a.min.row, b.min.row);
        r.min.instant = std::max(a.min.instant, b.min.instant);
        r.max.col = std::min(a.max.col, b.max.col);
        r.max.row = std::min(a.max.row, b.max.row);
        r.max.instant = std::min(a.max.instant, b.max.instant);
        if (!bounds_valid(r)) {
            return false;
        }
        if (out) {
            *out = r;
        }
        return true;
    }

    [[nodiscard]] constexpr KeyBounds bounds_combine(const KeyBounds& a, const KeyBounds& b) noexcept {
        KeyBounds r{};
        r.min.col = std::min(a.min.col, b.min.col);
        r.min.row = std::min(a.min.row, b.min.row);
        r.min.instant = std::min(a.min.instant, b.min.instant);
        r.max.col = std::max(a.max.col, b.max.col);
        r.max.row = std::max(a.max.row, b.max.row);
        r.max.instant = std::max(a.max.instant, b.max.instant);
        return r;
    }

    // Minimal bounds enclosing keys[0..count). Invalid for an empty set.
    [[nodiscard]] Status keys_bounding(const GridKey* keys, std::size_t count, KeyBounds* out) noexcept;

} // namespace tessera::core
