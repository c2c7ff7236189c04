#pragma once

#include <string>
#include <vector>

#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"
#include "tessera/db/db.hpp"
#include "tessera/index/key_index.hpp"

namespace tessera::catalog {
    using u8 = tessera::core::u8;
    using u32 = tessera::core::u32;

    constexpr u32 kAttributeVersion = 1;

    // Where a layer's rows live.
    struct LayerHeader {
        std::string format;      // backing store kind, e.g. "file"
        std::string partition;   // partition selector passed to the store

        friend bool operator==(const LayerHeader&, const LayerHeader&) = default;
    };

    struct LayerMetadata {
        LayerHeader header;
        tessera::core::KeyBounds key_bounds{};
        tessera::index::KeyIndex key_index{};
        std::string schema;
    };

    // The four attributes persisted per layer.
    enum class AttributeKind : u8 {
        Header = 0,
        KeyBounds = 1,
        KeyIndex = 2,
        Schema = 3,
    };

    inline constexpr u32 kAttributeKindCount = 4;

    [[nodiscard]] const char* attribute_name(AttributeKind kind) noexcept;
    [[nodiscard]] bool attribute_kind_from_name(const std::string& name, AttributeKind* out) noexcept;

    // Encodes all four attributes, each with its BLAKE3 checksum, in
    // AttributeKind order.
    [[nodiscard]] tessera::core::Status attributes_encode(const LayerMetadata& md,
                                                          std::vector<tessera::db::AttributeRow>* out) noexcept;

    // Checks one row's checksum. AttributeCorrupt on mismatch.
    [[nodiscard]] tessera::core::Status attribute_verify(const tessera::db::AttributeRow& row) noexcept;

    // Decodes one attribute payload into md. AttributeCorrupt when the bytes
    // do not match the attribute's format.
    [[nodiscard]] tessera::core::Status attribute_decode(AttributeKind kind,
                                                         const std::vector<u8>& payload,
                                                         LayerMetadata* md) noexcept;

} // namespace tessera::catalog
