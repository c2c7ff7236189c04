#pragma once

#include <string>
#include <type_traits>
#include <vector>

#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"
#include "tessera/index/key_index.hpp"
#include "tessera/storage/buffer.hpp"

namespace tessera::storage {
    using u32 = tessera::core::u32;
    using u64 = tessera::core::u64;
    using i64 = tessera::core::i64;

    constexpr u32 kLayoutVersion = 1;
    constexpr u32 kSegmentMagic = 0x54534547;  // "TSEG"

    constexpr u32 kSegmentHeaderBytes = 32;
    constexpr u32 kSegmentEntryBytes = 24;

    // Schema descriptor persisted with every layer written by this codec.
    inline constexpr const char* kTileRecordSchema = "tessera.tile.v1";

    enum class LayoutParseResult : u8 {
        Ok = 0,
        NeedMore = 1,
        Invalid = 2,
    };

    struct SegmentHeader {
        u32 magic{kSegmentMagic};
        u32 version{kLayoutVersion};
        u64 record_count{0};
        u32 flags{0};
        u32 reserved{0};
        u64 payload_bytes{0};
    };

    // One record of a segment: key is the record's index, offset is relative
    // to the start of the payload.
    struct SegmentEntry {
        i64 key{0};
        u64 offset{0};
        u64 size_bytes{0};
    };

    struct TileRecord {
        tessera::core::GridKey key{};
        std::vector<u8> value;
    };

    static_assert(std::is_trivially_copyable_v<SegmentHeader>);
    static_assert(std::is_trivially_copyable_v<SegmentEntry>);
    static_assert(std::is_standard_layout_v<SegmentHeader>);
    static_assert(std::is_standard_layout_v<SegmentEntry>);

    u32 layout_write_segment_header(const SegmentHeader& h, BufferMut out) noexcept;
    LayoutParseResult layout_read_segment_header(BufferView in, SegmentHeader* out) noexcept;

    u32 layout_write_segment_entry(const SegmentEntry& e, BufferMut out) noexcept;
    LayoutParseResult layout_read_segment_entry(BufferView in, SegmentEntry* out) noexcept;

    // Tile record codec. Unsupported when schema is not kTileRecordSchema,
    // Corrupt when the bytes do not decode.
    [[nodiscard]] tessera::core::Status record_encode(const TileRecord& record,
                                                      const std::string& schema,
                                                      std::vector<u8>* out) noexcept;
    [[nodiscard]] tessera::core::Status record_decode(BufferView in,
                                                      const std::string& schema,
                                                      TileRecord* out) noexcept;

    // Metadata attribute payloads.
    void layout_write_key_bounds(const tessera::core::KeyBounds& b, std::vector<u8>* out);
    LayoutParseResult layout_read_key_bounds(BufferView in, tessera::core::KeyBounds* out) noexcept;

    void layout_write_key_index(const tessera::index::KeyIndex& ix, std::vector<u8>* out);
    // Rebuilds the index through key_index_create so a decoded index is
    // always one the writer could have produced.
    LayoutParseResult layout_read_key_index(BufferView in, tessera::index::KeyIndex* out) noexcept;

} // namespace tessera::storage
