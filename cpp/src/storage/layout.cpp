#include "tessera/storage/layout.hpp"
#include "tessera/storage/bytes.hpp"
#include "tessera/core/keys.hpp"

#include <cstddef>
#include <cstring>
#include <utility>

namespace tessera::storage {
    using namespace tessera::core;

    namespace {
        constexpr u32 kKeyBoundsBytes = 32;

        void write_key(ByteWriter& w, const GridKey& k) {
            w.i32v(k.col);
            w.i32v(k.row);
            w.i64v(k.instant);
        }

        [[nodiscard]] bool read_key(ByteReader& r, GridKey* k) noexcept {
            return r.i32v(&k->col) && r.i32v(&k->row) && r.i64v(&k->instant);
        }
    } // namespace

    u32 layout_write_segment_header(const SegmentHeader& h, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kSegmentHeaderBytes) {
            return 0;
        }
        if (h.magic != kSegmentMagic || h.version != kLayoutVersion) {
            return 0;
        }
        if (h.reserved != 0) {
            return 0;
        }

        u8* p = out.data;
        put_u32_be(p + 0, h.magic);
        put_u32_be(p + 4, h.version);
        put_u64_be(p + 8, h.record_count);
        put_u32_be(p + 16, h.flags);
        put_u32_be(p + 20, h.reserved);
        put_u64_be(p + 24, h.payload_bytes);
        return kSegmentHeaderBytes;
    }

    LayoutParseResult layout_read_segment_header(BufferView in, SegmentHeader* out) noexcept {
        if (out == nullptr) {
            return LayoutParseResult::Invalid;
        }
        if (in.len < kSegmentHeaderBytes) {
            return LayoutParseResult::NeedMore;
        }
        if (in.data == nullptr) {
            return LayoutParseResult::Invalid;
        }

        const u8* p = in.data;
        SegmentHeader h{};
        h.magic = get_u32_be(p + 0);
        h.version = get_u32_be(p + 4);
        h.record_count = get_u64_be(p + 8);
        h.flags = get_u32_be(p + 16);
        h.reserved = get_u32_be(p + 20);
        h.payload_bytes = get_u64_be(p + 24);

        if (h.magic != kSegmentMagic || h.version != kLayoutVersion) {
            return LayoutParseResult::Invalid;
        }
        if (h.reserved != 0) {
            return LayoutParseResult::Invalid;
        }

        *out = h;
        return LayoutParseResult::Ok;
    }

    u32 layout_write_segment_entry(const SegmentEntry& e, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kSegmentEntryBytes) {
            return 0;
        }

        u8* p = out.data;
        put_u64_be(p + 0, static_cast<u64>(e.key));
        put_u64_be(p + 8, e.offset);
        put_u64_be(p + 16, e.size_bytes);
        return kSegmentEntryBytes;
    }

    LayoutParseResult layout_read_segment_entry(BufferView in, SegmentEntry* out) noexcept {
        if (out == nullptr) {
            return LayoutParseResult::Invalid;
        }
        if (in.len < kSegmentEntryBytes) {
            return LayoutParseResult::NeedMore;
        }
        if (in.data == nullptr) {
            return LayoutParseResult::Invalid;
        }

        const u8* p = in.data;
        out->key = static_cast<i64>(get_u64_be(p + 0));
        out->offset = get_u64_be(p + 8);
        out->size_bytes = get_u64_be(p + 16);
        return LayoutParseResult::Ok;
    }

    Status record_encode(const TileRecord& record, const std::string& schema, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (schema != kTileRecordSchema) {
            return make_status(StatusDomain::Storage, StatusCode::Unsupported);
        }

        out->clear();
        out->reserve(20 + record.value.size());
        ByteWriter w{out};
        write_key(w, record.key);
        w.bytes(record.value.data(), static_cast<u32>(record.value.size()));
        return ok_status();
    }

    Status record_decode(BufferView in, const std::string& schema, TileRecord* out) noexcept {
        if (out == nullptr || (in.len > 0 && in.data == nullptr)) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (schema != kTileRecordSchema) {
            return make_status(StatusDomain::Storage, StatusCode::Unsupported);
        }

        ByteReader r{in.data, in.len};
        TileRecord rec{};
        if (!read_key(r, &rec.key) || !r.bytes(&rec.value) || !r.done()) {
            return make_status(StatusDomain::Storage, StatusCode::Corrupt);
        }

        *out = std::move(rec);
        return ok_status();
    }

    void layout_write_key_bounds(const KeyBounds& b, std::vector<u8>* out) {
        ByteWriter w{out};
        write_key(w, b.min);
        write_key(w, b.max);
    }

    LayoutParseResult layout_read_key_bounds(BufferView in, KeyBounds* out) noexcept {
        if (out == nullptr) {
            return LayoutParseResult::Invalid;
        }
        if (in.len < kKeyBoundsBytes) {
            return LayoutParseResult::NeedMore;
        }

        ByteReader r{in.data, in.len};
        KeyBounds b{};
        if (!read_key(r, &b.min) || !read_key(r, &b.max)) {
            return LayoutParseResult::Invalid;
        }
        if (!bounds_valid(b)) {
            return LayoutParseResult::Invalid;
        }

        *out = b;
        return LayoutParseResult::Ok;
    }

    void layout_write_key_index(const tessera::index::KeyIndex& ix, std::vector<u8>* out) {
        ByteWriter w{out};
        w.u8v(static_cast<u8>(ix.kind));
        write_key(w, ix.key_space.min);
        write_key(w, ix.key_space.max);
        w.i64v(ix.temporal_resolution);
        w.u32v(ix.bits);
        w.u32v(ix.max_depth);
    }

    LayoutParseResult layout_read_key_index(BufferView in, tessera::index::KeyIndex* out) noexcept {
        if (out == nullptr) {
            return LayoutParseResult::Invalid;
        }
        if (in.len < 1 + kKeyBoundsBytes + 16) {
            return LayoutParseResult::NeedMore;
        }

        ByteReader r{in.data, in.len};
        u8 raw_kind = 0;
        KeyBounds key_space{};
        i64 resolution = 0;
        u32 bits = 0;
        u32 max_depth = 0;
        if (!r.u8v(&raw_kind) || !read_key(r, &key_space.min) || !read_key(r, &key_space.max) ||
            !r.i64v(&resolution) || !r.u32v(&bits) || !r.u32v(&max_depth) || !r.done()) {
            return LayoutParseResult::Invalid;
        }
        if (!tessera::index::key_index_kind_valid(raw_kind)) {
            return LayoutParseResult::Invalid;
        }

        tessera::index::KeyIndexMethod method{};
        method.kind = static_cast<tessera::index::KeyIndexKind>(raw_kind);
        method.temporal_resolution = resolution;
        method.max_depth = max_depth;

        tessera::index::KeyIndex ix{};
        if (!is_ok(tessera::index::key_index_create(method, key_space, &ix))) {
            return LayoutParseResult::Invalid;
        }
        if (ix.bits != bits || ix.temporal_resolution != resolution) {
            return LayoutParseResult::Invalid;
        }

        *out = ix;
        return LayoutParseResult::Ok;
    }
} // namespace tessera::storage
