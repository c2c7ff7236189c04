#include "tessera/catalog/metadata.hpp"
#include "tessera/storage/bytes.hpp"
#include "tessera/storage/hashing.hpp"
#include "tessera/storage/layout.hpp"

namespace tessera::catalog {

using namespace tessera::core;
using tessera::storage::ByteReader;
using tessera::storage::ByteWriter;
using tessera::storage::LayoutParseResult;

namespace {
    [[nodiscard]] Status corrupt() noexcept {
        return make_status(StatusDomain::Catalog, StatusCode::AttributeCorrupt);
    }

    [[nodiscard]] Status checksum_of(const std::vector<u8>& payload, Hash256* out) noexcept {
        return tessera::storage::hash_compute({payload.data(), static_cast<u32>(payload.size())}, out);
    }

    void encode_payload(AttributeKind kind, const LayerMetadata& md, std::vector<u8>* out) {
        ByteWriter w{out};
        w.u32v(kAttributeVersion);
        switch (kind) {
            case AttributeKind::Header:
                w.str(md.header.format);
                w.str(md.header.partition);
                break;
            case AttributeKind::KeyBounds:
                tessera::storage::layout_write_key_bounds(md.key_bounds, out);
                break;
            case AttributeKind::KeyIndex:
                tessera::storage::layout_write_key_index(md.key_index, out);
                break;
            case AttributeKind::Schema:
                w.str(md.schema);
                break;
        }
    }
}

const char* attribute_name(AttributeKind kind) noexcept {
    switch (kind) {
        case AttributeKind::Header: return "header";
        case AttributeKind::KeyBounds: return "keyBounds";
        case AttributeKind::KeyIndex: return "keyIndex";
        case AttributeKind::Schema: return "schema";
    }
    return "";
}

bool attribute_kind_from_name(const std::string& name, AttributeKind* out) noexcept {
    for (u32 i = 0; i < kAttributeKindCount; ++i) {
        const auto kind = static_cast<AttributeKind>(i);
        if (name == attribute_name(kind)) {
            if (out) *out = kind;
            return true;
        }
    }
    return false;
}

Status attributes_encode(const LayerMetadata& md, std::vector<tessera::db::AttributeRow>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    out->clear();
    out->reserve(kAttributeKindCount);

    for (u32 i = 0; i < kAttributeKindCount; ++i) {
        const auto kind = static_cast<AttributeKind>(i);
        tessera::db::AttributeRow row;
        row.name = attribute_name(kind);
        encode_payload(kind, md, &row.value);
        Status s = checksum_of(row.value, &row.checksum);
        if (!is_ok(s)) {
            out->clear();
            return s;
        }
        out->push_back(std::move(row));
    }
    return ok_status();
}

Status attribute_verify(const tessera::db::AttributeRow& row) noexcept {
    Hash256 actual{};
    Status s = checksum_of(row.value, &actual);
    if (!is_ok(s)) {
        return s;
    }
    return actual == row.checksum ? ok_status() : corrupt();
}

Status attribute_decode(AttributeKind kind, const std::vector<u8>& payload, LayerMetadata* md) noexcept {
    if (!md) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    ByteReader r{payload.data(), payload.size()};
    u32 version = 0;
    if (!r.u32v(&version) || version != kAttributeVersion) {
        return corrupt();
    }
    const tessera::storage::BufferView rest{payload.data() + r.pos, static_cast<u32>(payload.size() - r.pos)};

    switch (kind) {
        case AttributeKind::Header: {
            LayerHeader h;
            if (!r.str(&h.format) || !r.str(&h.partition) || !r.done()) {
                return corrupt();
            }
            md->header = std::move(h);
            return ok_status();
        }
        case AttributeKind::KeyBounds: {
            KeyBounds b{};
            if (rest.len != 32 || tessera::storage::layout_read_key_bounds(rest, &b) != LayoutParseResult::Ok) {
                return corrupt();
            }
            md->key_bounds = b;
            return ok_status();
        }
        case AttributeKind::KeyIndex: {
            tessera::index::KeyIndex ix{};
            if (tessera::storage::layout_read_key_index(rest, &ix) != LayoutParseResult::Ok) {
                return corrupt();
            }
            md->key_index = ix;
            return ok_status();
        }
        case AttributeKind::Schema: {
            std::string schema;
            if (!r.str(&schema) || !r.done()) {
                return corrupt();
            }
            md->schema = std::move(schema);
            return ok_status();
        }
    }
    return corrupt();
}

} // namespace tessera::catalog
