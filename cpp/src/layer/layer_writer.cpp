#include "tessera/layer/layer_io.hpp"
#include "tessera/core/keys.hpp"
#include "tessera/core/log.hpp"

#include <algorithm>

namespace tessera::layer {

using namespace tessera::core;
using tessera::catalog::LayerMetadata;
using tessera::index::KeyIndex;
using tessera::index::KeyIndexMethod;
using tessera::storage::StoreRecord;

namespace {
    [[nodiscard]] Status failed(const LayerIo& io, const LayerId& id, const char* stage, Status s) noexcept {
        if (io.error) {
            *io.error = LayerError{id, stage, s};
        }
        return s;
    }

    [[nodiscard]] Status write_error(const LayerIo& io, const LayerId& id, const char* stage, Status cause) noexcept {
        log_write(LogLevel::Error, "layer: write %s/%u failed at %s: %s/%s", id.name.c_str(), id.zoom, stage,
                  status_domain_name(cause.cause_domain), status_code_name(cause.cause));
        return failed(io, id, stage, wrap_status(StatusDomain::Layer, StatusCode::LayerWrite, cause));
    }

    [[nodiscard]] bool same_method(const KeyIndexMethod& a, const KeyIndexMethod& b) noexcept {
        return a.kind == b.kind && a.temporal_resolution == b.temporal_resolution && a.max_depth == b.max_depth;
    }

    // The existing layer's index when it can address bounds under the same
    // method, otherwise a fresh index over bounds. exists is set when the
    // catalog holds an entry for id, readable or not.
    [[nodiscard]] Status choose_index(const LayerIo& io, const LayerId& id, const KeyIndexMethod& method,
                                      const KeyBounds& bounds, KeyIndex* out, bool* exists) noexcept {
        LayerMetadata existing;
        Status s = io.catalog->read(id, &existing);
        *exists = is_ok(s) || s.code == StatusCode::AttributeCorrupt;
        if (is_ok(s)) {
            if (same_method(tessera::index::key_index_method(existing.key_index), method) &&
                tessera::index::key_index_covers(existing.key_index, bounds)) {
                *out = existing.key_index;
                return ok_status();
            }
        } else if (s.code != StatusCode::LayerNotFound && s.code != StatusCode::AttributeCorrupt) {
            return s;
        }
        return tessera::index::key_index_create(method, bounds, out);
    }
}

// ============================================================================
// Write
// ============================================================================

Status layer_write(const LayerIo& io, const LayerId& id, const Dataset& dataset,
                   const KeyIndexMethod& method, const LayerWriterConfig& cfg) noexcept {
    if (!io.catalog || !io.store || !io.format || io.format[0] == '\0' || id.name.empty()) {
        return make_status(StatusDomain::Layer, StatusCode::Invalid);
    }
    if (dataset.empty()) {
        return make_status(StatusDomain::Layer, StatusCode::Invalid);
    }

    std::vector<GridKey> keys;
    keys.reserve(dataset.size());
    for (const TileRecord& r : dataset) {
        keys.push_back(r.key);
    }

    KeyBounds bounds{};
    Status s = keys_bounding(keys.data(), keys.size(), &bounds);
    if (!is_ok(s)) {
        return write_error(io, id, "bounds", s);
    }

    KeyIndex index{};
    bool exists = false;
    s = choose_index(io, id, method, bounds, &index, &exists);
    if (!is_ok(s)) {
        return write_error(io, id, "index", s);
    }
    if (exists && !cfg.clobber) {
        log_write(LogLevel::Warn, "layer: %s/%u exists and clobber is off", id.name.c_str(), id.zoom);
        return failed(io, id, "exists", make_status(StatusDomain::Layer, StatusCode::Conflict));
    }

    std::vector<StoreRecord> rows;
    rows.reserve(dataset.size());
    for (const TileRecord& r : dataset) {
        StoreRecord row;
        s = tessera::index::key_index_to_index(index, r.key, &row.key);
        if (is_ok(s)) {
            s = tessera::storage::record_encode(r, tessera::storage::kTileRecordSchema, &row.value);
        }
        if (!is_ok(s)) {
            return write_error(io, id, "encode", s);
        }
        rows.push_back(std::move(row));
    }

    std::sort(rows.begin(), rows.end(), [](const StoreRecord& a, const StoreRecord& b) { return a.key < b.key; });
    auto dup = std::adjacent_find(rows.begin(), rows.end(),
                                  [](const StoreRecord& a, const StoreRecord& b) { return a.key == b.key; });
    if (dup != rows.end()) {
        return write_error(io, id, "encode", make_status(StatusDomain::Layer, StatusCode::Conflict));
    }

    LayerMetadata md;
    md.header.format = io.format;
    md.header.partition = partition_selector(id);
    md.key_bounds = bounds;
    md.key_index = index;
    md.schema = tessera::storage::kTileRecordSchema;

    if (exists) {
        s = io.catalog->remove(id);
        if (!is_ok(s) && s.code != StatusCode::LayerNotFound) {
            return write_error(io, id, "unlink", s);
        }
    }

    const std::size_t count = rows.size();
    s = io.store->write(md.header.partition, std::move(rows));
    if (!is_ok(s)) {
        return write_error(io, id, "data", s);
    }

    s = io.catalog->write(id, md);
    if (!is_ok(s)) {
        log_write(LogLevel::Warn, "layer: %s/%u data written to %s but metadata write failed: %s/%s",
                  id.name.c_str(), id.zoom, md.header.partition.c_str(), status_domain_name(s.cause_domain),
                  status_code_name(s.cause));
        return failed(io, id, "metadata", wrap_status(StatusDomain::Layer, StatusCode::Orphaned, s));
    }

    log_write(LogLevel::Info, "layer: wrote %s/%u: %zu records, index %s", id.name.c_str(), id.zoom, count,
              tessera::index::key_index_kind_name(index.kind));
    return ok_status();
}

} // namespace tessera::layer
