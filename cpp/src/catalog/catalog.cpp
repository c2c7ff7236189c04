#include "tessera/catalog/catalog.hpp"
#include "tessera/core/keys.hpp"
#include "tessera/core/log.hpp"

#include <mutex>

namespace tessera::catalog {

using namespace tessera::core;

namespace {
    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    [[nodiscard]] bool metadata_valid(const LayerMetadata& md) noexcept {
        return !md.header.format.empty() && !md.header.partition.empty() && !md.schema.empty() &&
               bounds_valid(md.key_bounds);
    }
}

LayerCatalog::LayerCatalog() noexcept = default;

LayerCatalog::~LayerCatalog() noexcept {
    if (open_) {
        (void)close();
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Status LayerCatalog::open(const CatalogConfig& cfg) noexcept {
    std::unique_lock<std::shared_mutex> lock(rw_);
    if (open_) {
        return invalid();
    }

    Status s = tessera::db::db_open(cfg.db, &db_);
    if (!is_ok(s)) {
        return s;
    }
    cache_.reset(cfg.cache_capacity);
    open_ = true;
    return ok_status();
}

Status LayerCatalog::close() noexcept {
    std::unique_lock<std::shared_mutex> lock(rw_);
    if (!open_) {
        return invalid();
    }

    open_ = false;
    cache_.clear();
    Status s = tessera::db::db_close(db_);
    db_ = {};
    return s;
}

bool LayerCatalog::is_open() const noexcept {
    std::shared_lock<std::shared_mutex> lock(rw_);
    return open_;
}

// ============================================================================
// Attributes
// ============================================================================

Status LayerCatalog::write(const LayerId& id, const LayerMetadata& metadata) noexcept {
    if (id.name.empty() || !metadata_valid(metadata)) {
        return invalid();
    }

    std::vector<tessera::db::AttributeRow> rows;
    Status s = attributes_encode(metadata, &rows);
    if (!is_ok(s)) {
        return s;
    }

    std::unique_lock<std::shared_mutex> lock(rw_);
    if (!open_) {
        return invalid();
    }

    s = tessera::db::db_attr_put_all(db_, id, rows);
    if (!is_ok(s)) {
        log_write(LogLevel::Error, "catalog: write %s/%u failed: %s", id.name.c_str(), id.zoom,
                  status_code_name(s.code));
        return s;
    }
    cache_.invalidate(id);
    return ok_status();
}

Status LayerCatalog::read(const LayerId& id, LayerMetadata* out) noexcept {
    if (!out) {
        return invalid();
    }

    std::shared_lock<std::shared_mutex> lock(rw_);
    if (!open_) {
        return invalid();
    }

    LayerMetadata md;
    bool cached = true;
    for (u32 i = 0; i < kAttributeKindCount && cached; ++i) {
        const auto kind = static_cast<AttributeKind>(i);
        std::vector<u8> payload;
        cached = cache_.get(id, kind, &payload) && is_ok(attribute_decode(kind, payload, &md));
    }
    if (cached) {
        *out = std::move(md);
        return ok_status();
    }

    return load(id, out);
}

Status LayerCatalog::load(const LayerId& id, LayerMetadata* out) noexcept {
    std::vector<tessera::db::AttributeRow> rows;
    Status s = tessera::db::db_attr_get_all(db_, id, &rows);
    if (s.code == StatusCode::NotFound) {
        return make_status(StatusDomain::Catalog, StatusCode::LayerNotFound);
    }
    if (!is_ok(s)) {
        return s;
    }

    LayerMetadata md;
    bool seen[kAttributeKindCount] = {};
    for (const tessera::db::AttributeRow& row : rows) {
        AttributeKind kind{};
        if (!attribute_kind_from_name(row.name, &kind)) {
            continue;  // written by a newer version
        }
        s = attribute_verify(row);
        if (is_ok(s)) {
            s = attribute_decode(kind, row.value, &md);
        }
        if (!is_ok(s)) {
            log_write(LogLevel::Error, "catalog: %s/%u attribute %s is corrupt", id.name.c_str(), id.zoom,
                      row.name.c_str());
            return s;
        }
        seen[static_cast<u32>(kind)] = true;
    }

    for (u32 i = 0; i < kAttributeKindCount; ++i) {
        if (!seen[i]) {
            log_write(LogLevel::Error, "catalog: %s/%u is missing attribute %s", id.name.c_str(), id.zoom,
                      attribute_name(static_cast<AttributeKind>(i)));
            return make_status(StatusDomain::Catalog, StatusCode::AttributeCorrupt);
        }
    }

    for (tessera::db::AttributeRow& row : rows) {
        AttributeKind kind{};
        if (attribute_kind_from_name(row.name, &kind)) {
            cache_.put(id, kind, std::move(row.value));
        }
    }

    *out = std::move(md);
    return ok_status();
}

Status LayerCatalog::exists(const LayerId& id, bool* out) noexcept {
    if (!out) {
        return invalid();
    }

    std::shared_lock<std::shared_mutex> lock(rw_);
    if (!open_) {
        return invalid();
    }
    return tessera::db::db_layer_exists(db_, id, out);
}

Status LayerCatalog::remove(const LayerId& id) noexcept {
    std::unique_lock<std::shared_mutex> lock(rw_);
    if (!open_) {
        return invalid();
    }

    Status s = tessera::db::db_attr_delete_all(db_, id);
    if (s.code == StatusCode::NotFound) {
        return make_status(StatusDomain::Catalog, StatusCode::LayerNotFound);
    }
    if (!is_ok(s)) {
        return s;
    }
    cache_.invalidate(id);
    return ok_status();
}

Status LayerCatalog::list(std::vector<LayerId>* out) noexcept {
    if (!out) {
        return invalid();
    }

    std::shared_lock<std::shared_mutex> lock(rw_);
    if (!open_) {
        return invalid();
    }
    return tessera::db::db_layer_list(db_, out);
}

} // namespace tessera::catalog
