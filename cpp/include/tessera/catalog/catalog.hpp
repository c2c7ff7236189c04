#pragma once

#include <shared_mutex>
#include <vector>

#include "tessera/catalog/attribute_cache.hpp"
#include "tessera/catalog/metadata.hpp"
#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"
#include "tessera/db/db.hpp"

namespace tessera::catalog {

    struct CatalogConfig {
        tessera::db::DbConfig db{};
        u32 cache_capacity{kDefaultCacheCapacity};
    };

    // Layer metadata catalog over the SQLite attribute table.
    //
    // write() replaces all four attributes of a layer in one transaction and
    // then drops the layer from the cache. read() serves from the cache when
    // every attribute is present, otherwise loads all four in one statement.
    // Reads hold the catalog lock shared and writes hold it exclusively, so a
    // reader in this process never mixes attributes from two writes.
    class LayerCatalog {
    public:
        LayerCatalog() noexcept;
        ~LayerCatalog() noexcept;
        LayerCatalog(const LayerCatalog&) = delete;
        LayerCatalog& operator=(const LayerCatalog&) = delete;

        [[nodiscard]] tessera::core::Status open(const CatalogConfig& cfg) noexcept;
        [[nodiscard]] tessera::core::Status close() noexcept;
        [[nodiscard]] bool is_open() const noexcept;

        [[nodiscard]] tessera::core::Status write(const tessera::core::LayerId& id,
                                                  const LayerMetadata& metadata) noexcept;

        // LayerNotFound when the layer was never written; AttributeCorrupt
        // when an attribute is missing, fails its checksum or fails to decode.
        [[nodiscard]] tessera::core::Status read(const tessera::core::LayerId& id,
                                                 LayerMetadata* out) noexcept;

        [[nodiscard]] tessera::core::Status exists(const tessera::core::LayerId& id, bool* out) noexcept;

        // LayerNotFound when there was nothing to delete.
        [[nodiscard]] tessera::core::Status remove(const tessera::core::LayerId& id) noexcept;

        [[nodiscard]] tessera::core::Status list(std::vector<tessera::core::LayerId>* out) noexcept;

        [[nodiscard]] const AttributeCache& cache() const noexcept { return cache_; }

    private:
        [[nodiscard]] tessera::core::Status load(const tessera::core::LayerId& id, LayerMetadata* out) noexcept;

        mutable std::shared_mutex rw_;
        tessera::db::DbHandle db_{};
        bool open_{false};
        AttributeCache cache_;
    };

} // namespace tessera::catalog
