#pragma once

#include <string>
#include <vector>

#include "tessera/catalog/catalog.hpp"
#include "tessera/catalog/metadata.hpp"
#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"
#include "tessera/index/key_index.hpp"
#include "tessera/index/merge_queue.hpp"
#include "tessera/storage/layout.hpp"
#include "tessera/storage/tile_store.hpp"

namespace tessera::layer {
    using u32 = tessera::core::u32;
    using i64 = tessera::core::i64;
    using LayerId = tessera::core::LayerId;
    using GridKey = tessera::core::GridKey;
    using KeyBounds = tessera::core::KeyBounds;
    using TileRecord = tessera::storage::TileRecord;

    using Dataset = std::vector<TileRecord>;

    // Which layer an operation failed on and where. status is the value the
    // operation returned.
    struct LayerError {
        LayerId layer;
        std::string stage;
        tessera::core::Status status{};
    };

    // The collaborators a layer operation runs against. Not owned.
    struct LayerIo {
        tessera::catalog::LayerCatalog* catalog{nullptr};
        tessera::storage::TileStore* store{nullptr};
        const char* format{"file"};   // recorded in the layer header; reads require a match
        LayerError* error{nullptr};   // when set, filled by any failure past argument checks
    };

    struct LayerReaderConfig {
        u32 max_workers{1};                                  // scans in flight; 0 and 1 scan inline
        i64 merge_fudge{tessera::index::kDefaultMergeFudge};
    };

    struct LayerWriterConfig {
        bool clobber{true};   // false: refuse to replace an existing layer
    };

    // "{name}/{zoom}"; the store partition holding the layer's rows.
    [[nodiscard]] std::string partition_selector(const LayerId& id);

    // Records whose key lies in query, in index order.
    //
    // Every failure comes back as LayerRead with the underlying cause kept
    // (LayerNotFound, AttributeCorrupt, InvalidBounds, store errors). A query
    // disjoint from the layer's extent is not an error and yields nothing.
    // out is empty on failure.
    [[nodiscard]] tessera::core::Status layer_read(const LayerIo& io,
                                                   const LayerId& id,
                                                   const KeyBounds& query,
                                                   Dataset* out,
                                                   const LayerReaderConfig& cfg = {}) noexcept;

    // Reads the layer's full extent.
    [[nodiscard]] tessera::core::Status layer_read_all(const LayerIo& io,
                                                       const LayerId& id,
                                                       Dataset* out,
                                                       const LayerReaderConfig& cfg = {}) noexcept;

    // The record stored under key. NotFound (Layer domain) when the key lies
    // outside the layer or has no tile; other failures are LayerRead.
    [[nodiscard]] tessera::core::Status layer_read_tile(const LayerIo& io,
                                                        const LayerId& id,
                                                        const GridKey& key,
                                                        TileRecord* out) noexcept;

    [[nodiscard]] tessera::core::Status layer_read_metadata(const LayerIo& io,
                                                            const LayerId& id,
                                                            tessera::catalog::LayerMetadata* out) noexcept;

    // Writes the rows, then the metadata.
    // - Invalid for an empty dataset
    // - Conflict when the layer exists and cfg.clobber is false
    // - LayerWrite (cause kept) when indexing or the data write fails
    // - Orphaned (cause kept) when the data landed but the metadata write
    //   failed
    // Replacing a layer drops its catalog entry before touching its rows, so
    // a failed rewrite leaves the layer absent rather than pointing old
    // metadata at new rows. An existing layer's key index is reused when
    // built by the same method and its key space covers the new data.
    [[nodiscard]] tessera::core::Status layer_write(const LayerIo& io,
                                                    const LayerId& id,
                                                    const Dataset& dataset,
                                                    const tessera::index::KeyIndexMethod& method,
                                                    const LayerWriterConfig& cfg = {}) noexcept;

} // namespace tessera::layer
