#include "tessera/layer/layer_io.hpp"
#include "tessera/core/keys.hpp"
#include "tessera/core/log.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <system_error>
#include <thread>

namespace tessera::layer {

using namespace tessera::core;
using tessera::catalog::LayerMetadata;
using tessera::storage::StoreRecord;

namespace {
    [[nodiscard]] Status failed(const LayerIo& io, const LayerId& id, const char* stage, Status s) noexcept {
        if (io.error) {
            *io.error = LayerError{id, stage, s};
        }
        return s;
    }

    [[nodiscard]] Status read_error(const LayerIo& io, const LayerId& id, const char* stage, Status cause) noexcept {
        log_write(LogLevel::Error, "layer: read %s/%u failed at %s: %s/%s", id.name.c_str(), id.zoom, stage,
                  status_domain_name(cause.cause_domain), status_code_name(cause.cause));
        return failed(io, id, stage, wrap_status(StatusDomain::Layer, StatusCode::LayerRead, cause));
    }

    [[nodiscard]] Status check_format(const LayerIo& io, const LayerId& id, const LayerMetadata& md) noexcept {
        if (!io.format || md.header.format != io.format) {
            log_write(LogLevel::Warn, "layer: %s/%u is stored as '%s', not '%s'", id.name.c_str(), id.zoom,
                      md.header.format.c_str(), io.format ? io.format : "");
            return read_error(io, id, "header", make_status(StatusDomain::Layer, StatusCode::Unsupported));
        }
        return ok_status();
    }

    // Runs one scan per range, results kept in range order.
    class ScanBatch {
    public:
        ScanBatch(tessera::storage::TileStore* store, const std::string& partition,
                  const std::vector<IndexRange>& ranges)
            : store_(store), partition_(partition), ranges_(ranges), results_(ranges.size()) {}

        [[nodiscard]] Status run(u32 max_workers) noexcept {
            const std::size_t workers = std::min<std::size_t>(max_workers, ranges_.size());
            if (workers <= 1) {
                work();
                return first_error_;
            }

            std::vector<std::thread> threads;
            threads.reserve(workers);
            for (std::size_t i = 0; i < workers; ++i) {
                try {
                    threads.emplace_back([this] { work(); });
                } catch (const std::system_error& e) {
                    // Whatever threads did start plus this one drain the queue.
                    log_write(LogLevel::Debug, "layer: scan worker not started: %s", e.what());
                    break;
                }
            }
            work();
            for (std::thread& t : threads) {
                t.join();
            }
            return first_error_;
        }

        [[nodiscard]] std::vector<std::vector<StoreRecord>>& results() noexcept { return results_; }

    private:
        void work() noexcept {
            for (;;) {
                if (failed_.load(std::memory_order_acquire)) {
                    return;
                }
                const std::size_t i = next_.fetch_add(1, std::memory_order_relaxed);
                if (i >= ranges_.size()) {
                    return;
                }
                Status s = store_->scan(partition_, ranges_[i], &results_[i]);
                if (!is_ok(s)) {
                    std::lock_guard<std::mutex> lock(error_mutex_);
                    if (is_ok(first_error_)) {
                        first_error_ = s;
                    }
                    failed_.store(true, std::memory_order_release);
                    return;
                }
            }
        }

        tessera::storage::TileStore* store_;
        const std::string& partition_;
        const std::vector<IndexRange>& ranges_;
        std::vector<std::vector<StoreRecord>> results_;
        std::atomic<std::size_t> next_{0};
        std::atomic<bool> failed_{false};
        std::mutex error_mutex_;
        Status first_error_{};
    };
}

std::string partition_selector(const LayerId& id) {
    return id.name + "/" + std::to_string(id.zoom);
}

// ============================================================================
// Metadata
// ============================================================================

Status layer_read_metadata(const LayerIo& io, const LayerId& id, LayerMetadata* out) noexcept {
    if (!io.catalog || !out) {
        return make_status(StatusDomain::Layer, StatusCode::Invalid);
    }
    Status s = io.catalog->read(id, out);
    if (!is_ok(s)) {
        return read_error(io, id, "metadata", s);
    }
    return ok_status();
}

// ============================================================================
// Query
// ============================================================================

Status layer_read(const LayerIo& io, const LayerId& id, const KeyBounds& query, Dataset* out,
                  const LayerReaderConfig& cfg) noexcept {
    if (!io.catalog || !io.store || !out) {
        return make_status(StatusDomain::Layer, StatusCode::Invalid);
    }
    out->clear();

    LayerMetadata md;
    Status s = layer_read_metadata(io, id, &md);
    if (!is_ok(s)) {
        return s;
    }

    if (!bounds_valid(query)) {
        return read_error(io, id, "query", make_status(StatusDomain::Index, StatusCode::InvalidBounds));
    }
    s = check_format(io, id, md);
    if (!is_ok(s)) {
        return s;
    }

    KeyBounds clipped{};
    if (!bounds_intersect(query, md.key_bounds, &clipped)) {
        return ok_status();
    }

    std::vector<IndexRange> ranges;
    s = tessera::index::key_index_ranges(md.key_index, clipped, &ranges);
    if (!is_ok(s)) {
        return read_error(io, id, "decompose", s);
    }

    std::vector<IndexRange> merged;
    s = tessera::index::merge_ranges(ranges, &merged, cfg.merge_fudge);
    if (!is_ok(s)) {
        return read_error(io, id, "merge", s);
    }
    log_write(LogLevel::Debug, "layer: read %s/%u: %zu ranges merged into %zu scans", id.name.c_str(), id.zoom,
              ranges.size(), merged.size());

    ScanBatch batch(io.store, md.header.partition, merged);
    s = batch.run(cfg.max_workers);
    if (!is_ok(s)) {
        return read_error(io, id, "scan", s);
    }

    Dataset result;
    for (std::vector<StoreRecord>& rows : batch.results()) {
        for (StoreRecord& row : rows) {
            TileRecord record;
            s = tessera::storage::record_decode({row.value.data(), static_cast<u32>(row.value.size())}, md.schema,
                                                &record);
            if (!is_ok(s)) {
                return read_error(io, id, "decode", s);
            }
            if (bounds_contains(query, record.key)) {
                result.push_back(std::move(record));
            }
        }
    }

    *out = std::move(result);
    return ok_status();
}

Status layer_read_tile(const LayerIo& io, const LayerId& id, const GridKey& key, TileRecord* out) noexcept {
    if (!io.catalog || !io.store || !out) {
        return make_status(StatusDomain::Layer, StatusCode::Invalid);
    }

    LayerMetadata md;
    Status s = layer_read_metadata(io, id, &md);
    if (!is_ok(s)) {
        return s;
    }
    s = check_format(io, id, md);
    if (!is_ok(s)) {
        return s;
    }

    const Status missing = make_status(StatusDomain::Layer, StatusCode::NotFound);
    if (!bounds_contains(md.key_bounds, key)) {
        return failed(io, id, "lookup", missing);
    }

    i64 index = 0;
    s = tessera::index::key_index_to_index(md.key_index, key, &index);
    if (!is_ok(s)) {
        return read_error(io, id, "index", s);
    }

    std::vector<StoreRecord> rows;
    s = io.store->scan(md.header.partition, IndexRange{index, index}, &rows);
    if (!is_ok(s)) {
        return read_error(io, id, "scan", s);
    }

    // Space-time layers can hold several instants in one time bin.
    for (const StoreRecord& row : rows) {
        TileRecord record;
        s = tessera::storage::record_decode({row.value.data(), static_cast<u32>(row.value.size())}, md.schema,
                                            &record);
        if (!is_ok(s)) {
            return read_error(io, id, "decode", s);
        }
        if (record.key == key) {
            *out = std::move(record);
            return ok_status();
        }
    }
    return failed(io, id, "lookup", missing);
}

Status layer_read_all(const LayerIo& io, const LayerId& id, Dataset* out, const LayerReaderConfig& cfg) noexcept {
    if (!io.catalog || !io.store || !out) {
        return make_status(StatusDomain::Layer, StatusCode::Invalid);
    }
    out->clear();

    LayerMetadata md;
    Status s = layer_read_metadata(io, id, &md);
    if (!is_ok(s)) {
        return s;
    }
    return layer_read(io, id, md.key_bounds, out, cfg);
}

} // namespace tessera::layer
