#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"

namespace tessera::storage {
    using u8 = tessera::core::u8;
    using i64 = tessera::core::i64;
    using IndexRange = tessera::core::IndexRange;

    // One row of the backing store: index key plus encoded record.
    struct StoreRecord {
        i64 key{0};
        std::vector<u8> value;
    };

    // Backing-store client. A partition selector scopes every call to one
    // layer's rows. Implementations must allow concurrent scan() calls.
    class TileStore {
    public:
        virtual ~TileStore() = default;

        // Replaces the partition's rows with records. Conflict on duplicate keys.
        [[nodiscard]] virtual tessera::core::Status write(const std::string& partition,
                                                          std::vector<StoreRecord> records) noexcept = 0;

        // Appends rows with range.start <= key <= range.end, ascending by key.
        // NotFound when the partition was never written.
        [[nodiscard]] virtual tessera::core::Status scan(const std::string& partition,
                                                         IndexRange range,
                                                         std::vector<StoreRecord>* out) noexcept = 0;

        [[nodiscard]] virtual tessera::core::Status remove(const std::string& partition) noexcept = 0;
    };

    class MemoryTileStore final : public TileStore {
    public:
        [[nodiscard]] tessera::core::Status write(const std::string& partition,
                                                  std::vector<StoreRecord> records) noexcept override;
        [[nodiscard]] tessera::core::Status scan(const std::string& partition,
                                                 IndexRange range,
                                                 std::vector<StoreRecord>* out) noexcept override;
        [[nodiscard]] tessera::core::Status remove(const std::string& partition) noexcept override;

        [[nodiscard]] std::size_t row_count(const std::string& partition) const noexcept;

    private:
        mutable std::shared_mutex mutex_;
        std::map<std::string, std::map<i64, std::vector<u8>>> partitions_;
    };

    struct FileTileStoreConfig {
        const char* data_root{nullptr};   // Root directory; partitions are subdirectories
        bool verify_on_read{false};       // Check the payload digest on every scan (slow)
    };

    // Stores each partition as one sorted segment file:
    //   {data_root}/{partition}/tiles.seg
    // laid out as header, index entries, BLAKE3 digest of the payload, payload.
    // Segments are replaced by atomic rename, so scans never see a half-written file.
    class FileTileStore final : public TileStore {
    public:
        explicit FileTileStore(const FileTileStoreConfig& cfg);

        [[nodiscard]] tessera::core::Status write(const std::string& partition,
                                                  std::vector<StoreRecord> records) noexcept override;
        [[nodiscard]] tessera::core::Status scan(const std::string& partition,
                                                 IndexRange range,
                                                 std::vector<StoreRecord>* out) noexcept override;
        [[nodiscard]] tessera::core::Status remove(const std::string& partition) noexcept override;

        [[nodiscard]] std::string segment_path(const std::string& partition) const;

    private:
        std::string root_;
        bool verify_on_read_;
    };

    // Rejects empty selectors, absolute paths and ".." components.
    [[nodiscard]] bool partition_valid(const std::string& partition) noexcept;

} // namespace tessera::storage
