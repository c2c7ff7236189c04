#include "tessera/storage/tile_store.hpp"

#include <mutex>
#include <utility>

namespace tessera::storage {

using namespace tessera::core;

bool partition_valid(const std::string& partition) noexcept {
    if (partition.empty() || partition.front() == '/' || partition.back() == '/') {
        return false;
    }
    size_t begin = 0;
    while (begin <= partition.size()) {
        size_t end = partition.find('/', begin);
        if (end == std::string::npos) {
            end = partition.size();
        }
        const size_t len = end - begin;
        if (len == 0) {
            return false;
        }
        if ((len == 1 && partition[begin] == '.') ||
            (len == 2 && partition[begin] == '.' && partition[begin + 1] == '.')) {
            return false;
        }
        begin = end + 1;
    }
    return true;
}

Status MemoryTileStore::write(const std::string& partition, std::vector<StoreRecord> records) noexcept {
    if (!partition_valid(partition)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::map<i64, std::vector<u8>> rows;
    for (StoreRecord& r : records) {
        if (!rows.emplace(r.key, std::move(r.value)).second) {
            return make_status(StatusDomain::Storage, StatusCode::Conflict);
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    partitions_[partition] = std::move(rows);
    return ok_status();
}

Status MemoryTileStore::scan(const std::string& partition, IndexRange range, std::vector<StoreRecord>* out) noexcept {
    if (!out || range.start > range.end) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto p = partitions_.find(partition);
    if (p == partitions_.end()) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }

    for (auto it = p->second.lower_bound(range.start); it != p->second.end() && it->first <= range.end; ++it) {
        out->push_back(StoreRecord{it->first, it->second});
    }
    return ok_status();
}

Status MemoryTileStore::remove(const std::string& partition) noexcept {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (partitions_.erase(partition) == 0) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    return ok_status();
}

std::size_t MemoryTileStore::row_count(const std::string& partition) const noexcept {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto p = partitions_.find(partition);
    return p == partitions_.end() ? 0 : p->second.size();
}

} // namespace tessera::storage
