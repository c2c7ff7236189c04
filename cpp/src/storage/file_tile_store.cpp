#include "tessera/storage/tile_store.hpp"
#include "tessera/storage/hashing.hpp"
#include "tessera/storage/layout.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

namespace tessera::storage {

using namespace tessera::core;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {
    constexpr const char* kSegmentFile = "tiles.seg";

    std::atomic<u64> g_temp_counter{0};

    [[nodiscard]] Status io_status(int err) noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(err));
    }

    [[nodiscard]] Status corrupt_status() noexcept {
        return make_status(StatusDomain::Storage, StatusCode::Corrupt);
    }

    // Create a directory and any missing parents.
    [[nodiscard]] Status create_directories(const std::string& path) noexcept {
        if (path.empty()) {
            return ok_status();
        }
        if (mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) {
            return ok_status();
        }
        if (errno != ENOENT) {
            return io_status(errno);
        }

        const size_t slash = path.find_last_of('/');
        if (slash == std::string::npos || slash == 0) {
            return io_status(ENOENT);
        }
        Status s = create_directories(path.substr(0, slash));
        if (!is_ok(s)) return s;

        if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
            return io_status(errno);
        }
        return ok_status();
    }

    [[nodiscard]] bool write_all(int fd, const u8* data, size_t len) noexcept {
        while (len > 0) {
            const ssize_t n = ::write(fd, data, len);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    [[nodiscard]] bool read_at(int fd, u8* data, size_t len, u64 offset) noexcept {
        while (len > 0) {
            const ssize_t n = ::pread(fd, data, len, static_cast<off_t>(offset));
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            if (n == 0) {
                errno = EIO;
                return false;
            }
            data += n;
            len -= static_cast<size_t>(n);
            offset += static_cast<u64>(n);
        }
        return true;
    }

    // Closes the descriptor on every exit path.
    struct FdGuard {
        int fd{-1};
        ~FdGuard() {
            if (fd >= 0) ::close(fd);
        }
    };

    struct SegmentReader {
        int fd;
        SegmentHeader header;

        [[nodiscard]] u64 entry_offset(u64 i) const noexcept {
            return kSegmentHeaderBytes + i * kSegmentEntryBytes;
        }

        [[nodiscard]] u64 digest_offset() const noexcept {
            return entry_offset(header.record_count);
        }

        [[nodiscard]] u64 payload_offset() const noexcept {
            return digest_offset() + 32;
        }

        [[nodiscard]] bool entry(u64 i, SegmentEntry* out) const noexcept {
            std::array<u8, kSegmentEntryBytes> buf{};
            if (!read_at(fd, buf.data(), buf.size(), entry_offset(i))) {
                return false;
            }
            return layout_read_segment_entry({buf.data(), kSegmentEntryBytes}, out) == LayoutParseResult::Ok;
        }

        // First entry with key >= target (record_count when none).
        [[nodiscard]] bool lower_bound(i64 target, u64* out) const noexcept {
            u64 lo = 0;
            u64 hi = header.record_count;
            while (lo < hi) {
                const u64 mid = lo + (hi - lo) / 2;
                SegmentEntry e{};
                if (!entry(mid, &e)) {
                    return false;
                }
                if (e.key < target) {
                    lo = mid + 1;
                } else {
                    hi = mid;
                }
            }
            *out = lo;
            return true;
        }

        [[nodiscard]] Status verify_payload() const noexcept {
            Hash256 expected{};
            if (!read_at(fd, expected.b.data(), expected.b.size(), digest_offset())) {
                return io_status(errno);
            }

            Hasher hasher;
            std::vector<u8> chunk(64 * 1024);
            u64 remaining = header.payload_bytes;
            u64 offset = payload_offset();
            while (remaining > 0) {
                const size_t n = static_cast<size_t>(std::min<u64>(remaining, chunk.size()));
                if (!read_at(fd, chunk.data(), n, offset)) {
                    return io_status(errno);
                }
                hasher.update(chunk.data(), static_cast<u32>(n));
                remaining -= n;
                offset += n;
            }

            Hash256 actual{};
            Status s = hasher.finalize(&actual);
            if (!is_ok(s)) {
                return s;
            }
            return actual == expected ? ok_status() : corrupt_status();
        }
    };
}

// ========================================================================
// FileTileStore
// ========================================================================

FileTileStore::FileTileStore(const FileTileStoreConfig& cfg)
    : root_(cfg.data_root ? cfg.data_root : ""), verify_on_read_(cfg.verify_on_read) {}

std::string FileTileStore::segment_path(const std::string& partition) const {
    return root_ + "/" + partition + "/" + kSegmentFile;
}

Status FileTileStore::write(const std::string& partition, std::vector<StoreRecord> records) noexcept {
    if (root_.empty() || !partition_valid(partition)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::sort(records.begin(), records.end(),
              [](const StoreRecord& a, const StoreRecord& b) { return a.key < b.key; });
    for (size_t i = 1; i < records.size(); ++i) {
        if (records[i - 1].key == records[i].key) {
            return make_status(StatusDomain::Storage, StatusCode::Conflict);
        }
    }

    // Header and index first, then digest, then payload.
    SegmentHeader header{};
    header.record_count = records.size();

    std::vector<u8> index(records.size() * kSegmentEntryBytes);
    Hasher hasher;
    u64 offset = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        const StoreRecord& r = records[i];
        SegmentEntry e{r.key, offset, r.value.size()};
        (void)layout_write_segment_entry(e, {index.data() + i * kSegmentEntryBytes, kSegmentEntryBytes});
        hasher.update(r.value.data(), static_cast<u32>(r.value.size()));
        offset += r.value.size();
    }
    header.payload_bytes = offset;

    std::array<u8, kSegmentHeaderBytes> header_buf{};
    if (layout_write_segment_header(header, {header_buf.data(), kSegmentHeaderBytes}) != kSegmentHeaderBytes) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    Hash256 digest{};
    Status s = hasher.finalize(&digest);
    if (!is_ok(s)) {
        return s;
    }

    const std::string dir = root_ + "/" + partition;
    s = create_directories(dir);
    if (!is_ok(s)) {
        return s;
    }

    char temp_path[1024];
    std::snprintf(temp_path, sizeof(temp_path), "%s/%s.tmp.%d.%llu", dir.c_str(), kSegmentFile,
                  static_cast<int>(getpid()),
                  static_cast<unsigned long long>(g_temp_counter.fetch_add(1)));

    const int fd = ::open(temp_path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return io_status(errno);
    }

    bool ok = write_all(fd, header_buf.data(), header_buf.size()) &&
              write_all(fd, index.data(), index.size()) &&
              write_all(fd, digest.b.data(), digest.b.size());
    for (size_t i = 0; ok && i < records.size(); ++i) {
        ok = write_all(fd, records[i].value.data(), records[i].value.size());
    }
    if (ok) {
        ok = ::fsync(fd) == 0;
    }
    int err = ok ? 0 : errno;

    if (::close(fd) != 0 && ok) {
        ok = false;
        err = errno;
    }
    if (!ok) {
        ::unlink(temp_path);
        return io_status(err != 0 ? err : EIO);
    }

    if (::rename(temp_path, segment_path(partition).c_str()) != 0) {
        const int err = errno;
        ::unlink(temp_path);
        return io_status(err);
    }
    return ok_status();
}

Status FileTileStore::scan(const std::string& partition, IndexRange range, std::vector<StoreRecord>* out) noexcept {
    if (!out || range.start > range.end || root_.empty() || !partition_valid(partition)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    FdGuard guard{::open(segment_path(partition).c_str(), O_RDONLY)};
    if (guard.fd < 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }
        return io_status(errno);
    }

    std::array<u8, kSegmentHeaderBytes> header_buf{};
    if (!read_at(guard.fd, header_buf.data(), header_buf.size(), 0)) {
        return corrupt_status();
    }

    SegmentReader seg{guard.fd, {}};
    if (layout_read_segment_header({header_buf.data(), kSegmentHeaderBytes}, &seg.header) != LayoutParseResult::Ok) {
        return corrupt_status();
    }

    struct stat st{};
    if (::fstat(guard.fd, &st) != 0) {
        return io_status(errno);
    }
    if (seg.header.record_count > static_cast<u64>(st.st_size) / kSegmentEntryBytes ||
        static_cast<u64>(st.st_size) != seg.payload_offset() + seg.header.payload_bytes) {
        return corrupt_status();
    }

    if (verify_on_read_) {
        Status v = seg.verify_payload();
        if (!is_ok(v)) {
            return v;
        }
    }

    u64 i = 0;
    if (!seg.lower_bound(range.start, &i)) {
        return corrupt_status();
    }

    for (; i < seg.header.record_count; ++i) {
        SegmentEntry e{};
        if (!seg.entry(i, &e)) {
            return corrupt_status();
        }
        if (e.key > range.end) {
            break;
        }
        if (e.offset > seg.header.payload_bytes || e.size_bytes > seg.header.payload_bytes - e.offset) {
            return corrupt_status();
        }

        StoreRecord r{e.key, std::vector<u8>(static_cast<size_t>(e.size_bytes))};
        if (e.size_bytes > 0 && !read_at(guard.fd, r.value.data(), r.value.size(), seg.payload_offset() + e.offset)) {
            return io_status(errno);
        }
        out->push_back(std::move(r));
    }
    return ok_status();
}

Status FileTileStore::remove(const std::string& partition) noexcept {
    if (root_.empty() || !partition_valid(partition)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (::unlink(segment_path(partition).c_str()) != 0) {
        if (errno == ENOENT) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound);
        }
        return io_status(errno);
    }
    // Leave the directory if something else lives there.
    (void)::rmdir((root_ + "/" + partition).c_str());
    return ok_status();
}

} // namespace tessera::storage
