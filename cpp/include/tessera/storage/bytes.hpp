#pragma once

#include <cstring>
#include <string>
#include <vector>

#include "tessera/core/types.hpp"

namespace tessera::storage {
    using u8 = tessera::core::u8;
    using u32 = tessera::core::u32;
    using u64 = tessera::core::u64;
    using i32 = tessera::core::i32;
    using i64 = tessera::core::i64;

    inline void put_u32_be(u8* out, u32 v) noexcept {
        out[0] = static_cast<u8>((v >> 24) & 0xffu);
        out[1] = static_cast<u8>((v >> 16) & 0xffu);
        out[2] = static_cast<u8>((v >> 8) & 0xffu);
        out[3] = static_cast<u8>((v >> 0) & 0xffu);
    }

    inline void put_u64_be(u8* out, u64 v) noexcept {
        out[0] = static_cast<u8>((v >> 56) & 0xffu);
        out[1] = static_cast<u8>((v >> 48) & 0xffu);
        out[2] = static_cast<u8>((v >> 40) & 0xffu);
        out[3] = static_cast<u8>((v >> 32) & 0xffu);
        out[4] = static_cast<u8>((v >> 24) & 0xffu);
        out[5] = static_cast<u8>((v >> 16) & 0xffu);
        out[6] = static_cast<u8>((v >> 8) & 0xffu);
        out[7] = static_cast<u8>((v >> 0) & 0xffu);
    }

    [[nodiscard]] inline u32 get_u32_be(const u8* in) noexcept {
        return (static_cast<u32>(in[0]) << 24) | (static_cast<u32>(in[1]) << 16) | (static_cast<u32>(in[2]) << 8) |
               (static_cast<u32>(in[3]) << 0);
    }

    [[nodiscard]] inline u64 get_u64_be(const u8* in) noexcept {
        return (static_cast<u64>(in[0]) << 56) | (static_cast<u64>(in[1]) << 48) | (static_cast<u64>(in[2]) << 40) |
               (static_cast<u64>(in[3]) << 32) | (static_cast<u64>(in[4]) << 24) | (static_cast<u64>(in[5]) << 16) |
               (static_cast<u64>(in[6]) << 8) | (static_cast<u64>(in[7]) << 0);
    }

    // Append-only big-endian encoder over a growable buffer.
    struct ByteWriter {
        std::vector<u8>* out;

        void u8v(u8 v) { out->push_back(v); }
        void u32v(u32 v) {
            const size_t at = out->size();
            out->resize(at + 4);
            put_u32_be(out->data() + at, v);
        }
        void u64v(u64 v) {
            const size_t at = out->size();
            out->resize(at + 8);
            put_u64_be(out->data() + at, v);
        }
        void i32v(i32 v) { u32v(static_cast<u32>(v)); }
        void i64v(i64 v) { u64v(static_cast<u64>(v)); }
        void bytes(const u8* data, u32 len) {
            u32v(len);
            if (len > 0) out->insert(out->end(), data, data + len);
        }
        void str(const std::string& s) {
            bytes(reinterpret_cast<const u8*>(s.data()), static_cast<u32>(s.size()));
        }
    };

    // Bounds-checked big-endian decoder. Every read returns false once the
    // input is exhausted; callers treat that as corruption.
    struct ByteReader {
        const u8* data;
        size_t len;
        size_t pos{0};

        [[nodiscard]] bool has(size_t n) const noexcept { return len - pos >= n; }
        [[nodiscard]] bool done() const noexcept { return pos == len; }

        [[nodiscard]] bool u8v(u8* v) noexcept {
            if (!has(1)) return false;
            *v = data[pos++];
            return true;
        }
        [[nodiscard]] bool u32v(u32* v) noexcept {
            if (!has(4)) return false;
            *v = get_u32_be(data + pos);
            pos += 4;
            return true;
        }
        [[nodiscard]] bool u64v(u64* v) noexcept {
            if (!has(8)) return false;
            *v = get_u64_be(data + pos);
            pos += 8;
            return true;
        }
        [[nodiscard]] bool i32v(i32* v) noexcept {
            u32 raw = 0;
            if (!u32v(&raw)) return false;
            *v = static_cast<i32>(raw);
            return true;
        }
        [[nodiscard]] bool i64v(i64* v) noexcept {
            u64 raw = 0;
            if (!u64v(&raw)) return false;
            *v = static_cast<i64>(raw);
            return true;
        }
        [[nodiscard]] bool bytes(std::vector<u8>* v) {
            u32 n = 0;
            if (!u32v(&n) || !has(n)) return false;
            v->assign(data + pos, data + pos + n);
            pos += n;
            return true;
        }
        [[nodiscard]] bool str(std::string* v) {
            u32 n = 0;
            if (!u32v(&n) || !has(n)) return false;
            v->assign(reinterpret_cast<const char*>(data + pos), n);
            pos += n;
            return true;
        }
    };

} // namespace tessera::storage
