#include "tessera/storage/hashing.hpp"

#include <cstddef>
#include <new>

#include <blake3.h>

namespace tessera::storage {
    tessera::core::Status hash_compute(BufferView data, tessera::core::Hash256* out) noexcept {
        if (out == nullptr){
            return tessera::core::make_status(tessera::core::StatusDomain::Storage, tessera::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return tessera::core::make_status(tessera::core::StatusDomain::Storage, tessera::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return tessera::core::ok_status();
    }

    struct Hasher::State {
        blake3_hasher hasher;
    };

    Hasher::Hasher() noexcept : state_(new (std::nothrow) State) {
        if (state_) {
            blake3_hasher_init(&state_->hasher);
        }
    }

    Hasher::~Hasher() noexcept = default;

    void Hasher::update(const u8* data, u32 len) noexcept {
        if (!state_ || !data || len == 0) {
            return;
        }
        blake3_hasher_update(&state_->hasher, data, static_cast<size_t>(len));
    }

    tessera::core::Status Hasher::finalize(tessera::core::Hash256* out) const noexcept {
        if (!out) {
            return tessera::core::make_status(tessera::core::StatusDomain::Storage, tessera::core::StatusCode::Invalid);
        }
        if (!state_) {
            return tessera::core::make_status(tessera::core::StatusDomain::Storage, tessera::core::StatusCode::Busy);
        }
        blake3_hasher_finalize(&state_->hasher, out->b.data(), out->b.size());
        return tessera::core::ok_status();
    }
} // namespace tessera::storage
