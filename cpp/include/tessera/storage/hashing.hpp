#pragma once

#include <memory>

#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"
#include "tessera/storage/buffer.hpp"

namespace tessera::storage {
    [[nodiscard]] tessera::core::Status hash_compute(BufferView data, tessera::core::Hash256* out) noexcept;

    // Incremental BLAKE3 for payloads assembled piecewise (segment files).
    class Hasher {
    public:
        Hasher() noexcept;
        ~Hasher() noexcept;
        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;

        void update(const u8* data, u32 len) noexcept;

        // Busy when the hasher state could not be allocated.
        [[nodiscard]] tessera::core::Status finalize(tessera::core::Hash256* out) const noexcept;

    private:
        struct State;
        std::unique_ptr<State> state_;
    };

} // namespace tessera::storage
