#pragma once

#include <string>
#include <type_traits>
#include <vector>

#include "tessera/core/errors.hpp"
#include "tessera/core/types.hpp"

namespace tessera::db {
    using u8 = tessera::core::u8;
    using u32 = tessera::core::u32;

    struct DbConfig {
        const char* path{nullptr};      // SQLite file; nullptr opens a private in-memory database
        u32 busy_timeout_ms{0};         // 0 = SQLite default (fail immediately when locked)
    };

    struct DbHandle {
        u32 id{0};
    };

    // One stored attribute blob of a layer.
    struct AttributeRow {
        std::string name;
        std::vector<u8> value;
        tessera::core::Hash256 checksum{};
    };

    // Journal mode comes from TESSERA_DB_JOURNAL_MODE (default WAL).
    [[nodiscard]] tessera::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    [[nodiscard]] tessera::core::Status db_close(DbHandle db) noexcept;

    // Replaces every attribute of the layer with rows, in one transaction.
    [[nodiscard]] tessera::core::Status db_attr_put_all(DbHandle db,
                                                        const tessera::core::LayerId& layer,
                                                        const std::vector<AttributeRow>& rows) noexcept;

    // All attributes of the layer from one statement. NotFound when it has none.
    [[nodiscard]] tessera::core::Status db_attr_get_all(DbHandle db,
                                                        const tessera::core::LayerId& layer,
                                                        std::vector<AttributeRow>* out) noexcept;

    [[nodiscard]] tessera::core::Status db_attr_delete_all(DbHandle db,
                                                           const tessera::core::LayerId& layer) noexcept;

    [[nodiscard]] tessera::core::Status db_layer_exists(DbHandle db,
                                                        const tessera::core::LayerId& layer,
                                                        bool* out) noexcept;

    // Every layer with at least one attribute, ordered by name then zoom.
    [[nodiscard]] tessera::core::Status db_layer_list(DbHandle db,
                                                      std::vector<tessera::core::LayerId>* out) noexcept;

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbHandle>);

} // namespace tessera::db
