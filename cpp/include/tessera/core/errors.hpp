#pragma once
#include <cstdint>
#include <type_traits>

namespace tessera::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        Busy,
        Corrupt,
        Io,
        Unsupported,
        InvalidBounds,
        LayerNotFound,
        AttributeCorrupt,
        LayerRead,
        LayerWrite,
        Orphaned,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Index,
        Storage,
        Db,
        Catalog,
        Layer,
        External,
    };

    // cause/cause_domain carry the innermost failure when a status wraps
    // another one; they equal code/domain for unwrapped statuses.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
        StatusCode cause{StatusCode::Ok};
        StatusDomain cause_domain{StatusDomain::Core};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux, code, domain};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Rewrap inner with a new code/domain, keeping its root cause and aux.
    [[nodiscard]] constexpr Status wrap_status(StatusDomain domain, StatusCode code, Status inner) noexcept {
        return Status{code, domain, inner.aux, inner.cause, inner.cause_domain};
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace tessera::core
