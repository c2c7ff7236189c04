#include "tessera/core/errors.hpp"

namespace tessera::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::InvalidBounds: return "InvalidBounds";
        case StatusCode::LayerNotFound: return "LayerNotFound";
        case StatusCode::AttributeCorrupt: return "AttributeCorrupt";
        case StatusCode::LayerRead: return "LayerRead";
        case StatusCode::LayerWrite: return "LayerWrite";
        case StatusCode::Orphaned: return "Orphaned";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Index: return "Index";
        case StatusDomain::Storage: return "Storage";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Catalog: return "Catalog";
        case StatusDomain::Layer: return "Layer";
        case StatusDomain::External: return "External";
    }
    return "Unknown";
}

} // namespace tessera::core
