#include "tessera/core/keys.hpp"

namespace tessera::core {

Status keys_bounding(const GridKey* keys, std::size_t count, KeyBounds* out) noexcept {
    if (!out || count == 0 || !keys) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    KeyBounds b{keys[0], keys[0]};
    for (std::size_t i = 1; i < count; ++i) {
        b = bounds_combine(b, KeyBounds{keys[i], keys[i]});
    }

    *out = b;
    return ok_status();
}

} // namespace tessera::core
