// =============================================================================
// registry.cpp - Factory record lifecycle
// =============================================================================

#include "kswap/registry.hpp"
#include "kswap/keys.hpp"

namespace kswap {

Registry initialize_registry(const Address& owner) {
    Registry registry{};
    registry.key = derive_address("registry", {seed(owner)});
    registry.owner = owner;
    registry.pair_count = 0;
    registry.fee_collector = addresses::ZERO;
    registry.fee_enabled = false;
    registry.last_pair = addresses::ZERO;
    return registry;
}

int32_t authorize(const Registry& registry, const Address& caller) {
    return caller == registry.owner ? errors::OK : errors::UNAUTHORIZED;
}

int32_t set_protocol_fee(Registry& registry, const Address& caller,
                         const Address& fee_collector, bool fee_enabled) {
    int32_t rc = authorize(registry, caller);
    if (rc != errors::OK) return rc;

    registry.fee_collector = fee_collector;
    registry.fee_enabled = fee_enabled;
    return errors::OK;
}

} // namespace kswap
