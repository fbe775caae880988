#ifndef KSWAP_REGISTRY_HPP
#define KSWAP_REGISTRY_HPP

#include "types.hpp"

namespace kswap {

// =============================================================================
// Registry (factory record, one per exchange)
// =============================================================================

struct Registry {
    Address key;             // Record address
    Address owner;           // Creates pairs, changes protocol fee settings
    uint64_t pair_count;     // Pairs that completed configuration
    Address fee_collector;   // Reserved: no arithmetic path reads it
    bool fee_enabled;        // Reserved: no arithmetic path reads it
    Address last_pair;       // Most recently configured pair
};

// Fresh registry: zero pairs, fee switched off, empty references
Registry initialize_registry(const Address& owner);

// errors::UNAUTHORIZED unless `caller` is the registry owner
int32_t authorize(const Registry& registry, const Address& caller);

// Owner-gated update of the protocol fee destination and switch
int32_t set_protocol_fee(Registry& registry, const Address& caller,
                         const Address& fee_collector, bool fee_enabled);

} // namespace kswap

#endif // KSWAP_REGISTRY_HPP
