#ifndef KSWAP_KEYS_HPP
#define KSWAP_KEYS_HPP

#include <initializer_list>
#include <string_view>
#include <utility>

#include "types.hpp"

namespace kswap {

// =============================================================================
// Deterministic Key Derivation
//
// Record addresses are derived from a domain tag and seed bytes so that the
// same inputs always name the same record. The mixing is not cryptographic;
// only determinism and practical uniqueness are required here.
// =============================================================================

Address derive_address(std::string_view domain,
                       std::initializer_list<std::string_view> seeds);

// Seed view over an address' raw bytes
inline std::string_view seed(const Address& addr) {
    return std::string_view(reinterpret_cast<const char*>(addr.data()), addr.size());
}

// Smaller identifier first
inline std::pair<Address, Address> canonical_order(const Address& x, const Address& y) {
    return x < y ? std::make_pair(x, y) : std::make_pair(y, x);
}

// One key per unordered asset pair: pair_key(x, y) == pair_key(y, x)
Address pair_key(const Address& x, const Address& y);

// =============================================================================
// Pair Authority Capability
// =============================================================================

// Non-custodial control key scoped to a single pair. It owns the pair's reserve
// custody accounts and is the authority of its share mint; the ledger accepts
// pair-side transfers, mints and burns only when presented with it.
struct PairAuthority {
    Address key{};

    bool operator==(const PairAuthority& other) const { return key == other.key; }
    bool operator!=(const PairAuthority& other) const { return key != other.key; }
};

PairAuthority pair_authority(const Address& pair_key);

// Maps a free-form label ("alice", "USDC") to a stable address
Address address_from_label(std::string_view label);

// 64 hex digits are taken literally, anything else goes through address_from_label
Address parse_identity(std::string_view text);

} // namespace kswap

#endif // KSWAP_KEYS_HPP
