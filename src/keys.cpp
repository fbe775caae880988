// =============================================================================
// keys.cpp - Deterministic record keys and pair authority derivation
// =============================================================================

#include "kswap/keys.hpp"

namespace kswap {

namespace {

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;
constexpr uint64_t LANE_SPREAD = 0x9e3779b97f4a7c15ULL;

inline uint64_t fnv1a(uint64_t h, std::string_view bytes) {
    for (char c : bytes) {
        h ^= static_cast<uint8_t>(c);
        h *= FNV_PRIME;
    }
    return h;
}

// Length prefix keeps ("ab","c") and ("a","bc") apart
inline uint64_t fnv1a_framed(uint64_t h, std::string_view bytes) {
    uint64_t len = bytes.size();
    for (int i = 0; i < 8; ++i) {
        h ^= static_cast<uint8_t>(len >> (8 * i));
        h *= FNV_PRIME;
    }
    return fnv1a(h, bytes);
}

// splitmix64 finalizer
inline uint64_t avalanche(uint64_t z) {
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

} // anonymous namespace

Address derive_address(std::string_view domain,
                       std::initializer_list<std::string_view> seeds) {
    Address out{};
    constexpr size_t LANES = sizeof(Address) / sizeof(uint64_t);

    for (size_t lane = 0; lane < LANES; ++lane) {
        uint64_t h = FNV_OFFSET ^ (LANE_SPREAD * (lane + 1));
        h = fnv1a_framed(h, domain);
        for (std::string_view s : seeds) {
            h = fnv1a_framed(h, s);
        }
        h = avalanche(h);
        for (size_t i = 0; i < 8; ++i) {
            out[lane * 8 + i] = static_cast<uint8_t>(h >> (56 - 8 * i));
        }
    }
    return out;
}

Address pair_key(const Address& x, const Address& y) {
    auto [a, b] = canonical_order(x, y);
    return derive_address("pair", {seed(a), seed(b)});
}

PairAuthority pair_authority(const Address& pair_key) {
    return PairAuthority{derive_address("authority", {seed(pair_key)})};
}

Address address_from_label(std::string_view label) {
    return derive_address("label", {label});
}

Address parse_identity(std::string_view text) {
    if (auto addr = from_hex(text)) return *addr;
    return address_from_label(text);
}

} // namespace kswap
