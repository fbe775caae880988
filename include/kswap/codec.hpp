#ifndef KSWAP_CODEC_HPP
#define KSWAP_CODEC_HPP

#include <nlohmann/json_fwd.hpp>

#include "registry.hpp"
#include "pair.hpp"
#include "ledger.hpp"
#include "events.hpp"

namespace kswap {

// =============================================================================
// JSON Codecs
//
// Addresses are 64-digit lowercase hex strings, amounts are JSON unsigned
// integers. Decoding throws std::runtime_error on malformed input.
// =============================================================================

nlohmann::json address_to_json(const Address& addr);
Address address_from_json(const nlohmann::json& j);

// Range-checked unsigned fields. Negative, fractional, non-numeric and
// out-of-range values throw instead of wrapping.
uint64_t amount_from_json(const nlohmann::json& j);
uint8_t decimals_from_json(const nlohmann::json& j);

void to_json(nlohmann::json& j, const Registry& registry);
void from_json(const nlohmann::json& j, Registry& registry);

void to_json(nlohmann::json& j, const Pair& pair);
void from_json(const nlohmann::json& j, Pair& pair);

void to_json(nlohmann::json& j, const CustodyAccount& account);
void from_json(const nlohmann::json& j, CustodyAccount& account);

void to_json(nlohmann::json& j, const ShareMint& mint);
void from_json(const nlohmann::json& j, ShareMint& mint);

void to_json(nlohmann::json& j, const ShareHolding& holding);
void from_json(const nlohmann::json& j, ShareHolding& holding);

void to_json(nlohmann::json& j, const MemoryLedger::Snapshot& snapshot);
void from_json(const nlohmann::json& j, MemoryLedger::Snapshot& snapshot);

void to_json(nlohmann::json& j, const PairCreatedEvent& event);
void to_json(nlohmann::json& j, const LiquidityEvent& event);
void to_json(nlohmann::json& j, const SwapEvent& event);

} // namespace kswap

#endif // KSWAP_CODEC_HPP
