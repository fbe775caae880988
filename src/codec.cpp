// =============================================================================
// codec.cpp - JSON encoding of records, ledger snapshots and events
// =============================================================================

#include "kswap/codec.hpp"

#include <nlohmann/json.hpp>
#include <limits>
#include <stdexcept>
#include <string>

namespace kswap {

using json = nlohmann::json;

// =============================================================================
// Address
// =============================================================================

json address_to_json(const Address& addr) {
    return to_hex(addr);
}

Address address_from_json(const json& j) {
    auto addr = from_hex(j.get<std::string>());
    if (!addr) {
        throw std::runtime_error("Invalid address: " + j.dump());
    }
    return *addr;
}

// =============================================================================
// Unsigned Fields
// =============================================================================

uint64_t amount_from_json(const json& j) {
    if (!j.is_number_unsigned()) {
        throw std::runtime_error("Expected an unsigned integer, got " + j.dump());
    }
    return j.get<uint64_t>();
}

uint8_t decimals_from_json(const json& j) {
    uint64_t value = amount_from_json(j);
    if (value > std::numeric_limits<uint8_t>::max()) {
        throw std::runtime_error("Decimals out of range: " + j.dump());
    }
    return static_cast<uint8_t>(value);
}

// =============================================================================
// Registry
// =============================================================================

void to_json(json& j, const Registry& registry) {
    j = json{
        {"key", address_to_json(registry.key)},
        {"owner", address_to_json(registry.owner)},
        {"pair_count", registry.pair_count},
        {"fee_collector", address_to_json(registry.fee_collector)},
        {"fee_enabled", registry.fee_enabled},
        {"last_pair", address_to_json(registry.last_pair)}
    };
}

void from_json(const json& j, Registry& registry) {
    registry.key = address_from_json(j.at("key"));
    registry.owner = address_from_json(j.at("owner"));
    registry.pair_count = amount_from_json(j.at("pair_count"));
    registry.fee_collector = address_from_json(j.at("fee_collector"));
    registry.fee_enabled = j.at("fee_enabled").get<bool>();
    registry.last_pair = address_from_json(j.at("last_pair"));
}

// =============================================================================
// Pair
// =============================================================================

void to_json(json& j, const Pair& pair) {
    j = json{
        {"key", address_to_json(pair.key)},
        {"registry", address_to_json(pair.registry)},
        {"token_a", address_to_json(pair.token_a)},
        {"token_b", address_to_json(pair.token_b)},
        {"reserve_a", pair.reserve_a},
        {"reserve_b", pair.reserve_b},
        {"reserve_account_a", address_to_json(pair.reserve_account_a)},
        {"reserve_account_b", address_to_json(pair.reserve_account_b)},
        {"share_mint", address_to_json(pair.share_mint)},
        {"total_shares", pair.total_shares},
        {"authority", address_to_json(pair.authority.key)},
        {"state", pair.configured() ? "configured" : "uninitialized"}
    };
}

void from_json(const json& j, Pair& pair) {
    pair.key = address_from_json(j.at("key"));
    pair.registry = address_from_json(j.at("registry"));
    pair.token_a = address_from_json(j.at("token_a"));
    pair.token_b = address_from_json(j.at("token_b"));
    pair.reserve_a = amount_from_json(j.at("reserve_a"));
    pair.reserve_b = amount_from_json(j.at("reserve_b"));
    pair.reserve_account_a = address_from_json(j.at("reserve_account_a"));
    pair.reserve_account_b = address_from_json(j.at("reserve_account_b"));
    pair.share_mint = address_from_json(j.at("share_mint"));
    pair.total_shares = amount_from_json(j.at("total_shares"));
    pair.authority.key = address_from_json(j.at("authority"));

    std::string state = j.at("state").get<std::string>();
    if (state == "configured") {
        pair.state = PairState::CONFIGURED;
    } else if (state == "uninitialized") {
        pair.state = PairState::UNINITIALIZED;
    } else {
        throw std::runtime_error("Invalid pair state: " + state);
    }
}

// =============================================================================
// Ledger
// =============================================================================

void to_json(json& j, const CustodyAccount& account) {
    j = json{
        {"address", address_to_json(account.address)},
        {"asset", address_to_json(account.asset)},
        {"owner", address_to_json(account.owner)},
        {"balance", account.balance}
    };
}

void from_json(const json& j, CustodyAccount& account) {
    account.address = address_from_json(j.at("address"));
    account.asset = address_from_json(j.at("asset"));
    account.owner = address_from_json(j.at("owner"));
    account.balance = amount_from_json(j.at("balance"));
}

void to_json(json& j, const ShareMint& mint) {
    j = json{
        {"address", address_to_json(mint.address)},
        {"authority", address_to_json(mint.authority)},
        {"decimals", mint.decimals},
        {"supply", mint.supply}
    };
}

void from_json(const json& j, ShareMint& mint) {
    mint.address = address_from_json(j.at("address"));
    mint.authority = address_from_json(j.at("authority"));
    mint.decimals = decimals_from_json(j.at("decimals"));
    mint.supply = amount_from_json(j.at("supply"));
}

void to_json(json& j, const ShareHolding& holding) {
    j = json{
        {"mint", address_to_json(holding.mint)},
        {"holder", address_to_json(holding.holder)},
        {"balance", holding.balance}
    };
}

void from_json(const json& j, ShareHolding& holding) {
    holding.mint = address_from_json(j.at("mint"));
    holding.holder = address_from_json(j.at("holder"));
    holding.balance = amount_from_json(j.at("balance"));
}

void to_json(json& j, const MemoryLedger::Snapshot& snapshot) {
    j = json{
        {"accounts", snapshot.accounts},
        {"mints", snapshot.mints},
        {"holdings", snapshot.holdings},
        {"nonce", snapshot.nonce}
    };
}

void from_json(const json& j, MemoryLedger::Snapshot& snapshot) {
    snapshot.accounts = j.at("accounts").get<std::vector<CustodyAccount>>();
    snapshot.mints = j.at("mints").get<std::vector<ShareMint>>();
    snapshot.holdings = j.at("holdings").get<std::vector<ShareHolding>>();
    snapshot.nonce = amount_from_json(j.at("nonce"));
}

// =============================================================================
// Events
// =============================================================================

void to_json(json& j, const PairCreatedEvent& event) {
    j = json{
        {"type", "pair_created"},
        {"token_a", address_to_json(event.token_a)},
        {"token_b", address_to_json(event.token_b)},
        {"pair", address_to_json(event.pair)},
        {"pair_count", event.pair_count}
    };
}

void to_json(json& j, const LiquidityEvent& event) {
    j = json{
        {"pair", address_to_json(event.pair)},
        {"sender", address_to_json(event.sender)},
        {"amount_a", event.amount_a},
        {"amount_b", event.amount_b},
        {"shares", event.shares}
    };
}

void to_json(json& j, const SwapEvent& event) {
    j = json{
        {"type", "swap"},
        {"pair", address_to_json(event.pair)},
        {"sender", address_to_json(event.sender)},
        {"amount_in", event.amount_in},
        {"amount_out", event.amount_out},
        {"a_in", event.a_in}
    };
}

} // namespace kswap
