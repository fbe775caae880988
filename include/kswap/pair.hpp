#ifndef KSWAP_PAIR_HPP
#define KSWAP_PAIR_HPP

#include "types.hpp"
#include "keys.hpp"
#include "registry.hpp"
#include "ledger.hpp"
#include "events.hpp"

namespace kswap {

// =============================================================================
// Pair Record
// =============================================================================

enum class PairState : uint8_t {
    UNINITIALIZED = 0,
    CONFIGURED = 1      // Terminal
};

struct Pair {
    Address key;                  // pair_key(token_a, token_b)
    Address registry;             // Owning registry record
    Address token_a;              // Smaller identifier
    Address token_b;
    Amount reserve_a;
    Amount reserve_b;
    Address reserve_account_a;    // Custody of reserve_a, owned by `authority`
    Address reserve_account_b;
    Address share_mint;
    Amount total_shares;          // Includes MINIMUM_LIQUIDITY once funded
    PairAuthority authority;
    PairState state;

    bool configured() const { return state == PairState::CONFIGURED; }
};

// =============================================================================
// Lifecycle
// =============================================================================

// Allocates an UNINITIALIZED pair for the unordered asset pair {x, y}.
// Asset ordering is decided by configure_pair.
int32_t create_pair(const Registry& registry, const Address& caller,
                    const Address& token_x, const Address& token_y,
                    Pair& out);

// Accounts prepared for a pair, in the caller's asset order
struct PairAccounts {
    Address custody_x;      // Holds token_x, owned by the pair authority
    Address custody_y;      // Holds token_y, owned by the pair authority
    Address share_mint;     // Authority is the pair authority, zero supply
};

// UNINITIALIZED -> CONFIGURED. Orders the assets canonically, records the
// custody accounts and share mint, bumps registry.pair_count and emits
// PairCreatedEvent. A second call on the same pair fails with ALREADY_CONFIGURED.
int32_t configure_pair(Pair& pair, Registry& registry, const Address& caller,
                       const Address& token_x, const Address& token_y,
                       const PairAccounts& accounts,
                       const ILedger& ledger, IEventSink& events);

// =============================================================================
// Liquidity
// =============================================================================

struct AddLiquidityParams {
    Address sender;
    Address source_a;       // Sender's token_a account
    Address source_b;       // Sender's token_b account
    Address share_holder;   // Receives the minted shares
    U128 desired_a;
    U128 desired_b;
    U128 min_a;
    U128 min_b;
};

struct AddLiquidityResult {
    Amount amount_a;
    Amount amount_b;
    Amount shares;
};

int32_t add_liquidity(Pair& pair, const Registry& registry,
                      ILedger& ledger, IEventSink& events,
                      const AddLiquidityParams& params,
                      AddLiquidityResult& out);

struct RemoveLiquidityParams {
    Address sender;         // Holder of the shares being redeemed
    Address destination_a;
    Address destination_b;
    U128 shares;
    U128 min_a;
    U128 min_b;
};

struct RemoveLiquidityResult {
    Amount amount_a;
    Amount amount_b;
    Amount shares;
};

// Burns first, then pays out of custody
int32_t remove_liquidity(Pair& pair, const Registry& registry,
                         ILedger& ledger, IEventSink& events,
                         const RemoveLiquidityParams& params,
                         RemoveLiquidityResult& out);

// =============================================================================
// Swap
// =============================================================================

struct SwapParams {
    Address sender;
    Address source;         // Input asset is the asset of this account
    Address destination;    // Must hold the other asset of the pair
    U128 amount_in;
    U128 amount_out_min;
};

struct SwapResult {
    Amount amount_in;
    Amount amount_out;
    bool a_in;
};

int32_t swap(Pair& pair, const Registry& registry,
             ILedger& ledger, IEventSink& events,
             const SwapParams& params,
             SwapResult& out);

// Output for `amount_in` of `asset_in` at the pair's current reserves
int32_t quote_pair(const Pair& pair, const Address& asset_in, U128 amount_in,
                   U128& amount_out);

} // namespace kswap

#endif // KSWAP_PAIR_HPP
