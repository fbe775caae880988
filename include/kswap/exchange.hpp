#ifndef KSWAP_EXCHANGE_HPP
#define KSWAP_EXCHANGE_HPP

// =============================================================================
// kswap - Constant-Product Exchange
//
// Exchange hosts the registry and pair records outside a transactional ledger
// environment. Operations on the same pair are serialized by a per-pair mutex;
// registry and pair-map changes take the records lock exclusively.
// =============================================================================

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "types.hpp"
#include "keys.hpp"
#include "math.hpp"
#include "registry.hpp"
#include "pair.hpp"
#include "ledger.hpp"
#include "events.hpp"
#include "store.hpp"

namespace kswap {

class Exchange {
public:
    Exchange(ILedger& ledger, IEventSink& events);
    Exchange(RecordStore records, ILedger& ledger, IEventSink& events);
    ~Exchange() = default;

    // Non-copyable
    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // =========================================================================
    // Registry
    // =========================================================================

    int32_t initialize(const Address& owner);
    int32_t set_protocol_fee(const Address& caller, const Address& fee_collector, bool fee_enabled);
    std::optional<Registry> registry() const;

    // =========================================================================
    // Pair Lifecycle
    // =========================================================================

    // Allocate an UNINITIALIZED record at pair_key(x, y)
    int32_t allocate_pair(const Address& caller, const Address& token_x, const Address& token_y);

    // Configure a previously allocated record
    int32_t configure_pair(const Address& caller, const Address& token_x, const Address& token_y,
                           const PairAccounts& accounts);

    // Allocate and configure in one step; nothing is stored on failure
    int32_t create_pair(const Address& caller, const Address& token_x, const Address& token_y,
                        const PairAccounts& accounts);

    // Open the reserve custody accounts and share mint in `ledger` and create
    // the pair. Checks and account opening run under the exclusive records
    // lock, so a losing concurrent attempt opens nothing.
    int32_t provision_pair(MemoryLedger& ledger, const Address& caller,
                           const Address& token_x, const Address& token_y,
                           Address& pair_key_out, uint8_t share_decimals = SHARE_DECIMALS);

    // =========================================================================
    // Trading
    // =========================================================================

    int32_t add_liquidity(const Address& pair_key, const AddLiquidityParams& params,
                          AddLiquidityResult& out);
    int32_t remove_liquidity(const Address& pair_key, const RemoveLiquidityParams& params,
                             RemoveLiquidityResult& out);
    int32_t swap(const Address& pair_key, const SwapParams& params, SwapResult& out);

    int32_t quote(const Address& pair_key, const Address& asset_in, U128 amount_in,
                  U128& amount_out) const;

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Pair> get_pair(const Address& pair_key) const;
    std::optional<Pair> find_pair(const Address& token_x, const Address& token_y) const;
    std::vector<Pair> pairs() const;

    // Consistent copy of all records
    RecordStore records() const;

    struct Stats {
        uint64_t total_pairs;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

private:
    RecordStore records_;
    ILedger& ledger_;
    IEventSink& events_;

    mutable std::shared_mutex records_mutex_;

    // One entry per stored pair; inserted only under the exclusive records lock
    std::map<Address, std::unique_ptr<std::mutex>> pair_locks_;

    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};

    // Caller holds records_mutex_ exclusively
    int32_t create_pair_locked(const Address& caller, const Address& token_x,
                               const Address& token_y, const PairAccounts& accounts);

    template <typename Fn>
    int32_t with_pair(const Address& pair_key, Fn&& fn);
};

// =============================================================================
// Provisioning against the in-process ledger
// =============================================================================

// Same as Exchange::provision_pair
int32_t provision_pair(Exchange& exchange, MemoryLedger& ledger, const Address& caller,
                       const Address& token_x, const Address& token_y,
                       Address& pair_key_out, uint8_t share_decimals = SHARE_DECIMALS);

} // namespace kswap

#endif // KSWAP_EXCHANGE_HPP
