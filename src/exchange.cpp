// =============================================================================
// exchange.cpp - Hosted registry and per-pair serialization
// =============================================================================

#include "kswap/exchange.hpp"

#include <utility>

namespace kswap {

// =============================================================================
// Constructors
// =============================================================================

Exchange::Exchange(ILedger& ledger, IEventSink& events)
    : ledger_(ledger), events_(events) {}

Exchange::Exchange(RecordStore records, ILedger& ledger, IEventSink& events)
    : records_(std::move(records)), ledger_(ledger), events_(events) {
    for (const Pair& pair : records_.pairs()) {
        pair_locks_.emplace(pair.key, std::make_unique<std::mutex>());
    }
}

template <typename Fn>
int32_t Exchange::with_pair(const Address& pair_key, Fn&& fn) {
    std::shared_lock records_lock(records_mutex_);

    const Registry* registry = records_.registry();
    if (!registry) return errors::REGISTRY_NOT_INITIALIZED;

    Pair* pair = records_.find_pair(pair_key);
    if (!pair) return errors::PAIR_NOT_FOUND;

    std::lock_guard<std::mutex> pair_lock(*pair_locks_.at(pair_key));
    return fn(*pair, *registry);
}

// =============================================================================
// Registry
// =============================================================================

int32_t Exchange::initialize(const Address& owner) {
    std::unique_lock lock(records_mutex_);
    return records_.put_registry(initialize_registry(owner));
}

int32_t Exchange::set_protocol_fee(const Address& caller, const Address& fee_collector,
                                   bool fee_enabled) {
    std::unique_lock lock(records_mutex_);

    Registry* registry = records_.registry();
    if (!registry) return errors::REGISTRY_NOT_INITIALIZED;
    return kswap::set_protocol_fee(*registry, caller, fee_collector, fee_enabled);
}

std::optional<Registry> Exchange::registry() const {
    std::shared_lock lock(records_mutex_);
    const Registry* registry = records_.registry();
    if (!registry) return std::nullopt;
    return *registry;
}

// =============================================================================
// Pair Lifecycle
// =============================================================================

int32_t Exchange::allocate_pair(const Address& caller, const Address& token_x,
                                const Address& token_y) {
    std::unique_lock lock(records_mutex_);

    const Registry* registry = records_.registry();
    if (!registry) return errors::REGISTRY_NOT_INITIALIZED;

    Pair pair{};
    int32_t rc = kswap::create_pair(*registry, caller, token_x, token_y, pair);
    if (rc != errors::OK) return rc;

    if ((rc = records_.allocate_pair(pair)) != errors::OK) return rc;
    pair_locks_.emplace(pair.key, std::make_unique<std::mutex>());
    return errors::OK;
}

int32_t Exchange::configure_pair(const Address& caller, const Address& token_x,
                                 const Address& token_y, const PairAccounts& accounts) {
    std::unique_lock lock(records_mutex_);
    return create_pair_locked(caller, token_x, token_y, accounts);
}

int32_t Exchange::create_pair_locked(const Address& caller, const Address& token_x,
                                     const Address& token_y, const PairAccounts& accounts) {
    Registry* registry = records_.registry();
    if (!registry) return errors::REGISTRY_NOT_INITIALIZED;

    Pair* pair = records_.find_pair(pair_key(token_x, token_y));
    if (!pair) return errors::PAIR_NOT_FOUND;

    return kswap::configure_pair(*pair, *registry, caller, token_x, token_y,
                                 accounts, ledger_, events_);
}

int32_t Exchange::create_pair(const Address& caller, const Address& token_x,
                              const Address& token_y, const PairAccounts& accounts) {
    std::unique_lock lock(records_mutex_);

    Registry* registry = records_.registry();
    if (!registry) return errors::REGISTRY_NOT_INITIALIZED;

    Pair pair{};
    int32_t rc = kswap::create_pair(*registry, caller, token_x, token_y, pair);
    if (rc != errors::OK) return rc;
    if (records_.find_pair(pair.key)) return errors::PAIR_EXISTS;

    // Configure against a staged registry so a failure leaves no trace;
    // the creation event is held back until both records are committed.
    struct DeferredSink : IEventSink {
        std::optional<PairCreatedEvent> created;
        void on_pair_created(const PairCreatedEvent& event) override { created = event; }
    } deferred;

    Registry staged = *registry;
    rc = kswap::configure_pair(pair, staged, caller, token_x, token_y,
                               accounts, ledger_, deferred);
    if (rc != errors::OK) return rc;

    if ((rc = records_.allocate_pair(pair)) != errors::OK) return rc;
    pair_locks_.emplace(pair.key, std::make_unique<std::mutex>());
    *registry = staged;

    if (deferred.created) events_.on_pair_created(*deferred.created);
    return errors::OK;
}

// =============================================================================
// Trading
// =============================================================================

int32_t Exchange::add_liquidity(const Address& pair_key, const AddLiquidityParams& params,
                                AddLiquidityResult& out) {
    int32_t rc = with_pair(pair_key, [&](Pair& pair, const Registry& registry) {
        return kswap::add_liquidity(pair, registry, ledger_, events_, params, out);
    });
    if (rc == errors::OK) total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);
    return rc;
}

int32_t Exchange::remove_liquidity(const Address& pair_key, const RemoveLiquidityParams& params,
                                   RemoveLiquidityResult& out) {
    int32_t rc = with_pair(pair_key, [&](Pair& pair, const Registry& registry) {
        return kswap::remove_liquidity(pair, registry, ledger_, events_, params, out);
    });
    if (rc == errors::OK) total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);
    return rc;
}

int32_t Exchange::swap(const Address& pair_key, const SwapParams& params, SwapResult& out) {
    int32_t rc = with_pair(pair_key, [&](Pair& pair, const Registry& registry) {
        return kswap::swap(pair, registry, ledger_, events_, params, out);
    });
    if (rc == errors::OK) total_swaps_.fetch_add(1, std::memory_order_relaxed);
    return rc;
}

int32_t Exchange::quote(const Address& pair_key, const Address& asset_in, U128 amount_in,
                        U128& amount_out) const {
    std::optional<Pair> pair = get_pair(pair_key);
    if (!pair) return errors::PAIR_NOT_FOUND;
    return quote_pair(*pair, asset_in, amount_in, amount_out);
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Pair> Exchange::get_pair(const Address& pair_key) const {
    std::shared_lock records_lock(records_mutex_);

    const Pair* pair = records_.find_pair(pair_key);
    if (!pair) return std::nullopt;

    std::lock_guard<std::mutex> pair_lock(*pair_locks_.at(pair_key));
    return *pair;
}

std::optional<Pair> Exchange::find_pair(const Address& token_x, const Address& token_y) const {
    return get_pair(pair_key(token_x, token_y));
}

std::vector<Pair> Exchange::pairs() const {
    return records().pairs();
}

RecordStore Exchange::records() const {
    // Exclusive: pair operations hold the shared lock while mutating
    std::unique_lock lock(records_mutex_);
    return records_;
}

Exchange::Stats Exchange::get_stats() const {
    Stats stats{};
    if (auto reg = registry()) stats.total_pairs = reg->pair_count;
    stats.total_swaps = total_swaps_.load(std::memory_order_relaxed);
    stats.total_liquidity_ops = total_liquidity_ops_.load(std::memory_order_relaxed);
    return stats;
}

// =============================================================================
// Provisioning
// =============================================================================

int32_t Exchange::provision_pair(MemoryLedger& ledger, const Address& caller,
                                 const Address& token_x, const Address& token_y,
                                 Address& pair_key_out, uint8_t share_decimals) {
    if (token_x == token_y) return errors::IDENTICAL_ASSETS;

    std::unique_lock lock(records_mutex_);

    const Registry* registry = records_.registry();
    if (!registry) return errors::REGISTRY_NOT_INITIALIZED;
    int32_t rc = authorize(*registry, caller);
    if (rc != errors::OK) return rc;

    Address key = pair_key(token_x, token_y);
    if (records_.find_pair(key)) return errors::PAIR_EXISTS;

    PairAuthority authority = pair_authority(key);
    PairAccounts accounts{};
    accounts.custody_x = ledger.open_account(token_x, authority.key);
    accounts.custody_y = ledger.open_account(token_y, authority.key);
    accounts.share_mint = ledger.create_mint(authority.key, share_decimals);

    rc = create_pair_locked(caller, token_x, token_y, accounts);
    if (rc != errors::OK) return rc;

    pair_key_out = key;
    return errors::OK;
}

int32_t provision_pair(Exchange& exchange, MemoryLedger& ledger, const Address& caller,
                       const Address& token_x, const Address& token_y,
                       Address& pair_key_out, uint8_t share_decimals) {
    return exchange.provision_pair(ledger, caller, token_x, token_y, pair_key_out, share_decimals);
}

} // namespace kswap
