// =============================================================================
// pair.cpp - Pair lifecycle, liquidity provisioning and swaps
//
// Every operation validates and computes against a staged copy of the pair.
// The ledger batch runs last; the staged record replaces the stored one only
// after the batch succeeds, so a failure leaves no partial state behind.
// =============================================================================

#include "kswap/pair.hpp"
#include "kswap/math.hpp"

#include <vector>

namespace kswap {

namespace {

// User-side account: must exist, hold `asset` and belong to `owner`
int32_t check_user_account(const ILedger& ledger, const Address& account,
                           const Address& asset, const Address& owner) {
    auto info = ledger.get_account(account);
    if (!info) return errors::ACCOUNT_NOT_FOUND;
    if (info->asset != asset) return errors::INVALID_ASSET;
    if (info->owner != owner) return errors::INVALID_OWNER;
    return errors::OK;
}

// Pair-side custody account: must hold `asset` and belong to the pair authority
int32_t check_custody(const ILedger& ledger, const Address& account,
                      const Address& asset, const PairAuthority& authority) {
    auto info = ledger.get_account(account);
    if (!info || info->asset != asset || info->owner != authority.key) {
        return errors::INVALID_CUSTODY_REFERENCE;
    }
    return errors::OK;
}

int32_t check_active(const Pair& pair, const Registry& registry) {
    if (!pair.configured()) return errors::NOT_CONFIGURED;
    if (pair.registry != registry.key) return errors::INVALID_REGISTRY;
    return errors::OK;
}

} // anonymous namespace

// =============================================================================
// Create
// =============================================================================

int32_t create_pair(const Registry& registry, const Address& caller,
                    const Address& token_x, const Address& token_y,
                    Pair& out) {
    if (token_x == token_y) return errors::IDENTICAL_ASSETS;

    int32_t rc = authorize(registry, caller);
    if (rc != errors::OK) return rc;

    Pair pair{};
    pair.key = pair_key(token_x, token_y);
    pair.authority = pair_authority(pair.key);
    pair.state = PairState::UNINITIALIZED;

    out = pair;
    return errors::OK;
}

// =============================================================================
// Configure
// =============================================================================

int32_t configure_pair(Pair& pair, Registry& registry, const Address& caller,
                       const Address& token_x, const Address& token_y,
                       const PairAccounts& accounts,
                       const ILedger& ledger, IEventSink& events) {
    if (pair.state != PairState::UNINITIALIZED) return errors::ALREADY_CONFIGURED;
    if (token_x == token_y) return errors::IDENTICAL_ASSETS;

    // Smaller identifier becomes token_a; custody references follow their asset
    bool swapped = token_y < token_x;
    const Address& token_a = swapped ? token_y : token_x;
    const Address& token_b = swapped ? token_x : token_y;
    const Address& custody_a = swapped ? accounts.custody_y : accounts.custody_x;
    const Address& custody_b = swapped ? accounts.custody_x : accounts.custody_y;

    int32_t rc = authorize(registry, caller);
    if (rc != errors::OK) return rc;

    if (pair_key(token_a, token_b) != pair.key) return errors::INVALID_ASSET;

    if ((rc = check_custody(ledger, custody_a, token_a, pair.authority)) != errors::OK) return rc;
    if ((rc = check_custody(ledger, custody_b, token_b, pair.authority)) != errors::OK) return rc;
    if (custody_a == custody_b) return errors::INVALID_CUSTODY_REFERENCE;

    auto mint = ledger.get_mint(accounts.share_mint);
    if (!mint || mint->authority != pair.authority.key || mint->supply != 0) {
        return errors::INVALID_SHARE_MINT;
    }

    uint64_t pair_count = 0;
    if (__builtin_add_overflow(registry.pair_count, uint64_t{1}, &pair_count)) {
        return errors::MATH_OVERFLOW;
    }

    pair.registry = registry.key;
    pair.token_a = token_a;
    pair.token_b = token_b;
    pair.reserve_a = 0;
    pair.reserve_b = 0;
    pair.reserve_account_a = custody_a;
    pair.reserve_account_b = custody_b;
    pair.share_mint = accounts.share_mint;
    pair.total_shares = 0;
    pair.state = PairState::CONFIGURED;

    registry.pair_count = pair_count;
    registry.last_pair = pair.key;

    events.on_pair_created({token_a, token_b, pair.key, pair_count});
    return errors::OK;
}

// =============================================================================
// Add Liquidity
// =============================================================================

int32_t add_liquidity(Pair& pair, const Registry& registry,
                      ILedger& ledger, IEventSink& events,
                      const AddLiquidityParams& params,
                      AddLiquidityResult& out) {
    int32_t rc = check_active(pair, registry);
    if (rc != errors::OK) return rc;

    if ((rc = check_user_account(ledger, params.source_a, pair.token_a, params.sender)) != errors::OK) return rc;
    if ((rc = check_user_account(ledger, params.source_b, pair.token_b, params.sender)) != errors::OK) return rc;

    DepositQuote quote{};
    rc = quote_deposit(pair.reserve_a, pair.reserve_b, pair.total_shares,
                       params.desired_a, params.desired_b,
                       params.min_a, params.min_b, quote);
    if (rc != errors::OK) return rc;

    Pair staged = pair;
    if ((rc = checked::add(pair.reserve_a, quote.amount_a, staged.reserve_a)) != errors::OK) return rc;
    if ((rc = checked::add(pair.reserve_b, quote.amount_b, staged.reserve_b)) != errors::OK) return rc;
    if ((rc = checked::add(pair.total_shares, quote.shares, staged.total_shares)) != errors::OK) return rc;
    if ((rc = checked::add(staged.total_shares, quote.locked_shares, staged.total_shares)) != errors::OK) return rc;

    std::vector<LedgerOp> batch;
    batch.reserve(4);
    batch.push_back(LedgerOp::transfer(params.source_a, pair.reserve_account_a,
                                       params.sender, quote.amount_a));
    batch.push_back(LedgerOp::transfer(params.source_b, pair.reserve_account_b,
                                       params.sender, quote.amount_b));
    if (quote.locked_shares > 0) {
        batch.push_back(LedgerOp::mint_to(pair.share_mint, addresses::LIQUIDITY_SINK,
                                          pair.authority.key, quote.locked_shares));
    }
    batch.push_back(LedgerOp::mint_to(pair.share_mint, params.share_holder,
                                      pair.authority.key, quote.shares));

    if ((rc = ledger.execute(batch)) != errors::OK) return rc;

    pair = staged;
    out = {quote.amount_a, quote.amount_b, quote.shares};

    events.on_liquidity_added({pair.key, params.sender, quote.amount_a, quote.amount_b, quote.shares});
    return errors::OK;
}

// =============================================================================
// Remove Liquidity
// =============================================================================

int32_t remove_liquidity(Pair& pair, const Registry& registry,
                         ILedger& ledger, IEventSink& events,
                         const RemoveLiquidityParams& params,
                         RemoveLiquidityResult& out) {
    // Locked minimum liquidity stays in the pool for good
    if (params.sender == addresses::LIQUIDITY_SINK) return errors::UNAUTHORIZED;

    int32_t rc = check_active(pair, registry);
    if (rc != errors::OK) return rc;

    if ((rc = check_user_account(ledger, params.destination_a, pair.token_a, params.sender)) != errors::OK) return rc;
    if ((rc = check_user_account(ledger, params.destination_b, pair.token_b, params.sender)) != errors::OK) return rc;

    WithdrawalQuote quote{};
    rc = quote_withdrawal(pair.reserve_a, pair.reserve_b, pair.total_shares,
                          params.shares, params.min_a, params.min_b, quote);
    if (rc != errors::OK) return rc;

    Pair staged = pair;
    if ((rc = checked::sub(pair.reserve_a, quote.amount_a, staged.reserve_a)) != errors::OK) return rc;
    if ((rc = checked::sub(pair.reserve_b, quote.amount_b, staged.reserve_b)) != errors::OK) return rc;
    if ((rc = checked::sub(pair.total_shares, quote.shares, staged.total_shares)) != errors::OK) return rc;

    // Burn before paying out so the same shares cannot be redeemed twice
    std::vector<LedgerOp> batch;
    batch.reserve(3);
    batch.push_back(LedgerOp::burn(pair.share_mint, params.sender, params.sender, quote.shares));
    batch.push_back(LedgerOp::transfer(pair.reserve_account_a, params.destination_a,
                                       pair.authority.key, quote.amount_a));
    batch.push_back(LedgerOp::transfer(pair.reserve_account_b, params.destination_b,
                                       pair.authority.key, quote.amount_b));

    if ((rc = ledger.execute(batch)) != errors::OK) return rc;

    pair = staged;
    out = {quote.amount_a, quote.amount_b, quote.shares};

    events.on_liquidity_removed({pair.key, params.sender, quote.amount_a, quote.amount_b, quote.shares});
    return errors::OK;
}

// =============================================================================
// Swap
// =============================================================================

int32_t swap(Pair& pair, const Registry& registry,
             ILedger& ledger, IEventSink& events,
             const SwapParams& params,
             SwapResult& out) {
    int32_t rc = check_active(pair, registry);
    if (rc != errors::OK) return rc;

    auto source = ledger.get_account(params.source);
    if (!source) return errors::ACCOUNT_NOT_FOUND;

    bool a_in;
    if (source->asset == pair.token_a) {
        a_in = true;
    } else if (source->asset == pair.token_b) {
        a_in = false;
    } else {
        return errors::INVALID_ASSET;
    }
    if (source->owner != params.sender) return errors::INVALID_OWNER;

    const Address& asset_out = a_in ? pair.token_b : pair.token_a;
    if ((rc = check_user_account(ledger, params.destination, asset_out, params.sender)) != errors::OK) return rc;

    Amount reserve_in = a_in ? pair.reserve_a : pair.reserve_b;
    Amount reserve_out = a_in ? pair.reserve_b : pair.reserve_a;

    SwapQuote quote{};
    rc = quote_swap(params.amount_in, params.amount_out_min, reserve_in, reserve_out, quote);
    if (rc != errors::OK) return rc;

    Amount new_in = 0, new_out = 0;
    if ((rc = checked::add(reserve_in, quote.amount_in, new_in)) != errors::OK) return rc;
    if ((rc = checked::sub(reserve_out, quote.amount_out, new_out)) != errors::OK) return rc;

    Pair staged = pair;
    staged.reserve_a = a_in ? new_in : new_out;
    staged.reserve_b = a_in ? new_out : new_in;

    // k must not shrink
    rc = check_invariant(pair.reserve_a, pair.reserve_b, staged.reserve_a, staged.reserve_b);
    if (rc != errors::OK) return rc;

    const Address& custody_in = a_in ? pair.reserve_account_a : pair.reserve_account_b;
    const Address& custody_out = a_in ? pair.reserve_account_b : pair.reserve_account_a;

    std::vector<LedgerOp> batch;
    batch.reserve(2);
    batch.push_back(LedgerOp::transfer(params.source, custody_in, params.sender, quote.amount_in));
    batch.push_back(LedgerOp::transfer(custody_out, params.destination, pair.authority.key, quote.amount_out));

    if ((rc = ledger.execute(batch)) != errors::OK) return rc;

    pair = staged;
    out = {quote.amount_in, quote.amount_out, a_in};

    events.on_swap({pair.key, params.sender, quote.amount_in, quote.amount_out, a_in});
    return errors::OK;
}

int32_t quote_pair(const Pair& pair, const Address& asset_in, U128 amount_in,
                   U128& amount_out) {
    if (!pair.configured()) return errors::NOT_CONFIGURED;

    if (asset_in == pair.token_a) {
        return get_amount_out(amount_in, pair.reserve_a, pair.reserve_b, amount_out);
    }
    if (asset_in == pair.token_b) {
        return get_amount_out(amount_in, pair.reserve_b, pair.reserve_a, amount_out);
    }
    return errors::INVALID_ASSET;
}

} // namespace kswap
