// =============================================================================
// ledger.cpp - MemoryLedger custody and share bookkeeping
// =============================================================================

#include "kswap/ledger.hpp"
#include "kswap/keys.hpp"
#include "kswap/math.hpp"

#include <mutex>
#include <string>

namespace kswap {

// =============================================================================
// Constructor
// =============================================================================

MemoryLedger::MemoryLedger() = default;

Address MemoryLedger::next_address(const char* domain, const Address& a, const Address& b) {
    uint64_t n = ++nonce_;
    std::string nonce_bytes(sizeof(n), '\0');
    for (size_t i = 0; i < sizeof(n); ++i) {
        nonce_bytes[i] = static_cast<char>((n >> (8 * i)) & 0xff);   // little-endian
    }
    return derive_address(domain, {seed(a), seed(b), nonce_bytes});
}

// =============================================================================
// Account / Mint Creation
// =============================================================================

Address MemoryLedger::open_account(const Address& asset, const Address& owner) {
    std::unique_lock lock(mutex_);

    Address address = next_address("custody", asset, owner);
    accounts_[address] = CustodyAccount{address, asset, owner, 0};
    return address;
}

Address MemoryLedger::create_mint(const Address& authority, uint8_t decimals) {
    std::unique_lock lock(mutex_);

    Address address = next_address("mint", authority, authority);
    mints_[address] = ShareMint{address, authority, decimals, 0};
    return address;
}

int32_t MemoryLedger::credit(const Address& account, Amount amount) {
    std::unique_lock lock(mutex_);

    auto it = accounts_.find(account);
    if (it == accounts_.end()) return errors::ACCOUNT_NOT_FOUND;
    return checked::add(it->second.balance, amount, it->second.balance);
}

// =============================================================================
// Queries
// =============================================================================

std::optional<CustodyAccount> MemoryLedger::get_account(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = accounts_.find(account);
    if (it == accounts_.end()) return std::nullopt;
    return it->second;
}

std::optional<ShareMint> MemoryLedger::get_mint(const Address& mint) const {
    std::shared_lock lock(mutex_);
    auto it = mints_.find(mint);
    if (it == mints_.end()) return std::nullopt;
    return it->second;
}

Amount MemoryLedger::share_balance(const Address& mint, const Address& holder) const {
    std::shared_lock lock(mutex_);
    auto it = holdings_.find({mint, holder});
    return it != holdings_.end() ? it->second : 0;
}

std::optional<Address> MemoryLedger::find_account(const Address& asset, const Address& owner) const {
    std::shared_lock lock(mutex_);
    for (const auto& [address, account] : accounts_) {
        if (account.asset == asset && account.owner == owner) return address;
    }
    return std::nullopt;
}

std::vector<CustodyAccount> MemoryLedger::accounts_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    std::vector<CustodyAccount> result;
    for (const auto& [address, account] : accounts_) {
        if (account.owner == owner) result.push_back(account);
    }
    return result;
}

std::vector<ShareHolding> MemoryLedger::holdings_of(const Address& holder) const {
    std::shared_lock lock(mutex_);
    std::vector<ShareHolding> result;
    for (const auto& [key, balance] : holdings_) {
        if (key.second == holder) result.push_back({key.first, key.second, balance});
    }
    return result;
}

// =============================================================================
// Batch Execution
// =============================================================================

int32_t MemoryLedger::execute(const std::vector<LedgerOp>& batch) {
    std::unique_lock lock(mutex_);

    // Working copies of every balance the batch touches; committed only when
    // the whole batch succeeds.
    std::map<Address, Amount> balances;
    std::map<Address, Amount> supplies;
    std::map<HoldingKey, Amount> holdings;

    auto balance_of = [&](const CustodyAccount& account) -> Amount& {
        auto it = balances.find(account.address);
        if (it == balances.end()) {
            it = balances.emplace(account.address, account.balance).first;
        }
        return it->second;
    };
    auto supply_of = [&](const ShareMint& mint) -> Amount& {
        auto it = supplies.find(mint.address);
        if (it == supplies.end()) {
            it = supplies.emplace(mint.address, mint.supply).first;
        }
        return it->second;
    };
    auto holding_of = [&](const HoldingKey& key) -> Amount& {
        auto it = holdings.find(key);
        if (it == holdings.end()) {
            auto stored = holdings_.find(key);
            it = holdings.emplace(key, stored != holdings_.end() ? stored->second : 0).first;
        }
        return it->second;
    };

    for (const LedgerOp& op : batch) {
        int32_t rc = errors::OK;

        switch (op.kind) {
            case LedgerOpKind::TRANSFER: {
                auto from = accounts_.find(op.source);
                auto to = accounts_.find(op.destination);
                if (from == accounts_.end() || to == accounts_.end()) {
                    return errors::ACCOUNT_NOT_FOUND;
                }
                if (from->second.asset != to->second.asset) return errors::INVALID_ASSET;
                if (op.authority != from->second.owner) return errors::UNAUTHORIZED;
                if (op.authority == addresses::LIQUIDITY_SINK) return errors::UNAUTHORIZED;

                Amount& src = balance_of(from->second);
                if (src < op.amount) return errors::INSUFFICIENT_BALANCE;
                src -= op.amount;
                Amount& dst = balance_of(to->second);
                rc = checked::add(dst, op.amount, dst);
                break;
            }
            case LedgerOpKind::MINT: {
                auto mint = mints_.find(op.mint);
                if (mint == mints_.end()) return errors::ACCOUNT_NOT_FOUND;
                if (op.authority != mint->second.authority) return errors::UNAUTHORIZED;

                Amount& supply = supply_of(mint->second);
                if ((rc = checked::add(supply, op.amount, supply)) != errors::OK) return rc;
                Amount& held = holding_of({op.mint, op.destination});
                rc = checked::add(held, op.amount, held);
                break;
            }
            case LedgerOpKind::BURN: {
                auto mint = mints_.find(op.mint);
                if (mint == mints_.end()) return errors::ACCOUNT_NOT_FOUND;
                if (op.authority != op.source && op.authority != mint->second.authority) {
                    return errors::UNAUTHORIZED;
                }
                // Shares held by the sink are never burned, whoever signs
                if (op.source == addresses::LIQUIDITY_SINK || op.authority == addresses::LIQUIDITY_SINK) {
                    return errors::UNAUTHORIZED;
                }

                Amount& held = holding_of({op.mint, op.source});
                if (held < op.amount) return errors::INSUFFICIENT_BALANCE;
                held -= op.amount;
                Amount& supply = supply_of(mint->second);
                rc = checked::sub(supply, op.amount, supply);
                break;
            }
        }

        if (rc != errors::OK) return rc;
    }

    for (const auto& [address, balance] : balances) {
        accounts_[address].balance = balance;
    }
    for (const auto& [address, supply] : supplies) {
        mints_[address].supply = supply;
    }
    for (const auto& [key, balance] : holdings) {
        if (balance == 0) {
            holdings_.erase(key);
        } else {
            holdings_[key] = balance;
        }
    }
    return errors::OK;
}

// =============================================================================
// Snapshot
// =============================================================================

MemoryLedger::Snapshot MemoryLedger::snapshot() const {
    std::shared_lock lock(mutex_);

    Snapshot snap;
    snap.nonce = nonce_;
    for (const auto& [address, account] : accounts_) snap.accounts.push_back(account);
    for (const auto& [address, mint] : mints_) snap.mints.push_back(mint);
    for (const auto& [key, balance] : holdings_) {
        snap.holdings.push_back({key.first, key.second, balance});
    }
    return snap;
}

void MemoryLedger::restore(const Snapshot& snapshot) {
    std::unique_lock lock(mutex_);

    accounts_.clear();
    mints_.clear();
    holdings_.clear();
    for (const auto& account : snapshot.accounts) accounts_[account.address] = account;
    for (const auto& mint : snapshot.mints) mints_[mint.address] = mint;
    for (const auto& holding : snapshot.holdings) {
        holdings_[{holding.mint, holding.holder}] = holding.balance;
    }
    nonce_ = snapshot.nonce;
}

} // namespace kswap
