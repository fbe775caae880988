#ifndef KSWAP_LEDGER_HPP
#define KSWAP_LEDGER_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "types.hpp"

namespace kswap {

// =============================================================================
// Ledger Records
// =============================================================================

// Holds one asset for one owner
struct CustodyAccount {
    Address address;
    Address asset;
    Address owner;
    Amount balance;
};

// Fungible share token class of a pair
struct ShareMint {
    Address address;
    Address authority;
    uint8_t decimals;
    Amount supply;
};

struct ShareHolding {
    Address mint;
    Address holder;
    Amount balance;
};

// =============================================================================
// Ledger Operations
// =============================================================================

enum class LedgerOpKind : uint8_t {
    TRANSFER = 0,   // source account -> destination account
    MINT = 1,       // mint -> destination holder
    BURN = 2        // source holder -> destroyed
};

struct LedgerOp {
    LedgerOpKind kind;
    Address source;
    Address destination;
    Address mint;
    Address authority;      // Identity or capability presented for the operation
    Amount amount;

    static LedgerOp transfer(const Address& from, const Address& to,
                             const Address& authority, Amount amount) {
        return {LedgerOpKind::TRANSFER, from, to, Address{}, authority, amount};
    }

    static LedgerOp mint_to(const Address& mint, const Address& holder,
                            const Address& authority, Amount amount) {
        return {LedgerOpKind::MINT, Address{}, holder, mint, authority, amount};
    }

    static LedgerOp burn(const Address& mint, const Address& holder,
                         const Address& authority, Amount amount) {
        return {LedgerOpKind::BURN, holder, Address{}, mint, authority, amount};
    }
};

// =============================================================================
// Ledger Interface
//
// Custody and share balances live outside the exchange core. The core reads
// account metadata for validation and submits each operation's balance
// movements as one batch. A batch applies in order and atomically: if any
// operation fails, none of them is visible.
//
// Authorization rules:
//   TRANSFER  authority must own the source account
//   MINT      authority must be the mint authority
//   BURN      authority must be the holder or the mint authority
// =============================================================================

class ILedger {
public:
    virtual ~ILedger() = default;

    virtual std::optional<CustodyAccount> get_account(const Address& account) const = 0;
    virtual std::optional<ShareMint> get_mint(const Address& mint) const = 0;
    virtual Amount share_balance(const Address& mint, const Address& holder) const = 0;

    virtual int32_t execute(const std::vector<LedgerOp>& batch) = 0;
};

// =============================================================================
// MemoryLedger - in-process ledger
// =============================================================================

class MemoryLedger : public ILedger {
public:
    MemoryLedger();
    ~MemoryLedger() override = default;

    // Non-copyable
    MemoryLedger(const MemoryLedger&) = delete;
    MemoryLedger& operator=(const MemoryLedger&) = delete;

    // =========================================================================
    // Account / Mint Creation
    // =========================================================================

    // Opens an empty custody account and returns its address
    Address open_account(const Address& asset, const Address& owner);

    // Creates a share mint with zero supply
    Address create_mint(const Address& authority, uint8_t decimals = SHARE_DECIMALS);

    // Credits an account out of thin air (faucet for tests and the CLI)
    int32_t credit(const Address& account, Amount amount);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<CustodyAccount> get_account(const Address& account) const override;
    std::optional<ShareMint> get_mint(const Address& mint) const override;
    Amount share_balance(const Address& mint, const Address& holder) const override;

    // First account of `owner` holding `asset`
    std::optional<Address> find_account(const Address& asset, const Address& owner) const;

    std::vector<CustodyAccount> accounts_of(const Address& owner) const;
    std::vector<ShareHolding> holdings_of(const Address& holder) const;

    // =========================================================================
    // Execution
    // =========================================================================

    int32_t execute(const std::vector<LedgerOp>& batch) override;

    // =========================================================================
    // Snapshot
    // =========================================================================

    struct Snapshot {
        std::vector<CustodyAccount> accounts;
        std::vector<ShareMint> mints;
        std::vector<ShareHolding> holdings;
        uint64_t nonce;
    };
    Snapshot snapshot() const;
    void restore(const Snapshot& snapshot);

private:
    using HoldingKey = std::pair<Address, Address>;  // (mint, holder)

    std::map<Address, CustodyAccount> accounts_;
    std::map<Address, ShareMint> mints_;
    std::map<HoldingKey, Amount> holdings_;
    uint64_t nonce_{0};
    mutable std::shared_mutex mutex_;

    Address next_address(const char* domain, const Address& a, const Address& b);
};

} // namespace kswap

#endif // KSWAP_LEDGER_HPP
