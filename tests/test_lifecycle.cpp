// kswap - Registry and Pair Lifecycle Tests

#include <catch2/catch_test_macros.hpp>
#include <kswap/pair.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace kswap;

namespace {

struct RecordingSink : IEventSink {
    std::vector<PairCreatedEvent> created;
    void on_pair_created(const PairCreatedEvent& event) override { created.push_back(event); }
};

Address id(const char* label) {
    return address_from_label(label);
}

// Ledger accounts a pair needs, prepared in the caller's asset order
PairAccounts prepare(MemoryLedger& ledger, const Pair& pair,
                     const Address& token_x, const Address& token_y) {
    PairAccounts accounts{};
    accounts.custody_x = ledger.open_account(token_x, pair.authority.key);
    accounts.custody_y = ledger.open_account(token_y, pair.authority.key);
    accounts.share_mint = ledger.create_mint(pair.authority.key);
    return accounts;
}

} // namespace

TEST_CASE("Registry initialization", "[registry]") {
    Address owner = id("owner");
    Registry registry = initialize_registry(owner);

    REQUIRE(registry.owner == owner);
    REQUIRE(registry.pair_count == 0);
    REQUIRE_FALSE(registry.fee_enabled);
    REQUIRE(addresses::is_zero(registry.fee_collector));
    REQUIRE(addresses::is_zero(registry.last_pair));
    REQUIRE_FALSE(addresses::is_zero(registry.key));

    SECTION("Key is deterministic per owner") {
        REQUIRE(initialize_registry(owner).key == registry.key);
        REQUIRE(initialize_registry(id("someone else")).key != registry.key);
    }

    SECTION("Only the owner is authorized") {
        REQUIRE(authorize(registry, owner) == errors::OK);
        REQUIRE(authorize(registry, id("mallory")) == errors::UNAUTHORIZED);
    }
}

TEST_CASE("Protocol fee settings", "[registry]") {
    Address owner = id("owner");
    Registry registry = initialize_registry(owner);
    Address collector = id("treasury");

    SECTION("Owner may switch the fee on") {
        REQUIRE(set_protocol_fee(registry, owner, collector, true) == errors::OK);
        REQUIRE(registry.fee_collector == collector);
        REQUIRE(registry.fee_enabled);
    }

    SECTION("Anyone else is rejected and nothing changes") {
        REQUIRE(set_protocol_fee(registry, id("mallory"), collector, true) == errors::UNAUTHORIZED);
        REQUIRE(addresses::is_zero(registry.fee_collector));
        REQUIRE_FALSE(registry.fee_enabled);
    }
}

TEST_CASE("Pair keys", "[keys]") {
    Address usdc = id("USDC");
    Address weth = id("WETH");

    REQUIRE(pair_key(usdc, weth) == pair_key(weth, usdc));
    REQUIRE(pair_key(usdc, weth) != pair_key(usdc, id("DAI")));
    REQUIRE(pair_authority(pair_key(usdc, weth)) == pair_authority(pair_key(weth, usdc)));
    REQUIRE(pair_authority(pair_key(usdc, weth)).key != pair_key(usdc, weth));

    SECTION("Identities parse as hex or label") {
        std::string hex = to_hex(usdc);
        REQUIRE(parse_identity(hex) == usdc);
        REQUIRE(parse_identity("USDC") == usdc);
        REQUIRE(parse_identity("usdc") != usdc);
    }

    SECTION("Seed framing separates boundaries") {
        REQUIRE(derive_address("t", {"ab", "c"}) != derive_address("t", {"a", "bc"}));
        REQUIRE(derive_address("t", {"ab"}) != derive_address("u", {"ab"}));
    }
}

TEST_CASE("Create pair", "[lifecycle]") {
    Address owner = id("owner");
    Registry registry = initialize_registry(owner);
    Address usdc = id("USDC");
    Address weth = id("WETH");

    SECTION("Allocates an uninitialized record") {
        Pair pair{};
        REQUIRE(create_pair(registry, owner, usdc, weth, pair) == errors::OK);
        REQUIRE(pair.state == PairState::UNINITIALIZED);
        REQUIRE_FALSE(pair.configured());
        REQUIRE(pair.key == pair_key(usdc, weth));
        REQUIRE(pair.authority == pair_authority(pair.key));
        REQUIRE(registry.pair_count == 0);
    }

    SECTION("Identical assets") {
        Pair pair{};
        REQUIRE(create_pair(registry, owner, usdc, usdc, pair) == errors::IDENTICAL_ASSETS);
    }

    SECTION("Non-owner") {
        Pair pair{};
        REQUIRE(create_pair(registry, id("mallory"), usdc, weth, pair) == errors::UNAUTHORIZED);
    }
}

TEST_CASE("Configure pair", "[lifecycle]") {
    Address owner = id("owner");
    Registry registry = initialize_registry(owner);
    MemoryLedger ledger;
    RecordingSink events;

    Address low{};
    Address high{};
    low[0] = 0x01;
    high[0] = 0xf0;

    Pair pair{};
    REQUIRE(create_pair(registry, owner, high, low, pair) == errors::OK);

    SECTION("Stores the smaller identifier as token_a") {
        PairAccounts accounts = prepare(ledger, pair, high, low);
        REQUIRE(configure_pair(pair, registry, owner, high, low, accounts, ledger, events) ==
                errors::OK);

        REQUIRE(pair.configured());
        REQUIRE(pair.token_a == low);
        REQUIRE(pair.token_b == high);
        REQUIRE(pair.registry == registry.key);
        REQUIRE(pair.reserve_a == 0);
        REQUIRE(pair.reserve_b == 0);
        REQUIRE(pair.total_shares == 0);
        REQUIRE(pair.share_mint == accounts.share_mint);

        // Custody references follow their asset
        REQUIRE(pair.reserve_account_a == accounts.custody_y);
        REQUIRE(pair.reserve_account_b == accounts.custody_x);
        REQUIRE(ledger.get_account(pair.reserve_account_a)->asset == low);
        REQUIRE(ledger.get_account(pair.reserve_account_b)->asset == high);

        REQUIRE(registry.pair_count == 1);
        REQUIRE(registry.last_pair == pair.key);

        REQUIRE(events.created.size() == 1);
        REQUIRE(events.created[0].token_a == low);
        REQUIRE(events.created[0].token_b == high);
        REQUIRE(events.created[0].pair == pair.key);
        REQUIRE(events.created[0].pair_count == 1);
    }

    SECTION("Argument order does not matter") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        REQUIRE(configure_pair(pair, registry, owner, low, high, accounts, ledger, events) ==
                errors::OK);
        REQUIRE(pair.token_a == low);
        REQUIRE(pair.reserve_account_a == accounts.custody_x);
    }

    SECTION("Configuration is terminal") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        REQUIRE(configure_pair(pair, registry, owner, low, high, accounts, ledger, events) ==
                errors::OK);
        Pair before = pair;

        PairAccounts again = prepare(ledger, pair, low, high);
        REQUIRE(configure_pair(pair, registry, owner, low, high, again, ledger, events) ==
                errors::ALREADY_CONFIGURED);
        REQUIRE(pair.reserve_account_a == before.reserve_account_a);
        REQUIRE(pair.share_mint == before.share_mint);
        REQUIRE(registry.pair_count == 1);
        REQUIRE(events.created.size() == 1);
    }

    SECTION("Non-owner leaves the pair untouched") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        REQUIRE(configure_pair(pair, registry, id("mallory"), low, high, accounts, ledger, events) ==
                errors::UNAUTHORIZED);
        REQUIRE_FALSE(pair.configured());
        REQUIRE(registry.pair_count == 0);
        REQUIRE(events.created.empty());
    }

    SECTION("Identical assets") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        REQUIRE(configure_pair(pair, registry, owner, low, low, accounts, ledger, events) ==
                errors::IDENTICAL_ASSETS);
    }

    SECTION("Assets must match the allocated key") {
        Address other{};
        other[0] = 0x7f;
        PairAccounts accounts = prepare(ledger, pair, low, other);
        REQUIRE(configure_pair(pair, registry, owner, low, other, accounts, ledger, events) ==
                errors::INVALID_ASSET);
    }

    SECTION("Custody must be owned by the pair authority") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        accounts.custody_x = ledger.open_account(low, owner);
        REQUIRE(configure_pair(pair, registry, owner, low, high, accounts, ledger, events) ==
                errors::INVALID_CUSTODY_REFERENCE);
    }

    SECTION("Custody must hold its asset") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        std::swap(accounts.custody_x, accounts.custody_y);
        REQUIRE(configure_pair(pair, registry, owner, low, high, accounts, ledger, events) ==
                errors::INVALID_CUSTODY_REFERENCE);
    }

    SECTION("Unknown custody account") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        accounts.custody_y = id("nowhere");
        REQUIRE(configure_pair(pair, registry, owner, low, high, accounts, ledger, events) ==
                errors::INVALID_CUSTODY_REFERENCE);
    }

    SECTION("Share mint must belong to the pair authority") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        accounts.share_mint = ledger.create_mint(owner);
        REQUIRE(configure_pair(pair, registry, owner, low, high, accounts, ledger, events) ==
                errors::INVALID_SHARE_MINT);
    }

    SECTION("Share mint must start empty") {
        PairAccounts accounts = prepare(ledger, pair, low, high);
        REQUIRE(ledger.execute({LedgerOp::mint_to(accounts.share_mint, owner,
                                                  pair.authority.key, 5)}) == errors::OK);
        REQUIRE(configure_pair(pair, registry, owner, low, high, accounts, ledger, events) ==
                errors::INVALID_SHARE_MINT);
    }

    SECTION("Pair counter cannot wrap") {
        registry.pair_count = UINT64_MAX;
        PairAccounts accounts = prepare(ledger, pair, low, high);
        REQUIRE(configure_pair(pair, registry, owner, low, high, accounts, ledger, events) ==
                errors::MATH_OVERFLOW);
        REQUIRE_FALSE(pair.configured());
    }
}

TEST_CASE("Pair count tracks configured pairs", "[lifecycle]") {
    Address owner = id("owner");
    Registry registry = initialize_registry(owner);
    MemoryLedger ledger;
    NullEventSink events;

    const char* labels[] = {"A", "B", "C", "D"};
    Address last{};
    for (int i = 0; i < 3; ++i) {
        Address x = id(labels[i]);
        Address y = id(labels[i + 1]);
        Pair pair{};
        REQUIRE(create_pair(registry, owner, x, y, pair) == errors::OK);
        PairAccounts accounts = prepare(ledger, pair, x, y);
        REQUIRE(configure_pair(pair, registry, owner, x, y, accounts, ledger, events) == errors::OK);
        last = pair.key;
    }

    REQUIRE(registry.pair_count == 3);
    REQUIRE(registry.last_pair == last);
}

TEST_CASE("Operations on an unconfigured pair", "[lifecycle]") {
    Address owner = id("owner");
    Registry registry = initialize_registry(owner);
    MemoryLedger ledger;
    NullEventSink events;

    Pair pair{};
    REQUIRE(create_pair(registry, owner, id("X"), id("Y"), pair) == errors::OK);

    AddLiquidityResult added{};
    REQUIRE(add_liquidity(pair, registry, ledger, events, AddLiquidityParams{}, added) ==
            errors::NOT_CONFIGURED);

    RemoveLiquidityResult removed{};
    REQUIRE(remove_liquidity(pair, registry, ledger, events, RemoveLiquidityParams{}, removed) ==
            errors::NOT_CONFIGURED);

    SwapResult swapped{};
    REQUIRE(swap(pair, registry, ledger, events, SwapParams{}, swapped) == errors::NOT_CONFIGURED);

    U128 out = 0;
    REQUIRE(quote_pair(pair, id("X"), 100, out) == errors::NOT_CONFIGURED);
}
