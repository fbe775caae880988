// kswap - Persistence and Configuration Tests

#include <catch2/catch_test_macros.hpp>
#include <kswap/codec.hpp>
#include <kswap/config.hpp>
#include <kswap/exchange.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

using namespace kswap;
using json = nlohmann::json;

namespace {

std::string temp_path(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST_CASE("Record codecs", "[store][json]") {
    SECTION("Addresses are lowercase hex") {
        Address addr{};
        addr[0] = 0xAB;
        addr[31] = 0x01;
        json j = address_to_json(addr);
        std::string text = j.get<std::string>();
        REQUIRE(text.size() == 64);
        REQUIRE(text.substr(0, 2) == "ab");
        REQUIRE(text.substr(62) == "01");
        REQUIRE(address_from_json(j) == addr);
    }

    SECTION("Malformed addresses are rejected") {
        REQUIRE_THROWS_AS(address_from_json(json("xyz")), std::runtime_error);
        REQUIRE_THROWS_AS(address_from_json(json(std::string(64, 'g'))), std::runtime_error);
    }

    SECTION("Pair state is named") {
        Pair pair{};
        pair.state = PairState::CONFIGURED;
        pair.reserve_a = UINT64_MAX;
        json j = pair;
        REQUIRE(j["state"] == "configured");
        REQUIRE(j["reserve_a"].get<uint64_t>() == UINT64_MAX);

        Pair decoded = j.get<Pair>();
        REQUIRE(decoded.configured());
        REQUIRE(decoded.reserve_a == UINT64_MAX);
    }

    SECTION("Events carry their kind") {
        json created = PairCreatedEvent{Address{}, Address{}, Address{}, 3};
        REQUIRE(created["type"] == "pair_created");
        REQUIRE(created["pair_count"] == 3);

        json swapped = SwapEvent{Address{}, Address{}, 10, 9, false};
        REQUIRE(swapped["type"] == "swap");
        REQUIRE(swapped["a_in"] == false);
    }

    SECTION("Amounts must be unsigned integers in range") {
        Pair pair{};
        json j = pair;
        j["reserve_a"] = -5;
        REQUIRE_THROWS_AS(j.get<Pair>(), std::runtime_error);
        j["reserve_a"] = 1.9;
        REQUIRE_THROWS_AS(j.get<Pair>(), std::runtime_error);

        json mint = ShareMint{Address{}, Address{}, 8, 0};
        mint["decimals"] = 256;
        REQUIRE_THROWS_AS(mint.get<ShareMint>(), std::runtime_error);
        mint["decimals"] = 255;
        REQUIRE(mint.get<ShareMint>().decimals == 255);
    }

    SECTION("Event sink writes one line per event") {
        std::ostringstream out;
        JsonEventSink sink(out);
        sink.on_swap(SwapEvent{Address{}, Address{}, 10, 9, true});
        sink.on_liquidity_removed(LiquidityEvent{});

        std::istringstream lines(out.str());
        std::string line;
        REQUIRE(static_cast<bool>(std::getline(lines, line)));
        REQUIRE(json::parse(line)["type"] == "swap");
        REQUIRE(static_cast<bool>(std::getline(lines, line)));
        REQUIRE(json::parse(line)["type"] == "liquidity_removed");
        REQUIRE_FALSE(static_cast<bool>(std::getline(lines, line)));
    }
}

TEST_CASE("Record store", "[store]") {
    RecordStore store;
    Address owner = address_from_label("owner");

    REQUIRE_FALSE(store.has_registry());
    REQUIRE(store.put_registry(initialize_registry(owner)) == errors::OK);
    REQUIRE(store.put_registry(initialize_registry(owner)) == errors::REGISTRY_ALREADY_INITIALIZED);

    Pair pair{};
    REQUIRE(create_pair(*store.registry(), owner, address_from_label("X"),
                        address_from_label("Y"), pair) == errors::OK);
    REQUIRE(store.allocate_pair(pair) == errors::OK);
    REQUIRE(store.allocate_pair(pair) == errors::PAIR_EXISTS);
    REQUIRE(store.size() == 1);
    REQUIRE(store.find_pair(pair.key) != nullptr);

    SECTION("JSON round trip") {
        RecordStore copy = RecordStore::from_json(store.to_json());
        REQUIRE(copy.registry()->owner == owner);
        REQUIRE(copy.find_pair(pair.key)->authority == pair.authority);
        REQUIRE_FALSE(copy.find_pair(pair.key)->configured());
    }

    SECTION("Duplicate records in a snapshot") {
        json j = store.to_json();
        j["pairs"].push_back(j["pairs"][0]);
        REQUIRE_THROWS_AS(RecordStore::from_json(j), std::runtime_error);
    }
}

TEST_CASE("State file", "[store]") {
    std::string path = temp_path("kswap-test-state.json");
    std::remove(path.c_str());

    MemoryLedger ledger;
    NullEventSink events;
    Address owner = address_from_label("owner");
    Address alice = address_from_label("alice");
    Address usdc = address_from_label("USDC");
    Address weth = address_from_label("WETH");
    Address key{};

    {
        Exchange exchange(ledger, events);
        REQUIRE(exchange.initialize(owner) == errors::OK);
        REQUIRE(provision_pair(exchange, ledger, owner, usdc, weth, key) == errors::OK);

        Pair pair = *exchange.get_pair(key);
        Address src_a = ledger.open_account(pair.token_a, alice);
        Address src_b = ledger.open_account(pair.token_b, alice);
        REQUIRE(ledger.credit(src_a, 50'000) == errors::OK);
        REQUIRE(ledger.credit(src_b, 50'000) == errors::OK);

        AddLiquidityResult added{};
        AddLiquidityParams params{alice, src_a, src_b, alice, 10'000, 40'000, 0, 0};
        REQUIRE(exchange.add_liquidity(key, params, added) == errors::OK);

        save_state(path, exchange.records(), ledger);
    }

    SECTION("Missing file") {
        RecordStore store;
        MemoryLedger empty;
        REQUIRE_FALSE(load_state(temp_path("kswap-test-missing.json"), store, empty));
    }

    SECTION("Reload") {
        RecordStore store;
        MemoryLedger restored;
        REQUIRE(load_state(path, store, restored));

        REQUIRE(store.registry()->pair_count == 1);
        const Pair* pair = store.find_pair(key);
        REQUIRE(pair != nullptr);
        REQUIRE(pair->configured());
        REQUIRE(pair->reserve_a + pair->reserve_b == 50'000);
        REQUIRE(pair->total_shares == 20'000);
        REQUIRE(restored.share_balance(pair->share_mint, alice) == 19'000);
        REQUIRE(restored.get_account(pair->reserve_account_a)->balance == pair->reserve_a);

        // A reloaded exchange keeps trading
        Exchange exchange(std::move(store), restored, events);
        Pair live = *exchange.get_pair(key);
        Address src = *restored.find_account(live.token_a, alice);
        Address dst = *restored.find_account(live.token_b, alice);
        SwapResult result{};
        REQUIRE(exchange.swap(key, SwapParams{alice, src, dst, 100, 0}, result) == errors::OK);
        REQUIRE(result.amount_out > 0);
    }

    SECTION("Negative reserve in the file") {
        json state;
        {
            std::ifstream in(path);
            in >> state;
        }
        state["records"]["pairs"][0]["reserve_a"] = -5;
        {
            std::ofstream out(path, std::ios::trunc);
            out << state.dump(2);
        }
        RecordStore store;
        MemoryLedger restored;
        REQUIRE_THROWS_AS(load_state(path, store, restored), std::runtime_error);
        REQUIRE_FALSE(store.has_registry());
    }

    SECTION("Malformed file") {
        {
            std::ofstream out(path, std::ios::trunc);
            out << "{\"records\": 12";
        }
        RecordStore store;
        MemoryLedger restored;
        REQUIRE_THROWS_AS(load_state(path, store, restored), std::runtime_error);
    }

    std::remove(path.c_str());
}

TEST_CASE("Exchange configuration", "[config]") {
    SECTION("Defaults") {
        ExchangeConfig config = ExchangeConfig::from_json_string("{}");
        REQUIRE(config.state_path == "kswap-state.json");
        REQUIRE(config.log_level == "info");
        REQUIRE(config.emit_events);
        REQUIRE(config.share_decimals == SHARE_DECIMALS);
    }

    SECTION("Overrides and unknown keys") {
        ExchangeConfig config = ExchangeConfig::from_json_string(R"({
            "state_path": "/tmp/pool.json",
            "log_level": "debug",
            "emit_events": false,
            "share_decimals": 6,
            "comment": "ignored"
        })");
        REQUIRE(config.state_path == "/tmp/pool.json");
        REQUIRE(config.log_level == "debug");
        REQUIRE_FALSE(config.emit_events);
        REQUIRE(config.share_decimals == 6);
    }

    SECTION("Rejected input") {
        REQUIRE_THROWS_AS(ExchangeConfig::from_json_string("{"), std::runtime_error);
        REQUIRE_THROWS_AS(ExchangeConfig::from_json_string("[]"), std::runtime_error);
        REQUIRE_THROWS_AS(ExchangeConfig::from_json_string(R"({"emit_events": "yes"})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(ExchangeConfig::from_json_string(R"({"log_level": "loud"})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(ExchangeConfig::from_json_string(R"({"share_decimals": 300})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(ExchangeConfig::from_json_string(R"({"share_decimals": -1})"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(ExchangeConfig::from_json_string(R"({"share_decimals": 1.5})"),
                          std::runtime_error);
    }

    SECTION("From file") {
        std::string path = temp_path("kswap-test-config.json");
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"log_level": "error"})";
        }
        REQUIRE(ExchangeConfig::from_file(path).log_level == "error");
        std::remove(path.c_str());

        REQUIRE_THROWS_AS(ExchangeConfig::from_file(temp_path("kswap-test-no-config.json")),
                          std::runtime_error);
    }
}
