// kswap C++ CLI
//
// Command-line front end for a kswap exchange whose registry, pairs and
// in-process ledger are persisted to a JSON state file between invocations.

#include <nlohmann/json.hpp>

#include "kswap/codec.hpp"
#include "kswap/config.hpp"
#include "kswap/exchange.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace kswap;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> state_path;
    bool verbose = false;
    std::vector<std::string> command_args;
};

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

//------------------------------------------------------------------------------
// Argument helpers
//------------------------------------------------------------------------------

U128 parse_amount(const std::string& text) {
    auto value = parse_u128(text);
    if (!value) throw UsageError("Invalid amount: " + text);
    return *value;
}

Amount parse_amount64(const std::string& text) {
    Amount out = 0;
    if (checked::to_amount(parse_amount(text), out) != errors::OK) {
        throw UsageError("Amount out of range: " + text);
    }
    return out;
}

void require_args(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() != count) throw UsageError(std::string("Usage: kswap-cli ") + usage);
}

//------------------------------------------------------------------------------
// Session: exchange + ledger + state file
//------------------------------------------------------------------------------

class Session {
public:
    Session(const ExchangeConfig& config, std::string state_path, bool verbose)
        : config_(config)
        , state_path_(std::move(state_path))
        , verbose_(verbose)
    {
        if (config_.emit_events) {
            sink_ = std::make_unique<JsonEventSink>(std::cerr);
        } else {
            sink_ = std::make_unique<NullEventSink>();
        }

        RecordStore records;
        bool loaded = load_state(state_path_, records, ledger_);
        debug(loaded ? "Loaded state from " + state_path_
                     : "No state at " + state_path_ + ", starting empty");
        exchange_ = std::make_unique<Exchange>(std::move(records), ledger_, *sink_);
    }

    void save() {
        save_state(state_path_, exchange_->records(), ledger_);
        debug("Saved state to " + state_path_);
    }

    int run(const std::vector<std::string>& args);

private:
    ExchangeConfig config_;
    std::string state_path_;
    bool verbose_;
    MemoryLedger ledger_;
    std::unique_ptr<IEventSink> sink_;
    std::unique_ptr<Exchange> exchange_;

    void debug(const std::string& msg) const {
        if (verbose_) std::cerr << "[debug] " << msg << "\n";
    }

    int fail(const std::string& what, int32_t rc) const {
        std::cerr << what << " failed: " << error_message(rc) << " (" << rc << ")\n";
        return EXIT_FAILED;
    }

    Pair require_pair(const Address& x, const Address& y) const {
        auto pair = exchange_->find_pair(x, y);
        if (!pair) throw UsageError("No pair for these assets");
        return *pair;
    }

    // Existing account of owner for asset, or a fresh empty one
    Address account_for(const Address& asset, const Address& owner) {
        if (auto existing = ledger_.find_account(asset, owner)) return *existing;
        Address opened = ledger_.open_account(asset, owner);
        debug("Opened account " + to_hex(opened));
        return opened;
    }

    int cmd_init(const std::vector<std::string>& args);
    int cmd_fund(const std::vector<std::string>& args);
    int cmd_create_pair(const std::vector<std::string>& args);
    int cmd_add_liquidity(const std::vector<std::string>& args);
    int cmd_remove_liquidity(const std::vector<std::string>& args);
    int cmd_swap(const std::vector<std::string>& args);
    int cmd_quote(const std::vector<std::string>& args);
    int cmd_show();
    int cmd_balance(const std::vector<std::string>& args);
};

int Session::run(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    if (cmd == "init") return cmd_init(args);
    if (cmd == "fund") return cmd_fund(args);
    if (cmd == "create-pair") return cmd_create_pair(args);
    if (cmd == "add-liquidity") return cmd_add_liquidity(args);
    if (cmd == "remove-liquidity") return cmd_remove_liquidity(args);
    if (cmd == "swap") return cmd_swap(args);
    if (cmd == "quote") return cmd_quote(args);
    if (cmd == "show") return cmd_show();
    if (cmd == "balance") return cmd_balance(args);

    throw UsageError("Unknown command: " + cmd);
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

int Session::cmd_init(const std::vector<std::string>& args) {
    require_args(args, 2, "init <owner>");

    int32_t rc = exchange_->initialize(parse_identity(args[1]));
    if (rc != errors::OK) return fail("init", rc);

    save();
    std::cout << json(*exchange_->registry()).dump(2) << "\n";
    return 0;
}

int Session::cmd_fund(const std::vector<std::string>& args) {
    require_args(args, 4, "fund <owner> <asset> <amount>");

    Address owner = parse_identity(args[1]);
    Address asset = parse_identity(args[2]);
    Amount amount = parse_amount64(args[3]);

    Address account = account_for(asset, owner);
    int32_t rc = ledger_.credit(account, amount);
    if (rc != errors::OK) return fail("fund", rc);

    save();
    std::cout << json(*ledger_.get_account(account)).dump(2) << "\n";
    return 0;
}

int Session::cmd_create_pair(const std::vector<std::string>& args) {
    require_args(args, 4, "create-pair <caller> <asset_x> <asset_y>");

    Address key{};
    int32_t rc = provision_pair(*exchange_, ledger_, parse_identity(args[1]),
                                parse_identity(args[2]), parse_identity(args[3]),
                                key, config_.share_decimals);
    if (rc != errors::OK) return fail("create-pair", rc);

    save();
    std::cout << json(*exchange_->get_pair(key)).dump(2) << "\n";
    return 0;
}

int Session::cmd_add_liquidity(const std::vector<std::string>& args) {
    require_args(args, 8,
                 "add-liquidity <sender> <asset_x> <asset_y> <desired_x> <desired_y> <min_x> <min_y>");

    Address sender = parse_identity(args[1]);
    Address x = parse_identity(args[2]);
    Address y = parse_identity(args[3]);
    Pair pair = require_pair(x, y);
    bool x_is_a = pair.token_a == x;

    U128 desired_x = parse_amount(args[4]), desired_y = parse_amount(args[5]);
    U128 min_x = parse_amount(args[6]), min_y = parse_amount(args[7]);

    AddLiquidityParams params{};
    params.sender = sender;
    params.source_a = account_for(pair.token_a, sender);
    params.source_b = account_for(pair.token_b, sender);
    params.share_holder = sender;
    params.desired_a = x_is_a ? desired_x : desired_y;
    params.desired_b = x_is_a ? desired_y : desired_x;
    params.min_a = x_is_a ? min_x : min_y;
    params.min_b = x_is_a ? min_y : min_x;

    AddLiquidityResult result{};
    int32_t rc = exchange_->add_liquidity(pair.key, params, result);
    if (rc != errors::OK) return fail("add-liquidity", rc);

    save();
    std::cout << json{
        {"amount_x", x_is_a ? result.amount_a : result.amount_b},
        {"amount_y", x_is_a ? result.amount_b : result.amount_a},
        {"shares", result.shares}
    }.dump(2) << "\n";
    return 0;
}

int Session::cmd_remove_liquidity(const std::vector<std::string>& args) {
    require_args(args, 7, "remove-liquidity <sender> <asset_x> <asset_y> <shares> <min_x> <min_y>");

    Address sender = parse_identity(args[1]);
    Address x = parse_identity(args[2]);
    Address y = parse_identity(args[3]);
    Pair pair = require_pair(x, y);
    bool x_is_a = pair.token_a == x;

    U128 min_x = parse_amount(args[5]), min_y = parse_amount(args[6]);

    RemoveLiquidityParams params{};
    params.sender = sender;
    params.destination_a = account_for(pair.token_a, sender);
    params.destination_b = account_for(pair.token_b, sender);
    params.shares = parse_amount(args[4]);
    params.min_a = x_is_a ? min_x : min_y;
    params.min_b = x_is_a ? min_y : min_x;

    RemoveLiquidityResult result{};
    int32_t rc = exchange_->remove_liquidity(pair.key, params, result);
    if (rc != errors::OK) return fail("remove-liquidity", rc);

    save();
    std::cout << json{
        {"amount_x", x_is_a ? result.amount_a : result.amount_b},
        {"amount_y", x_is_a ? result.amount_b : result.amount_a},
        {"shares", result.shares}
    }.dump(2) << "\n";
    return 0;
}

int Session::cmd_swap(const std::vector<std::string>& args) {
    require_args(args, 6, "swap <sender> <asset_in> <asset_out> <amount_in> <min_out>");

    Address sender = parse_identity(args[1]);
    Address asset_in = parse_identity(args[2]);
    Address asset_out = parse_identity(args[3]);
    Pair pair = require_pair(asset_in, asset_out);

    SwapParams params{};
    params.sender = sender;
    params.source = account_for(asset_in, sender);
    params.destination = account_for(asset_out, sender);
    params.amount_in = parse_amount(args[4]);
    params.amount_out_min = parse_amount(args[5]);

    SwapResult result{};
    int32_t rc = exchange_->swap(pair.key, params, result);
    if (rc != errors::OK) return fail("swap", rc);

    save();
    std::cout << json{
        {"amount_in", result.amount_in},
        {"amount_out", result.amount_out}
    }.dump(2) << "\n";
    return 0;
}

int Session::cmd_quote(const std::vector<std::string>& args) {
    require_args(args, 5, "quote <asset_x> <asset_y> <asset_in> <amount_in>");

    Pair pair = require_pair(parse_identity(args[1]), parse_identity(args[2]));

    U128 amount_out = 0;
    int32_t rc = exchange_->quote(pair.key, parse_identity(args[3]), parse_amount(args[4]), amount_out);
    if (rc != errors::OK) return fail("quote", rc);

    std::cout << json{{"amount_out", to_string(amount_out)}}.dump(2) << "\n";
    return 0;
}

int Session::cmd_show() {
    json out;
    auto registry = exchange_->registry();
    out["registry"] = registry ? json(*registry) : json(nullptr);
    out["pairs"] = exchange_->pairs();
    std::cout << out.dump(2) << "\n";
    return 0;
}

int Session::cmd_balance(const std::vector<std::string>& args) {
    require_args(args, 2, "balance <owner>");

    Address owner = parse_identity(args[1]);
    json out;
    out["owner"] = address_to_json(owner);
    out["accounts"] = ledger_.accounts_of(owner);
    out["shares"] = ledger_.holdings_of(owner);
    std::cout << out.dump(2) << "\n";
    return 0;
}

//------------------------------------------------------------------------------
// Entry point
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "kswap C++ CLI\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  JSON configuration file\n"
              << "  -s, --state <file>   State file (overrides config state_path)\n"
              << "  -v, --verbose        Debug output on stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Identities are 64 hex digits or labels such as alice or USDC.\n\n"
              << "Commands:\n"
              << "  init <owner>\n"
              << "  fund <owner> <asset> <amount>\n"
              << "  create-pair <caller> <asset_x> <asset_y>\n"
              << "  add-liquidity <sender> <asset_x> <asset_y> <desired_x> <desired_y> <min_x> <min_y>\n"
              << "  remove-liquidity <sender> <asset_x> <asset_y> <shares> <min_x> <min_y>\n"
              << "  swap <sender> <asset_in> <asset_out> <amount_in> <min_out>\n"
              << "  quote <asset_x> <asset_y> <asset_in> <amount_in>\n"
              << "  show\n"
              << "  balance <owner>\n\n"
              << "Examples:\n"
              << "  " << prog << " init admin\n"
              << "  " << prog << " fund alice USDC 1000000\n"
              << "  " << prog << " create-pair admin USDC WETH\n"
              << "  " << prog << " swap alice USDC WETH 1000 1\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) throw UsageError("Missing config file argument");
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--state") {
            if (i + 1 >= argc) throw UsageError("Missing state file argument");
            options.state_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            throw UsageError("Unknown option: " + arg);
        }
        ++i;
    }

    if (options.command_args.empty()) throw UsageError("Missing command");
    return options;
}

int main(int argc, char* argv[]) {
    try {
        Options options = parse_args(argc, argv);

        ExchangeConfig config;
        if (options.config_path) {
            config = ExchangeConfig::from_file(*options.config_path);
        }
        std::string state_path = options.state_path.value_or(config.state_path);
        bool verbose = options.verbose || config.log_level == "debug";

        Session session(config, state_path, verbose);
        return session.run(options.command_args);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        std::cerr << "Run with --help for usage\n";
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILED;
    }
}
