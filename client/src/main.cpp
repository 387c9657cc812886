// cpamm CLI
//
// Replays a JSON script of ledger and pool operations against an in-memory
// ledger and prints every result and emitted event as one JSON line.

#include <cpamm/amm.hpp>
#include <cpamm/config.hpp>
#include <cpamm/errors.hpp>
#include <cpamm/events.hpp>
#include <cpamm/ledger.hpp>
#include <cpamm/log.hpp>
#include <cpamm/pool_store.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
using namespace cpamm;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string script_path;
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cout << "cpamm - constant-product AMM script runner\n\n"
              << "Usage: " << prog << " [options] <script.json | ->\n\n"
              << "Options:\n"
              << "  -c, --config <file>  JSON config (fee_bps, log_level, custody)\n"
              << "  -v, --verbose        Debug logging to stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Script steps (array, or {\"steps\": [...]}):\n"
              << "  {\"op\":\"mint\", \"asset\", \"to\", \"amount\"}\n"
              << "  {\"op\":\"approve\", \"asset\", \"owner\", \"amount\"}\n"
              << "  {\"op\":\"create_pool\", \"caller\", \"asset_a\", \"asset_b\", \"amount_a\", \"amount_b\"}\n"
              << "  {\"op\":\"add_liquidity\", \"caller\", \"pool\" | \"pair\", \"amount0\", \"amount1\"}\n"
              << "  {\"op\":\"remove_liquidity\", \"caller\", \"pool\" | \"pair\", \"shares\"}\n"
              << "  {\"op\":\"swap\", \"caller\", \"pool\" | \"pair\", \"asset_in\", \"amount_in\",\n"
              << "         \"min_amount_out\", \"recipient\"}\n"
              << "  {\"op\":\"get_pool\", \"pool\" | \"pair\"}\n"
              << "  {\"op\":\"share_balance\", \"pool\" | \"pair\", \"holder\"}\n"
              << "  {\"op\":\"balance\", \"asset\", \"holder\"}\n\n"
              << "Addresses are hex (0x-prefixed, up to 40 digits); amounts are decimal\n"
              << "strings or unsigned JSON numbers.\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            opts.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-" || arg[0] != '-') {
            opts.script_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (opts.script_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return opts;
}

//------------------------------------------------------------------------------
// Field Parsing
//------------------------------------------------------------------------------

Address address_field(const json& step, const char* key) {
    auto text = step.at(key).get<std::string>();
    auto addr = addresses::from_hex(text);
    if (!addr) {
        throw std::invalid_argument(std::string("invalid address for '") + key + "': " + text);
    }
    return *addr;
}

Asset asset_field(const json& step, const char* key) {
    return Asset(address_field(step, key));
}

U128 amount_field(const json& step, const char* key, U128 fallback = 0, bool required = true) {
    if (!step.contains(key)) {
        if (required) {
            throw std::invalid_argument(std::string("missing field '") + key + "'");
        }
        return fallback;
    }
    const json& v = step.at(key);
    if (v.is_number_unsigned()) {
        return static_cast<U128>(v.get<uint64_t>());
    }
    return parse_u128(v.get<std::string>());
}

PoolId pool_field(const Amm& amm, const json& step) {
    if (step.contains("pool")) {
        auto text = step.at("pool").get<std::string>();
        auto id = pool_id_from_hex(text);
        if (!id) {
            throw std::invalid_argument("invalid pool id: " + text);
        }
        return *id;
    }
    const json& pair = step.at("pair");
    if (!pair.is_array() || pair.size() != 2) {
        throw std::invalid_argument("'pair' must be an array of two assets");
    }
    auto a = addresses::from_hex(pair[0].get<std::string>());
    auto b = addresses::from_hex(pair[1].get<std::string>());
    if (!a || !b) {
        throw std::invalid_argument("invalid asset in 'pair'");
    }
    auto id = amm.find_pool(Asset(*a), Asset(*b));
    // Unknown pairs still resolve to their derived id so the pool lookup
    // reports PoolNotFound
    return id ? *id : PoolStore::pool_id_for(Asset(*a), Asset(*b));
}

json pool_json(const PoolInfo& info) {
    return json{
        {"asset0", addresses::to_hex(info.asset0.addr)},
        {"asset1", addresses::to_hex(info.asset1.addr)},
        {"reserve0", to_string(info.reserve0)},
        {"reserve1", to_string(info.reserve1)},
        {"fee_bps", info.fee_bps},
        {"total_shares", to_string(info.total_shares)}
    };
}

//------------------------------------------------------------------------------
// Script Runner
//------------------------------------------------------------------------------

json run_step(Amm& amm, Ledger& ledger, const json& step) {
    if (!step.is_object()) {
        throw std::invalid_argument("step must be an object");
    }
    std::string op = step.at("op").get<std::string>();

    if (op == "mint") {
        ledger.mint(asset_field(step, "asset"), address_field(step, "to"),
                    amount_field(step, "amount"));
        return json::object();
    }
    if (op == "approve") {
        ledger.approve(asset_field(step, "asset"), address_field(step, "owner"),
                       amount_field(step, "amount"));
        return json::object();
    }
    if (op == "create_pool") {
        PoolId id = amm.create_pool(address_field(step, "caller"),
                                    asset_field(step, "asset_a"), asset_field(step, "asset_b"),
                                    amount_field(step, "amount_a"), amount_field(step, "amount_b"));
        return json{{"pool_id", pool_id_to_hex(id)}};
    }
    if (op == "add_liquidity") {
        U128 shares = amm.add_liquidity(address_field(step, "caller"), pool_field(amm, step),
                                        amount_field(step, "amount0"), amount_field(step, "amount1"));
        return json{{"shares_minted", to_string(shares)}};
    }
    if (op == "remove_liquidity") {
        Amounts out = amm.remove_liquidity(address_field(step, "caller"), pool_field(amm, step),
                                           amount_field(step, "shares"));
        return json{{"amount0", to_string(out.amount0)}, {"amount1", to_string(out.amount1)}};
    }
    if (op == "swap") {
        Address caller = address_field(step, "caller");
        Address recipient = step.contains("recipient") ? address_field(step, "recipient") : caller;
        U128 out = amm.swap(caller, pool_field(amm, step), asset_field(step, "asset_in"),
                            amount_field(step, "amount_in"),
                            amount_field(step, "min_amount_out", 0, false), recipient);
        return json{{"amount_out", to_string(out)}};
    }
    if (op == "get_pool") {
        return pool_json(amm.get_pool(pool_field(amm, step)));
    }
    if (op == "share_balance") {
        U128 shares = amm.get_share_balance(pool_field(amm, step), address_field(step, "holder"));
        return json{{"shares", to_string(shares)}};
    }
    if (op == "balance") {
        U128 bal = ledger.balance_of(asset_field(step, "asset"), address_field(step, "holder"));
        return json{{"balance", to_string(bal)}};
    }
    throw std::invalid_argument("unknown op: " + op);
}

json load_script(const std::string& path) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file{path};
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open script: " + path);
        }
        buffer << file.rdbuf();
    }

    json doc = json::parse(buffer.str());
    if (doc.is_object() && doc.contains("steps")) {
        doc = doc.at("steps");
    }
    if (!doc.is_array()) {
        throw std::runtime_error("Script must be an array of steps");
    }
    return doc;
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    Config config;
    json script;
    try {
        if (!opts.config_path.empty()) {
            config = Config::from_file(opts.config_path);
        }
        if (opts.verbose) {
            config.with_log_level("debug");
        }
        config.validate();
        script = load_script(opts.script_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    Logger logger(config.level());
    Ledger ledger(config.custody);
    PoolStore store;
    EventLog events;
    Amm amm(config.fee_bps, store, ledger, events, logger);

    for (size_t i = 0; i < script.size(); ++i) {
        const json& step = script[i];
        json line = {{"step", i}};

        try {
            line["op"] = step.is_object() ? step.value("op", "") : "";
            line["result"] = run_step(amm, ledger, step);
        } catch (const AmmError& e) {
            line["error"] = to_string(e.code());
            line["message"] = e.what();
        } catch (const InvariantViolation& e) {
            line["fatal"] = e.what();
            std::cout << line.dump() << "\n";
            return 2;
        } catch (const json::exception& e) {
            std::cerr << "Error: step " << i << ": " << e.what() << "\n";
            return 1;
        } catch (const std::logic_error& e) {
            std::cerr << "Error: step " << i << ": " << e.what() << "\n";
            return 1;
        } catch (const std::runtime_error& e) {
            std::cerr << "Error: step " << i << ": " << e.what() << "\n";
            return 1;
        }

        std::cout << line.dump() << "\n";
        for (const auto& event : events.events()) {
            std::cout << to_json(event).dump() << "\n";
        }
        events.clear();
    }

    return 0;
}
