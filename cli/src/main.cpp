// crowdsale CLI
// SPDX-License-Identifier: MIT
//
// Interactive shell hosting one staged token sale over in-memory ledgers.
// Responses and committed events are printed as JSON.

#include <crowdsale/config.hpp>
#include <crowdsale/host.hpp>
#include <crowdsale/json.hpp>
#include <crowdsale/log.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace crowdsale;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string log_level;
    bool verbose = false;
    bool interactive = true;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Shell
//------------------------------------------------------------------------------

class Shell {
public:
    Shell(SaleHost& host, bool verbose)
        : host_(host)
        , verbose_(verbose)
        , now_(host.sale().now())
    {
        host_.sale().set_clock([this]() { return now_.load(); });
        listener_ = host_.sale().events().subscribe([this](const Event& event) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            pending_events_.push_back(event_json(event));
        });
    }

    ~Shell() {
        host_.sale().events().unsubscribe(listener_);
    }

    // Executes one command line; throws std::invalid_argument on bad input
    json execute(const std::vector<std::string>& parts) {
        const std::string& cmd = parts[0];
        CrowdSale& sale = host_.sale();

        // Views
        if (cmd == "state") {
            return state_json(sale.state(), sale.phase());
        }
        if (cmd == "stages") {
            json out = json::array();
            auto stages = sale.stages();
            for (size_t i = 0; i < stages.size(); ++i) {
                out.push_back(stage_json(stages[i], static_cast<uint32_t>(i)));
            }
            return out;
        }
        if (cmd == "assets") {
            json out = json::array();
            for (const auto& [asset, entry] : sale.payment_assets()) {
                out.push_back(asset_json(asset, entry, sale.is_acceptable(asset)));
            }
            return out;
        }
        if (cmd == "purchaser") {
            need(parts, 2, "purchaser <address>");
            Address buyer = address_arg(parts[1]);
            auto record = sale.purchaser(buyer);
            return record ? purchaser_json(buyer, *record) : json{{"buyer", addresses::to_hex(buyer)}};
        }
        if (cmd == "events") {
            json out = json::array();
            for (const auto& event : sale.events().history()) out.push_back(event_json(event));
            return out;
        }
        if (cmd == "balance") {
            need(parts, 3, "balance <asset> <address>");
            ITokenLedger& ledger = ledger_arg(parts[1]);
            Address owner = address_arg(parts[2]);
            return {{"asset", addresses::to_hex(ledger.address())},
                    {"owner", addresses::to_hex(owner)},
                    {"balance", amount::to_string(ledger.balance_of(owner))}};
        }
        if (cmd == "quote") {
            need(parts, 3, "quote <asset> <amount>");
            return quote_json(sale.quote(address_arg(parts[1]), amount_arg(parts[2])));
        }
        if (cmd == "quote_native") {
            need(parts, 2, "quote_native <value>");
            return quote_json(sale.quote_native(amount_arg(parts[1])));
        }

        // Environment
        if (cmd == "time") {
            if (parts.size() >= 2) {
                now_ = parts[1] == "now" ? system_time() : timestamp_arg(parts[1]);
            }
            return {{"now", now_.load()}, {"phase", phase_name(sale.phase())}};
        }
        if (cmd == "price") {
            need(parts, 3, "price <feed> <price> [decimals]");
            Address feed = address_arg(parts[1]);
            I128 price = signed_arg(parts[2]);
            uint8_t decimals = parts.size() > 3 ? decimals_arg(parts[3]) : 8;
            host_.feed().set_report(feed, price, decimals, now_.load());
            return {{"feed", addresses::to_hex(feed)}, {"price", amount::to_string(price)},
                    {"decimals", decimals}};
        }
        if (cmd == "fund") {
            need(parts, 4, "fund <asset> <address> <amount>");
            MemoryTokenLedger& ledger = ledger_arg(parts[1]);
            return status_json(ledger.mint(address_arg(parts[2]), amount_arg(parts[3])));
        }
        if (cmd == "approve") {
            need(parts, 4, "approve <asset> <owner> <amount>");
            MemoryTokenLedger& ledger = ledger_arg(parts[1]);
            return status_json(ledger.approve(address_arg(parts[2]), sale.params().sale,
                                              amount_arg(parts[3])));
        }

        // Purchases
        if (cmd == "buy_native") {
            need(parts, 3, "buy_native <buyer> <value>");
            return purchase_json(sale.buy_with_native(address_arg(parts[1]), amount_arg(parts[2])));
        }
        if (cmd == "buy_token") {
            need(parts, 4, "buy_token <buyer> <asset> <amount>");
            return purchase_json(sale.buy_with_token(address_arg(parts[1]), address_arg(parts[2]),
                                                     amount_arg(parts[3])));
        }

        // Administration: first argument is the caller
        if (cmd == "register_asset") {
            need(parts, 4, "register_asset <caller> <asset> <feed>");
            return status_json(sale.register_payment_asset(address_arg(parts[1]),
                                                           address_arg(parts[2]),
                                                           address_arg(parts[3])));
        }
        if (cmd == "enable_asset") {
            need(parts, 3, "enable_asset <caller> <asset>");
            return status_json(sale.enable_payment_asset(address_arg(parts[1]), address_arg(parts[2])));
        }
        if (cmd == "disable_asset") {
            need(parts, 3, "disable_asset <caller> <asset>");
            return status_json(sale.disable_payment_asset(address_arg(parts[1]), address_arg(parts[2])));
        }
        if (cmd == "add_stage") {
            need(parts, 4, "add_stage <caller> <rate> <cap>");
            return status_json(sale.add_stage(address_arg(parts[1]), amount_arg(parts[2]),
                                              amount_arg(parts[3])));
        }
        if (cmd == "advance_stage") {
            need(parts, 2, "advance_stage <caller>");
            return status_json(sale.advance_stage(address_arg(parts[1])));
        }
        if (cmd == "update_end_time") {
            need(parts, 3, "update_end_time <caller> <timestamp>");
            return status_json(sale.update_end_time(address_arg(parts[1]), timestamp_arg(parts[2])));
        }
        if (cmd == "update_limit") {
            need(parts, 3, "update_limit <caller> <tokens>");
            return status_json(sale.update_max_purchase_limit(address_arg(parts[1]),
                                                              amount_arg(parts[2])));
        }
        if (cmd == "pause") {
            need(parts, 2, "pause <caller>");
            return status_json(sale.pause(address_arg(parts[1])));
        }
        if (cmd == "unpause") {
            need(parts, 2, "unpause <caller>");
            return status_json(sale.unpause(address_arg(parts[1])));
        }
        if (cmd == "finalize") {
            need(parts, 2, "finalize <caller>");
            return status_json(sale.finalize(address_arg(parts[1])));
        }
        if (cmd == "withdraw_native") {
            need(parts, 4, "withdraw_native <caller> <to> <amount>");
            return status_json(sale.withdraw_native(address_arg(parts[1]), address_arg(parts[2]),
                                                    amount_arg(parts[3])));
        }
        if (cmd == "withdraw_tokens") {
            need(parts, 5, "withdraw_tokens <caller> <asset> <to> <amount>");
            return status_json(sale.withdraw_tokens(address_arg(parts[1]), address_arg(parts[2]),
                                                    address_arg(parts[3]), amount_arg(parts[4])));
        }
        if (cmd == "transfer_ownership") {
            need(parts, 3, "transfer_ownership <caller> <new_owner>");
            return status_json(sale.transfer_ownership(address_arg(parts[1]), address_arg(parts[2])));
        }

        throw std::invalid_argument("Unknown command: " + cmd + ". Type 'help' for commands.");
    }

    // Events committed since the last call
    std::vector<json> drain_events() {
        std::lock_guard<std::mutex> lock(events_mutex_);
        std::vector<json> out;
        out.swap(pending_events_);
        return out;
    }

    bool verbose() const { return verbose_; }

private:
    SaleHost& host_;
    bool verbose_;
    std::atomic<Timestamp> now_;
    uint64_t listener_ = 0;

    std::mutex events_mutex_;
    std::vector<json> pending_events_;

    static void need(const std::vector<std::string>& parts, size_t count, const char* usage) {
        if (parts.size() < count) {
            throw std::invalid_argument(std::string("Usage: ") + usage);
        }
    }

    static Timestamp system_time() {
        return static_cast<Timestamp>(std::time(nullptr));
    }

    // Hex address, "@N" shorthand account, or a configured role name
    Address address_arg(const std::string& text) const {
        const SaleConfig& config = host_.config();
        if (text == "owner") return host_.sale().state().owner;
        if (text == "treasury") return config.treasury;
        if (text == "sale") return config.sale;
        if (text == "token") return config.token;
        if (text == "native") return config.native_asset;
        if (text == "native_feed") return config.native_feed;
        if (!text.empty() && text[0] == '@') {
            auto n = amount::parse(std::string_view(text).substr(1));
            if (n && *n <= UINT64_MAX) return addresses::from_u64(static_cast<uint64_t>(*n));
        }
        auto addr = addresses::from_hex(text);
        if (!addr) throw std::invalid_argument("Invalid address: " + text);
        return *addr;
    }

    MemoryTokenLedger& ledger_arg(const std::string& text) {
        if (text == "token") return host_.sale_token();
        MemoryTokenLedger* ledger = host_.ledger(address_arg(text));
        if (!ledger) throw std::invalid_argument("No ledger for asset: " + text);
        return *ledger;
    }

    static Amount amount_arg(const std::string& text) {
        auto value = amount::parse(text);
        if (!value) throw std::invalid_argument("Invalid amount: " + text);
        return *value;
    }

    static I128 signed_arg(const std::string& text) {
        std::string_view digits(text);
        bool negative = !digits.empty() && digits.front() == '-';
        if (negative) digits.remove_prefix(1);
        auto magnitude = amount::parse(digits);
        if (!magnitude || *magnitude > (AMOUNT_MAX >> 1)) {
            throw std::invalid_argument("Invalid price: " + text);
        }
        I128 v = static_cast<I128>(*magnitude);
        return negative ? -v : v;
    }

    static Timestamp timestamp_arg(const std::string& text) {
        auto value = amount::parse(text);
        if (!value || *value > UINT64_MAX) throw std::invalid_argument("Invalid timestamp: " + text);
        return static_cast<Timestamp>(*value);
    }

    static uint8_t decimals_arg(const std::string& text) {
        auto value = amount::parse(text);
        if (!value || *value > 255) throw std::invalid_argument("Invalid decimals: " + text);
        return static_cast<uint8_t>(*value);
    }
};

//------------------------------------------------------------------------------
// CLI Interface
//------------------------------------------------------------------------------

void print_help() {
    std::cout << R"(
crowdsale CLI Commands:

  Addresses are 0x-hex, @N (account N), or one of:
  owner treasury sale token native native_feed

  Views
    state | stages | assets | events
    purchaser <address>
    balance <asset|token> <address>
    quote <asset> <amount>
    quote_native <value>

  Environment
    time [<timestamp>|now]
    price <feed> <price> [decimals]
    fund <asset|token> <address> <amount>
    approve <asset> <owner> <amount>        (spender is the sale)

  Purchases
    buy_native <buyer> <value>
    buy_token <buyer> <asset> <amount>

  Administration (caller first)
    register_asset <caller> <asset> <feed>
    enable_asset <caller> <asset>
    disable_asset <caller> <asset>
    add_stage <caller> <rate> <cap>
    advance_stage <caller>
    update_end_time <caller> <timestamp>
    update_limit <caller> <tokens>
    pause <caller> | unpause <caller> | finalize <caller>
    withdraw_native <caller> <to> <amount>
    withdraw_tokens <caller> <asset> <to> <amount>
    transfer_ownership <caller> <new_owner>

  help
    Show this help message

  quit / exit
    Exit the CLI
)";
}

void print_message(const json& msg) {
    if (msg.contains("error") && !msg["error"].is_null()) {
        std::cout << "Error: " << msg.dump() << "\n";
        return;
    }
    std::cout << msg.dump(2) << "\n";
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Returns false when the command failed
bool run_line(Shell& shell, std::vector<std::string> parts) {
    // Convert to lowercase
    for (auto& c : parts[0]) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    bool ok = true;
    try {
        json resp = shell.execute(parts);
        if (resp.contains("ok") && !resp["ok"].get<bool>()) ok = false;
        print_message(resp);
    } catch (const std::invalid_argument& e) {
        std::cout << e.what() << "\n";
        return false;
    }

    for (const auto& event : shell.drain_events()) {
        if (shell.verbose()) {
            std::cout << "Event: " << event.dump(2) << "\n";
        } else {
            std::cout << "Event: " << event.dump() << "\n";
        }
    }
    return ok;
}

void run_interactive(Shell& shell) {
    std::cout << "crowdsale CLI - Type 'help' for commands\n> ";

    std::string line;
    while (std::getline(std::cin, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            std::cout << "> ";
            continue;
        }

        auto parts = split(line);
        if (parts.empty()) {
            std::cout << "> ";
            continue;
        }

        if (parts[0] == "help") {
            print_help();
        } else if (parts[0] == "quit" || parts[0] == "exit") {
            std::cout << "Goodbye\n";
            break;
        } else {
            run_line(shell, parts);
        }

        std::cout << "> ";
    }
}

void print_usage(const char* prog) {
    std::cout << "crowdsale CLI\n\n"
              << "Usage: " << prog << " [options] <config.json> [command] [args...]\n\n"
              << "Options:\n"
              << "  -l, --log-level <level>  Override the config log level\n"
              << "                           (trace, debug, info, warn, error, off)\n"
              << "  -v, --verbose            Pretty-print events\n"
              << "  -h, --help               Show this help message\n\n"
              << "Examples:\n"
              << "  " << prog << " sale.json                       # Interactive mode\n"
              << "  " << prog << " sale.json state\n"
              << "  " << prog << " -l debug sale.json stages\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level argument\n";
                std::exit(1);
            }
            options.log_level = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
            if (options.config_path.empty()) {
                options.config_path = arg;
            } else {
                // Command and its arguments
                options.interactive = false;
                while (i < argc) {
                    options.command_args.push_back(argv[i++]);
                }
                break;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.config_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }

    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    SaleConfig config;
    try {
        config = SaleConfig::from_file(options.config_path);
        if (!options.log_level.empty()) config.set_log_level(options.log_level);
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<SaleHost> host;
    try {
        host = std::make_unique<SaleHost>(config);
    } catch (const ConfigError& e) {
        std::cerr << "Setup failed: " << e.what() << "\n";
        return 1;
    }

    Shell shell(*host, options.verbose);

    if (options.interactive) {
        run_interactive(shell);
        return 0;
    }
    return run_line(shell, options.command_args) ? 0 : 1;
}
