#include "common/settings.h"
#include "common/types.h"
#include "raffle/instruction.h"
#include "raffle/state.h"
#include "raffle/utils.h"
#include "raffle/vrf.h"
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace solcino;
using namespace solcino::raffle;
using nlohmann::json;

void print_usage() {
    std::cout << "Solcino Raffle Inspector\n";
    std::cout << "Usage: raffle-inspect [command] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  config <hex>        Decode a Config account\n";
    std::cout << "  raffle <hex>        Decode a Raffle account\n";
    std::cout << "  ticket <hex>        Decode a TicketPurchase account\n";
    std::cout << "  index <hex>         Decode a raffle's purchase index\n";
    std::cout << "  vrf <hex>           Decode a randomness account\n";
    std::cout << "  instruction <hex>   Decode raffle instruction data\n";
    std::cout << "  address             Print the config address and bump\n";
    std::cout << "  fee <amount> <bp>   Compute the fee on an amount\n\n";
    std::cout << "Options:\n";
    std::cout << "  --settings <path>      Settings file (program ids, logging)\n";
    std::cout << "  --program-id <hex>     Override the raffle program id\n";
    std::cout << "  --help                 Show this help message\n";
}

namespace {

json describe_config(const Config& config) {
    return json{{"is_initialized", config.is_initialized},
                {"admin", common::to_hex(config.admin)},
                {"treasury", common::to_hex(config.treasury)},
                {"ticket_price", config.ticket_price},
                {"fee_basis_points", config.fee_basis_points}};
}

json describe_raffle(const Raffle& raffle) {
    return json{{"is_initialized", raffle.is_initialized},
                {"authority", common::to_hex(raffle.authority)},
                {"title", title_to_string(raffle.title)},
                {"end_time", raffle.end_time},
                {"status", to_string(raffle.status)},
                {"winner", common::to_hex(raffle.winner)},
                {"tickets_sold", raffle.tickets_sold},
                {"vrf_account", common::to_hex(raffle.vrf_account)},
                {"vrf_request_in_progress", raffle.vrf_request_in_progress}};
}

json describe_ticket(const TicketPurchase& purchase) {
    return json{{"is_initialized", purchase.is_initialized},
                {"raffle", common::to_hex(purchase.raffle)},
                {"purchaser", common::to_hex(purchase.purchaser)},
                {"ticket_count", purchase.ticket_count},
                {"purchase_time", purchase.purchase_time}};
}

json describe_index(const PurchaseIndex& index) {
    json entries = json::array();
    for (const auto& entry : index.entries) {
        entries.push_back({{"ticket_purchase", common::to_hex(entry.ticket_purchase)},
                           {"first_ticket", entry.first_ticket},
                           {"ticket_count", entry.ticket_count}});
    }
    return json{{"raffle", common::to_hex(index.raffle)},
                {"tickets", index.next_ticket()},
                {"entries", entries}};
}

json describe_vrf(const vrf::VrfState& state) {
    const std::vector<uint8_t> result(state.result.begin(), state.result.end());
    return json{{"status", static_cast<int>(state.status)},
                {"requester", common::to_hex(state.requester)},
                {"request_counter", state.request_counter},
                {"result", common::to_hex(result)},
                {"result_verified", state.result_verified},
                {"finalized", state.is_finalized()}};
}

json describe_instruction(const RaffleInstruction& instruction) {
    json out{{"opcode", static_cast<int>(opcode_of(instruction))},
             {"name", to_string(opcode_of(instruction))}};
    if (auto ix = std::get_if<InitializeConfig>(&instruction)) {
        out["ticket_price"] = ix->ticket_price;
        out["fee_basis_points"] = ix->fee_basis_points;
    } else if (auto ix = std::get_if<InitializeRaffle>(&instruction)) {
        out["title"] = title_to_string(ix->title);
        out["duration"] = ix->duration;
    } else if (auto ix = std::get_if<PurchaseTickets>(&instruction)) {
        out["ticket_count"] = ix->ticket_count;
    } else if (auto ix = std::get_if<UpdateTicketPrice>(&instruction)) {
        out["new_price"] = ix->new_price;
    } else if (auto ix = std::get_if<UpdateFeePercentage>(&instruction)) {
        out["new_fee_basis_points"] = ix->new_fee_basis_points;
    }
    return out;
}

template <typename Decoded, typename Describe>
int print_decoded(const Decoded& decoded, Describe describe_fn) {
    if (!decoded.is_ok()) {
        std::cerr << "❌ Decode failed: " << to_string(decoded.error()) << " ("
                  << describe(decoded.error()) << ")" << std::endl;
        return 1;
    }
    std::cout << describe_fn(decoded.value()).dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::string settings_path;
    std::string program_id_hex;

    // Parse options
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--settings" && i + 1 < argc) {
            settings_path = argv[++i];
        } else if (arg == "--program-id" && i + 1 < argc) {
            program_id_hex = argv[++i];
        } else if (arg == "--help") {
            print_usage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (command == "--help" || command == "help") {
        print_usage();
        return 0;
    }

    common::ProgramSettings settings = common::SettingsManager::create_default();
    if (!settings_path.empty()) {
        auto loaded = common::SettingsManager::load_from_file(settings_path);
        if (!loaded.is_ok()) {
            std::cerr << "Failed to load settings: " << loaded.error() << std::endl;
            return 1;
        }
        settings = loaded.value();
    }
    if (!program_id_hex.empty()) {
        auto parsed = common::from_hex(program_id_hex);
        if (!parsed.is_ok() || parsed.value().size() != common::PUBKEY_BYTES) {
            std::cerr << "❌ --program-id must be 32 bytes of hex" << std::endl;
            return 1;
        }
        settings.program_id = parsed.value();
    }
    common::SettingsManager::apply_logging(settings);

    if (command == "address") {
        auto found = find_config_address(settings.program_id);
        if (!found.is_ok()) {
            std::cerr << "❌ " << found.error() << std::endl;
            return 1;
        }
        json out{{"program_id", common::to_hex(settings.program_id)},
                 {"config_address", common::to_hex(found.value().first)},
                 {"bump", found.value().second}};
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (command == "fee") {
        if (positional.size() < 2) {
            std::cerr << "❌ fee requires <amount> <basis_points>\n";
            return 1;
        }
        uint64_t amount = 0;
        unsigned long basis_points = 0;
        try {
            amount = std::stoull(positional[0]);
            basis_points = std::stoul(positional[1]);
        } catch (const std::exception& e) {
            std::cerr << "❌ Invalid number: " << e.what() << std::endl;
            return 1;
        }
        if (basis_points > 0xFFFF) {
            std::cerr << "❌ Basis points out of range\n";
            return 1;
        }
        auto fee = calculate_fee(amount, static_cast<uint16_t>(basis_points));
        if (!fee.is_ok()) {
            std::cerr << "❌ " << describe(fee.error()) << std::endl;
            return 1;
        }
        json out{{"amount", amount},
                 {"fee", fee.value()},
                 {"net", amount - fee.value()},
                 {"net_sol", lamports_to_sol_string(amount - fee.value())}};
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (positional.empty()) {
        std::cerr << "❌ " << command << " requires a hex argument\n";
        return 1;
    }
    auto bytes = common::from_hex(positional[0]);
    if (!bytes.is_ok()) {
        std::cerr << "❌ Invalid hex: " << bytes.error() << std::endl;
        return 1;
    }
    const std::vector<uint8_t>& data = bytes.value();

    if (command == "config") {
        return print_decoded(Config::unpack(data), describe_config);
    } else if (command == "raffle") {
        return print_decoded(Raffle::unpack(data), describe_raffle);
    } else if (command == "ticket") {
        return print_decoded(TicketPurchase::unpack(data), describe_ticket);
    } else if (command == "index") {
        return print_decoded(PurchaseIndex::unpack(data), describe_index);
    } else if (command == "vrf") {
        return print_decoded(vrf::VrfState::unpack(data), describe_vrf);
    } else if (command == "instruction") {
        return print_decoded(unpack_instruction(data), describe_instruction);
    }

    std::cerr << "❌ Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
