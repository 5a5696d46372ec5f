#include "raffle/instruction.h"
#include "raffle/utils.h"
#include "byte_io.h"
#include <algorithm>

namespace solcino {
namespace raffle {

using namespace byte_io;
using svm::AccountMeta;

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Operand bytes after the opcode, indexed by opcode
size_t operand_length(Opcode opcode) {
    switch (opcode) {
        case Opcode::InitializeConfig: return 8 + 2;
        case Opcode::InitializeRaffle: return 32 + 8;
        case Opcode::PurchaseTickets: return 8;
        case Opcode::UpdateTicketPrice: return 8;
        case Opcode::UpdateFeePercentage: return 2;
        case Opcode::CompleteRaffle:
        case Opcode::UpdateAdmin:
        case Opcode::UpdateFeeAddress:
        case Opcode::RequestRandomness:
        case Opcode::CompleteRaffleWithVrf:
            return 0;
    }
    return 0;
}

svm::Instruction make_instruction(const common::PublicKey& program_id,
                                  std::vector<AccountMeta> accounts,
                                  const RaffleInstruction& instruction) {
    svm::Instruction result;
    result.program_id = program_id;
    result.accounts = std::move(accounts);
    result.data = pack_instruction(instruction);
    return result;
}

common::PublicKey config_address(const common::PublicKey& program_id) {
    auto found = find_config_address(program_id);
    return found.is_ok() ? found.value().first : common::PublicKey(common::PUBKEY_BYTES, 0);
}

common::PublicKey purchase_index_address(const common::PublicKey& program_id,
                                         const common::PublicKey& raffle) {
    auto found = find_purchase_index_address(program_id, raffle);
    return found.is_ok() ? found.value().first : common::PublicKey(common::PUBKEY_BYTES, 0);
}

} // namespace

std::string to_string(Opcode opcode) {
    switch (opcode) {
        case Opcode::InitializeConfig: return "InitializeConfig";
        case Opcode::InitializeRaffle: return "InitializeRaffle";
        case Opcode::PurchaseTickets: return "PurchaseTickets";
        case Opcode::CompleteRaffle: return "CompleteRaffle";
        case Opcode::UpdateAdmin: return "UpdateAdmin";
        case Opcode::UpdateFeeAddress: return "UpdateFeeAddress";
        case Opcode::UpdateTicketPrice: return "UpdateTicketPrice";
        case Opcode::UpdateFeePercentage: return "UpdateFeePercentage";
        case Opcode::RequestRandomness: return "RequestRandomness";
        case Opcode::CompleteRaffleWithVrf: return "CompleteRaffleWithVrf";
    }
    return "Unknown";
}

ProgramResult<RaffleInstruction> unpack_instruction(const std::vector<uint8_t>& data) {
    using Decoded = ProgramResult<RaffleInstruction>;

    if (data.empty() || data[0] > static_cast<uint8_t>(Opcode::CompleteRaffleWithVrf)) {
        return Decoded(RaffleError::InvalidInstruction);
    }

    const Opcode opcode = static_cast<Opcode>(data[0]);
    if (data.size() - 1 < operand_length(opcode)) {
        return Decoded(RaffleError::InvalidInstruction);
    }

    const uint8_t* operands = data.data() + 1;

    switch (opcode) {
        case Opcode::InitializeConfig: {
            InitializeConfig ix;
            ix.ticket_price = read_u64(operands);
            ix.fee_basis_points = read_u16(operands + 8);
            return Decoded(RaffleInstruction(ix));
        }
        case Opcode::InitializeRaffle: {
            InitializeRaffle ix;
            std::copy(operands, operands + 32, ix.title.begin());
            ix.duration = read_u64(operands + 32);
            return Decoded(RaffleInstruction(ix));
        }
        case Opcode::PurchaseTickets: {
            PurchaseTickets ix;
            ix.ticket_count = read_u64(operands);
            return Decoded(RaffleInstruction(ix));
        }
        case Opcode::CompleteRaffle:
            return Decoded(RaffleInstruction(CompleteRaffle{}));
        case Opcode::UpdateAdmin:
            return Decoded(RaffleInstruction(UpdateAdmin{}));
        case Opcode::UpdateFeeAddress:
            return Decoded(RaffleInstruction(UpdateFeeAddress{}));
        case Opcode::UpdateTicketPrice: {
            UpdateTicketPrice ix;
            ix.new_price = read_u64(operands);
            return Decoded(RaffleInstruction(ix));
        }
        case Opcode::UpdateFeePercentage: {
            UpdateFeePercentage ix;
            ix.new_fee_basis_points = read_u16(operands);
            return Decoded(RaffleInstruction(ix));
        }
        case Opcode::RequestRandomness:
            return Decoded(RaffleInstruction(RequestRandomness{}));
        case Opcode::CompleteRaffleWithVrf:
            return Decoded(RaffleInstruction(CompleteRaffleWithVrf{}));
    }

    return Decoded(RaffleError::InvalidInstruction);
}

Opcode opcode_of(const RaffleInstruction& instruction) {
    // Variant alternatives are declared in opcode order
    return static_cast<Opcode>(instruction.index());
}

std::vector<uint8_t> pack_instruction(const RaffleInstruction& instruction) {
    std::vector<uint8_t> data;
    data.push_back(static_cast<uint8_t>(opcode_of(instruction)));

    std::visit(Overloaded{
        [&data](const InitializeConfig& ix) {
            append_u64(data, ix.ticket_price);
            append_u16(data, ix.fee_basis_points);
        },
        [&data](const InitializeRaffle& ix) {
            data.insert(data.end(), ix.title.begin(), ix.title.end());
            append_u64(data, ix.duration);
        },
        [&data](const PurchaseTickets& ix) { append_u64(data, ix.ticket_count); },
        [&data](const UpdateTicketPrice& ix) { append_u64(data, ix.new_price); },
        [&data](const UpdateFeePercentage& ix) { append_u16(data, ix.new_fee_basis_points); },
        [](const auto&) {}
    }, instruction);

    return data;
}

namespace instructions {

svm::Instruction initialize_config(const PublicKey& program_id,
                                   const PublicKey& admin,
                                   const PublicKey& treasury,
                                   uint64_t ticket_price,
                                   uint16_t fee_basis_points) {
    InitializeConfig ix;
    ix.ticket_price = ticket_price;
    ix.fee_basis_points = fee_basis_points;
    return make_instruction(program_id,
                            {AccountMeta::writable(admin, true),
                             AccountMeta::writable(config_address(program_id), false),
                             AccountMeta::readonly(treasury, false),
                             AccountMeta::readonly(svm::system_program_id(), false)},
                            ix);
}

svm::Instruction initialize_raffle(const PublicKey& program_id,
                                   const PublicKey& authority,
                                   const PublicKey& raffle,
                                   const Title& title,
                                   uint64_t duration) {
    InitializeRaffle ix;
    ix.title = title;
    ix.duration = duration;
    return make_instruction(program_id,
                            {AccountMeta::readonly(authority, true),
                             AccountMeta::writable(raffle, false),
                             AccountMeta::readonly(config_address(program_id), false),
                             AccountMeta::readonly(svm::system_program_id(), false),
                             AccountMeta::readonly(svm::clock_sysvar_id(), false)},
                            ix);
}

svm::Instruction purchase_tickets(const PublicKey& program_id,
                                  const PublicKey& purchaser,
                                  const PublicKey& raffle,
                                  const PublicKey& ticket_purchase,
                                  const PublicKey& treasury,
                                  uint64_t ticket_count) {
    PurchaseTickets ix;
    ix.ticket_count = ticket_count;
    return make_instruction(program_id,
                            {AccountMeta::writable(purchaser, true),
                             AccountMeta::writable(raffle, false),
                             AccountMeta::writable(ticket_purchase, true),
                             AccountMeta::writable(treasury, false),
                             AccountMeta::readonly(config_address(program_id), false),
                             AccountMeta::readonly(svm::system_program_id(), false),
                             AccountMeta::readonly(svm::clock_sysvar_id(), false),
                             AccountMeta::writable(purchase_index_address(program_id, raffle),
                                                   false)},
                            ix);
}

svm::Instruction complete_raffle(const PublicKey& program_id,
                                 const PublicKey& authority,
                                 const PublicKey& raffle,
                                 const PublicKey& winner) {
    return make_instruction(program_id,
                            {AccountMeta::readonly(authority, true),
                             AccountMeta::writable(raffle, false),
                             AccountMeta::writable(winner, false),
                             AccountMeta::readonly(svm::clock_sysvar_id(), false)},
                            CompleteRaffle{});
}

svm::Instruction update_admin(const PublicKey& program_id,
                              const PublicKey& admin,
                              const PublicKey& new_admin) {
    return make_instruction(program_id,
                            {AccountMeta::readonly(admin, true),
                             AccountMeta::readonly(new_admin, false),
                             AccountMeta::writable(config_address(program_id), false)},
                            UpdateAdmin{});
}

svm::Instruction update_fee_address(const PublicKey& program_id,
                                    const PublicKey& admin,
                                    const PublicKey& new_treasury) {
    return make_instruction(program_id,
                            {AccountMeta::readonly(admin, true),
                             AccountMeta::readonly(new_treasury, false),
                             AccountMeta::writable(config_address(program_id), false)},
                            UpdateFeeAddress{});
}

svm::Instruction update_ticket_price(const PublicKey& program_id,
                                     const PublicKey& admin,
                                     uint64_t new_price) {
    UpdateTicketPrice ix;
    ix.new_price = new_price;
    return make_instruction(program_id,
                            {AccountMeta::readonly(admin, true),
                             AccountMeta::writable(config_address(program_id), false)},
                            ix);
}

svm::Instruction update_fee_percentage(const PublicKey& program_id,
                                       const PublicKey& admin,
                                       uint16_t new_fee_basis_points) {
    UpdateFeePercentage ix;
    ix.new_fee_basis_points = new_fee_basis_points;
    return make_instruction(program_id,
                            {AccountMeta::readonly(admin, true),
                             AccountMeta::writable(config_address(program_id), false)},
                            ix);
}

svm::Instruction request_randomness(const PublicKey& program_id,
                                    const PublicKey& authority,
                                    const PublicKey& raffle,
                                    const PublicKey& vrf,
                                    const PublicKey& payer,
                                    const PublicKey& randomness_program_id,
                                    const std::vector<AccountMeta>& service_accounts) {
    std::vector<AccountMeta> accounts = {
        AccountMeta::readonly(authority, true),
        AccountMeta::writable(raffle, false),
        AccountMeta::writable(vrf, false),
        AccountMeta::writable(payer, true),
        AccountMeta::readonly(randomness_program_id, false),
        AccountMeta::readonly(svm::clock_sysvar_id(), false)};
    accounts.insert(accounts.end(), service_accounts.begin(), service_accounts.end());
    return make_instruction(program_id, std::move(accounts), RequestRandomness{});
}

svm::Instruction complete_raffle_with_vrf(const PublicKey& program_id,
                                          const PublicKey& authority,
                                          const PublicKey& raffle,
                                          const PublicKey& vrf,
                                          const PublicKey& winner,
                                          const PublicKey& randomness_program_id,
                                          const PublicKey& winning_purchase) {
    return make_instruction(program_id,
                            {AccountMeta::readonly(authority, true),
                             AccountMeta::writable(raffle, false),
                             AccountMeta::readonly(vrf, false),
                             AccountMeta::writable(winner, false),
                             AccountMeta::readonly(randomness_program_id, false),
                             AccountMeta::readonly(svm::clock_sysvar_id(), false),
                             AccountMeta::readonly(purchase_index_address(program_id, raffle),
                                                   false),
                             AccountMeta::readonly(winning_purchase, false)},
                            CompleteRaffleWithVrf{});
}

} // namespace instructions

} // namespace raffle
} // namespace solcino
