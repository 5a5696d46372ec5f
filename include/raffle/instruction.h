#pragma once

#include "common/types.h"
#include "raffle/error.h"
#include "raffle/state.h"
#include "svm/engine.h"
#include <cstdint>
#include <variant>
#include <vector>

namespace solcino {
namespace raffle {

enum class Opcode : uint8_t {
    InitializeConfig = 0,
    InitializeRaffle = 1,
    PurchaseTickets = 2,
    CompleteRaffle = 3,
    UpdateAdmin = 4,
    UpdateFeeAddress = 5,
    UpdateTicketPrice = 6,
    UpdateFeePercentage = 7,
    RequestRandomness = 8,
    CompleteRaffleWithVrf = 9
};

std::string to_string(Opcode opcode);

/// Create the config singleton. Operands: ticket_price u64, fee_basis_points u16
struct InitializeConfig {
    uint64_t ticket_price = 0;
    uint16_t fee_basis_points = 0;
};

/// Open a raffle. Operands: title [32], duration u64 seconds
struct InitializeRaffle {
    Title title{};
    uint64_t duration = 0;
};

/// Operands: ticket_count u64
struct PurchaseTickets {
    uint64_t ticket_count = 0;
};

/// Superseded by CompleteRaffleWithVrf; always rejected
struct CompleteRaffle {};

struct UpdateAdmin {};

struct UpdateFeeAddress {};

/// Operands: new_price u64
struct UpdateTicketPrice {
    uint64_t new_price = 0;
};

/// Operands: new_fee_basis_points u16
struct UpdateFeePercentage {
    uint16_t new_fee_basis_points = 0;
};

struct RequestRandomness {};

struct CompleteRaffleWithVrf {};

using RaffleInstruction = std::variant<
    InitializeConfig,
    InitializeRaffle,
    PurchaseTickets,
    CompleteRaffle,
    UpdateAdmin,
    UpdateFeeAddress,
    UpdateTicketPrice,
    UpdateFeePercentage,
    RequestRandomness,
    CompleteRaffleWithVrf>;

/**
 * Decode opcode + operands. Unknown opcodes and short operand regions fail
 * with InvalidInstruction; bytes past the operands are ignored.
 */
ProgramResult<RaffleInstruction> unpack_instruction(const std::vector<uint8_t>& data);

std::vector<uint8_t> pack_instruction(const RaffleInstruction& instruction);

Opcode opcode_of(const RaffleInstruction& instruction);

/**
 * Builders producing ready-to-submit instructions with the account metas
 * each command expects.
 */
namespace instructions {

using common::PublicKey;

svm::Instruction initialize_config(const PublicKey& program_id,
                                   const PublicKey& admin,
                                   const PublicKey& treasury,
                                   uint64_t ticket_price,
                                   uint16_t fee_basis_points);

svm::Instruction initialize_raffle(const PublicKey& program_id,
                                   const PublicKey& authority,
                                   const PublicKey& raffle,
                                   const Title& title,
                                   uint64_t duration);

svm::Instruction purchase_tickets(const PublicKey& program_id,
                                  const PublicKey& purchaser,
                                  const PublicKey& raffle,
                                  const PublicKey& ticket_purchase,
                                  const PublicKey& treasury,
                                  uint64_t ticket_count);

svm::Instruction complete_raffle(const PublicKey& program_id,
                                 const PublicKey& authority,
                                 const PublicKey& raffle,
                                 const PublicKey& winner);

svm::Instruction update_admin(const PublicKey& program_id,
                              const PublicKey& admin,
                              const PublicKey& new_admin);

svm::Instruction update_fee_address(const PublicKey& program_id,
                                    const PublicKey& admin,
                                    const PublicKey& new_treasury);

svm::Instruction update_ticket_price(const PublicKey& program_id,
                                     const PublicKey& admin,
                                     uint64_t new_price);

svm::Instruction update_fee_percentage(const PublicKey& program_id,
                                       const PublicKey& admin,
                                       uint16_t new_fee_basis_points);

svm::Instruction request_randomness(const PublicKey& program_id,
                                    const PublicKey& authority,
                                    const PublicKey& raffle,
                                    const PublicKey& vrf,
                                    const PublicKey& payer,
                                    const PublicKey& randomness_program_id,
                                    const std::vector<svm::AccountMeta>& service_accounts = {});

svm::Instruction complete_raffle_with_vrf(const PublicKey& program_id,
                                          const PublicKey& authority,
                                          const PublicKey& raffle,
                                          const PublicKey& vrf,
                                          const PublicKey& winner,
                                          const PublicKey& randomness_program_id,
                                          const PublicKey& winning_purchase);

} // namespace instructions

} // namespace raffle
} // namespace solcino
