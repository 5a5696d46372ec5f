#pragma once

#include "common/settings.h"
#include "raffle/error.h"
#include "raffle/instruction.h"
#include "raffle/state.h"
#include "svm/engine.h"

namespace solcino {
namespace raffle {

using common::PublicKey;

/**
 * @brief The raffle program as a built-in of the execution engine
 *
 * Decodes each instruction, validates every positional account, applies the
 * state transition and moves lamports. Failures surface as a custom error
 * code equal to the RaffleError value; the engine discards all account
 * changes of a failed transaction.
 */
class RaffleProgram : public svm::BuiltinProgram {
public:
    /// Base compute cost charged per instruction
    static constexpr uint64_t COMPUTE_UNITS = 5000;

    explicit RaffleProgram(const common::ProgramSettings& settings);
    RaffleProgram(const PublicKey& program_id, const PublicKey& randomness_program_id);
    ~RaffleProgram() override = default;

    PublicKey get_program_id() const override;

    svm::ExecutionOutcome execute(
        const svm::Instruction& instruction,
        svm::ExecutionContext& context
    ) const override;

    /// Decode and run one instruction; the typed error is what execute() reports
    ProcessResult process(const svm::Instruction& instruction,
                          svm::ExecutionContext& context) const;

    const PublicKey& randomness_program_id() const { return randomness_program_id_; }
    const PublicKey& config_address() const { return config_address_; }
    uint8_t config_bump() const { return config_bump_; }

private:
    ProcessResult process_initialize_config(const InitializeConfig& args,
                                            const svm::Instruction& instruction,
                                            svm::ExecutionContext& context) const;

    ProcessResult process_initialize_raffle(const InitializeRaffle& args,
                                            const svm::Instruction& instruction,
                                            svm::ExecutionContext& context) const;

    ProcessResult process_purchase_tickets(const PurchaseTickets& args,
                                           const svm::Instruction& instruction,
                                           svm::ExecutionContext& context) const;

    ProcessResult process_update_admin(const svm::Instruction& instruction,
                                       svm::ExecutionContext& context) const;

    ProcessResult process_update_fee_address(const svm::Instruction& instruction,
                                             svm::ExecutionContext& context) const;

    ProcessResult process_update_ticket_price(const UpdateTicketPrice& args,
                                              const svm::Instruction& instruction,
                                              svm::ExecutionContext& context) const;

    ProcessResult process_update_fee_percentage(const UpdateFeePercentage& args,
                                                const svm::Instruction& instruction,
                                                svm::ExecutionContext& context) const;

    ProcessResult process_request_randomness(const svm::Instruction& instruction,
                                             svm::ExecutionContext& context) const;

    ProcessResult process_complete_raffle_with_vrf(const svm::Instruction& instruction,
                                                   svm::ExecutionContext& context) const;

    // Shared account checks
    ProgramResult<Config> load_config(const svm::Instruction& instruction, size_t index,
                                      svm::ExecutionContext& context) const;

    ProgramResult<Raffle> load_raffle(const svm::Instruction& instruction, size_t index,
                                      svm::ExecutionContext& context) const;

    ProgramResult<PublicKey> resolve_winner(const svm::Instruction& instruction,
                                            const PublicKey& raffle_key,
                                            const Raffle& raffle,
                                            const std::vector<uint8_t>& random_value,
                                            svm::ExecutionContext& context) const;

    /// Create `address` as a program-owned account of `space` bytes, funded by `payer`
    ProcessResult create_program_account(const PublicKey& payer,
                                         const PublicKey& address,
                                         size_t space,
                                         const std::vector<svm::SignerSeeds>& signer_seeds,
                                         svm::ExecutionContext& context) const;

    PublicKey program_id_;
    PublicKey randomness_program_id_;
    PublicKey config_address_;
    uint8_t config_bump_ = 0;
};

} // namespace raffle
} // namespace solcino
