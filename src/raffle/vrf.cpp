#include "raffle/vrf.h"
#include "common/logging.h"
#include "byte_io.h"
#include <algorithm>

namespace solcino {
namespace raffle {
namespace vrf {

using namespace byte_io;

std::vector<uint8_t> VrfState::pack() const {
    std::vector<uint8_t> data(LEN, 0);
    uint8_t* p = data.data();
    p[0] = static_cast<uint8_t>(status);
    write_key(p + 1, requester);
    write_u64(p + 33, request_counter);
    std::copy(result.begin(), result.end(), p + 41);
    p[73] = result_verified ? 1 : 0;
    return data;
}

ProgramResult<VrfState> VrfState::unpack(const std::vector<uint8_t>& data) {
    if (data.size() < LEN) {
        return ProgramResult<VrfState>(RaffleError::MalformedAccount);
    }
    const uint8_t* p = data.data();
    if (p[0] > static_cast<uint8_t>(VrfStatus::Finalized)) {
        return ProgramResult<VrfState>(RaffleError::MalformedAccount);
    }

    VrfState state;
    state.status = static_cast<VrfStatus>(p[0]);
    state.requester = read_key(p + 1);
    state.request_counter = read_u64(p + 33);
    std::copy(p + 41, p + 73, state.result.begin());
    state.result_verified = p[73] != 0;
    return ProgramResult<VrfState>(state);
}

svm::Instruction build_request_instruction(const PublicKey& randomness_program_id,
                                           const PublicKey& vrf_account,
                                           const PublicKey& payer,
                                           const PublicKey& requester,
                                           const std::vector<svm::AccountMeta>& extra_accounts) {
    svm::Instruction instruction;
    instruction.program_id = randomness_program_id;
    instruction.accounts = {svm::AccountMeta::writable(vrf_account, false),
                            svm::AccountMeta::writable(payer, true),
                            svm::AccountMeta::readonly(requester, false)};
    instruction.accounts.insert(instruction.accounts.end(), extra_accounts.begin(),
                                extra_accounts.end());
    instruction.data = {REQUEST_RANDOMNESS_OPCODE};
    return instruction;
}

ProcessResult request(svm::ExecutionContext& context,
                      const PublicKey& randomness_program_id,
                      const PublicKey& raffle_key,
                      Raffle& raffle,
                      const PublicKey& vrf_account,
                      const PublicKey& payer,
                      UnixTimestamp now,
                      const std::vector<svm::AccountMeta>& extra_accounts) {
    if (raffle.status != RaffleStatus::Active) {
        return fail(RaffleError::RaffleNotActive);
    }
    if (now < raffle.end_time) {
        return fail(RaffleError::RaffleNotEnded);
    }
    if (raffle.vrf_request_in_progress) {
        return fail(RaffleError::RandomnessAlreadyRequested);
    }
    if (raffle.tickets_sold == 0) {
        return fail(RaffleError::NoTicketsSold);
    }

    auto instruction = build_request_instruction(randomness_program_id, vrf_account, payer,
                                                 raffle_key, extra_accounts);
    auto outcome = context.invoke(instruction);
    if (!outcome.is_success()) {
        LOG_WARN("raffle", "Randomness request for ", common::short_key(raffle_key), " failed: ",
                 svm::to_string(outcome.result), " ", outcome.error_details);
        return fail(RaffleError::RandomnessServiceFailed);
    }

    raffle.vrf_account = vrf_account;
    raffle.vrf_request_in_progress = true;
    context.log("VRF randomness requested: " + common::to_hex(vrf_account));
    return ok();
}

ProgramResult<RandomValue> extract_result(const svm::ProgramAccount& vrf_account,
                                          const PublicKey& randomness_program_id,
                                          const PublicKey& raffle_key,
                                          const Raffle& raffle) {
    using Extracted = ProgramResult<RandomValue>;

    if (vrf_account.owner != randomness_program_id) {
        return Extracted(RaffleError::VrfAccountMismatch);
    }
    if (vrf_account.pubkey != raffle.vrf_account) {
        return Extracted(RaffleError::VrfAccountMismatch);
    }

    auto state = VrfState::unpack(vrf_account.data);
    if (!state.is_ok()) {
        return Extracted(state.error());
    }
    if (state.value().requester != raffle_key) {
        return Extracted(RaffleError::VrfAccountMismatch);
    }
    if (!state.value().is_finalized()) {
        return Extracted(RaffleError::VrfResultNotReady);
    }

    return Extracted(state.value().result);
}

} // namespace vrf
} // namespace raffle
} // namespace solcino
