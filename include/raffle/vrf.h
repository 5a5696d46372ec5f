#pragma once

#include "common/types.h"
#include "raffle/error.h"
#include "raffle/state.h"
#include "svm/engine.h"
#include <array>
#include <cstdint>
#include <vector>

namespace solcino {
namespace raffle {
namespace vrf {

using common::PublicKey;

using RandomValue = std::array<uint8_t, 32>;

/// Opcode of the randomness service's request instruction
constexpr uint8_t REQUEST_RANDOMNESS_OPCODE = 0;

enum class VrfStatus : uint8_t {
    Empty = 0,
    Pending = 1,
    Finalized = 2
};

/**
 * @brief Randomness account written by the external service
 *
 * Layout (74 bytes): status u8 | requester [32] | request_counter u64 |
 * result [32] | result_verified u8
 */
struct VrfState {
    static constexpr size_t LEN = 74;

    VrfStatus status = VrfStatus::Empty;
    PublicKey requester = PublicKey(common::PUBKEY_BYTES, 0);
    uint64_t request_counter = 0;
    RandomValue result{};
    bool result_verified = false;

    bool is_finalized() const {
        return status == VrfStatus::Finalized && result_verified;
    }

    std::vector<uint8_t> pack() const;
    static ProgramResult<VrfState> unpack(const std::vector<uint8_t>& data);
};

/// Service request: accounts [vrf (w), payer (s,w), requester, extra...]
svm::Instruction build_request_instruction(const PublicKey& randomness_program_id,
                                           const PublicKey& vrf_account,
                                           const PublicKey& payer,
                                           const PublicKey& requester,
                                           const std::vector<svm::AccountMeta>& extra_accounts = {});

/**
 * Ask the service for randomness on behalf of `raffle_key`.
 *
 * Checks, in order: raffle Active, `now >= end_time`, no request in flight,
 * at least one ticket sold. Then invokes the service and, on success,
 * records the VRF account and marks the request in progress on `raffle`.
 * The caller persists `raffle`.
 */
ProcessResult request(svm::ExecutionContext& context,
                      const PublicKey& randomness_program_id,
                      const PublicKey& raffle_key,
                      Raffle& raffle,
                      const PublicKey& vrf_account,
                      const PublicKey& payer,
                      UnixTimestamp now,
                      const std::vector<svm::AccountMeta>& extra_accounts);

/**
 * Read the finalized random value for `raffle_key` from `vrf_account`.
 *
 * VrfAccountMismatch when the account is not owned by `randomness_program_id`,
 * is not the account recorded on the raffle, or was requested by someone
 * else; VrfResultNotReady until the service has finalized and verified it.
 */
ProgramResult<RandomValue> extract_result(const svm::ProgramAccount& vrf_account,
                                          const PublicKey& randomness_program_id,
                                          const PublicKey& raffle_key,
                                          const Raffle& raffle);

} // namespace vrf
} // namespace raffle
} // namespace solcino
