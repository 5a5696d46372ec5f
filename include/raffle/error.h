#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>

namespace solcino {
namespace raffle {

/**
 * @brief Every way a raffle instruction can fail
 *
 * The numeric value is the custom error code reported in the execution
 * outcome and must never be renumbered.
 */
enum class RaffleError : uint32_t {
    InvalidInstruction = 0,
    MalformedAccount = 1,
    AlreadyInitialized = 2,
    RaffleNotActive = 3,
    RaffleEnded = 4,
    RaffleNotEnded = 5,
    AlreadyComplete = 6,
    RandomnessAlreadyRequested = 7,
    Unauthorized = 8,
    VrfResultNotReady = 9,
    VrfAccountMismatch = 10,
    InvalidWinnerAccount = 11,
    InvalidTicketCount = 12,
    InvalidDuration = 13,
    NoTicketsSold = 14,
    ConfigNotInitialized = 15,
    MissingRequiredSignature = 16,
    IncorrectProgramId = 17,
    InvalidAccountAddress = 18,
    NotEnoughAccountKeys = 19,
    InsufficientFunds = 20,
    InvalidFeeBasisPoints = 21,
    InvalidTicketPrice = 22,
    ArithmeticOverflow = 23,
    RandomnessNotRequested = 24,
    DeprecatedInstruction = 25,
    AccountNotWritable = 26,
    RandomnessServiceFailed = 27,
    PurchaseIndexFull = 28
};

/// Stable error name, e.g. "RaffleNotActive"
std::string to_string(RaffleError error);

/// Human readable description used in program logs
std::string describe(RaffleError error);

inline uint32_t error_code(RaffleError error) {
    return static_cast<uint32_t>(error);
}

/// Result of a raffle operation that yields a value
template <typename T>
using ProgramResult = common::Result<T, RaffleError>;

/// Result of a processor step; the bool payload carries no meaning
using ProcessResult = ProgramResult<bool>;

inline ProcessResult ok() {
    return ProcessResult(true);
}

inline ProcessResult fail(RaffleError error) {
    return ProcessResult(error);
}

} // namespace raffle
} // namespace solcino
