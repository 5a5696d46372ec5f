#include "raffle/error.h"

namespace solcino {
namespace raffle {

std::string to_string(RaffleError error) {
    switch (error) {
        case RaffleError::InvalidInstruction: return "InvalidInstruction";
        case RaffleError::MalformedAccount: return "MalformedAccount";
        case RaffleError::AlreadyInitialized: return "AlreadyInitialized";
        case RaffleError::RaffleNotActive: return "RaffleNotActive";
        case RaffleError::RaffleEnded: return "RaffleEnded";
        case RaffleError::RaffleNotEnded: return "RaffleNotEnded";
        case RaffleError::AlreadyComplete: return "AlreadyComplete";
        case RaffleError::RandomnessAlreadyRequested: return "RandomnessAlreadyRequested";
        case RaffleError::Unauthorized: return "Unauthorized";
        case RaffleError::VrfResultNotReady: return "VrfResultNotReady";
        case RaffleError::VrfAccountMismatch: return "VrfAccountMismatch";
        case RaffleError::InvalidWinnerAccount: return "InvalidWinnerAccount";
        case RaffleError::InvalidTicketCount: return "InvalidTicketCount";
        case RaffleError::InvalidDuration: return "InvalidDuration";
        case RaffleError::NoTicketsSold: return "NoTicketsSold";
        case RaffleError::ConfigNotInitialized: return "ConfigNotInitialized";
        case RaffleError::MissingRequiredSignature: return "MissingRequiredSignature";
        case RaffleError::IncorrectProgramId: return "IncorrectProgramId";
        case RaffleError::InvalidAccountAddress: return "InvalidAccountAddress";
        case RaffleError::NotEnoughAccountKeys: return "NotEnoughAccountKeys";
        case RaffleError::InsufficientFunds: return "InsufficientFunds";
        case RaffleError::InvalidFeeBasisPoints: return "InvalidFeeBasisPoints";
        case RaffleError::InvalidTicketPrice: return "InvalidTicketPrice";
        case RaffleError::ArithmeticOverflow: return "ArithmeticOverflow";
        case RaffleError::RandomnessNotRequested: return "RandomnessNotRequested";
        case RaffleError::DeprecatedInstruction: return "DeprecatedInstruction";
        case RaffleError::AccountNotWritable: return "AccountNotWritable";
        case RaffleError::RandomnessServiceFailed: return "RandomnessServiceFailed";
        case RaffleError::PurchaseIndexFull: return "PurchaseIndexFull";
    }
    return "Unknown";
}

std::string describe(RaffleError error) {
    switch (error) {
        case RaffleError::InvalidInstruction: return "Invalid instruction data";
        case RaffleError::MalformedAccount: return "Account data is malformed";
        case RaffleError::AlreadyInitialized: return "Account is already initialized";
        case RaffleError::RaffleNotActive: return "Raffle is not active";
        case RaffleError::RaffleEnded: return "Raffle has already ended";
        case RaffleError::RaffleNotEnded: return "Raffle has not ended yet";
        case RaffleError::AlreadyComplete: return "Raffle is already complete";
        case RaffleError::RandomnessAlreadyRequested: return "Randomness was already requested";
        case RaffleError::Unauthorized: return "Only the raffle authority or admin can perform this action";
        case RaffleError::VrfResultNotReady: return "VRF result is not finalized";
        case RaffleError::VrfAccountMismatch: return "VRF account does not belong to this raffle";
        case RaffleError::InvalidWinnerAccount: return "Winner account does not match the drawn ticket";
        case RaffleError::InvalidTicketCount: return "Ticket count must be greater than zero";
        case RaffleError::InvalidDuration: return "Duration must be greater than zero";
        case RaffleError::NoTicketsSold: return "No tickets were sold";
        case RaffleError::ConfigNotInitialized: return "Config is not initialized";
        case RaffleError::MissingRequiredSignature: return "Missing required signature";
        case RaffleError::IncorrectProgramId: return "Account has the wrong owner";
        case RaffleError::InvalidAccountAddress: return "Account address does not match";
        case RaffleError::NotEnoughAccountKeys: return "Not enough account keys";
        case RaffleError::InsufficientFunds: return "Insufficient funds for operation";
        case RaffleError::InvalidFeeBasisPoints: return "Fee basis points exceed 10000";
        case RaffleError::InvalidTicketPrice: return "Ticket price must be greater than zero";
        case RaffleError::ArithmeticOverflow: return "Arithmetic overflow";
        case RaffleError::RandomnessNotRequested: return "Randomness has not been requested";
        case RaffleError::DeprecatedInstruction: return "Instruction is deprecated, use CompleteRaffleWithVrf";
        case RaffleError::AccountNotWritable: return "Account must be writable";
        case RaffleError::RandomnessServiceFailed: return "Randomness service request failed";
        case RaffleError::PurchaseIndexFull: return "Raffle cannot record more purchases";
    }
    return "Unknown error";
}

} // namespace raffle
} // namespace solcino
