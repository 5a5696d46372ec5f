#include "raffle/utils.h"
#include "svm/program_address.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace solcino {
namespace raffle {

const char* const CONFIG_SEED = "config";
const char* const PURCHASE_INDEX_SEED = "purchases";

ProgramResult<uint64_t> calculate_fee(uint64_t amount, uint16_t basis_points) {
    if (basis_points > MAX_FEE_BASIS_POINTS) {
        return ProgramResult<uint64_t>(RaffleError::InvalidFeeBasisPoints);
    }

    // Split so neither product can exceed u64
    uint64_t whole = amount / BASIS_POINTS_DENOMINATOR;
    uint64_t remainder = amount % BASIS_POINTS_DENOMINATOR;
    uint64_t fee = whole * basis_points + (remainder * basis_points) / BASIS_POINTS_DENOMINATOR;
    return ProgramResult<uint64_t>(fee);
}

ProgramResult<uint64_t> random_index(const std::vector<uint8_t>& random_bytes,
                                     uint64_t tickets_sold) {
    if (tickets_sold == 0) {
        return ProgramResult<uint64_t>(RaffleError::NoTicketsSold);
    }

    uint64_t value = 0;
    size_t width = std::min<size_t>(random_bytes.size(), 8);
    for (size_t i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(random_bytes[i]) << (i * 8);
    }
    uint64_t index = value % tickets_sold;
    return ProgramResult<uint64_t>(index);
}

common::Result<std::pair<common::PublicKey, uint8_t>>
find_config_address(const common::PublicKey& program_id) {
    return svm::find_program_address({svm::seed_bytes(CONFIG_SEED)}, program_id);
}

common::Result<std::pair<common::PublicKey, uint8_t>>
find_purchase_index_address(const common::PublicKey& program_id,
                            const common::PublicKey& raffle) {
    return svm::find_program_address({svm::seed_bytes(PURCHASE_INDEX_SEED), raffle}, program_id);
}

std::string lamports_to_sol_string(uint64_t lamports) {
    std::ostringstream oss;
    oss << lamports / 1000000000ULL << "." << std::setw(9) << std::setfill('0')
        << lamports % 1000000000ULL;
    return oss.str();
}

} // namespace raffle
} // namespace solcino
