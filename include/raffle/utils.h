#pragma once

#include "common/types.h"
#include "raffle/error.h"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace solcino {
namespace raffle {

constexpr uint16_t MAX_FEE_BASIS_POINTS = 10000;
constexpr uint64_t BASIS_POINTS_DENOMINATOR = 10000;

/// Seed of the config program address
extern const char* const CONFIG_SEED;

/// Seed of each raffle's purchase index, followed by the raffle key
extern const char* const PURCHASE_INDEX_SEED;

/**
 * floor(amount * basis_points / 10000), exact for every u64 amount.
 * InvalidFeeBasisPoints when basis_points > 10000.
 */
ProgramResult<uint64_t> calculate_fee(uint64_t amount, uint16_t basis_points);

/**
 * Index of the winning ticket: the first (up to) 8 bytes of `random_bytes`
 * read little-endian, modulo `tickets_sold`. NoTicketsSold when zero.
 */
ProgramResult<uint64_t> random_index(const std::vector<uint8_t>& random_bytes,
                                     uint64_t tickets_sold);

/// Config address and bump for `program_id`
common::Result<std::pair<common::PublicKey, uint8_t>>
find_config_address(const common::PublicKey& program_id);

/// Purchase index address and bump of `raffle` under `program_id`
common::Result<std::pair<common::PublicKey, uint8_t>>
find_purchase_index_address(const common::PublicKey& program_id,
                            const common::PublicKey& raffle);

/// Lamports formatted as SOL with 9 decimals, e.g. "0.475000000"
std::string lamports_to_sol_string(uint64_t lamports);

} // namespace raffle
} // namespace solcino
