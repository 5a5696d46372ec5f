#pragma once

#include "common/types.h"
#include <string>
#include <utility>
#include <vector>

namespace solcino {
namespace svm {

using namespace solcino::common;

constexpr size_t MAX_SEED_LEN = 32;
constexpr size_t MAX_SEEDS = 16;

/// True when the 32 bytes decode to a valid ed25519 point
bool is_on_curve(const PublicKey& address);

/**
 * Derive sha256(seeds || program_id || "ProgramDerivedAddress").
 * Fails when a seed is too long, there are too many seeds, or the digest
 * lands on the ed25519 curve (a real key could then sign for it).
 */
Result<PublicKey> create_program_address(const std::vector<std::vector<uint8_t>>& seeds,
                                         const PublicKey& program_id);

/**
 * Append a bump byte to `seeds`, trying 255 down to 0, and return the first
 * off-curve address with the bump that produced it.
 */
Result<std::pair<PublicKey, uint8_t>> find_program_address(
    const std::vector<std::vector<uint8_t>>& seeds,
    const PublicKey& program_id);

/// Seed bytes for a string literal seed
std::vector<uint8_t> seed_bytes(const std::string& seed);

} // namespace svm
} // namespace solcino
