#include "svm/program_address.h"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sodium.h>

namespace solcino {
namespace svm {

namespace {

const std::string PDA_MARKER = "ProgramDerivedAddress";

bool sodium_ready() {
    static const bool ready = sodium_init() >= 0;
    return ready;
}

} // namespace

bool is_on_curve(const PublicKey& address) {
    if (address.size() != PUBKEY_BYTES || !sodium_ready()) {
        return false;
    }
    return crypto_core_ed25519_is_valid_point(address.data()) == 1;
}

Result<PublicKey> create_program_address(const std::vector<std::vector<uint8_t>>& seeds,
                                         const PublicKey& program_id) {
    if (seeds.size() > MAX_SEEDS) {
        return Result<PublicKey>("Too many seeds");
    }
    if (program_id.size() != PUBKEY_BYTES) {
        return Result<PublicKey>("Program id must be 32 bytes");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return Result<PublicKey>("Failed to allocate digest context");
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LEN) {
            EVP_MD_CTX_free(ctx);
            return Result<PublicKey>("Seed exceeds maximum length of 32 bytes");
        }
        ok = ok && EVP_DigestUpdate(ctx, seed.data(), seed.size()) == 1;
    }
    ok = ok && EVP_DigestUpdate(ctx, program_id.data(), program_id.size()) == 1;
    ok = ok && EVP_DigestUpdate(ctx, PDA_MARKER.data(), PDA_MARKER.size()) == 1;

    PublicKey address(SHA256_DIGEST_LENGTH);
    unsigned int len = SHA256_DIGEST_LENGTH;
    ok = ok && EVP_DigestFinal_ex(ctx, address.data(), &len) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        return Result<PublicKey>("SHA-256 digest failed");
    }

    // The derived address must NOT be on the ed25519 curve
    if (is_on_curve(address)) {
        return Result<PublicKey>("Derived address is on the ed25519 curve");
    }

    return Result<PublicKey>(address);
}

Result<std::pair<PublicKey, uint8_t>> find_program_address(
    const std::vector<std::vector<uint8_t>>& seeds,
    const PublicKey& program_id) {
    using Found = std::pair<PublicKey, uint8_t>;

    if (seeds.size() >= MAX_SEEDS) {
        return Result<Found>("Too many seeds");
    }

    std::vector<std::vector<uint8_t>> seeds_with_bump = seeds;
    seeds_with_bump.emplace_back(1, 0);

    for (int bump = 255; bump >= 0; --bump) {
        seeds_with_bump.back()[0] = static_cast<uint8_t>(bump);
        auto address = create_program_address(seeds_with_bump, program_id);
        if (address.is_ok()) {
            return Result<Found>(Found(address.value(), static_cast<uint8_t>(bump)));
        }
    }

    return Result<Found>("Unable to find a viable program address bump seed");
}

std::vector<uint8_t> seed_bytes(const std::string& seed) {
    return std::vector<uint8_t>(seed.begin(), seed.end());
}

} // namespace svm
} // namespace solcino
