/**
 * Unit tests for program-derived addresses
 */

#include "svm/program_address.h"
#include "common/types.h"
#include <gtest/gtest.h>

using namespace solcino::svm;
using solcino::common::PublicKey;

class ProgramAddressTest : public ::testing::Test {
protected:
    PublicKey program_id_ = PublicKey(32, 0x5C);
};

TEST_F(ProgramAddressTest, FindReturnsOffCurveAddress) {
    auto found = find_program_address({seed_bytes("config")}, program_id_);
    ASSERT_TRUE(found.is_ok()) << found.error();
    EXPECT_EQ(found.value().first.size(), 32u);
    EXPECT_FALSE(is_on_curve(found.value().first));
}

TEST_F(ProgramAddressTest, FindAgreesWithCreate) {
    auto found = find_program_address({seed_bytes("config")}, program_id_);
    ASSERT_TRUE(found.is_ok());

    std::vector<std::vector<uint8_t>> seeds = {seed_bytes("config"),
                                               std::vector<uint8_t>{found.value().second}};
    auto created = create_program_address(seeds, program_id_);
    ASSERT_TRUE(created.is_ok());
    EXPECT_EQ(created.value(), found.value().first);
}

TEST_F(ProgramAddressTest, DependsOnSeedsAndProgram) {
    auto config = find_program_address({seed_bytes("config")}, program_id_);
    auto other_seed = find_program_address({seed_bytes("treasury")}, program_id_);
    auto other_program = find_program_address({seed_bytes("config")}, PublicKey(32, 0x11));
    ASSERT_TRUE(config.is_ok());
    ASSERT_TRUE(other_seed.is_ok());
    ASSERT_TRUE(other_program.is_ok());
    EXPECT_NE(config.value().first, other_seed.value().first);
    EXPECT_NE(config.value().first, other_program.value().first);
}

TEST_F(ProgramAddressTest, RejectsOversizedSeed) {
    std::vector<std::vector<uint8_t>> seeds = {std::vector<uint8_t>(MAX_SEED_LEN + 1, 7)};
    auto created = create_program_address(seeds, program_id_);
    EXPECT_FALSE(created.is_ok());
}

TEST_F(ProgramAddressTest, AcceptsMaximumSeedLength) {
    std::vector<std::vector<uint8_t>> seeds = {std::vector<uint8_t>(MAX_SEED_LEN, 7)};
    auto found = find_program_address(seeds, program_id_);
    EXPECT_TRUE(found.is_ok());
}

TEST_F(ProgramAddressTest, RejectsTooManySeeds) {
    std::vector<std::vector<uint8_t>> seeds(MAX_SEEDS + 1, std::vector<uint8_t>{1});
    EXPECT_FALSE(create_program_address(seeds, program_id_).is_ok());

    // find appends the bump, so it accepts one seed fewer
    std::vector<std::vector<uint8_t>> full(MAX_SEEDS, std::vector<uint8_t>{1});
    EXPECT_FALSE(find_program_address(full, program_id_).is_ok());
}

TEST_F(ProgramAddressTest, RejectsMalformedProgramId) {
    auto created = create_program_address({seed_bytes("config")}, PublicKey(31, 1));
    EXPECT_FALSE(created.is_ok());
}

TEST_F(ProgramAddressTest, CurveCheck) {
    // Compressed ed25519 base point
    auto base_point = solcino::common::from_hex(
        "5866666666666666666666666666666666666666666666666666666666666666");
    ASSERT_TRUE(base_point.is_ok());
    EXPECT_TRUE(is_on_curve(base_point.value()));

    EXPECT_FALSE(is_on_curve(PublicKey(31, 0)));
}
