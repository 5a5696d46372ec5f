/**
 * Unit tests for the instruction decoder, encoder and builders
 */

#include "raffle/instruction.h"
#include "raffle/utils.h"
#include <gtest/gtest.h>

using namespace solcino;
using namespace solcino::raffle;

class InstructionTest : public ::testing::Test {
protected:
    common::PublicKey program_id_ = common::PublicKey(32, 0x5C);
    common::PublicKey randomness_id_ = common::PublicKey(32, 0x5B);

    common::PublicKey config_address() const {
        return find_config_address(program_id_).value().first;
    }
};

// ============================================================================
// Decoding
// ============================================================================

TEST_F(InstructionTest, DecodeInitializeConfig) {
    std::vector<uint8_t> data = {0, 0x00, 0xE1, 0xF5, 0x05, 0, 0, 0, 0, 0xF4, 0x01};
    auto decoded = unpack_instruction(data);
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(opcode_of(decoded.value()), Opcode::InitializeConfig);

    const auto& ix = std::get<InitializeConfig>(decoded.value());
    EXPECT_EQ(ix.ticket_price, 100000000u);
    EXPECT_EQ(ix.fee_basis_points, 500);
}

TEST_F(InstructionTest, DecodeInitializeRaffle) {
    std::vector<uint8_t> data(1 + 32 + 8, 0);
    data[0] = 1;
    data[1] = 'D';
    data[2] = 'r';
    data[33] = 60;
    auto decoded = unpack_instruction(data);
    ASSERT_TRUE(decoded.is_ok());

    const auto& ix = std::get<InitializeRaffle>(decoded.value());
    EXPECT_EQ(title_to_string(ix.title), "Dr");
    EXPECT_EQ(ix.duration, 60u);
}

TEST_F(InstructionTest, DecodeOperandlessOpcodes) {
    const Opcode operandless[] = {Opcode::CompleteRaffle, Opcode::UpdateAdmin,
                                  Opcode::UpdateFeeAddress, Opcode::RequestRandomness,
                                  Opcode::CompleteRaffleWithVrf};
    for (Opcode opcode : operandless) {
        std::vector<uint8_t> data = {static_cast<uint8_t>(opcode)};
        auto decoded = unpack_instruction(data);
        ASSERT_TRUE(decoded.is_ok()) << to_string(opcode);
        EXPECT_EQ(opcode_of(decoded.value()), opcode);
    }
}

TEST_F(InstructionTest, TrailingBytesIgnored) {
    std::vector<uint8_t> data = {2, 3, 0, 0, 0, 0, 0, 0, 0, 0xDE, 0xAD};
    auto decoded = unpack_instruction(data);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(std::get<PurchaseTickets>(decoded.value()).ticket_count, 3u);
}

TEST_F(InstructionTest, RejectsEmptyData) {
    auto decoded = unpack_instruction({});
    ASSERT_FALSE(decoded.is_ok());
    EXPECT_EQ(decoded.error(), RaffleError::InvalidInstruction);
}

TEST_F(InstructionTest, RejectsUnknownOpcode) {
    for (uint8_t opcode : {10, 11, 200, 255}) {
        auto decoded = unpack_instruction({opcode});
        ASSERT_FALSE(decoded.is_ok());
        EXPECT_EQ(decoded.error(), RaffleError::InvalidInstruction);
    }
}

TEST_F(InstructionTest, RejectsShortOperands) {
    const std::vector<std::vector<uint8_t>> truncated = {
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},     // InitializeConfig needs 10 operand bytes
        std::vector<uint8_t>(40, 1),         // InitializeRaffle needs 40
        {2, 1, 0, 0},                        // PurchaseTickets needs 8
        {6, 1},                              // UpdateTicketPrice needs 8
        {7, 1},                              // UpdateFeePercentage needs 2
    };
    for (const auto& data : truncated) {
        auto decoded = unpack_instruction(data);
        ASSERT_FALSE(decoded.is_ok()) << "opcode " << static_cast<int>(data[0]);
        EXPECT_EQ(decoded.error(), RaffleError::InvalidInstruction);
    }
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(InstructionTest, PackMatchesWireLayout) {
    UpdateFeePercentage fee;
    fee.new_fee_basis_points = 250;
    EXPECT_EQ(pack_instruction(fee), (std::vector<uint8_t>{7, 0xFA, 0x00}));

    EXPECT_EQ(pack_instruction(CompleteRaffleWithVrf{}), (std::vector<uint8_t>{9}));

    InitializeRaffle raffle;
    raffle.title = make_title("A");
    raffle.duration = 86400;
    auto data = pack_instruction(raffle);
    ASSERT_EQ(data.size(), 41u);
    EXPECT_EQ(data[0], 1);
    EXPECT_EQ(data[1], 'A');
    EXPECT_EQ(data[33], 0x80);
    EXPECT_EQ(data[34], 0x51);
    EXPECT_EQ(data[35], 0x01);
}

TEST_F(InstructionTest, PackThenDecodePurchase) {
    PurchaseTickets purchase;
    purchase.ticket_count = 0xFFFFFFFFFFull;
    auto decoded = unpack_instruction(pack_instruction(purchase));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(std::get<PurchaseTickets>(decoded.value()).ticket_count, 0xFFFFFFFFFFull);
}

TEST_F(InstructionTest, OpcodeNames) {
    EXPECT_EQ(to_string(Opcode::InitializeConfig), "InitializeConfig");
    EXPECT_EQ(to_string(Opcode::CompleteRaffle), "CompleteRaffle");
    EXPECT_EQ(to_string(Opcode::CompleteRaffleWithVrf), "CompleteRaffleWithVrf");
}

// ============================================================================
// Builders
// ============================================================================

TEST_F(InstructionTest, InitializeConfigBuilder) {
    common::PublicKey admin(32, 1);
    common::PublicKey treasury(32, 2);
    auto ix = instructions::initialize_config(program_id_, admin, treasury, 1000, 250);

    EXPECT_EQ(ix.program_id, program_id_);
    ASSERT_EQ(ix.accounts.size(), 4u);
    EXPECT_EQ(ix.accounts[0].pubkey, admin);
    EXPECT_TRUE(ix.accounts[0].is_signer);
    EXPECT_TRUE(ix.accounts[0].is_writable);
    EXPECT_EQ(ix.accounts[1].pubkey, config_address());
    EXPECT_TRUE(ix.accounts[1].is_writable);
    EXPECT_FALSE(ix.accounts[1].is_signer);
    EXPECT_EQ(ix.accounts[2].pubkey, treasury);
    EXPECT_EQ(ix.accounts[3].pubkey, svm::system_program_id());

    auto decoded = unpack_instruction(ix.data);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(std::get<InitializeConfig>(decoded.value()).fee_basis_points, 250);
}

TEST_F(InstructionTest, PurchaseTicketsBuilder) {
    common::PublicKey purchaser(32, 3), raffle(32, 4), ticket(32, 5), treasury(32, 6);
    auto ix = instructions::purchase_tickets(program_id_, purchaser, raffle, ticket, treasury, 2);

    ASSERT_EQ(ix.accounts.size(), 8u);
    EXPECT_TRUE(ix.accounts[0].is_signer);
    EXPECT_TRUE(ix.accounts[2].is_signer);
    EXPECT_TRUE(ix.accounts[2].is_writable);
    EXPECT_TRUE(ix.accounts[3].is_writable);
    EXPECT_EQ(ix.accounts[4].pubkey, config_address());
    EXPECT_FALSE(ix.accounts[4].is_writable);
    EXPECT_EQ(ix.accounts[6].pubkey, svm::clock_sysvar_id());
    EXPECT_EQ(ix.accounts[7].pubkey,
              find_purchase_index_address(program_id_, raffle).value().first);
    EXPECT_TRUE(ix.accounts[7].is_writable);
    EXPECT_FALSE(ix.accounts[7].is_signer);
}

TEST_F(InstructionTest, CompleteWithVrfBuilderNamesIndexAndWinningPurchase) {
    common::PublicKey authority(32, 7), raffle(32, 8), vrf(32, 9), winner(32, 10);
    common::PublicKey winning_purchase(32, 11);
    auto ix = instructions::complete_raffle_with_vrf(program_id_, authority, raffle, vrf, winner,
                                                     randomness_id_, winning_purchase);

    ASSERT_EQ(ix.accounts.size(), 8u);
    EXPECT_TRUE(ix.accounts[0].is_signer);
    EXPECT_TRUE(ix.accounts[1].is_writable);
    EXPECT_FALSE(ix.accounts[2].is_writable);
    EXPECT_TRUE(ix.accounts[3].is_writable);
    EXPECT_EQ(ix.accounts[4].pubkey, randomness_id_);
    EXPECT_EQ(ix.accounts[6].pubkey,
              find_purchase_index_address(program_id_, raffle).value().first);
    EXPECT_FALSE(ix.accounts[6].is_writable);
    EXPECT_EQ(ix.accounts[7].pubkey, winning_purchase);
    EXPECT_FALSE(ix.accounts[7].is_writable);
    EXPECT_EQ(ix.data, (std::vector<uint8_t>{9}));
}

TEST_F(InstructionTest, RequestRandomnessBuilderForwardsServiceAccounts) {
    common::PublicKey authority(32, 7), raffle(32, 8), vrf(32, 9);
    std::vector<svm::AccountMeta> extra = {svm::AccountMeta::readonly(common::PublicKey(32, 13),
                                                                      false)};
    auto ix = instructions::request_randomness(program_id_, authority, raffle, vrf, authority,
                                               randomness_id_, extra);
    ASSERT_EQ(ix.accounts.size(), 7u);
    EXPECT_TRUE(ix.accounts[3].is_signer);
    EXPECT_TRUE(ix.accounts[3].is_writable);
    EXPECT_EQ(ix.accounts[5].pubkey, svm::clock_sysvar_id());
    EXPECT_EQ(ix.accounts[6].pubkey, common::PublicKey(32, 13));
}
