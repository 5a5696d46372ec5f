/**
 * Unit tests for the randomness adapter
 *
 * Tests:
 * - VrfState layout and decoding
 * - extract_result ownership, binding and readiness checks
 * - request() preconditions and the service invocation through the engine
 */

#include "raffle/vrf.h"
#include "fake_randomness_service.h"
#include <gtest/gtest.h>
#include <memory>

using namespace solcino;
using namespace solcino::raffle;
using solcino::common::PublicKey;

namespace {

PublicKey key_of(uint8_t fill) {
    return PublicKey(32, fill);
}

// Calls vrf::request from inside a program so the service runs as a CPI.
// Instruction accounts: 0 raffle (w), 1 vrf (w), 2 payer (s,w), 3 service.
// Data byte 0 carries the raffle state to use: 0 ended, 1 still open,
// 2 complete, 3 already requested, 4 nothing sold.
class RequestHarness : public svm::BuiltinProgram {
public:
    RequestHarness(const PublicKey& program_id, const PublicKey& service_id)
        : program_id_(program_id), service_id_(service_id) {}

    PublicKey get_program_id() const override { return program_id_; }

    svm::ExecutionOutcome execute(const svm::Instruction& instruction,
                                  svm::ExecutionContext& context) const override {
        Raffle raffle;
        raffle.is_initialized = true;
        raffle.end_time = 1000;
        raffle.tickets_sold = 4;
        switch (instruction.data.at(0)) {
            case 1: raffle.end_time = 5000; break;
            case 2: raffle.status = RaffleStatus::Complete; break;
            case 3: raffle.vrf_request_in_progress = true; break;
            case 4: raffle.tickets_sold = 0; break;
            default: break;
        }

        auto result = vrf::request(context, service_id_, instruction.accounts[0].pubkey, raffle,
                                   instruction.accounts[1].pubkey, instruction.accounts[2].pubkey,
                                   2000, {});
        if (!result.is_ok()) {
            return svm::ExecutionOutcome::custom_failure(error_code(result.error()),
                                                         to_string(result.error()));
        }
        if (!raffle.vrf_request_in_progress || raffle.vrf_account != instruction.accounts[1].pubkey) {
            return svm::ExecutionOutcome::failure(svm::ExecutionResult::PROGRAM_ERROR,
                                                  "request did not record the vrf account");
        }
        return svm::ExecutionOutcome::success(100);
    }

private:
    PublicKey program_id_;
    PublicKey service_id_;
};

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class VrfTest : public ::testing::Test {
protected:
    PublicKey service_id_ = key_of(0x5B);
    PublicKey raffle_key_ = key_of(0x21);
    PublicKey vrf_key_ = key_of(0x22);

    Raffle requested_raffle() const {
        Raffle raffle;
        raffle.is_initialized = true;
        raffle.tickets_sold = 5;
        raffle.vrf_account = vrf_key_;
        raffle.vrf_request_in_progress = true;
        return raffle;
    }

    svm::ProgramAccount vrf_account(const vrf::VrfState& state) const {
        svm::ProgramAccount account;
        account.pubkey = vrf_key_;
        account.owner = service_id_;
        account.lamports = svm::rent_exempt_minimum(vrf::VrfState::LEN);
        account.data = state.pack();
        return account;
    }

    vrf::VrfState finalized_state() const {
        vrf::VrfState state;
        state.status = vrf::VrfStatus::Finalized;
        state.requester = raffle_key_;
        state.request_counter = 1;
        state.result[0] = 3;
        state.result_verified = true;
        return state;
    }
};

// ============================================================================
// VrfState
// ============================================================================

TEST_F(VrfTest, StateLayout) {
    auto state = finalized_state();
    state.request_counter = 0x0102;
    auto data = state.pack();
    ASSERT_EQ(data.size(), vrf::VrfState::LEN);
    EXPECT_EQ(data[0], 2);
    EXPECT_EQ(data[1], 0x21);
    EXPECT_EQ(data[33], 0x02);
    EXPECT_EQ(data[34], 0x01);
    EXPECT_EQ(data[41], 3);
    EXPECT_EQ(data[73], 1);
}

TEST_F(VrfTest, StateRejectsUnknownStatus) {
    auto data = finalized_state().pack();
    data[0] = 3;
    auto decoded = vrf::VrfState::unpack(data);
    ASSERT_FALSE(decoded.is_ok());
    EXPECT_EQ(decoded.error(), RaffleError::MalformedAccount);
}

TEST_F(VrfTest, FinalizedRequiresVerification) {
    auto state = finalized_state();
    EXPECT_TRUE(state.is_finalized());
    state.result_verified = false;
    EXPECT_FALSE(state.is_finalized());
    state.result_verified = true;
    state.status = vrf::VrfStatus::Pending;
    EXPECT_FALSE(state.is_finalized());
}

// ============================================================================
// extract_result
// ============================================================================

TEST_F(VrfTest, ExtractFinalizedResult) {
    auto result = vrf::extract_result(vrf_account(finalized_state()), service_id_, raffle_key_,
                                      requested_raffle());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()[0], 3);
    EXPECT_EQ(result.value()[31], 0);
}

TEST_F(VrfTest, ExtractRejectsForeignOwner) {
    auto account = vrf_account(finalized_state());
    account.owner = key_of(0x99);
    auto result = vrf::extract_result(account, service_id_, raffle_key_, requested_raffle());
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error(), RaffleError::VrfAccountMismatch);
}

TEST_F(VrfTest, ExtractRejectsUnboundAccount) {
    Raffle raffle = requested_raffle();
    raffle.vrf_account = key_of(0x98);
    auto result = vrf::extract_result(vrf_account(finalized_state()), service_id_, raffle_key_,
                                      raffle);
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error(), RaffleError::VrfAccountMismatch);
}

TEST_F(VrfTest, ExtractRejectsOtherRequester) {
    auto state = finalized_state();
    state.requester = key_of(0x97);
    auto result = vrf::extract_result(vrf_account(state), service_id_, raffle_key_,
                                      requested_raffle());
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error(), RaffleError::VrfAccountMismatch);
}

TEST_F(VrfTest, ExtractPendingNotReady) {
    auto state = finalized_state();
    state.status = vrf::VrfStatus::Pending;
    state.result_verified = false;
    auto result = vrf::extract_result(vrf_account(state), service_id_, raffle_key_,
                                      requested_raffle());
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error(), RaffleError::VrfResultNotReady);
}

TEST_F(VrfTest, ExtractUnverifiedNotReady) {
    auto state = finalized_state();
    state.result_verified = false;
    auto result = vrf::extract_result(vrf_account(state), service_id_, raffle_key_,
                                      requested_raffle());
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error(), RaffleError::VrfResultNotReady);
}

TEST_F(VrfTest, ExtractTruncatedAccountIsMalformed) {
    auto account = vrf_account(finalized_state());
    account.data.resize(10);
    auto result = vrf::extract_result(account, service_id_, raffle_key_, requested_raffle());
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error(), RaffleError::MalformedAccount);
}

// ============================================================================
// request
// ============================================================================

class VrfRequestTest : public VrfTest {
protected:
    void SetUp() override {
        engine_.register_builtin_program(std::make_unique<RequestHarness>(harness_id_, service_id_));
        engine_.register_builtin_program(
            std::make_unique<test_support::FakeRandomnessService>(service_id_));

        svm::ProgramAccount payer;
        payer.pubkey = payer_key_;
        payer.owner = svm::system_program_id();
        payer.lamports = 1000000000;
        accounts_[payer_key_] = payer;

        vrf::VrfState empty;
        accounts_[vrf_key_] = vrf_account(empty);
    }

    svm::ExecutionOutcome run(uint8_t scenario) {
        svm::Instruction instruction;
        instruction.program_id = harness_id_;
        instruction.accounts = {svm::AccountMeta::writable(raffle_key_, false),
                                svm::AccountMeta::writable(vrf_key_, false),
                                svm::AccountMeta::writable(payer_key_, true),
                                svm::AccountMeta::readonly(service_id_, false)};
        instruction.data = {scenario};
        svm::Clock clock;
        clock.unix_timestamp = 2000;
        return engine_.execute_transaction({instruction}, accounts_, clock);
    }

    PublicKey harness_id_ = key_of(0x70);
    PublicKey payer_key_ = key_of(0x23);
    svm::ExecutionEngine engine_;
    std::unordered_map<PublicKey, svm::ProgramAccount> accounts_;
};

TEST_F(VrfRequestTest, RequestInvokesService) {
    auto outcome = run(0);
    ASSERT_TRUE(outcome.is_success()) << outcome.error_details;

    auto state = vrf::VrfState::unpack(accounts_[vrf_key_].data);
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().status, vrf::VrfStatus::Pending);
    EXPECT_EQ(state.value().requester, raffle_key_);
    EXPECT_EQ(state.value().request_counter, 1u);
}

TEST_F(VrfRequestTest, RequestBeforeEndFails) {
    auto outcome = run(1);
    ASSERT_FALSE(outcome.is_success());
    ASSERT_TRUE(outcome.custom_error.has_value());
    EXPECT_EQ(*outcome.custom_error, error_code(RaffleError::RaffleNotEnded));
}

TEST_F(VrfRequestTest, RequestOnCompleteRaffleFails) {
    auto outcome = run(2);
    ASSERT_TRUE(outcome.custom_error.has_value());
    EXPECT_EQ(*outcome.custom_error, error_code(RaffleError::RaffleNotActive));
}

TEST_F(VrfRequestTest, SecondRequestFails) {
    auto outcome = run(3);
    ASSERT_TRUE(outcome.custom_error.has_value());
    EXPECT_EQ(*outcome.custom_error, error_code(RaffleError::RandomnessAlreadyRequested));
}

TEST_F(VrfRequestTest, RequestWithoutTicketsFails) {
    auto outcome = run(4);
    ASSERT_TRUE(outcome.custom_error.has_value());
    EXPECT_EQ(*outcome.custom_error, error_code(RaffleError::NoTicketsSold));
}

TEST_F(VrfRequestTest, ServiceFailureIsReported) {
    // A VRF account the service does not own makes the service call fail
    accounts_[vrf_key_].owner = svm::system_program_id();
    auto outcome = run(0);
    ASSERT_TRUE(outcome.custom_error.has_value());
    EXPECT_EQ(*outcome.custom_error, error_code(RaffleError::RandomnessServiceFailed));
}

TEST_F(VrfRequestTest, BuildRequestInstruction) {
    auto ix = vrf::build_request_instruction(service_id_, vrf_key_, payer_key_, raffle_key_);
    EXPECT_EQ(ix.program_id, service_id_);
    ASSERT_EQ(ix.accounts.size(), 3u);
    EXPECT_TRUE(ix.accounts[0].is_writable);
    EXPECT_FALSE(ix.accounts[0].is_signer);
    EXPECT_TRUE(ix.accounts[1].is_signer);
    EXPECT_TRUE(ix.accounts[1].is_writable);
    EXPECT_FALSE(ix.accounts[2].is_writable);
    EXPECT_EQ(ix.data, (std::vector<uint8_t>{vrf::REQUEST_RANDOMNESS_OPCODE}));
}
