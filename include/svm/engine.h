#pragma once

#include "common/types.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace solcino {
namespace svm {

using namespace solcino::common;

/// Maximum number of account metas a single instruction may reference
constexpr size_t MAX_INSTRUCTION_ACCOUNTS = 64;

/// Maximum nesting of cross-program invocations (top level counts as 1)
constexpr size_t MAX_INVOKE_DEPTH = 4;

/// Well-known runtime addresses
PublicKey system_program_id();
PublicKey native_loader_id();
PublicKey sysvar_owner_id();
PublicKey clock_sysvar_id();

/**
 * Account state as seen by programs
 */
struct ProgramAccount {
    PublicKey pubkey;        // Account's public key address
    PublicKey owner;         // Program allowed to write data and debit lamports
    Lamports lamports = 0;
    std::vector<uint8_t> data;
    bool executable = false;
    Epoch rent_epoch = 0;

    bool operator==(const ProgramAccount& other) const;
    bool operator!=(const ProgramAccount& other) const { return !(*this == other); }
};

/**
 * Account reference with the privileges an instruction grants it
 */
struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const PublicKey& pubkey, bool is_signer);
    static AccountMeta readonly(const PublicKey& pubkey, bool is_signer);
};

/**
 * Instruction to be executed by the SVM
 */
struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;
    std::vector<uint8_t> data;
};

/**
 * Clock sysvar contents
 */
struct Clock {
    Slot slot = 0;
    UnixTimestamp epoch_start_timestamp = 0;
    Epoch epoch = 0;
    Epoch leader_schedule_epoch = 0;
    UnixTimestamp unix_timestamp = 0;

    static constexpr size_t SIZE = 40;

    std::vector<uint8_t> serialize() const;
    static Result<Clock> deserialize(const std::vector<uint8_t>& data);
};

/**
 * SVM execution result
 */
enum class ExecutionResult {
    SUCCESS,
    COMPUTE_BUDGET_EXCEEDED,
    PROGRAM_ERROR,
    PROGRAM_NOT_FOUND,
    ACCOUNT_NOT_FOUND,
    INSUFFICIENT_FUNDS,
    INVALID_INSTRUCTION,
    MISSING_SIGNATURE,
    ACCOUNT_ALREADY_IN_USE,
    INVALID_ACCOUNT_MODIFICATION,
    UNBALANCED_INSTRUCTION,
    PRIVILEGE_ESCALATION,
    CALL_DEPTH_EXCEEDED,
    REENTRANCY_NOT_ALLOWED,
    TOO_MANY_ACCOUNTS
};

std::string to_string(ExecutionResult result);

struct ExecutionOutcome {
    ExecutionResult result = ExecutionResult::SUCCESS;
    uint64_t compute_units_consumed = 0;
    std::optional<uint32_t> custom_error;  // Program-defined error code
    std::string error_details;
    std::vector<std::string> logs;         // Program output logs

    bool is_success() const { return result == ExecutionResult::SUCCESS; }

    static ExecutionOutcome success(uint64_t compute_units);
    static ExecutionOutcome failure(ExecutionResult result, const std::string& details);
    static ExecutionOutcome custom_failure(uint32_t code, const std::string& details);
};

class ExecutionEngine;

/// Seeds for one program-derived signer of a cross-program invocation
using SignerSeeds = std::vector<std::vector<uint8_t>>;

/**
 * Transaction execution context
 *
 * Owns the working copy of every account the transaction touches. Nothing in
 * here reaches the caller's account store unless the whole transaction
 * succeeds.
 */
struct ExecutionContext {
    std::unordered_map<PublicKey, ProgramAccount> accounts;
    Clock clock;
    uint64_t max_compute_units = 0;
    uint64_t consumed_compute_units = 0;
    std::vector<std::string> logs;

    /// Returns nullptr when the key is not loaded
    ProgramAccount* get_account(const PublicKey& pubkey);
    const ProgramAccount* get_account(const PublicKey& pubkey) const;

    void log(const std::string& message);

    /**
     * Cross-program invocation from the currently executing program.
     *
     * Every account in the callee instruction must be passed to the caller.
     * Signer and writable flags may not exceed what the caller holds, except
     * that addresses derived from the caller's program id with one of
     * `signer_seeds` are treated as signers.
     */
    ExecutionOutcome invoke(const Instruction& instruction,
                            const std::vector<SignerSeeds>& signer_seeds = {});

    /// Program id of the innermost executing instruction (empty at top level)
    PublicKey current_program_id() const;

    size_t invoke_depth() const { return frames_.size(); }

private:
    friend class ExecutionEngine;

    struct Frame {
        PublicKey program_id;
        const Instruction* instruction = nullptr;
        std::unordered_map<PublicKey, ProgramAccount> pre_accounts;
    };

    const ExecutionEngine* engine_ = nullptr;
    std::vector<Frame> frames_;
};

/**
 * Built-in program interface
 */
class BuiltinProgram {
public:
    virtual ~BuiltinProgram() = default;
    virtual PublicKey get_program_id() const = 0;
    virtual ExecutionOutcome execute(
        const Instruction& instruction,
        ExecutionContext& context
    ) const = 0;
};

/**
 * System program: account creation, ownership assignment, allocation and
 * lamport transfers between system-owned accounts.
 */
class SystemProgram : public BuiltinProgram {
public:
    enum class Opcode : uint32_t {
        CreateAccount = 0,
        Assign = 1,
        Transfer = 2,
        Allocate = 8
    };

    /// Largest data length Allocate/CreateAccount accept
    static constexpr uint64_t MAX_PERMITTED_DATA_LENGTH = 10 * 1024 * 1024;

    SystemProgram();
    ~SystemProgram() override;

    PublicKey get_program_id() const override;
    ExecutionOutcome execute(
        const Instruction& instruction,
        ExecutionContext& context
    ) const override;

    // Instruction builders
    static Instruction create_account(const PublicKey& from, const PublicKey& to,
                                      Lamports lamports, uint64_t space,
                                      const PublicKey& owner);
    static Instruction assign(const PublicKey& account, const PublicKey& owner);
    static Instruction transfer(const PublicKey& from, const PublicKey& to,
                                Lamports lamports);
    static Instruction allocate(const PublicKey& account, uint64_t space);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Minimum balance for an account holding `data_len` bytes to be rent exempt
Lamports rent_exempt_minimum(size_t data_len);

/**
 * SVM execution engine
 */
class ExecutionEngine {
public:
    ExecutionEngine();
    ~ExecutionEngine();

    // Program management
    void register_builtin_program(std::unique_ptr<BuiltinProgram> program);
    bool is_program_loaded(const PublicKey& program_id) const;

    /**
     * Execute the instructions in order against a working copy of `accounts`.
     * On success every changed account is written back; on any failure the
     * store is left untouched. Top-level signer flags are trusted as already
     * verified.
     */
    ExecutionOutcome execute_transaction(
        const std::vector<Instruction>& instructions,
        std::unordered_map<PublicKey, ProgramAccount>& accounts,
        const Clock& clock
    );

    // Configuration
    void set_compute_budget(uint64_t max_compute_units);
    uint64_t get_compute_budget() const;

    // Statistics
    uint64_t get_total_instructions_executed() const;
    uint64_t get_total_compute_units_consumed() const;

private:
    friend struct ExecutionContext;

    ExecutionOutcome process_instruction(
        const Instruction& instruction,
        ExecutionContext& context,
        const std::unordered_set<PublicKey>& derived_signers
    ) const;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace svm
} // namespace solcino
