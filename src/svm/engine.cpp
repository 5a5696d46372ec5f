#include "svm/engine.h"
#include "svm/program_address.h"
#include "common/logging.h"
#include <algorithm>

namespace solcino {
namespace svm {

namespace {

PublicKey key_from_hex(const char* hex) {
    return from_hex(hex).value_or(PublicKey(PUBKEY_BYTES, 0));
}

void write_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

uint64_t read_u64(const std::vector<uint8_t>& data, size_t offset) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[offset + i]) << (i * 8);
    }
    return value;
}

uint32_t read_u32(const std::vector<uint8_t>& data, size_t offset) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data[offset + i]) << (i * 8);
    }
    return value;
}

void write_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

bool is_meta_writable(const Instruction& instruction, const PublicKey& key) {
    return std::any_of(instruction.accounts.begin(), instruction.accounts.end(),
                       [&key](const AccountMeta& meta) {
                           return meta.pubkey == key && meta.is_writable;
                       });
}

bool is_meta_signer(const Instruction& instruction, const PublicKey& key) {
    return std::any_of(instruction.accounts.begin(), instruction.accounts.end(),
                       [&key](const AccountMeta& meta) {
                           return meta.pubkey == key && meta.is_signer;
                       });
}

// Checks what the program at `program_id` did to the accounts of one
// instruction since `pre_accounts` was captured.
ExecutionOutcome verify_account_changes(
    const PublicKey& program_id,
    const Instruction& instruction,
    const std::unordered_map<PublicKey, ProgramAccount>& pre_accounts,
    const std::unordered_map<PublicKey, ProgramAccount>& accounts) {

    uint64_t pre_total = 0;
    uint64_t post_total = 0;

    for (const auto& [key, pre] : pre_accounts) {
        auto it = accounts.find(key);
        if (it == accounts.end()) {
            return ExecutionOutcome::failure(ExecutionResult::ACCOUNT_NOT_FOUND,
                                             "Account disappeared: " + short_key(key));
        }
        const ProgramAccount& post = it->second;
        pre_total += pre.lamports;
        post_total += post.lamports;

        if (pre == post) {
            continue;
        }

        if (pre.executable || post.executable != pre.executable) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_ACCOUNT_MODIFICATION,
                                             "Executable account modified: " + short_key(key));
        }

        if (!is_meta_writable(instruction, key)) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_ACCOUNT_MODIFICATION,
                                             "Read-only account modified: " + short_key(key));
        }

        const bool owned = pre.owner == program_id;

        if (pre.owner != post.owner) {
            bool zeroed = std::all_of(post.data.begin(), post.data.end(),
                                      [](uint8_t b) { return b == 0; });
            if (!owned || !zeroed) {
                return ExecutionOutcome::failure(ExecutionResult::INVALID_ACCOUNT_MODIFICATION,
                                                 "Illegal owner change: " + short_key(key));
            }
        }

        if (post.lamports < pre.lamports && !owned) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_ACCOUNT_MODIFICATION,
                                             "Debited account not owned by program: " + short_key(key));
        }

        if (post.data != pre.data && !owned) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_ACCOUNT_MODIFICATION,
                                             "Modified data of account not owned by program: " +
                                             short_key(key));
        }
    }

    if (pre_total != post_total) {
        return ExecutionOutcome::failure(ExecutionResult::UNBALANCED_INSTRUCTION,
                                         "Sum of account balances changed from " +
                                         std::to_string(pre_total) + " to " +
                                         std::to_string(post_total));
    }

    return ExecutionOutcome::success(0);
}

} // namespace

PublicKey system_program_id() {
    return PublicKey(PUBKEY_BYTES, 0);
}

PublicKey native_loader_id() {
    static const PublicKey id =
        key_from_hex("054a535a992921064d24e87160da387c7c35b5ddbc92bb81e41fa8404105448d");
    return id;
}

PublicKey sysvar_owner_id() {
    static const PublicKey id =
        key_from_hex("06a7d517187bd16635dad40455fdc2c0c124c68f215675a5dbbacb5f08000000");
    return id;
}

PublicKey clock_sysvar_id() {
    static const PublicKey id =
        key_from_hex("06a7d51718c774c928566398691d5eb68b5eb8a39b4b6d5c73555b2100000000");
    return id;
}

std::string to_string(ExecutionResult result) {
    switch (result) {
        case ExecutionResult::SUCCESS: return "SUCCESS";
        case ExecutionResult::COMPUTE_BUDGET_EXCEEDED: return "COMPUTE_BUDGET_EXCEEDED";
        case ExecutionResult::PROGRAM_ERROR: return "PROGRAM_ERROR";
        case ExecutionResult::PROGRAM_NOT_FOUND: return "PROGRAM_NOT_FOUND";
        case ExecutionResult::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case ExecutionResult::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ExecutionResult::INVALID_INSTRUCTION: return "INVALID_INSTRUCTION";
        case ExecutionResult::MISSING_SIGNATURE: return "MISSING_SIGNATURE";
        case ExecutionResult::ACCOUNT_ALREADY_IN_USE: return "ACCOUNT_ALREADY_IN_USE";
        case ExecutionResult::INVALID_ACCOUNT_MODIFICATION: return "INVALID_ACCOUNT_MODIFICATION";
        case ExecutionResult::UNBALANCED_INSTRUCTION: return "UNBALANCED_INSTRUCTION";
        case ExecutionResult::PRIVILEGE_ESCALATION: return "PRIVILEGE_ESCALATION";
        case ExecutionResult::CALL_DEPTH_EXCEEDED: return "CALL_DEPTH_EXCEEDED";
        case ExecutionResult::REENTRANCY_NOT_ALLOWED: return "REENTRANCY_NOT_ALLOWED";
        case ExecutionResult::TOO_MANY_ACCOUNTS: return "TOO_MANY_ACCOUNTS";
    }
    return "UNKNOWN";
}

// ProgramAccount implementation
bool ProgramAccount::operator==(const ProgramAccount& other) const {
    return pubkey == other.pubkey && owner == other.owner &&
           lamports == other.lamports && data == other.data &&
           executable == other.executable && rent_epoch == other.rent_epoch;
}

AccountMeta AccountMeta::writable(const PublicKey& pubkey, bool is_signer) {
    return AccountMeta{pubkey, is_signer, true};
}

AccountMeta AccountMeta::readonly(const PublicKey& pubkey, bool is_signer) {
    return AccountMeta{pubkey, is_signer, false};
}

// Clock implementation
std::vector<uint8_t> Clock::serialize() const {
    std::vector<uint8_t> result;
    result.reserve(SIZE);
    write_u64(result, slot);
    write_u64(result, static_cast<uint64_t>(epoch_start_timestamp));
    write_u64(result, epoch);
    write_u64(result, leader_schedule_epoch);
    write_u64(result, static_cast<uint64_t>(unix_timestamp));
    return result;
}

Result<Clock> Clock::deserialize(const std::vector<uint8_t>& data) {
    if (data.size() < SIZE) {
        return Result<Clock>("Clock sysvar data too short");
    }
    Clock clock;
    clock.slot = read_u64(data, 0);
    clock.epoch_start_timestamp = static_cast<UnixTimestamp>(read_u64(data, 8));
    clock.epoch = read_u64(data, 16);
    clock.leader_schedule_epoch = read_u64(data, 24);
    clock.unix_timestamp = static_cast<UnixTimestamp>(read_u64(data, 32));
    return Result<Clock>(clock);
}

// ExecutionOutcome implementation
ExecutionOutcome ExecutionOutcome::success(uint64_t compute_units) {
    ExecutionOutcome outcome;
    outcome.result = ExecutionResult::SUCCESS;
    outcome.compute_units_consumed = compute_units;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::failure(ExecutionResult result, const std::string& details) {
    ExecutionOutcome outcome;
    outcome.result = result;
    outcome.error_details = details;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::custom_failure(uint32_t code, const std::string& details) {
    ExecutionOutcome outcome;
    outcome.result = ExecutionResult::PROGRAM_ERROR;
    outcome.custom_error = code;
    outcome.error_details = details;
    return outcome;
}

// ExecutionContext implementation
ProgramAccount* ExecutionContext::get_account(const PublicKey& pubkey) {
    auto it = accounts.find(pubkey);
    return it == accounts.end() ? nullptr : &it->second;
}

const ProgramAccount* ExecutionContext::get_account(const PublicKey& pubkey) const {
    auto it = accounts.find(pubkey);
    return it == accounts.end() ? nullptr : &it->second;
}

void ExecutionContext::log(const std::string& message) {
    logs.push_back("Program log: " + message);
    LOG_DEBUG("svm", "Program log: ", message);
}

PublicKey ExecutionContext::current_program_id() const {
    return frames_.empty() ? PublicKey() : frames_.back().program_id;
}

ExecutionOutcome ExecutionContext::invoke(const Instruction& instruction,
                                          const std::vector<SignerSeeds>& signer_seeds) {
    if (!engine_ || frames_.empty()) {
        return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                         "invoke called outside of program execution");
    }

    const PublicKey caller_id = frames_.back().program_id;

    // Changes the caller made so far must be legal before the callee sees them
    {
        const Frame& caller = frames_.back();
        auto verified = verify_account_changes(caller.program_id, *caller.instruction,
                                               caller.pre_accounts, accounts);
        if (!verified.is_success()) {
            return verified;
        }
    }

    std::unordered_set<PublicKey> derived_signers;
    for (const auto& seeds : signer_seeds) {
        auto address = create_program_address(seeds, caller_id);
        if (!address.is_ok()) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                             "Invalid signer seeds: " + address.error());
        }
        derived_signers.insert(address.value());
    }

    logs.push_back("Program " + short_key(instruction.program_id) + " invoke [" +
                   std::to_string(frames_.size() + 1) + "]");

    ExecutionOutcome outcome = engine_->process_instruction(instruction, *this, derived_signers);

    // Callee changes become the caller's new baseline
    Frame& caller = frames_.back();
    for (auto& [key, pre] : caller.pre_accounts) {
        auto it = accounts.find(key);
        if (it != accounts.end()) {
            pre = it->second;
        }
    }

    return outcome;
}

// SystemProgram implementation
class SystemProgram::Impl {
public:
    static constexpr uint64_t COMPUTE_UNITS = 150;

    PublicKey program_id_ = system_program_id();

    static ProgramAccount* account_at(const Instruction& instruction,
                                      ExecutionContext& context, size_t index) {
        if (index >= instruction.accounts.size()) {
            return nullptr;
        }
        return context.get_account(instruction.accounts[index].pubkey);
    }

    ExecutionOutcome allocate(const Instruction& instruction, ExecutionContext& context,
                              size_t index, uint64_t space) const {
        ProgramAccount* account = account_at(instruction, context, index);
        if (!account) {
            return ExecutionOutcome::failure(ExecutionResult::ACCOUNT_NOT_FOUND,
                                             "Allocate target missing");
        }
        if (!instruction.accounts[index].is_signer) {
            return ExecutionOutcome::failure(ExecutionResult::MISSING_SIGNATURE,
                                             "Allocate: account must sign");
        }
        if (!account->data.empty() || account->owner != program_id_) {
            return ExecutionOutcome::failure(ExecutionResult::ACCOUNT_ALREADY_IN_USE,
                                             "Allocate: account already in use");
        }
        if (space > MAX_PERMITTED_DATA_LENGTH) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                             "Allocate: requested space too large");
        }
        account->data.assign(static_cast<size_t>(space), 0);
        return ExecutionOutcome::success(COMPUTE_UNITS);
    }

    ExecutionOutcome assign(const Instruction& instruction, ExecutionContext& context,
                            size_t index, const PublicKey& owner) const {
        ProgramAccount* account = account_at(instruction, context, index);
        if (!account) {
            return ExecutionOutcome::failure(ExecutionResult::ACCOUNT_NOT_FOUND,
                                             "Assign target missing");
        }
        if (account->owner == owner) {
            return ExecutionOutcome::success(COMPUTE_UNITS);
        }
        if (!instruction.accounts[index].is_signer) {
            return ExecutionOutcome::failure(ExecutionResult::MISSING_SIGNATURE,
                                             "Assign: account must sign");
        }
        if (account->owner != program_id_) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_ACCOUNT_MODIFICATION,
                                             "Assign: account not owned by system program");
        }
        account->owner = owner;
        return ExecutionOutcome::success(COMPUTE_UNITS);
    }

    ExecutionOutcome transfer(const Instruction& instruction, ExecutionContext& context,
                              size_t from_index, size_t to_index, Lamports lamports) const {
        ProgramAccount* from = account_at(instruction, context, from_index);
        ProgramAccount* to = account_at(instruction, context, to_index);
        if (!from || !to) {
            return ExecutionOutcome::failure(ExecutionResult::ACCOUNT_NOT_FOUND,
                                             "Transfer requires source and destination");
        }
        if (!instruction.accounts[from_index].is_signer) {
            return ExecutionOutcome::failure(ExecutionResult::MISSING_SIGNATURE,
                                             "Transfer: source must sign");
        }
        if (!from->data.empty()) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                             "Transfer: source must not carry data");
        }
        if (from->owner != program_id_) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_ACCOUNT_MODIFICATION,
                                             "Transfer: source not owned by system program");
        }
        if (from->lamports < lamports) {
            return ExecutionOutcome::failure(ExecutionResult::INSUFFICIENT_FUNDS,
                                             "Transfer: insufficient lamports " +
                                             std::to_string(from->lamports) + ", need " +
                                             std::to_string(lamports));
        }
        if (from == to) {
            return ExecutionOutcome::success(COMPUTE_UNITS);
        }
        if (to->lamports > UINT64_MAX - lamports) {
            return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                             "Transfer: destination balance overflow");
        }
        from->lamports -= lamports;
        to->lamports += lamports;
        return ExecutionOutcome::success(COMPUTE_UNITS);
    }

    ExecutionOutcome create_account(const Instruction& instruction, ExecutionContext& context,
                                    Lamports lamports, uint64_t space,
                                    const PublicKey& owner) const {
        ProgramAccount* to = account_at(instruction, context, 1);
        if (!to || !account_at(instruction, context, 0)) {
            return ExecutionOutcome::failure(ExecutionResult::ACCOUNT_NOT_FOUND,
                                             "CreateAccount requires funder and new account");
        }
        if (to->lamports > 0) {
            return ExecutionOutcome::failure(ExecutionResult::ACCOUNT_ALREADY_IN_USE,
                                             "CreateAccount: account already in use");
        }

        auto outcome = allocate(instruction, context, 1, space);
        if (!outcome.is_success()) return outcome;

        outcome = assign(instruction, context, 1, owner);
        if (!outcome.is_success()) return outcome;

        outcome = transfer(instruction, context, 0, 1, lamports);
        if (!outcome.is_success()) return outcome;

        return ExecutionOutcome::success(COMPUTE_UNITS);
    }
};

SystemProgram::SystemProgram() : impl_(std::make_unique<Impl>()) {}
SystemProgram::~SystemProgram() = default;

PublicKey SystemProgram::get_program_id() const {
    return impl_->program_id_;
}

ExecutionOutcome SystemProgram::execute(
    const Instruction& instruction,
    ExecutionContext& context) const {

    if (instruction.data.size() < 4) {
        return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                         "Empty instruction data");
    }

    uint32_t instruction_type = read_u32(instruction.data, 0);
    const auto& data = instruction.data;

    switch (static_cast<Opcode>(instruction_type)) {
        case Opcode::CreateAccount:
            if (data.size() < 4 + 8 + 8 + 32 || instruction.accounts.size() < 2) {
                return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                                 "CreateAccount requires 2 accounts and 52 bytes");
            }
            return impl_->create_account(instruction, context, read_u64(data, 4),
                                         read_u64(data, 12),
                                         PublicKey(data.begin() + 20, data.begin() + 52));

        case Opcode::Assign:
            if (data.size() < 4 + 32 || instruction.accounts.empty()) {
                return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                                 "Assign requires 1 account and an owner");
            }
            return impl_->assign(instruction, context, 0,
                                 PublicKey(data.begin() + 4, data.begin() + 36));

        case Opcode::Transfer:
            if (data.size() < 4 + 8 || instruction.accounts.size() < 2) {
                return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                                 "Transfer requires 2 accounts and an amount");
            }
            return impl_->transfer(instruction, context, 0, 1, read_u64(data, 4));

        case Opcode::Allocate:
            if (data.size() < 4 + 8 || instruction.accounts.empty()) {
                return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                                 "Allocate requires 1 account and a size");
            }
            return impl_->allocate(instruction, context, 0, read_u64(data, 4));
    }

    return ExecutionOutcome::failure(ExecutionResult::INVALID_INSTRUCTION,
                                     "Unknown system program instruction type: " +
                                     std::to_string(instruction_type));
}

Instruction SystemProgram::create_account(const PublicKey& from, const PublicKey& to,
                                          Lamports lamports, uint64_t space,
                                          const PublicKey& owner) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(from, true), AccountMeta::writable(to, true)};
    write_u32(instruction.data, static_cast<uint32_t>(Opcode::CreateAccount));
    write_u64(instruction.data, lamports);
    write_u64(instruction.data, space);
    instruction.data.insert(instruction.data.end(), owner.begin(), owner.end());
    return instruction;
}

Instruction SystemProgram::assign(const PublicKey& account, const PublicKey& owner) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(account, true)};
    write_u32(instruction.data, static_cast<uint32_t>(Opcode::Assign));
    instruction.data.insert(instruction.data.end(), owner.begin(), owner.end());
    return instruction;
}

Instruction SystemProgram::transfer(const PublicKey& from, const PublicKey& to,
                                    Lamports lamports) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(from, true), AccountMeta::writable(to, false)};
    write_u32(instruction.data, static_cast<uint32_t>(Opcode::Transfer));
    write_u64(instruction.data, lamports);
    return instruction;
}

Instruction SystemProgram::allocate(const PublicKey& account, uint64_t space) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(account, true)};
    write_u32(instruction.data, static_cast<uint32_t>(Opcode::Allocate));
    write_u64(instruction.data, space);
    return instruction;
}

Lamports rent_exempt_minimum(size_t data_len) {
    // Account storage overhead, lamports per byte-year, exemption threshold in years
    constexpr Lamports ACCOUNT_STORAGE_OVERHEAD = 128;
    constexpr Lamports LAMPORTS_PER_BYTE_YEAR = 3480;
    constexpr Lamports EXEMPTION_THRESHOLD_YEARS = 2;
    return (ACCOUNT_STORAGE_OVERHEAD + static_cast<Lamports>(data_len)) *
           LAMPORTS_PER_BYTE_YEAR * EXEMPTION_THRESHOLD_YEARS;
}

// ExecutionEngine implementation
class ExecutionEngine::Impl {
public:
    std::vector<std::unique_ptr<BuiltinProgram>> builtin_programs_;
    uint64_t max_compute_units_ = 200000; // Default compute budget

    // Statistics
    uint64_t total_instructions_executed_ = 0;
    uint64_t total_compute_units_consumed_ = 0;

    const BuiltinProgram* find_program(const PublicKey& program_id) const {
        for (const auto& builtin : builtin_programs_) {
            if (builtin->get_program_id() == program_id) {
                return builtin.get();
            }
        }
        return nullptr;
    }
};

ExecutionEngine::ExecutionEngine() : impl_(std::make_unique<Impl>()) {
    // Register default system program
    register_builtin_program(std::make_unique<SystemProgram>());
}

ExecutionEngine::~ExecutionEngine() = default;

void ExecutionEngine::register_builtin_program(std::unique_ptr<BuiltinProgram> program) {
    LOG_DEBUG("svm", "Registered builtin program ", short_key(program->get_program_id()));
    impl_->builtin_programs_.push_back(std::move(program));
}

bool ExecutionEngine::is_program_loaded(const PublicKey& program_id) const {
    return impl_->find_program(program_id) != nullptr;
}

ExecutionOutcome ExecutionEngine::process_instruction(
    const Instruction& instruction,
    ExecutionContext& context,
    const std::unordered_set<PublicKey>& derived_signers) const {

    if (instruction.accounts.size() > MAX_INSTRUCTION_ACCOUNTS) {
        return ExecutionOutcome::failure(ExecutionResult::TOO_MANY_ACCOUNTS,
                                         "Instruction references " +
                                         std::to_string(instruction.accounts.size()) +
                                         " accounts, limit is " +
                                         std::to_string(MAX_INSTRUCTION_ACCOUNTS));
    }

    if (context.frames_.size() >= MAX_INVOKE_DEPTH) {
        return ExecutionOutcome::failure(ExecutionResult::CALL_DEPTH_EXCEEDED,
                                         "Cross-program invocation depth exceeded");
    }

    const BuiltinProgram* program = impl_->find_program(instruction.program_id);
    if (!program) {
        return ExecutionOutcome::failure(ExecutionResult::PROGRAM_NOT_FOUND,
                                         "Program not found: " + short_key(instruction.program_id));
    }

    if (!context.frames_.empty()) {
        // Only direct self-recursion may re-enter a program already on the stack
        for (size_t i = 0; i + 1 < context.frames_.size(); ++i) {
            if (context.frames_[i].program_id == instruction.program_id &&
                context.frames_.back().program_id != instruction.program_id) {
                return ExecutionOutcome::failure(ExecutionResult::REENTRANCY_NOT_ALLOWED,
                                                 "Cross-program invocation reentrancy");
            }
        }

        const Instruction& caller = *context.frames_.back().instruction;
        for (const auto& meta : instruction.accounts) {
            bool passed = std::any_of(caller.accounts.begin(), caller.accounts.end(),
                                      [&meta](const AccountMeta& m) {
                                          return m.pubkey == meta.pubkey;
                                      });
            if (!passed) {
                return ExecutionOutcome::failure(ExecutionResult::ACCOUNT_NOT_FOUND,
                                                 "Account not passed to caller: " +
                                                 short_key(meta.pubkey));
            }
            if (meta.is_writable && !is_meta_writable(caller, meta.pubkey)) {
                return ExecutionOutcome::failure(ExecutionResult::PRIVILEGE_ESCALATION,
                                                 "Writable privilege escalated: " +
                                                 short_key(meta.pubkey));
            }
            if (meta.is_signer && !is_meta_signer(caller, meta.pubkey) &&
                derived_signers.count(meta.pubkey) == 0) {
                return ExecutionOutcome::failure(ExecutionResult::PRIVILEGE_ESCALATION,
                                                 "Signer privilege escalated: " +
                                                 short_key(meta.pubkey));
            }
        }
    }

    // Unknown addresses load as empty system accounts
    for (const auto& meta : instruction.accounts) {
        if (context.accounts.find(meta.pubkey) == context.accounts.end()) {
            ProgramAccount empty;
            empty.pubkey = meta.pubkey;
            empty.owner = system_program_id();
            context.accounts.emplace(meta.pubkey, std::move(empty));
        }
    }

    ExecutionContext::Frame frame;
    frame.program_id = instruction.program_id;
    frame.instruction = &instruction;
    for (const auto& meta : instruction.accounts) {
        frame.pre_accounts[meta.pubkey] = context.accounts.at(meta.pubkey);
    }
    context.frames_.push_back(std::move(frame));

    ExecutionOutcome outcome = program->execute(instruction, context);
    context.consumed_compute_units += outcome.compute_units_consumed;

    if (outcome.is_success() && context.consumed_compute_units > context.max_compute_units) {
        outcome = ExecutionOutcome::failure(ExecutionResult::COMPUTE_BUDGET_EXCEEDED,
                                            "Transaction exceeded compute budget");
    }

    if (outcome.is_success()) {
        const auto& current = context.frames_.back();
        auto verified = verify_account_changes(current.program_id, instruction,
                                               current.pre_accounts, context.accounts);
        if (!verified.is_success()) {
            outcome = verified;
        }
    }

    context.frames_.pop_back();
    impl_->total_instructions_executed_++;

    return outcome;
}

ExecutionOutcome ExecutionEngine::execute_transaction(
    const std::vector<Instruction>& instructions,
    std::unordered_map<PublicKey, ProgramAccount>& accounts,
    const Clock& clock) {

    ExecutionContext context;
    context.accounts = accounts;
    context.clock = clock;
    context.max_compute_units = impl_->max_compute_units_;
    context.engine_ = this;

    // Runtime-provided accounts that never persist into the caller's store
    std::unordered_set<PublicKey> injected;
    for (const auto& builtin : impl_->builtin_programs_) {
        PublicKey id = builtin->get_program_id();
        if (context.accounts.find(id) == context.accounts.end()) {
            ProgramAccount program_account;
            program_account.pubkey = id;
            program_account.owner = native_loader_id();
            program_account.lamports = 1;
            program_account.executable = true;
            context.accounts.emplace(id, std::move(program_account));
            injected.insert(id);
        }
    }

    ProgramAccount clock_account;
    clock_account.pubkey = clock_sysvar_id();
    clock_account.owner = sysvar_owner_id();
    clock_account.lamports = 1;
    clock_account.data = clock.serialize();
    if (accounts.find(clock_account.pubkey) == accounts.end()) {
        injected.insert(clock_account.pubkey);
    }
    context.accounts[clock_account.pubkey] = clock_account;

    uint64_t lamports_before = 0;
    for (const auto& entry : context.accounts) {
        lamports_before += entry.second.lamports;
    }

    ExecutionOutcome final_outcome = ExecutionOutcome::success(0);

    for (const auto& instruction : instructions) {
        context.logs.push_back("Program " + short_key(instruction.program_id) + " invoke [1]");
        auto outcome = process_instruction(instruction, context, {});

        if (!outcome.is_success()) {
            final_outcome = outcome;
            final_outcome.compute_units_consumed = context.consumed_compute_units;
            context.logs.push_back("Program " + short_key(instruction.program_id) +
                                   " failed: " + outcome.error_details);
            final_outcome.logs = context.logs;
            impl_->total_compute_units_consumed_ += context.consumed_compute_units;

            LOG_SVM_WARN("Transaction rolled back", to_string(outcome.result),
                         {{"program", short_key(instruction.program_id)},
                          {"details", outcome.error_details}});
            return final_outcome;
        }

        context.logs.push_back("Program " + short_key(instruction.program_id) + " success");
    }

    uint64_t lamports_after = 0;
    for (const auto& entry : context.accounts) {
        lamports_after += entry.second.lamports;
    }
    if (lamports_before != lamports_after) {
        final_outcome = ExecutionOutcome::failure(ExecutionResult::UNBALANCED_INSTRUCTION,
                                                  "Transaction changed total lamports");
        final_outcome.logs = context.logs;
        LOG_SVM_WARN("Transaction rolled back", to_string(final_outcome.result));
        return final_outcome;
    }

    // Commit
    for (auto& [key, account] : context.accounts) {
        if (injected.count(key) > 0) {
            continue;
        }
        if (accounts.find(key) != accounts.end() || account.lamports > 0 ||
            !account.data.empty()) {
            accounts[key] = std::move(account);
        }
    }

    final_outcome.compute_units_consumed = context.consumed_compute_units;
    final_outcome.logs = std::move(context.logs);
    impl_->total_compute_units_consumed_ += final_outcome.compute_units_consumed;

    LOG_DEBUG("svm", "Committed transaction with ", instructions.size(),
              " instructions, ", final_outcome.compute_units_consumed, " compute units");
    return final_outcome;
}

void ExecutionEngine::set_compute_budget(uint64_t max_compute_units) {
    impl_->max_compute_units_ = max_compute_units;
    LOG_DEBUG("svm", "Set compute budget to ", max_compute_units, " units");
}

uint64_t ExecutionEngine::get_compute_budget() const {
    return impl_->max_compute_units_;
}

uint64_t ExecutionEngine::get_total_instructions_executed() const {
    return impl_->total_instructions_executed_;
}

uint64_t ExecutionEngine::get_total_compute_units_consumed() const {
    return impl_->total_compute_units_consumed_;
}

} // namespace svm
} // namespace solcino
