#include "raffle/processor.h"
#include "raffle/utils.h"
#include "raffle/vrf.h"
#include "svm/program_address.h"
#include "common/logging.h"
#include <limits>

namespace solcino {
namespace raffle {

using common::Lamports;
using svm::AccountMeta;
using svm::ExecutionContext;
using svm::ExecutionOutcome;
using svm::Instruction;
using svm::ProgramAccount;

namespace {

// Account slot checks. Slots are positional; the engine has already loaded
// every key the instruction names.

ProcessResult require_accounts(const Instruction& instruction, size_t count) {
    if (instruction.accounts.size() < count) {
        return fail(RaffleError::NotEnoughAccountKeys);
    }
    return ok();
}

ProcessResult require_signer(const Instruction& instruction, size_t index) {
    if (!instruction.accounts[index].is_signer) {
        return fail(RaffleError::MissingRequiredSignature);
    }
    return ok();
}

ProcessResult require_writable(const Instruction& instruction, size_t index) {
    if (!instruction.accounts[index].is_writable) {
        return fail(RaffleError::AccountNotWritable);
    }
    return ok();
}

ProcessResult require_key(const Instruction& instruction, size_t index,
                          const PublicKey& expected) {
    if (instruction.accounts[index].pubkey != expected) {
        return fail(RaffleError::InvalidAccountAddress);
    }
    return ok();
}

const PublicKey& key_at(const Instruction& instruction, size_t index) {
    return instruction.accounts[index].pubkey;
}

ProgramAccount* account_at(const Instruction& instruction, size_t index,
                           ExecutionContext& context) {
    return context.get_account(instruction.accounts[index].pubkey);
}

ProgramResult<UnixTimestamp> read_clock(const Instruction& instruction, size_t index,
                                        ExecutionContext& context) {
    using Now = ProgramResult<UnixTimestamp>;

    if (key_at(instruction, index) != svm::clock_sysvar_id()) {
        return Now(RaffleError::InvalidAccountAddress);
    }
    const ProgramAccount* account = account_at(instruction, index, context);
    if (!account) {
        return Now(RaffleError::NotEnoughAccountKeys);
    }
    auto clock = svm::Clock::deserialize(account->data);
    if (!clock.is_ok()) {
        return Now(RaffleError::MalformedAccount);
    }
    UnixTimestamp now = clock.value().unix_timestamp;
    return Now(now);
}

RaffleError from_system_failure(const ExecutionOutcome& outcome) {
    switch (outcome.result) {
        case svm::ExecutionResult::INSUFFICIENT_FUNDS:
            return RaffleError::InsufficientFunds;
        case svm::ExecutionResult::MISSING_SIGNATURE:
        case svm::ExecutionResult::PRIVILEGE_ESCALATION:
            return RaffleError::MissingRequiredSignature;
        case svm::ExecutionResult::ACCOUNT_ALREADY_IN_USE:
            return RaffleError::AlreadyInitialized;
        case svm::ExecutionResult::INVALID_ACCOUNT_MODIFICATION:
            return RaffleError::IncorrectProgramId;
        default:
            return RaffleError::InvalidInstruction;
    }
}

ProcessResult invoke_system(ExecutionContext& context, const Instruction& instruction,
                            const std::vector<svm::SignerSeeds>& signer_seeds = {}) {
    auto outcome = context.invoke(instruction, signer_seeds);
    if (!outcome.is_success()) {
        LOG_WARN("raffle", "System program call failed: ", svm::to_string(outcome.result),
                 " ", outcome.error_details);
        return fail(from_system_failure(outcome));
    }
    return ok();
}

bool checked_add(uint64_t a, uint64_t b, uint64_t& out) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

bool checked_mul(uint64_t a, uint64_t b, uint64_t& out) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

} // namespace

RaffleProgram::RaffleProgram(const common::ProgramSettings& settings)
    : RaffleProgram(settings.program_id, settings.randomness_program_id) {}

RaffleProgram::RaffleProgram(const PublicKey& program_id,
                             const PublicKey& randomness_program_id)
    : program_id_(program_id), randomness_program_id_(randomness_program_id) {
    auto found = find_config_address(program_id_);
    if (found.is_ok()) {
        config_address_ = found.value().first;
        config_bump_ = found.value().second;
    } else {
        LOG_ERROR("raffle", "No config address for program ", common::short_key(program_id_),
                  ": ", found.error());
    }
}

PublicKey RaffleProgram::get_program_id() const {
    return program_id_;
}

ExecutionOutcome RaffleProgram::execute(const Instruction& instruction,
                                        ExecutionContext& context) const {
    auto result = process(instruction, context);
    if (!result.is_ok()) {
        const RaffleError error = result.error();
        context.log("Error: " + describe(error));
        LOG_RAFFLE_REJECT(describe(error), to_string(error),
                          {{"code", std::to_string(error_code(error))},
                           {"program", common::short_key(program_id_)}});

        auto outcome = ExecutionOutcome::custom_failure(error_code(error), to_string(error));
        outcome.compute_units_consumed = COMPUTE_UNITS;
        return outcome;
    }
    return ExecutionOutcome::success(COMPUTE_UNITS);
}

ProcessResult RaffleProgram::process(const Instruction& instruction,
                                     ExecutionContext& context) const {
    auto decoded = unpack_instruction(instruction.data);
    if (!decoded.is_ok()) {
        return fail(decoded.error());
    }
    const RaffleInstruction& ix = decoded.value();
    const Opcode opcode = opcode_of(ix);

    context.log("Instruction: " + to_string(opcode));
    LOG_INFO("raffle", "Instruction: ", to_string(opcode));

    switch (opcode) {
        case Opcode::InitializeConfig:
            return process_initialize_config(std::get<InitializeConfig>(ix), instruction, context);
        case Opcode::InitializeRaffle:
            return process_initialize_raffle(std::get<InitializeRaffle>(ix), instruction, context);
        case Opcode::PurchaseTickets:
            return process_purchase_tickets(std::get<PurchaseTickets>(ix), instruction, context);
        case Opcode::CompleteRaffle:
            context.log("CompleteRaffle is deprecated, use CompleteRaffleWithVrf");
            return fail(RaffleError::DeprecatedInstruction);
        case Opcode::UpdateAdmin:
            return process_update_admin(instruction, context);
        case Opcode::UpdateFeeAddress:
            return process_update_fee_address(instruction, context);
        case Opcode::UpdateTicketPrice:
            return process_update_ticket_price(std::get<UpdateTicketPrice>(ix), instruction, context);
        case Opcode::UpdateFeePercentage:
            return process_update_fee_percentage(std::get<UpdateFeePercentage>(ix), instruction,
                                                 context);
        case Opcode::RequestRandomness:
            return process_request_randomness(instruction, context);
        case Opcode::CompleteRaffleWithVrf:
            return process_complete_raffle_with_vrf(instruction, context);
    }
    return fail(RaffleError::InvalidInstruction);
}

ProgramResult<Config> RaffleProgram::load_config(const Instruction& instruction, size_t index,
                                                 ExecutionContext& context) const {
    using Loaded = ProgramResult<Config>;

    if (key_at(instruction, index) != config_address_) {
        return Loaded(RaffleError::InvalidAccountAddress);
    }
    const ProgramAccount* account = account_at(instruction, index, context);
    if (!account || account->owner != program_id_) {
        return Loaded(RaffleError::ConfigNotInitialized);
    }
    auto config = Config::unpack(account->data);
    if (!config.is_ok() || !config.value().is_initialized) {
        return Loaded(RaffleError::ConfigNotInitialized);
    }
    return config;
}

ProgramResult<Raffle> RaffleProgram::load_raffle(const Instruction& instruction, size_t index,
                                                 ExecutionContext& context) const {
    using Loaded = ProgramResult<Raffle>;

    const ProgramAccount* account = account_at(instruction, index, context);
    if (!account) {
        return Loaded(RaffleError::NotEnoughAccountKeys);
    }
    if (account->owner != program_id_) {
        return Loaded(RaffleError::IncorrectProgramId);
    }
    auto raffle = Raffle::unpack(account->data);
    if (!raffle.is_ok()) {
        return raffle;
    }
    if (!raffle.value().is_initialized) {
        return Loaded(RaffleError::MalformedAccount);
    }
    return raffle;
}

ProcessResult RaffleProgram::create_program_account(const PublicKey& payer,
                                                    const PublicKey& address,
                                                    size_t space,
                                                    const std::vector<svm::SignerSeeds>& signer_seeds,
                                                    ExecutionContext& context) const {
    const ProgramAccount* account = context.get_account(address);
    if (!account) {
        return fail(RaffleError::NotEnoughAccountKeys);
    }
    const Lamports required = svm::rent_exempt_minimum(space);

    if (account->lamports == 0) {
        context.log("Creating program account " + common::to_hex(address));
        return invoke_system(context,
                             svm::SystemProgram::create_account(payer, address, required, space,
                                                                program_id_),
                             signer_seeds);
    }

    // Pre-funded address: top up, then allocate and assign under the derived signature
    if (account->lamports < required) {
        auto funded = invoke_system(context,
                                    svm::SystemProgram::transfer(payer, address,
                                                                 required - account->lamports));
        if (!funded) return funded;
    }
    auto allocated = invoke_system(context, svm::SystemProgram::allocate(address, space),
                                   signer_seeds);
    if (!allocated) return allocated;

    return invoke_system(context, svm::SystemProgram::assign(address, program_id_), signer_seeds);
}

ProcessResult RaffleProgram::process_initialize_config(const InitializeConfig& args,
                                                       const Instruction& instruction,
                                                       ExecutionContext& context) const {
    // 0 admin (s,w) 1 config (w) 2 treasury 3 system program
    auto check = require_accounts(instruction, 4);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 1))) return check;
    if (!(check = require_key(instruction, 1, config_address_))) return check;
    if (!(check = require_key(instruction, 3, svm::system_program_id()))) return check;

    const ProgramAccount* config_account = account_at(instruction, 1, context);
    if (!config_account) {
        return fail(RaffleError::NotEnoughAccountKeys);
    }

    if (config_account->owner == program_id_) {
        auto existing = Config::unpack(config_account->data);
        if (existing.is_ok() && existing.value().is_initialized) {
            return fail(RaffleError::AlreadyInitialized);
        }
    } else if (config_account->owner != svm::system_program_id()) {
        return fail(RaffleError::IncorrectProgramId);
    }

    if (args.fee_basis_points > MAX_FEE_BASIS_POINTS) {
        return fail(RaffleError::InvalidFeeBasisPoints);
    }

    if (config_account->owner != program_id_) {
        const std::vector<svm::SignerSeeds> signer_seeds = {
            {svm::seed_bytes(CONFIG_SEED), std::vector<uint8_t>{config_bump_}}};
        check = create_program_account(key_at(instruction, 0), config_address_, Config::LEN,
                                       signer_seeds, context);
        if (!check) return check;
    }

    Config config;
    config.is_initialized = true;
    config.admin = key_at(instruction, 0);
    config.treasury = key_at(instruction, 2);
    config.ticket_price = args.ticket_price;
    config.fee_basis_points = args.fee_basis_points;

    ProgramAccount* account = account_at(instruction, 1, context);
    if (!(check = config.pack_into(account->data))) return check;

    context.log("Config initialized: ticket price " + std::to_string(config.ticket_price) +
                " lamports, fee " + std::to_string(config.fee_basis_points) + " bp");
    LOG_DEBUG("raffle", "Config admin ", common::short_key(config.admin), " treasury ",
              common::short_key(config.treasury));
    return ok();
}

ProcessResult RaffleProgram::process_initialize_raffle(const InitializeRaffle& args,
                                                       const Instruction& instruction,
                                                       ExecutionContext& context) const {
    // 0 authority (s) 1 raffle (w) 2 config 3 system program 4 clock
    auto check = require_accounts(instruction, 5);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 1))) return check;

    auto config = load_config(instruction, 2, context);
    if (!config.is_ok()) return fail(config.error());

    if (!(check = require_key(instruction, 3, svm::system_program_id()))) return check;

    auto now = read_clock(instruction, 4, context);
    if (!now.is_ok()) return fail(now.error());

    if (args.duration == 0) {
        return fail(RaffleError::InvalidDuration);
    }

    ProgramAccount* raffle_account = account_at(instruction, 1, context);
    if (!raffle_account) {
        return fail(RaffleError::NotEnoughAccountKeys);
    }
    if (raffle_account->owner != program_id_) {
        return fail(RaffleError::IncorrectProgramId);
    }
    auto existing = Raffle::unpack(raffle_account->data);
    if (!existing.is_ok()) {
        return fail(existing.error());
    }
    if (existing.value().is_initialized) {
        return fail(RaffleError::AlreadyInitialized);
    }

    const uint64_t max_duration = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (args.duration > max_duration ||
        now.value() > std::numeric_limits<int64_t>::max() - static_cast<int64_t>(args.duration)) {
        return fail(RaffleError::ArithmeticOverflow);
    }

    Raffle raffle;
    raffle.is_initialized = true;
    raffle.authority = key_at(instruction, 0);
    raffle.title = args.title;
    raffle.end_time = now.value() + static_cast<int64_t>(args.duration);
    raffle.status = RaffleStatus::Active;
    if (!(check = raffle.pack_into(raffle_account->data))) return check;

    context.log("Raffle \"" + title_to_string(raffle.title) + "\" ends at " +
                std::to_string(raffle.end_time));
    return ok();
}

ProcessResult RaffleProgram::process_purchase_tickets(const PurchaseTickets& args,
                                                      const Instruction& instruction,
                                                      ExecutionContext& context) const {
    // 0 purchaser (s,w) 1 raffle (w) 2 ticket purchase (s,w) 3 treasury (w)
    // 4 config 5 system program 6 clock 7 purchase index (w)
    auto check = require_accounts(instruction, 8);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 1))) return check;
    if (!(check = require_writable(instruction, 2))) return check;
    if (!(check = require_signer(instruction, 2))) return check;
    if (!(check = require_writable(instruction, 3))) return check;
    if (!(check = require_writable(instruction, 7))) return check;

    if (args.ticket_count == 0) {
        return fail(RaffleError::InvalidTicketCount);
    }

    auto config = load_config(instruction, 4, context);
    if (!config.is_ok()) return fail(config.error());

    if (!(check = require_key(instruction, 3, config.value().treasury))) return check;
    if (!(check = require_key(instruction, 5, svm::system_program_id()))) return check;

    auto now = read_clock(instruction, 6, context);
    if (!now.is_ok()) return fail(now.error());

    auto loaded = load_raffle(instruction, 1, context);
    if (!loaded.is_ok()) return fail(loaded.error());
    Raffle raffle = loaded.value();

    if (raffle.status != RaffleStatus::Active) {
        return fail(RaffleError::RaffleNotActive);
    }
    if (now.value() >= raffle.end_time) {
        return fail(RaffleError::RaffleEnded);
    }

    uint64_t total_price = 0;
    if (!checked_mul(config.value().ticket_price, args.ticket_count, total_price)) {
        return fail(RaffleError::ArithmeticOverflow);
    }
    uint64_t tickets_sold = 0;
    if (!checked_add(raffle.tickets_sold, args.ticket_count, tickets_sold)) {
        return fail(RaffleError::ArithmeticOverflow);
    }

    auto fee = calculate_fee(total_price, config.value().fee_basis_points);
    if (!fee.is_ok()) return fail(fee.error());
    const uint64_t fee_amount = fee.value();
    const uint64_t pool_amount = total_price - fee_amount;

    const PublicKey& purchaser_key = key_at(instruction, 0);
    const PublicKey& raffle_key = key_at(instruction, 1);
    const PublicKey& ticket_key = key_at(instruction, 2);
    const PublicKey& treasury_key = key_at(instruction, 3);
    const PublicKey& index_key = key_at(instruction, 7);

    const ProgramAccount* purchaser = account_at(instruction, 0, context);
    const ProgramAccount* ticket_account = account_at(instruction, 2, context);
    const ProgramAccount* index_account = account_at(instruction, 7, context);
    if (!purchaser || !ticket_account || !index_account) {
        return fail(RaffleError::NotEnoughAccountKeys);
    }

    // Ticket records are written once into a fresh account
    if (ticket_account->owner == program_id_) {
        return fail(RaffleError::AlreadyInitialized);
    }
    if (ticket_account->owner != svm::system_program_id()) {
        return fail(RaffleError::IncorrectProgramId);
    }
    if (ticket_account->data.size() < TicketPurchase::LEN) {
        context.log("Ticket purchase account needs " + std::to_string(TicketPurchase::LEN) +
                    " bytes");
        return fail(RaffleError::MalformedAccount);
    }
    if (ticket_account->lamports < svm::rent_exempt_minimum(ticket_account->data.size())) {
        context.log("Ticket purchase account is not rent exempt");
        return fail(RaffleError::InsufficientFunds);
    }

    // Ticket ranges in creation order; the raffle's first purchase creates the index
    auto index_address = find_purchase_index_address(program_id_, raffle_key);
    if (!index_address.is_ok()) {
        return fail(RaffleError::InvalidAccountAddress);
    }
    if (!(check = require_key(instruction, 7, index_address.value().first))) return check;

    PurchaseIndex index;
    index.raffle = raffle_key;
    const bool index_exists = index_account->owner == program_id_;
    if (index_exists) {
        auto existing = PurchaseIndex::unpack(index_account->data);
        if (!existing.is_ok()) return fail(existing.error());
        index = existing.value();
    } else if (index_account->owner != svm::system_program_id()) {
        return fail(RaffleError::IncorrectProgramId);
    }
    if (index.raffle != raffle_key || index.next_ticket() != raffle.tickets_sold) {
        context.log("Purchase index does not match the raffle's ticket count");
        return fail(RaffleError::MalformedAccount);
    }

    const size_t index_len = PurchaseIndex::space_for(index.entries.size() + 1);
    if (index_len > svm::SystemProgram::MAX_PERMITTED_DATA_LENGTH) {
        return fail(RaffleError::PurchaseIndexFull);
    }
    const Lamports index_rent = svm::rent_exempt_minimum(index_len);
    const Lamports index_top_up =
        index_account->lamports < index_rent ? index_rent - index_account->lamports : 0;

    uint64_t total_debit = 0;
    if (!checked_add(total_price, index_top_up, total_debit)) {
        return fail(RaffleError::ArithmeticOverflow);
    }
    if (purchaser->lamports < total_debit) {
        context.log("Insufficient funds: needed " + std::to_string(total_debit) +
                    " lamports, had " + std::to_string(purchaser->lamports));
        return fail(RaffleError::InsufficientFunds);
    }

    LOG_DEBUG("raffle", "Purchase of ", args.ticket_count, " tickets: total ", total_price,
              " fee ", fee_amount, " pool ", pool_amount);

    if (fee_amount > 0) {
        check = invoke_system(context,
                              svm::SystemProgram::transfer(purchaser_key, treasury_key, fee_amount));
        if (!check) return check;
    }
    if (pool_amount > 0) {
        check = invoke_system(context,
                              svm::SystemProgram::transfer(purchaser_key, raffle_key, pool_amount));
        if (!check) return check;
    }
    if (!(check = invoke_system(context, svm::SystemProgram::assign(ticket_key, program_id_)))) {
        return check;
    }

    if (!index_exists) {
        const std::vector<svm::SignerSeeds> signer_seeds = {
            {svm::seed_bytes(PURCHASE_INDEX_SEED), raffle_key,
             std::vector<uint8_t>{index_address.value().second}}};
        check = create_program_account(purchaser_key, index_key, PurchaseIndex::space_for(0),
                                       signer_seeds, context);
        if (!check) return check;
    }
    const Lamports index_balance = account_at(instruction, 7, context)->lamports;
    if (index_balance < index_rent) {
        check = invoke_system(context, svm::SystemProgram::transfer(purchaser_key, index_key,
                                                                    index_rent - index_balance));
        if (!check) return check;
    }

    PurchaseIndexEntry entry;
    entry.ticket_purchase = ticket_key;
    entry.first_ticket = raffle.tickets_sold;
    entry.ticket_count = args.ticket_count;
    index.entries.push_back(entry);

    ProgramAccount* index_data = account_at(instruction, 7, context);
    index_data->data.resize(index_len, 0);
    if (!(check = index.pack_into(index_data->data))) return check;

    TicketPurchase purchase;
    purchase.is_initialized = true;
    purchase.raffle = raffle_key;
    purchase.purchaser = purchaser_key;
    purchase.ticket_count = args.ticket_count;
    purchase.purchase_time = now.value();
    if (!(check = purchase.pack_into(account_at(instruction, 2, context)->data))) return check;

    raffle.tickets_sold = tickets_sold;
    if (!(check = raffle.pack_into(account_at(instruction, 1, context)->data))) return check;

    context.log("Purchased " + std::to_string(args.ticket_count) + " tickets for " +
                std::to_string(total_price) + " lamports (fee " + std::to_string(fee_amount) +
                ", pool " + lamports_to_sol_string(pool_amount) + " SOL)");
    return ok();
}

ProcessResult RaffleProgram::process_update_admin(const Instruction& instruction,
                                                  ExecutionContext& context) const {
    // 0 admin (s) 1 new admin 2 config (w)
    auto check = require_accounts(instruction, 3);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 2))) return check;

    auto loaded = load_config(instruction, 2, context);
    if (!loaded.is_ok()) return fail(loaded.error());
    Config config = loaded.value();

    if (config.admin != key_at(instruction, 0)) {
        return fail(RaffleError::Unauthorized);
    }

    config.admin = key_at(instruction, 1);
    if (!(check = config.pack_into(account_at(instruction, 2, context)->data))) return check;

    context.log("Admin updated to " + common::to_hex(config.admin));
    return ok();
}

ProcessResult RaffleProgram::process_update_fee_address(const Instruction& instruction,
                                                        ExecutionContext& context) const {
    // 0 admin (s) 1 new treasury 2 config (w)
    auto check = require_accounts(instruction, 3);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 2))) return check;

    auto loaded = load_config(instruction, 2, context);
    if (!loaded.is_ok()) return fail(loaded.error());
    Config config = loaded.value();

    if (config.admin != key_at(instruction, 0)) {
        return fail(RaffleError::Unauthorized);
    }

    config.treasury = key_at(instruction, 1);
    if (!(check = config.pack_into(account_at(instruction, 2, context)->data))) return check;

    context.log("Treasury updated to " + common::to_hex(config.treasury));
    return ok();
}

ProcessResult RaffleProgram::process_update_ticket_price(const UpdateTicketPrice& args,
                                                         const Instruction& instruction,
                                                         ExecutionContext& context) const {
    // 0 admin (s) 1 config (w)
    auto check = require_accounts(instruction, 2);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 1))) return check;

    auto loaded = load_config(instruction, 1, context);
    if (!loaded.is_ok()) return fail(loaded.error());
    Config config = loaded.value();

    if (config.admin != key_at(instruction, 0)) {
        return fail(RaffleError::Unauthorized);
    }
    if (args.new_price == 0) {
        return fail(RaffleError::InvalidTicketPrice);
    }

    LOG_DEBUG("raffle", "Ticket price ", config.ticket_price, " -> ", args.new_price);
    config.ticket_price = args.new_price;
    if (!(check = config.pack_into(account_at(instruction, 1, context)->data))) return check;

    context.log("Ticket price updated to " + std::to_string(config.ticket_price) + " lamports");
    return ok();
}

ProcessResult RaffleProgram::process_update_fee_percentage(const UpdateFeePercentage& args,
                                                           const Instruction& instruction,
                                                           ExecutionContext& context) const {
    // 0 admin (s) 1 config (w)
    auto check = require_accounts(instruction, 2);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 1))) return check;

    auto loaded = load_config(instruction, 1, context);
    if (!loaded.is_ok()) return fail(loaded.error());
    Config config = loaded.value();

    if (config.admin != key_at(instruction, 0)) {
        return fail(RaffleError::Unauthorized);
    }
    if (args.new_fee_basis_points > MAX_FEE_BASIS_POINTS) {
        return fail(RaffleError::InvalidFeeBasisPoints);
    }

    config.fee_basis_points = args.new_fee_basis_points;
    if (!(check = config.pack_into(account_at(instruction, 1, context)->data))) return check;

    context.log("Fee updated to " + std::to_string(config.fee_basis_points) + " bp");
    return ok();
}

ProcessResult RaffleProgram::process_request_randomness(const Instruction& instruction,
                                                        ExecutionContext& context) const {
    // 0 authority (s) 1 raffle (w) 2 vrf (w) 3 payer (s,w) 4 randomness program
    // 5 clock 6.. forwarded to the randomness service
    auto check = require_accounts(instruction, 6);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 1))) return check;
    if (!(check = require_writable(instruction, 2))) return check;
    if (!(check = require_signer(instruction, 3))) return check;
    if (!(check = require_writable(instruction, 3))) return check;
    if (!(check = require_key(instruction, 4, randomness_program_id_))) return check;

    auto now = read_clock(instruction, 5, context);
    if (!now.is_ok()) return fail(now.error());

    auto loaded = load_raffle(instruction, 1, context);
    if (!loaded.is_ok()) return fail(loaded.error());
    Raffle raffle = loaded.value();

    if (raffle.authority != key_at(instruction, 0)) {
        return fail(RaffleError::Unauthorized);
    }

    const std::vector<AccountMeta> forwarded(instruction.accounts.begin() + 6,
                                             instruction.accounts.end());
    check = vrf::request(context, randomness_program_id_, key_at(instruction, 1), raffle,
                         key_at(instruction, 2), key_at(instruction, 3), now.value(), forwarded);
    if (!check) return check;

    return raffle.pack_into(account_at(instruction, 1, context)->data);
}

ProgramResult<PublicKey> RaffleProgram::resolve_winner(const Instruction& instruction,
                                                       const PublicKey& raffle_key,
                                                       const Raffle& raffle,
                                                       const std::vector<uint8_t>& random_value,
                                                       ExecutionContext& context) const {
    using Winner = ProgramResult<PublicKey>;

    auto index_address = find_purchase_index_address(program_id_, raffle_key);
    if (!index_address.is_ok() || key_at(instruction, 6) != index_address.value().first) {
        return Winner(RaffleError::InvalidAccountAddress);
    }
    const ProgramAccount* index_account = account_at(instruction, 6, context);
    const ProgramAccount* record_account = account_at(instruction, 7, context);
    if (!index_account || !record_account) {
        return Winner(RaffleError::NotEnoughAccountKeys);
    }
    if (index_account->owner != program_id_) {
        return Winner(RaffleError::IncorrectProgramId);
    }
    auto loaded = PurchaseIndex::unpack(index_account->data);
    if (!loaded.is_ok()) {
        return Winner(loaded.error());
    }
    const PurchaseIndex& index = loaded.value();
    if (index.raffle != raffle_key || index.next_ticket() != raffle.tickets_sold) {
        return Winner(RaffleError::MalformedAccount);
    }

    auto ticket = random_index(random_value, raffle.tickets_sold);
    if (!ticket.is_ok()) {
        return Winner(ticket.error());
    }
    const PurchaseIndexEntry* entry = index.find(ticket.value());
    if (!entry) {
        return Winner(RaffleError::MalformedAccount);
    }

    // The supplied record must be the one whose range holds the drawn ticket
    const PublicKey& record_key = key_at(instruction, 7);
    if (record_key != entry->ticket_purchase) {
        context.log("Winning ticket " + std::to_string(ticket.value()) + " belongs to purchase " +
                    common::to_hex(entry->ticket_purchase));
        return Winner(RaffleError::InvalidWinnerAccount);
    }
    if (record_account->owner != program_id_) {
        return Winner(RaffleError::InvalidWinnerAccount);
    }
    auto record = TicketPurchase::unpack(record_account->data);
    if (!record.is_ok() || !record.value().is_initialized ||
        record.value().raffle != raffle_key ||
        record.value().ticket_count != entry->ticket_count) {
        return Winner(RaffleError::InvalidWinnerAccount);
    }

    context.log("Winning ticket " + std::to_string(ticket.value()) + " held by " +
                common::to_hex(record.value().purchaser));
    return Winner(record.value().purchaser);
}

ProcessResult RaffleProgram::process_complete_raffle_with_vrf(const Instruction& instruction,
                                                              ExecutionContext& context) const {
    // 0 authority (s) 1 raffle (w) 2 vrf 3 winner (w) 4 randomness program
    // 5 clock 6 purchase index 7 winning ticket purchase
    auto check = require_accounts(instruction, 8);
    if (!check) return check;
    if (!(check = require_signer(instruction, 0))) return check;
    if (!(check = require_writable(instruction, 1))) return check;
    if (!(check = require_writable(instruction, 3))) return check;
    if (!(check = require_key(instruction, 4, randomness_program_id_))) return check;

    auto now = read_clock(instruction, 5, context);
    if (!now.is_ok()) return fail(now.error());

    auto loaded = load_raffle(instruction, 1, context);
    if (!loaded.is_ok()) return fail(loaded.error());
    Raffle raffle = loaded.value();
    const PublicKey& raffle_key = key_at(instruction, 1);

    if (raffle.status == RaffleStatus::Complete) {
        return fail(RaffleError::AlreadyComplete);
    }
    if (raffle.authority != key_at(instruction, 0)) {
        return fail(RaffleError::Unauthorized);
    }
    if (!raffle.vrf_request_in_progress) {
        return fail(RaffleError::RandomnessNotRequested);
    }

    const ProgramAccount* vrf_account = account_at(instruction, 2, context);
    if (!vrf_account) {
        return fail(RaffleError::NotEnoughAccountKeys);
    }
    auto random = vrf::extract_result(*vrf_account, randomness_program_id_, raffle_key, raffle);
    if (!random.is_ok()) return fail(random.error());

    if (raffle.tickets_sold == 0) {
        return fail(RaffleError::NoTicketsSold);
    }

    const std::vector<uint8_t> random_bytes(random.value().begin(), random.value().end());
    auto winner = resolve_winner(instruction, raffle_key, raffle, random_bytes, context);
    if (!winner.is_ok()) return fail(winner.error());

    if (key_at(instruction, 3) != winner.value()) {
        context.log("Winner account does not match drawn purchaser");
        return fail(RaffleError::InvalidWinnerAccount);
    }

    ProgramAccount* raffle_account = account_at(instruction, 1, context);
    ProgramAccount* winner_account = account_at(instruction, 3, context);
    if (!raffle_account || !winner_account) {
        return fail(RaffleError::NotEnoughAccountKeys);
    }

    const Lamports prize = raffle_account->lamports;
    Lamports winner_balance = 0;
    if (!checked_add(winner_account->lamports, prize, winner_balance)) {
        return fail(RaffleError::ArithmeticOverflow);
    }

    raffle.status = RaffleStatus::Complete;
    raffle.winner = winner.value();
    raffle.vrf_request_in_progress = false;
    if (!(check = raffle.pack_into(raffle_account->data))) return check;

    raffle_account->lamports = 0;
    winner_account->lamports = winner_balance;

    context.log("Raffle complete, " + lamports_to_sol_string(prize) + " SOL paid to " +
                common::to_hex(raffle.winner));
    LOG_INFO("raffle", "Raffle ", common::short_key(raffle_key), " won by ",
             common::short_key(raffle.winner), " for ", prize, " lamports");
    return ok();
}

} // namespace raffle
} // namespace solcino
