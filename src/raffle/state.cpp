#include "raffle/state.h"
#include "byte_io.h"
#include <algorithm>
#include <limits>

namespace solcino {
namespace raffle {

using namespace byte_io;

namespace {

// Writers assume `p` has room for the record's LEN bytes

void encode(const Config& config, uint8_t* p) {
    p[0] = config.is_initialized ? 1 : 0;
    write_key(p + 1, config.admin);
    write_key(p + 33, config.treasury);
    write_u64(p + 65, config.ticket_price);
    write_u16(p + 73, config.fee_basis_points);
}

void encode(const Raffle& raffle, uint8_t* p) {
    p[0] = raffle.is_initialized ? 1 : 0;
    write_key(p + 1, raffle.authority);
    std::copy(raffle.title.begin(), raffle.title.end(), p + 33);
    write_i64(p + 65, raffle.end_time);
    p[73] = static_cast<uint8_t>(raffle.status);
    write_key(p + 74, raffle.winner);
    write_u64(p + 106, raffle.tickets_sold);
    write_key(p + 114, raffle.vrf_account);
    p[146] = raffle.vrf_request_in_progress ? 1 : 0;
}

void encode(const TicketPurchase& purchase, uint8_t* p) {
    p[0] = purchase.is_initialized ? 1 : 0;
    write_key(p + 1, purchase.raffle);
    write_key(p + 33, purchase.purchaser);
    write_u64(p + 65, purchase.ticket_count);
    write_i64(p + 73, purchase.purchase_time);
}

void encode(const PurchaseIndex& index, uint8_t* p) {
    write_key(p, index.raffle);
    write_u64(p + 32, index.entries.size());
    p += PurchaseIndex::HEADER_LEN;
    for (const auto& entry : index.entries) {
        write_key(p, entry.ticket_purchase);
        write_u64(p + 32, entry.first_ticket);
        write_u64(p + 40, entry.ticket_count);
        p += PurchaseIndex::ENTRY_LEN;
    }
}

} // namespace

Title make_title(const std::string& text) {
    Title title{};
    std::copy_n(text.begin(), std::min(text.size(), title.size()), title.begin());
    return title;
}

std::string title_to_string(const Title& title) {
    auto end = std::find(title.begin(), title.end(), 0);
    return std::string(title.begin(), end);
}

std::string to_string(RaffleStatus status) {
    switch (status) {
        case RaffleStatus::Active: return "Active";
        case RaffleStatus::Complete: return "Complete";
    }
    return "Unknown";
}

// Config

std::vector<uint8_t> Config::pack() const {
    std::vector<uint8_t> data(LEN, 0);
    encode(*this, data.data());
    return data;
}

ProcessResult Config::pack_into(std::vector<uint8_t>& data) const {
    if (data.size() < LEN) {
        return fail(RaffleError::MalformedAccount);
    }
    encode(*this, data.data());
    return ok();
}

ProgramResult<Config> Config::unpack(const std::vector<uint8_t>& data) {
    if (data.size() < LEN) {
        return ProgramResult<Config>(RaffleError::MalformedAccount);
    }
    const uint8_t* p = data.data();
    Config config;
    config.is_initialized = p[0] != 0;
    config.admin = read_key(p + 1);
    config.treasury = read_key(p + 33);
    config.ticket_price = read_u64(p + 65);
    config.fee_basis_points = read_u16(p + 73);
    return ProgramResult<Config>(config);
}

bool Config::operator==(const Config& other) const {
    return is_initialized == other.is_initialized && admin == other.admin &&
           treasury == other.treasury && ticket_price == other.ticket_price &&
           fee_basis_points == other.fee_basis_points;
}

// Raffle

std::vector<uint8_t> Raffle::pack() const {
    std::vector<uint8_t> data(LEN, 0);
    encode(*this, data.data());
    return data;
}

ProcessResult Raffle::pack_into(std::vector<uint8_t>& data) const {
    if (data.size() < LEN) {
        return fail(RaffleError::MalformedAccount);
    }
    encode(*this, data.data());
    return ok();
}

ProgramResult<Raffle> Raffle::unpack(const std::vector<uint8_t>& data) {
    if (data.size() < LEN) {
        return ProgramResult<Raffle>(RaffleError::MalformedAccount);
    }
    const uint8_t* p = data.data();

    if (p[73] > static_cast<uint8_t>(RaffleStatus::Complete)) {
        return ProgramResult<Raffle>(RaffleError::MalformedAccount);
    }

    Raffle raffle;
    raffle.is_initialized = p[0] != 0;
    raffle.authority = read_key(p + 1);
    std::copy(p + 33, p + 65, raffle.title.begin());
    raffle.end_time = read_i64(p + 65);
    raffle.status = static_cast<RaffleStatus>(p[73]);
    raffle.winner = read_key(p + 74);
    raffle.tickets_sold = read_u64(p + 106);
    raffle.vrf_account = read_key(p + 114);
    raffle.vrf_request_in_progress = p[146] != 0;
    return ProgramResult<Raffle>(raffle);
}

bool Raffle::operator==(const Raffle& other) const {
    return is_initialized == other.is_initialized && authority == other.authority &&
           title == other.title && end_time == other.end_time &&
           status == other.status && winner == other.winner &&
           tickets_sold == other.tickets_sold && vrf_account == other.vrf_account &&
           vrf_request_in_progress == other.vrf_request_in_progress;
}

// TicketPurchase

std::vector<uint8_t> TicketPurchase::pack() const {
    std::vector<uint8_t> data(LEN, 0);
    encode(*this, data.data());
    return data;
}

ProcessResult TicketPurchase::pack_into(std::vector<uint8_t>& data) const {
    if (data.size() < LEN) {
        return fail(RaffleError::MalformedAccount);
    }
    encode(*this, data.data());
    return ok();
}

ProgramResult<TicketPurchase> TicketPurchase::unpack(const std::vector<uint8_t>& data) {
    if (data.size() < LEN) {
        return ProgramResult<TicketPurchase>(RaffleError::MalformedAccount);
    }
    const uint8_t* p = data.data();
    TicketPurchase purchase;
    purchase.is_initialized = p[0] != 0;
    purchase.raffle = read_key(p + 1);
    purchase.purchaser = read_key(p + 33);
    purchase.ticket_count = read_u64(p + 65);
    purchase.purchase_time = read_i64(p + 73);
    return ProgramResult<TicketPurchase>(purchase);
}

bool TicketPurchase::operator==(const TicketPurchase& other) const {
    return is_initialized == other.is_initialized && raffle == other.raffle &&
           purchaser == other.purchaser && ticket_count == other.ticket_count &&
           purchase_time == other.purchase_time;
}

// PurchaseIndex

bool PurchaseIndexEntry::operator==(const PurchaseIndexEntry& other) const {
    return ticket_purchase == other.ticket_purchase && first_ticket == other.first_ticket &&
           ticket_count == other.ticket_count;
}

uint64_t PurchaseIndex::next_ticket() const {
    if (entries.empty()) {
        return 0;
    }
    return entries.back().first_ticket + entries.back().ticket_count;
}

const PurchaseIndexEntry* PurchaseIndex::find(uint64_t ticket) const {
    // Ranges are contiguous and ascending: last entry starting at or before `ticket`
    auto it = std::upper_bound(entries.begin(), entries.end(), ticket,
                               [](uint64_t value, const PurchaseIndexEntry& entry) {
                                   return value < entry.first_ticket;
                               });
    if (it == entries.begin()) {
        return nullptr;
    }
    --it;
    return it->contains(ticket) ? &*it : nullptr;
}

std::vector<uint8_t> PurchaseIndex::pack() const {
    std::vector<uint8_t> data(space_for(entries.size()), 0);
    encode(*this, data.data());
    return data;
}

ProcessResult PurchaseIndex::pack_into(std::vector<uint8_t>& data) const {
    if (data.size() < space_for(entries.size())) {
        return fail(RaffleError::MalformedAccount);
    }
    encode(*this, data.data());
    return ok();
}

ProgramResult<PurchaseIndex> PurchaseIndex::unpack(const std::vector<uint8_t>& data) {
    using Loaded = ProgramResult<PurchaseIndex>;

    if (data.size() < HEADER_LEN) {
        return Loaded(RaffleError::MalformedAccount);
    }
    const uint8_t* p = data.data();
    const uint64_t count = read_u64(p + 32);
    if (count > (data.size() - HEADER_LEN) / ENTRY_LEN) {
        return Loaded(RaffleError::MalformedAccount);
    }

    PurchaseIndex index;
    index.raffle = read_key(p);
    index.entries.reserve(count);
    p += HEADER_LEN;
    uint64_t expected_first = 0;
    for (uint64_t i = 0; i < count; ++i, p += ENTRY_LEN) {
        PurchaseIndexEntry entry;
        entry.ticket_purchase = read_key(p);
        entry.first_ticket = read_u64(p + 32);
        entry.ticket_count = read_u64(p + 40);
        if (entry.first_ticket != expected_first || entry.ticket_count == 0 ||
            entry.ticket_count > std::numeric_limits<uint64_t>::max() - expected_first) {
            return Loaded(RaffleError::MalformedAccount);
        }
        expected_first += entry.ticket_count;
        index.entries.push_back(std::move(entry));
    }
    return Loaded(index);
}

bool PurchaseIndex::operator==(const PurchaseIndex& other) const {
    return raffle == other.raffle && entries == other.entries;
}

} // namespace raffle
} // namespace solcino
