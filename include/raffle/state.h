#pragma once

#include "common/types.h"
#include "raffle/error.h"
#include <array>
#include <string>
#include <cstdint>
#include <vector>

namespace solcino {
namespace raffle {

using common::PublicKey;
using common::UnixTimestamp;

/// 32 opaque title bytes, zero padded
using Title = std::array<uint8_t, 32>;

Title make_title(const std::string& text);
std::string title_to_string(const Title& title);

enum class RaffleStatus : uint8_t {
    Active = 0,
    Complete = 1
};

std::string to_string(RaffleStatus status);

/**
 * @brief Program-wide singleton stored at the "config" program address
 *
 * Layout (75 bytes): is_initialized u8 | admin [32] | treasury [32] |
 * ticket_price u64 | fee_basis_points u16
 */
struct Config {
    static constexpr size_t LEN = 75;

    bool is_initialized = false;
    PublicKey admin = PublicKey(common::PUBKEY_BYTES, 0);
    PublicKey treasury = PublicKey(common::PUBKEY_BYTES, 0);
    uint64_t ticket_price = 0;
    uint16_t fee_basis_points = 0;

    std::vector<uint8_t> pack() const;
    /// Overwrite the first LEN bytes of `data`; MalformedAccount if it is shorter
    ProcessResult pack_into(std::vector<uint8_t>& data) const;
    static ProgramResult<Config> unpack(const std::vector<uint8_t>& data);

    bool operator==(const Config& other) const;
    bool operator!=(const Config& other) const { return !(*this == other); }
};

/**
 * @brief One raffle and its prize pool
 *
 * Layout (147 bytes): is_initialized u8 | authority [32] | title [32] |
 * end_time i64 | status u8 | winner [32] | tickets_sold u64 |
 * vrf_account [32] | vrf_request_in_progress u8
 */
struct Raffle {
    static constexpr size_t LEN = 147;

    bool is_initialized = false;
    PublicKey authority = PublicKey(common::PUBKEY_BYTES, 0);
    Title title{};
    UnixTimestamp end_time = 0;
    RaffleStatus status = RaffleStatus::Active;
    PublicKey winner = PublicKey(common::PUBKEY_BYTES, 0);
    uint64_t tickets_sold = 0;
    PublicKey vrf_account = PublicKey(common::PUBKEY_BYTES, 0);
    bool vrf_request_in_progress = false;

    std::vector<uint8_t> pack() const;
    ProcessResult pack_into(std::vector<uint8_t>& data) const;
    static ProgramResult<Raffle> unpack(const std::vector<uint8_t>& data);

    bool operator==(const Raffle& other) const;
    bool operator!=(const Raffle& other) const { return !(*this == other); }
};

/**
 * @brief Immutable record of one ticket purchase
 *
 * Layout (81 bytes): is_initialized u8 | raffle [32] | purchaser [32] |
 * ticket_count u64 | purchase_time i64
 */
struct TicketPurchase {
    static constexpr size_t LEN = 81;

    bool is_initialized = false;
    PublicKey raffle = PublicKey(common::PUBKEY_BYTES, 0);
    PublicKey purchaser = PublicKey(common::PUBKEY_BYTES, 0);
    uint64_t ticket_count = 0;
    UnixTimestamp purchase_time = 0;

    std::vector<uint8_t> pack() const;
    ProcessResult pack_into(std::vector<uint8_t>& data) const;
    static ProgramResult<TicketPurchase> unpack(const std::vector<uint8_t>& data);

    bool operator==(const TicketPurchase& other) const;
    bool operator!=(const TicketPurchase& other) const { return !(*this == other); }
};

/// One purchase's slice of the raffle's ticket sequence: [first_ticket, first_ticket + ticket_count)
struct PurchaseIndexEntry {
    PublicKey ticket_purchase = PublicKey(common::PUBKEY_BYTES, 0);
    uint64_t first_ticket = 0;
    uint64_t ticket_count = 0;

    bool contains(uint64_t ticket) const {
        return ticket >= first_ticket && ticket - first_ticket < ticket_count;
    }

    bool operator==(const PurchaseIndexEntry& other) const;
};

/**
 * @brief Ticket ranges of one raffle in creation order
 *
 * Lives at the "purchases" program address of the raffle and grows by one
 * entry per PurchaseTickets, so completion can locate the winning record
 * without enumerating every purchase.
 *
 * Layout (40 + 48n bytes): raffle [32] | entry_count u64 |
 * entry_count x (ticket_purchase [32] | first_ticket u64 | ticket_count u64)
 */
struct PurchaseIndex {
    static constexpr size_t HEADER_LEN = 40;
    static constexpr size_t ENTRY_LEN = 48;

    PublicKey raffle = PublicKey(common::PUBKEY_BYTES, 0);
    std::vector<PurchaseIndexEntry> entries;

    static constexpr size_t space_for(size_t entry_count) {
        return HEADER_LEN + entry_count * ENTRY_LEN;
    }

    /// Tickets covered so far; equals the raffle's tickets_sold
    uint64_t next_ticket() const;

    /// Entry whose range holds `ticket`, or nullptr past the end
    const PurchaseIndexEntry* find(uint64_t ticket) const;

    std::vector<uint8_t> pack() const;
    /// MalformedAccount if `data` is shorter than space_for(entries.size())
    ProcessResult pack_into(std::vector<uint8_t>& data) const;
    /// Fails when the declared entry count runs past the data or the ranges are not contiguous
    static ProgramResult<PurchaseIndex> unpack(const std::vector<uint8_t>& data);

    bool operator==(const PurchaseIndex& other) const;
    bool operator!=(const PurchaseIndex& other) const { return !(*this == other); }
};

} // namespace raffle
} // namespace solcino
