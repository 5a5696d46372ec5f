#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace solcino {
namespace common {

// Account addresses and hashes are raw 32-byte vectors
using Hash = std::vector<uint8_t>;
using PublicKey = std::vector<uint8_t>;

using Slot = uint64_t;
using Epoch = uint64_t;

/// 1 SOL = 1,000,000,000 lamports
using Lamports = uint64_t;

/// Seconds since the unix epoch as reported by the clock sysvar (signed)
using UnixTimestamp = int64_t;

constexpr size_t PUBKEY_BYTES = 32;

/**
 * @brief Either a value of type T or an error of type E
 *
 * The string error is used by configuration and the runtime. Raffle code
 * instantiates it with RaffleError so every failure carries a stable code:
 *
 * @code
 * auto raffle = Raffle::unpack(account.data);
 * if (!raffle.is_ok()) return fail(raffle.error());
 * @endcode
 *
 * Both constructors are explicit; construct from a typed value, never from a
 * bare 0, which would also match the `const char*` overload.
 */
template <typename T, typename E = std::string>
class Result {
private:
    bool success_;
    T value_;
    E error_;

public:
    explicit Result(T value) : success_(true), value_(std::move(value)), error_() {}
    explicit Result(const char* error) : success_(false), value_(), error_(error) {}
    explicit Result(const E& error) : success_(false), value_(), error_(error) {}

    Result(const Result& other) = default;
    Result(Result&& other) noexcept = default;
    Result& operator=(const Result& other) = default;
    Result& operator=(Result&& other) noexcept = default;

    bool is_ok() const noexcept { return success_; }
    bool is_err() const noexcept { return !success_; }

    /// Only meaningful when is_ok()
    const T& value() const& { return value_; }
    T&& value() && { return std::move(value_); }

    /// Only meaningful when is_err()
    const E& error() const noexcept { return error_; }

    explicit operator bool() const noexcept { return success_; }

    T value_or(const T& fallback) const { return success_ ? value_ : fallback; }
};

/// @brief Lowercase hex rendering of a byte vector (no prefix)
std::string to_hex(const std::vector<uint8_t>& bytes);

/// @brief Parse a hex string (optional 0x prefix); fails on odd length or non-hex digits
Result<std::vector<uint8_t>> from_hex(const std::string& hex);

/// @brief Abbreviated key for log lines: first 8 hex chars followed by "..."
std::string short_key(const PublicKey& key);

} // namespace common
} // namespace solcino

// Lets PublicKey key the account store and signer sets
namespace std {
template <>
struct hash<std::vector<uint8_t>> {
    std::size_t operator()(const std::vector<uint8_t>& v) const noexcept {
        std::size_t seed = v.size();
        for (const auto& byte : v) {
            seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
} // namespace std
