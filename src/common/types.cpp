#include "common/types.h"
#include <iomanip>
#include <sstream>

namespace solcino {
namespace common {

// Explicit template instantiations for frequently used Result types
template class Result<bool>;
template class Result<uint64_t>;
template class Result<std::vector<uint8_t>>;

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    for (uint8_t byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

namespace {

int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Result<std::vector<uint8_t>> from_hex(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }

    if ((hex.size() - start) % 2 != 0) {
        return Result<std::vector<uint8_t>>("Hex string has odd length");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = hex_digit_value(hex[i]);
        int lo = hex_digit_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Result<std::vector<uint8_t>>(std::string("Invalid hex digit at offset ") +
                                                std::to_string(i));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return Result<std::vector<uint8_t>>(std::move(bytes));
}

std::string short_key(const PublicKey& key) {
    std::string hex = to_hex(key);
    if (hex.size() <= 8) {
        return hex;
    }
    return hex.substr(0, 8) + "...";
}

} // namespace common
} // namespace solcino
