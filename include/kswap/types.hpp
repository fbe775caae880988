#ifndef KSWAP_TYPES_HPP
#define KSWAP_TYPES_HPP

#include <cstdint>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace kswap {

// =============================================================================
// Identifiers
// =============================================================================

// 32-byte identity of an owner, asset, custody account, share mint or record
using Address = std::array<uint8_t, 32>;

namespace addresses {

// Holder that receives the permanently locked minimum liquidity. No signer
// can ever present this identity, so shares credited to it are unredeemable.
constexpr Address LIQUIDITY_SINK = {
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xde,0xad
};

constexpr Address ZERO = {};

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

} // namespace addresses

// Lowercase hex, 64 characters
std::string to_hex(const Address& addr);

// Parses exactly 64 hex digits (either case); nullopt otherwise
std::optional<Address> from_hex(std::string_view hex);

// =============================================================================
// Amounts
// =============================================================================

// Custodied balances, reserves and share supply are 64-bit. Caller-supplied
// quantities and all intermediate products are 128-bit.
using Amount = uint64_t;
using U128 = unsigned __int128;

constexpr U128 AMOUNT_MAX = static_cast<U128>(UINT64_MAX);

// Shares locked forever on the first deposit into a pair
constexpr Amount MINIMUM_LIQUIDITY = 1000;

// 0.3% trading fee applied by scaling the input: in * 997 / 1000
constexpr uint32_t FEE_NUMERATOR = 997;
constexpr uint32_t FEE_DENOMINATOR = 1000;

// Decimals of every share mint
constexpr uint8_t SHARE_DECIMALS = 8;

// Decimal rendering of 128-bit values (iostreams cannot print them)
std::string to_string(U128 value);

// Parses a non-negative decimal integer up to 2^128 - 1
std::optional<U128> parse_u128(std::string_view text);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// State
constexpr int32_t NOT_CONFIGURED = -1;
constexpr int32_t ALREADY_CONFIGURED = -2;

// Validation
constexpr int32_t IDENTICAL_ASSETS = -3;
constexpr int32_t INVALID_ASSET = -4;
constexpr int32_t INVALID_CUSTODY_REFERENCE = -5;
constexpr int32_t INVALID_SHARE_MINT = -6;
constexpr int32_t INVALID_REGISTRY = -7;
constexpr int32_t INVALID_OWNER = -8;

// Economic
constexpr int32_t INSUFFICIENT_AMOUNT = -10;
constexpr int32_t INSUFFICIENT_LIQUIDITY_MINTED = -11;
constexpr int32_t INSUFFICIENT_OUTPUT_AMOUNT = -12;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -13;
constexpr int32_t INVARIANT_VIOLATED = -14;

// Numeric
constexpr int32_t AMOUNT_OVERFLOW = -20;
constexpr int32_t MATH_OVERFLOW = -21;
constexpr int32_t MATH_UNDERFLOW = -22;
constexpr int32_t DIVISION_BY_ZERO = -23;

// Ledger
constexpr int32_t INSUFFICIENT_BALANCE = -30;
constexpr int32_t ACCOUNT_NOT_FOUND = -31;

// Records
constexpr int32_t PAIR_EXISTS = -35;
constexpr int32_t PAIR_NOT_FOUND = -36;
constexpr int32_t REGISTRY_NOT_INITIALIZED = -37;
constexpr int32_t REGISTRY_ALREADY_INITIALIZED = -38;

// Authorization
constexpr int32_t UNAUTHORIZED = -40;
}

// Human-readable description of an errors:: code
const char* error_message(int32_t code);

} // namespace kswap

#endif // KSWAP_TYPES_HPP
