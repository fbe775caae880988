// =============================================================================
// types.cpp - Identifier/amount formatting and error descriptions
// =============================================================================

#include "kswap/types.hpp"

#include <algorithm>

namespace kswap {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Hex
// =============================================================================

std::string to_hex(const Address& addr) {
    std::string out;
    out.reserve(addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    Address addr{};
    if (hex.size() != addr.size() * 2) return std::nullopt;

    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// 128-bit Decimal
// =============================================================================

std::string to_string(U128 value) {
    if (value == 0) return "0";

    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<U128> parse_u128(std::string_view text) {
    if (text.empty()) return std::nullopt;

    constexpr U128 MAX = ~static_cast<U128>(0);
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (value > (MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// =============================================================================
// Error Descriptions
// =============================================================================

const char* error_message(int32_t code) {
    switch (code) {
        case errors::OK: return "ok";
        case errors::NOT_CONFIGURED: return "pair is not configured";
        case errors::ALREADY_CONFIGURED: return "pair is already configured";
        case errors::IDENTICAL_ASSETS: return "assets cannot be identical";
        case errors::INVALID_ASSET: return "account asset does not belong to the pair";
        case errors::INVALID_CUSTODY_REFERENCE: return "invalid custody account";
        case errors::INVALID_SHARE_MINT: return "invalid share mint";
        case errors::INVALID_REGISTRY: return "pair belongs to a different registry";
        case errors::INVALID_OWNER: return "account is not owned by the signer";
        case errors::INSUFFICIENT_AMOUNT: return "insufficient amount";
        case errors::INSUFFICIENT_LIQUIDITY_MINTED: return "insufficient liquidity minted";
        case errors::INSUFFICIENT_OUTPUT_AMOUNT: return "insufficient output amount";
        case errors::INSUFFICIENT_LIQUIDITY: return "insufficient liquidity";
        case errors::INVARIANT_VIOLATED: return "constant product decreased";
        case errors::AMOUNT_OVERFLOW: return "amount exceeds maximum transferable quantity";
        case errors::MATH_OVERFLOW: return "arithmetic overflow";
        case errors::MATH_UNDERFLOW: return "arithmetic underflow";
        case errors::DIVISION_BY_ZERO: return "division by zero";
        case errors::INSUFFICIENT_BALANCE: return "insufficient balance";
        case errors::ACCOUNT_NOT_FOUND: return "account not found";
        case errors::PAIR_EXISTS: return "pair already exists for these assets";
        case errors::PAIR_NOT_FOUND: return "pair not found";
        case errors::REGISTRY_NOT_INITIALIZED: return "registry is not initialized";
        case errors::REGISTRY_ALREADY_INITIALIZED: return "registry is already initialized";
        case errors::UNAUTHORIZED: return "only the registry owner can perform this action";
        default: return "unknown error";
    }
}

} // namespace kswap
