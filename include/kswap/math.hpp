#ifndef KSWAP_MATH_HPP
#define KSWAP_MATH_HPP

#include "types.hpp"

namespace kswap {

// =============================================================================
// Checked Arithmetic
//
// Every helper returns errors::OK and writes `out`, or returns the failure code
// and leaves `out` untouched. Nothing wraps or saturates.
// =============================================================================

namespace checked {

inline int32_t add(U128 a, U128 b, U128& out) {
    U128 r;
    if (__builtin_add_overflow(a, b, &r)) return errors::MATH_OVERFLOW;
    out = r;
    return errors::OK;
}

inline int32_t sub(U128 a, U128 b, U128& out) {
    if (b > a) return errors::MATH_UNDERFLOW;
    out = a - b;
    return errors::OK;
}

inline int32_t mul(U128 a, U128 b, U128& out) {
    U128 r;
    if (__builtin_mul_overflow(a, b, &r)) return errors::MATH_OVERFLOW;
    out = r;
    return errors::OK;
}

inline int32_t div(U128 a, U128 b, U128& out) {
    if (b == 0) return errors::DIVISION_BY_ZERO;
    out = a / b;
    return errors::OK;
}

// Floor of a * b / denom
inline int32_t mul_div(U128 a, U128 b, U128 denom, U128& out) {
    U128 product;
    int32_t rc = mul(a, b, product);
    if (rc != errors::OK) return rc;
    return div(product, denom, out);
}

inline int32_t add(Amount a, Amount b, Amount& out) {
    Amount r;
    if (__builtin_add_overflow(a, b, &r)) return errors::MATH_OVERFLOW;
    out = r;
    return errors::OK;
}

inline int32_t sub(Amount a, Amount b, Amount& out) {
    if (b > a) return errors::MATH_UNDERFLOW;
    out = a - b;
    return errors::OK;
}

// Narrowing for custody transfers
inline int32_t to_amount(U128 value, Amount& out) {
    if (value > AMOUNT_MAX) return errors::AMOUNT_OVERFLOW;
    out = static_cast<Amount>(value);
    return errors::OK;
}

} // namespace checked

// =============================================================================
// Integer Square Root
// =============================================================================

// floor(sqrt(value)) by Newton's method from value / 2
U128 isqrt(U128 value);

// =============================================================================
// Liquidity Math
// =============================================================================

// Result of sizing a deposit against the current pool
struct DepositQuote {
    Amount amount_a;        // Taken from the depositor
    Amount amount_b;
    Amount shares;          // Credited to the depositor
    Amount locked_shares;   // Credited to LIQUIDITY_SINK (first deposit only)
    bool first_deposit;
};

// Sizes a deposit. First deposit takes both desired amounts and mints
// sqrt(a * b) - MINIMUM_LIQUIDITY; later deposits take the binding side in full
// and the other side at the pool ratio, minting shares pro rata.
int32_t quote_deposit(Amount reserve_a, Amount reserve_b, Amount total_shares,
                      U128 desired_a, U128 desired_b,
                      U128 min_a, U128 min_b,
                      DepositQuote& out);

// Result of redeeming shares
struct WithdrawalQuote {
    Amount amount_a;
    Amount amount_b;
    Amount shares;
};

// amount = shares * reserve / total_shares, floored
int32_t quote_withdrawal(Amount reserve_a, Amount reserve_b, Amount total_shares,
                         U128 shares, U128 min_a, U128 min_b,
                         WithdrawalQuote& out);

// =============================================================================
// Swap Math
// =============================================================================

// Constant-product output with the fee folded into the input:
//   in' = in * 997
//   out = in' * reserve_out / (reserve_in * 1000 + in')
int32_t get_amount_out(U128 amount_in, Amount reserve_in, Amount reserve_out,
                       U128& amount_out);

struct SwapQuote {
    Amount amount_in;
    Amount amount_out;
};

// get_amount_out plus slippage, zero-output and liquidity checks
int32_t quote_swap(U128 amount_in, U128 amount_out_min,
                   Amount reserve_in, Amount reserve_out,
                   SwapQuote& out);

// Fails with INVARIANT_VIOLATED when new_a * new_b < old_a * old_b
int32_t check_invariant(Amount old_a, Amount old_b, Amount new_a, Amount new_b);

} // namespace kswap

#endif // KSWAP_MATH_HPP
