// =============================================================================
// math.cpp - Constant-product liquidity and swap arithmetic
// All division floors, so every rounding step favors the pool.
// =============================================================================

#include "kswap/math.hpp"

namespace kswap {

// =============================================================================
// Integer Square Root
// =============================================================================

U128 isqrt(U128 value) {
    if (value < 2) return value;

    U128 x = value / 2;
    U128 y = (x + value / x) / 2;
    while (y < x) {
        x = y;
        y = (x + value / x) / 2;
    }
    return x;
}

// =============================================================================
// Deposit
// =============================================================================

namespace {

int32_t quote_first_deposit(U128 desired_a, U128 desired_b, DepositQuote& out) {
    Amount amount_a = 0, amount_b = 0;
    int32_t rc = checked::to_amount(desired_a, amount_a);
    if (rc != errors::OK) return rc;
    rc = checked::to_amount(desired_b, amount_b);
    if (rc != errors::OK) return rc;

    // Both factors are below 2^64, the product cannot overflow
    U128 root = isqrt(static_cast<U128>(amount_a) * amount_b);
    Amount initial = 0;
    rc = checked::to_amount(root, initial);
    if (rc != errors::OK) return rc;

    Amount shares = initial > MINIMUM_LIQUIDITY ? initial - MINIMUM_LIQUIDITY : 0;
    if (shares == 0) return errors::INSUFFICIENT_LIQUIDITY_MINTED;

    out.amount_a = amount_a;
    out.amount_b = amount_b;
    out.shares = shares;
    out.locked_shares = MINIMUM_LIQUIDITY;
    out.first_deposit = true;
    return errors::OK;
}

} // anonymous namespace

int32_t quote_deposit(Amount reserve_a, Amount reserve_b, Amount total_shares,
                      U128 desired_a, U128 desired_b,
                      U128 min_a, U128 min_b,
                      DepositQuote& out) {
    DepositQuote quote{};

    if (reserve_a == 0 && reserve_b == 0) {
        int32_t rc = quote_first_deposit(desired_a, desired_b, quote);
        if (rc != errors::OK) return rc;
    } else {
        U128 amount_a = 0, amount_b = 0, liquidity = 0;

        U128 optimal_b = 0;
        int32_t rc = checked::mul_div(desired_a, reserve_b, reserve_a, optimal_b);
        if (rc != errors::OK) return rc;

        if (optimal_b <= desired_b) {
            // Asset A binds
            if (optimal_b < min_b) return errors::INSUFFICIENT_AMOUNT;
            rc = checked::mul_div(desired_a, total_shares, reserve_a, liquidity);
            if (rc != errors::OK) return rc;
            amount_a = desired_a;
            amount_b = optimal_b;
        } else {
            // Asset B binds
            U128 optimal_a = 0;
            rc = checked::mul_div(desired_b, reserve_a, reserve_b, optimal_a);
            if (rc != errors::OK) return rc;
            if (optimal_a < min_a) return errors::INSUFFICIENT_AMOUNT;
            rc = checked::mul_div(desired_b, total_shares, reserve_b, liquidity);
            if (rc != errors::OK) return rc;
            amount_a = optimal_a;
            amount_b = desired_b;
        }

        if ((rc = checked::to_amount(amount_a, quote.amount_a)) != errors::OK) return rc;
        if ((rc = checked::to_amount(amount_b, quote.amount_b)) != errors::OK) return rc;
        if ((rc = checked::to_amount(liquidity, quote.shares)) != errors::OK) return rc;

        // A deposit too small to earn a single share would be a pure donation
        if (quote.shares == 0) return errors::INSUFFICIENT_LIQUIDITY_MINTED;

        quote.locked_shares = 0;
        quote.first_deposit = false;
    }

    if (quote.amount_a < min_a || quote.amount_b < min_b) {
        return errors::INSUFFICIENT_AMOUNT;
    }

    out = quote;
    return errors::OK;
}

// =============================================================================
// Withdrawal
// =============================================================================

int32_t quote_withdrawal(Amount reserve_a, Amount reserve_b, Amount total_shares,
                         U128 shares, U128 min_a, U128 min_b,
                         WithdrawalQuote& out) {
    Amount shares64 = 0;
    int32_t rc = checked::to_amount(shares, shares64);
    if (rc != errors::OK) return rc;
    if (shares64 > total_shares) return errors::INSUFFICIENT_LIQUIDITY;

    U128 amount_a = 0, amount_b = 0;
    if ((rc = checked::mul_div(shares, reserve_a, total_shares, amount_a)) != errors::OK) return rc;
    if ((rc = checked::mul_div(shares, reserve_b, total_shares, amount_b)) != errors::OK) return rc;

    if (amount_a < min_a || amount_b < min_b) {
        return errors::INSUFFICIENT_AMOUNT;
    }

    WithdrawalQuote quote{};
    if ((rc = checked::to_amount(amount_a, quote.amount_a)) != errors::OK) return rc;
    if ((rc = checked::to_amount(amount_b, quote.amount_b)) != errors::OK) return rc;
    quote.shares = shares64;

    out = quote;
    return errors::OK;
}

// =============================================================================
// Swap
// =============================================================================

int32_t get_amount_out(U128 amount_in, Amount reserve_in, Amount reserve_out,
                       U128& amount_out) {
    U128 in_with_fee = 0, numerator = 0, denominator = 0;

    int32_t rc = checked::mul(amount_in, FEE_NUMERATOR, in_with_fee);
    if (rc != errors::OK) return rc;
    if ((rc = checked::mul(in_with_fee, reserve_out, numerator)) != errors::OK) return rc;
    if ((rc = checked::mul(reserve_in, FEE_DENOMINATOR, denominator)) != errors::OK) return rc;
    if ((rc = checked::add(denominator, in_with_fee, denominator)) != errors::OK) return rc;

    return checked::div(numerator, denominator, amount_out);
}

int32_t quote_swap(U128 amount_in, U128 amount_out_min,
                   Amount reserve_in, Amount reserve_out,
                   SwapQuote& out) {
    Amount in64 = 0;
    int32_t rc = checked::to_amount(amount_in, in64);
    if (rc != errors::OK) return rc;

    U128 amount_out = 0;
    if ((rc = get_amount_out(amount_in, reserve_in, reserve_out, amount_out)) != errors::OK) {
        return rc;
    }

    if (amount_out < amount_out_min) return errors::INSUFFICIENT_OUTPUT_AMOUNT;

    Amount out64 = 0;
    if ((rc = checked::to_amount(amount_out, out64)) != errors::OK) return rc;

    if (out64 == 0) return errors::INSUFFICIENT_OUTPUT_AMOUNT;
    if (out64 > reserve_out) return errors::INSUFFICIENT_LIQUIDITY;

    out.amount_in = in64;
    out.amount_out = out64;
    return errors::OK;
}

int32_t check_invariant(Amount old_a, Amount old_b, Amount new_a, Amount new_b) {
    // 64 x 64 bit products always fit in 128 bits
    U128 old_k = static_cast<U128>(old_a) * old_b;
    U128 new_k = static_cast<U128>(new_a) * new_b;
    return new_k >= old_k ? errors::OK : errors::INVARIANT_VIOLATED;
}

} // namespace kswap
