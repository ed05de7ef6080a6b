// =============================================================================
// math.cpp - Concentrated liquidity math (Uniswap v3/v4 formulas)
// Integer paths use a 256-bit intermediate so rounding is exact and the quote
// path and the execution path agree to the wei.
// =============================================================================

#include "liquid/math.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace liquid {

namespace {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

// Multiply two U128 values to produce U256
U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Divide U256 by U128 with remainder; the quotient must fit in 128 bits
U128 div_u256_u128(const U256& num, U128 denom, U128& remainder) {
    if (denom == 0) {
        throw std::domain_error("mul_div: division by zero");
    }
    if (num.hi >= denom) {
        throw std::overflow_error("mul_div: quotient exceeds 128 bits");
    }
    if (num.hi == 0) {
        remainder = num.lo % denom;
        return num.lo / denom;
    }

    // Restoring long division over the low limb; rem < denom throughout
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    remainder = rem;
    return quot;
}

constexpr U128 I128_MAX_U = ~U128(0) >> 1;

I128 checked_signed(U128 value) {
    if (value > I128_MAX_U) {
        throw std::overflow_error("mul_div: result exceeds int128");
    }
    return static_cast<I128>(value);
}

void require_non_negative(I128 a, I128 b, I128 denom) {
    if (a < 0 || b < 0 || denom < 0) {
        throw std::domain_error("mul_div: negative operand");
    }
}

} // anonymous namespace

// =============================================================================
// Full Math
// =============================================================================

namespace full_math {

I128 mul_div(I128 a, I128 b, I128 denom) {
    require_non_negative(a, b, denom);
    U128 rem = 0;
    U128 q = div_u256_u128(mul_u128(static_cast<U128>(a), static_cast<U128>(b)),
                           static_cast<U128>(denom), rem);
    return checked_signed(q);
}

I128 mul_div_up(I128 a, I128 b, I128 denom) {
    require_non_negative(a, b, denom);
    U128 rem = 0;
    U128 q = div_u256_u128(mul_u128(static_cast<U128>(a), static_cast<U128>(b)),
                           static_cast<U128>(denom), rem);
    if (rem != 0) {
        q += 1;
    }
    return checked_signed(q);
}

} // namespace full_math

// =============================================================================
// Tick Math
// =============================================================================

namespace tick_math {

I128 get_sqrt_ratio_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw std::out_of_range("tick out of range");
    }
    // sqrt(1.0001^tick) as Q64.96
    long double sqrt_price = std::pow(1.0001L, static_cast<long double>(tick) / 2.0L);
    return static_cast<I128>(std::ldexp(sqrt_price, 96));
}

I128 min_sqrt_ratio() {
    static const I128 value = get_sqrt_ratio_at_tick(MIN_TICK);
    return value;
}

I128 max_sqrt_ratio() {
    static const I128 value = get_sqrt_ratio_at_tick(MAX_TICK);
    return value;
}

int32_t get_tick_at_sqrt_ratio(I128 sqrt_price_x96) {
    if (sqrt_price_x96 <= min_sqrt_ratio()) return MIN_TICK;
    if (sqrt_price_x96 >= max_sqrt_ratio()) return MAX_TICK;

    long double sqrt_price = std::ldexp(static_cast<long double>(sqrt_price_x96), -96);
    long double tick_d = 2.0L * std::log(sqrt_price) / std::log(1.0001L);
    int32_t tick = static_cast<int32_t>(std::floor(tick_d));
    if (tick < MIN_TICK) tick = MIN_TICK;
    if (tick > MAX_TICK) tick = MAX_TICK;

    // Snap so that ratio(tick) <= price < ratio(tick + 1) holds exactly
    while (tick > MIN_TICK && get_sqrt_ratio_at_tick(tick) > sqrt_price_x96) --tick;
    while (tick < MAX_TICK && get_sqrt_ratio_at_tick(tick + 1) <= sqrt_price_x96) ++tick;
    return tick;
}

} // namespace tick_math

// =============================================================================
// Sqrt Price Math
// =============================================================================

namespace sqrt_price_math {

using full_math::mul_div;
using full_math::mul_div_up;
using tick_math::Q96;

I128 get_amount0_delta(I128 sqrt_a_x96, I128 sqrt_b_x96, I128 liquidity, bool round_up) {
    if (sqrt_a_x96 > sqrt_b_x96) std::swap(sqrt_a_x96, sqrt_b_x96);
    if (sqrt_a_x96 <= 0) {
        throw std::domain_error("amount0 delta: zero price");
    }
    // L * Q96 * (b - a) / (a * b)
    I128 diff = sqrt_b_x96 - sqrt_a_x96;
    if (round_up) {
        return mul_div_up(mul_div_up(liquidity, diff, sqrt_b_x96), Q96, sqrt_a_x96);
    }
    return mul_div(mul_div(liquidity, diff, sqrt_b_x96), Q96, sqrt_a_x96);
}

I128 get_amount1_delta(I128 sqrt_a_x96, I128 sqrt_b_x96, I128 liquidity, bool round_up) {
    if (sqrt_a_x96 > sqrt_b_x96) std::swap(sqrt_a_x96, sqrt_b_x96);
    I128 diff = sqrt_b_x96 - sqrt_a_x96;
    return round_up ? mul_div_up(liquidity, diff, Q96) : mul_div(liquidity, diff, Q96);
}

I128 get_next_sqrt_price_from_input(I128 sqrt_price_x96, I128 liquidity,
                                    I128 amount_in, bool zero_for_one) {
    if (sqrt_price_x96 <= 0 || liquidity <= 0) {
        throw std::domain_error("next sqrt price: no price or liquidity");
    }
    if (amount_in == 0) return sqrt_price_x96;

    if (zero_for_one) {
        // L * P / (L + amount * P / Q96), rounded up so the price moves less
        I128 denom = liquidity + mul_div(amount_in, sqrt_price_x96, Q96);
        return mul_div_up(liquidity, sqrt_price_x96, denom);
    }
    // P + amount * Q96 / L, rounded down
    return sqrt_price_x96 + mul_div(amount_in, Q96, liquidity);
}

I128 get_liquidity_for_amount1(I128 sqrt_a_x96, I128 sqrt_b_x96, I128 amount1) {
    if (sqrt_a_x96 > sqrt_b_x96) std::swap(sqrt_a_x96, sqrt_b_x96);
    return mul_div(amount1, Q96, sqrt_b_x96 - sqrt_a_x96);
}

I128 get_liquidity_for_amount0(I128 sqrt_a_x96, I128 sqrt_b_x96, I128 amount0) {
    if (sqrt_a_x96 > sqrt_b_x96) std::swap(sqrt_a_x96, sqrt_b_x96);
    I128 intermediate = mul_div(sqrt_a_x96, sqrt_b_x96, Q96);
    return mul_div(amount0, intermediate, sqrt_b_x96 - sqrt_a_x96);
}

} // namespace sqrt_price_math

// =============================================================================
// Swap Step
// =============================================================================

namespace swap_math {

StepResult compute_swap_step(I128 sqrt_current_x96, I128 sqrt_target_x96,
                             I128 liquidity, I128 amount_remaining,
                             uint32_t fee_pips) {
    using sqrt_price_math::get_amount0_delta;
    using sqrt_price_math::get_amount1_delta;

    const bool zero_for_one = sqrt_current_x96 >= sqrt_target_x96;
    StepResult step{sqrt_current_x96, 0, 0, 0};

    // No active liquidity: price moves to the target, nothing trades
    if (liquidity <= 0) {
        step.sqrt_price_next_x96 = sqrt_target_x96;
        return step;
    }

    I128 amount_less_fee = full_math::mul_div(amount_remaining,
                                              fees::DENOMINATOR - fee_pips,
                                              fees::DENOMINATOR);
    I128 next_from_input = sqrt_price_math::get_next_sqrt_price_from_input(
        sqrt_current_x96, liquidity, amount_less_fee, zero_for_one);

    bool capped = zero_for_one ? next_from_input < sqrt_target_x96
                               : next_from_input > sqrt_target_x96;

    if (capped) {
        step.sqrt_price_next_x96 = sqrt_target_x96;
        step.amount_in = zero_for_one
            ? get_amount0_delta(sqrt_target_x96, sqrt_current_x96, liquidity, true)
            : get_amount1_delta(sqrt_current_x96, sqrt_target_x96, liquidity, true);
        if (step.amount_in > amount_remaining) {
            step.amount_in = amount_remaining;
        }
        step.fee_amount = full_math::mul_div_up(step.amount_in, fee_pips,
                                                fees::DENOMINATOR - fee_pips);
        if (step.amount_in + step.fee_amount > amount_remaining) {
            step.fee_amount = amount_remaining - step.amount_in;
        }
    } else {
        step.sqrt_price_next_x96 = next_from_input;
        step.amount_in = zero_for_one
            ? get_amount0_delta(next_from_input, sqrt_current_x96, liquidity, true)
            : get_amount1_delta(sqrt_current_x96, next_from_input, liquidity, true);
        if (step.amount_in > amount_remaining) {
            step.amount_in = amount_remaining;
        }
        // Whole remainder consumed; what is not input is fee
        step.fee_amount = amount_remaining - step.amount_in;
    }

    step.amount_out = zero_for_one
        ? get_amount1_delta(step.sqrt_price_next_x96, sqrt_current_x96, liquidity, false)
        : get_amount0_delta(sqrt_current_x96, step.sqrt_price_next_x96, liquidity, false);
    return step;
}

} // namespace swap_math

} // namespace liquid
