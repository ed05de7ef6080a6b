#ifndef LIQUID_MATH_HPP
#define LIQUID_MATH_HPP

#include "types.hpp"

namespace liquid {

// =============================================================================
// Full-Precision Multiply/Divide (256-bit intermediate)
// =============================================================================

namespace full_math {

// floor(a * b / denom); operands must be non-negative.
// Throws std::domain_error on zero denominator, std::overflow_error when the
// quotient does not fit in 127 bits.
I128 mul_div(I128 a, I128 b, I128 denom);

// ceil(a * b / denom)
I128 mul_div_up(I128 a, I128 b, I128 denom);

} // namespace full_math

// =============================================================================
// Tick Math
// =============================================================================

namespace tick_math {

// Bounded so every Q64.96 sqrt price fits in a signed 128-bit integer
constexpr int32_t MIN_TICK = -400000;
constexpr int32_t MAX_TICK = 400000;

constexpr I128 Q96 = I128(1) << 96;

I128 get_sqrt_ratio_at_tick(int32_t tick);

// Greatest tick whose sqrt ratio is <= sqrt_price_x96
int32_t get_tick_at_sqrt_ratio(I128 sqrt_price_x96);

I128 min_sqrt_ratio();
I128 max_sqrt_ratio();

} // namespace tick_math

// =============================================================================
// Sqrt Price Math
// =============================================================================

namespace sqrt_price_math {

// currency0 owed between two prices for `liquidity`
I128 get_amount0_delta(I128 sqrt_a_x96, I128 sqrt_b_x96, I128 liquidity, bool round_up);

// currency1 owed between two prices for `liquidity`
I128 get_amount1_delta(I128 sqrt_a_x96, I128 sqrt_b_x96, I128 liquidity, bool round_up);

// Price after adding `amount_in` of the input currency (rounded against the trader)
I128 get_next_sqrt_price_from_input(I128 sqrt_price_x96, I128 liquidity,
                                    I128 amount_in, bool zero_for_one);

// Liquidity that `amount1` buys in a range strictly below the current price
I128 get_liquidity_for_amount1(I128 sqrt_a_x96, I128 sqrt_b_x96, I128 amount1);

// Liquidity that `amount0` buys in a range strictly above the current price
I128 get_liquidity_for_amount0(I128 sqrt_a_x96, I128 sqrt_b_x96, I128 amount0);

} // namespace sqrt_price_math

// =============================================================================
// Swap Step (exact input)
// =============================================================================

namespace swap_math {

struct StepResult {
    I128 sqrt_price_next_x96;
    I128 amount_in;      // excluding fee
    I128 amount_out;
    I128 fee_amount;
};

// One step towards sqrt_target_x96. The direction is implied by the targets.
// When the remaining input lands exactly on the target the whole remainder is
// consumed, so a price limit equal to a quoted end price fills completely.
StepResult compute_swap_step(I128 sqrt_current_x96, I128 sqrt_target_x96,
                             I128 liquidity, I128 amount_remaining,
                             uint32_t fee_pips);

} // namespace swap_math

} // namespace liquid

#endif // LIQUID_MATH_HPP
