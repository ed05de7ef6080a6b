// =============================================================================
// pool.cpp - PoolManager venue (Uniswap v4-style)
// Flash accounting, concentrated liquidity and exact-input swaps
// =============================================================================

#include "liquid/pool.hpp"
#include "liquid/math.hpp"
#include "liquid/errors.hpp"
#include "liquid/log.hpp"

#include <algorithm>
#include <iterator>

namespace liquid {

namespace {

// Fee growth is tracked as Q64.64 per unit of liquidity
constexpr I128 Q64 = I128(1) << 64;

inline I128 abs128(I128 x) { return x < 0 ? -x : x; }

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PoolManager::PoolManager(Chain& chain, const Address& self)
    : chain_(chain), self_(self) {
    chain_.attach(this);
}

PoolManager::~PoolManager() {
    chain_.detach(this);
}

// =============================================================================
// Internal Helpers
// =============================================================================

PoolState* PoolManager::get_pool(const PoolKey& key) {
    auto it = pools_.find(key.id());
    return it != pools_.end() ? &it->second : nullptr;
}

const PoolState* PoolManager::get_pool(const PoolKey& key) const {
    auto it = pools_.find(key.id());
    return it != pools_.end() ? &it->second : nullptr;
}

void PoolManager::require_unlocked(const char* op) const {
    if (!unlocked_) {
        throw VenueError(errors::MANAGER_NOT_UNLOCKED,
                         std::string("PoolManager: ") + op + " requires unlock");
    }
}

void PoolManager::account_delta(const Currency& currency, I128 delta) {
    if (delta == 0) return;
    currency_deltas_[currency.addr] += delta;
}

uint64_t PoolManager::position_key(const Address& owner, int32_t tick_lower,
                                   int32_t tick_upper, uint64_t salt) {
    uint64_t h = salt;
    for (uint8_t b : owner) h = h * 31 + b;
    // Offset ticks to ensure positive values for hashing
    h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_lower + 1000000));
    h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_upper + 1000000));
    return h;
}

// =============================================================================
// Initialize Pool
// =============================================================================

int32_t PoolManager::initialize(const PoolKey& key, I128 sqrt_price_x96) {
    // Validate: currencies must be sorted
    if (!(key.currency0 < key.currency1)) {
        return errors::CURRENCIES_NOT_SORTED;
    }

    // Validate: sqrt price in valid range
    if (sqrt_price_x96 < tick_math::min_sqrt_ratio() ||
        sqrt_price_x96 >= tick_math::max_sqrt_ratio()) {
        return errors::INVALID_PRICE;
    }

    if (key.fee > fees::FEE_MAX) {
        return errors::INVALID_FEE;
    }

    if (key.tick_spacing <= 0) {
        return errors::INVALID_TICK_RANGE;
    }

    uint64_t pool_id = key.id();
    if (pools_.find(pool_id) != pools_.end()) {
        return errors::POOL_ALREADY_INITIALIZED;
    }

    PoolState state{};
    state.slot0.sqrt_price_x96 = sqrt_price_x96;
    state.slot0.tick = tick_math::get_tick_at_sqrt_ratio(sqrt_price_x96);
    state.slot0.lp_fee = key.fee;
    state.fee_growth_global0_x64 = 0;
    state.fee_growth_global1_x64 = 0;
    state.liquidity = 0;

    pools_[pool_id] = std::move(state);

    log::get()->debug("PoolManager: initialized pool {:x} at tick {}", pool_id,
                      pools_[pool_id].slot0.tick);
    return errors::OK;
}

// =============================================================================
// Flash Accounting (Uniswap v4 pattern)
// =============================================================================

std::vector<uint8_t> PoolManager::unlock(IUnlockCallback& locker,
                                         const std::vector<uint8_t>& data) {
    if (unlocked_) {
        throw VenueError(errors::MANAGER_LOCKED, "PoolManager: already unlocked (reentrancy)");
    }

    unlocked_ = true;
    currency_deltas_.clear();

    std::vector<uint8_t> result;
    try {
        result = locker.unlock_callback(self_, data);
    } catch (...) {
        unlocked_ = false;
        currency_deltas_.clear();
        throw;
    }

    // Verify all deltas settled to zero
    for (const auto& [currency, delta] : currency_deltas_) {
        if (delta != 0) {
            unlocked_ = false;
            currency_deltas_.clear();
            throw VenueError(errors::CURRENCY_NOT_SETTLED,
                             "PoolManager: unsettled currency delta for " +
                             addresses::to_hex(currency));
        }
    }

    unlocked_ = false;
    currency_deltas_.clear();
    return result;
}

void PoolManager::take(const Currency& currency, const Address& to, I128 amount) {
    require_unlocked("take");
    if (amount < 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "PoolManager: negative take");
    }
    chain_.transfer(currency, self_, to, amount);
    // Taking creates debt (positive delta = pool is owed)
    account_delta(currency, amount);
}

I128 PoolManager::settle(const Currency& currency, const Address& payer, I128 amount) {
    require_unlocked("settle");
    if (amount < 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "PoolManager: negative settle");
    }
    chain_.transfer(currency, payer, self_, amount);
    account_delta(currency, -amount);
    return amount;
}

// =============================================================================
// Swap
// =============================================================================

PoolManager::SwapOutcome PoolManager::execute_swap(PoolState& pool,
                                                   const SwapParams& params) {
    if (params.amount_in <= 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "PoolManager: swap amount must be positive");
    }

    const bool zero_for_one = params.zero_for_one;
    const I128 min_sqrt = tick_math::min_sqrt_ratio();
    const I128 max_sqrt = tick_math::max_sqrt_ratio();

    // Determine price limit
    I128 sqrt_price_limit = params.sqrt_price_limit;
    if (sqrt_price_limit == 0) {
        sqrt_price_limit = zero_for_one ? min_sqrt + 1 : max_sqrt - 1;
    }

    // Validate price limit against the current price
    if (zero_for_one) {
        if (sqrt_price_limit >= pool.slot0.sqrt_price_x96 || sqrt_price_limit <= min_sqrt) {
            throw SlippageError(errors::PRICE_LIMIT_EXCEEDED,
                                "PoolManager: price limit already exceeded");
        }
    } else {
        if (sqrt_price_limit <= pool.slot0.sqrt_price_x96 || sqrt_price_limit >= max_sqrt) {
            throw SlippageError(errors::PRICE_LIMIT_EXCEEDED,
                                "PoolManager: price limit already exceeded");
        }
    }

    I128 remaining = params.amount_in;
    I128 amount_out = 0;
    I128 fee_paid = 0;
    I128 sqrt_price = pool.slot0.sqrt_price_x96;
    int32_t tick = pool.slot0.tick;
    I128 liquidity = pool.liquidity;
    const uint32_t swap_fee = pool.slot0.lp_fee;

    // Main swap loop: iterate through initialized ticks
    int max_iterations = 1000;
    while (remaining > 0 && sqrt_price != sqrt_price_limit && max_iterations-- > 0) {
        auto next_it = pool.ticks.end();
        if (zero_for_one) {
            // Highest initialized tick at or below the current tick
            auto it = pool.ticks.upper_bound(tick);
            if (it != pool.ticks.begin()) {
                next_it = std::prev(it);
            }
        } else {
            // Lowest initialized tick above the current tick
            next_it = pool.ticks.upper_bound(tick);
        }

        const bool has_next = next_it != pool.ticks.end();
        I128 sqrt_price_next = has_next
            ? tick_math::get_sqrt_ratio_at_tick(next_it->first)
            : (zero_for_one ? min_sqrt : max_sqrt);

        // Clamp to price limit
        I128 sqrt_price_target = zero_for_one
            ? std::max(sqrt_price_next, sqrt_price_limit)
            : std::min(sqrt_price_next, sqrt_price_limit);

        auto step = swap_math::compute_swap_step(sqrt_price, sqrt_price_target,
                                                 liquidity, remaining, swap_fee);

        remaining -= step.amount_in + step.fee_amount;
        amount_out += step.amount_out;
        fee_paid += step.fee_amount;

        // LP fees accrue to in-range liquidity in the input currency
        if (liquidity > 0 && step.fee_amount > 0) {
            U128 growth = static_cast<U128>(full_math::mul_div(step.fee_amount, Q64, liquidity));
            if (zero_for_one) {
                pool.fee_growth_global0_x64 += growth;
            } else {
                pool.fee_growth_global1_x64 += growth;
            }
        }

        sqrt_price = step.sqrt_price_next_x96;

        if (has_next && sqrt_price == sqrt_price_next) {
            // Cross the tick: flip fee growth outside, apply liquidity net
            TickInfo& info = next_it->second;
            info.fee_growth_outside0_x64 = pool.fee_growth_global0_x64 - info.fee_growth_outside0_x64;
            info.fee_growth_outside1_x64 = pool.fee_growth_global1_x64 - info.fee_growth_outside1_x64;
            liquidity += zero_for_one ? -info.liquidity_net : info.liquidity_net;
            tick = zero_for_one ? next_it->first - 1 : next_it->first;
        } else {
            tick = tick_math::get_tick_at_sqrt_ratio(sqrt_price);
        }
    }

    // Persist state changes
    pool.slot0.sqrt_price_x96 = sqrt_price;
    pool.slot0.tick = tick;
    pool.liquidity = liquidity;

    return SwapOutcome{params.amount_in - remaining, amount_out, fee_paid};
}

BalanceDelta PoolManager::swap(const PoolKey& key, const SwapParams& params) {
    require_unlocked("swap");

    PoolState* pool = get_pool(key);
    if (!pool) {
        throw VenueError(errors::POOL_NOT_INITIALIZED, "PoolManager: pool not initialized");
    }

    SwapOutcome outcome = execute_swap(*pool, params);

    BalanceDelta delta{};
    if (params.zero_for_one) {
        // Sold currency0, bought currency1
        delta.amount0 = outcome.amount_consumed;
        delta.amount1 = -outcome.amount_out;
    } else {
        delta.amount0 = -outcome.amount_out;
        delta.amount1 = outcome.amount_consumed;
    }

    account_delta(key.currency0, delta.amount0);
    account_delta(key.currency1, delta.amount1);

    ++total_swaps_;

    log::get()->debug("PoolManager: swap pool={:x} zero_for_one={} in={} out={} fee={}",
                      key.id(), params.zero_for_one, to_string(outcome.amount_consumed),
                      to_string(outcome.amount_out), to_string(outcome.fee_paid));
    return delta;
}

// =============================================================================
// Modify Liquidity
// =============================================================================

ModifyLiquidityResult PoolManager::modify_liquidity(const Address& owner, const PoolKey& key,
                                                    const ModifyLiquidityParams& params) {
    require_unlocked("modify_liquidity");

    // Validate tick range
    if (params.tick_lower >= params.tick_upper ||
        params.tick_lower < tick_math::MIN_TICK ||
        params.tick_upper > tick_math::MAX_TICK ||
        params.tick_lower % key.tick_spacing != 0 ||
        params.tick_upper % key.tick_spacing != 0) {
        throw VenueError(errors::INVALID_TICK_RANGE, "PoolManager: invalid tick range");
    }

    PoolState* pool = get_pool(key);
    if (!pool) {
        throw VenueError(errors::POOL_NOT_INITIALIZED, "PoolManager: pool not initialized");
    }

    uint64_t pos_key = position_key(owner, params.tick_lower, params.tick_upper, params.salt);
    PositionInfo& pos = pool->positions[pos_key];

    const I128 liquidity_delta = params.liquidity_delta;
    if (pos.liquidity + liquidity_delta < 0) {
        throw VenueError(errors::INSUFFICIENT_LIQUIDITY, "PoolManager: position liquidity underflow");
    }

    const int32_t tick_current = pool->slot0.tick;

    // Update tick bookkeeping (v3 semantics: outside growth starts at global
    // when the tick is at or below the current tick)
    auto update_tick = [&](int32_t tick, bool upper) {
        TickInfo& info = pool->ticks[tick];
        if (info.liquidity_gross == 0 && tick <= tick_current) {
            info.fee_growth_outside0_x64 = pool->fee_growth_global0_x64;
            info.fee_growth_outside1_x64 = pool->fee_growth_global1_x64;
        }
        info.liquidity_gross += abs128(liquidity_delta);
        info.liquidity_net += upper ? -liquidity_delta : liquidity_delta;
    };

    if (liquidity_delta != 0) {
        update_tick(params.tick_lower, false);
        update_tick(params.tick_upper, true);
    }

    // Fee growth inside the range
    U128 fee_inside0 = 0;
    U128 fee_inside1 = 0;
    auto lower_it = pool->ticks.find(params.tick_lower);
    auto upper_it = pool->ticks.find(params.tick_upper);
    if (lower_it != pool->ticks.end() && upper_it != pool->ticks.end()) {
        const TickInfo& lower = lower_it->second;
        const TickInfo& upper = upper_it->second;

        U128 below0 = tick_current >= params.tick_lower
            ? lower.fee_growth_outside0_x64
            : pool->fee_growth_global0_x64 - lower.fee_growth_outside0_x64;
        U128 below1 = tick_current >= params.tick_lower
            ? lower.fee_growth_outside1_x64
            : pool->fee_growth_global1_x64 - lower.fee_growth_outside1_x64;
        U128 above0 = tick_current < params.tick_upper
            ? upper.fee_growth_outside0_x64
            : pool->fee_growth_global0_x64 - upper.fee_growth_outside0_x64;
        U128 above1 = tick_current < params.tick_upper
            ? upper.fee_growth_outside1_x64
            : pool->fee_growth_global1_x64 - upper.fee_growth_outside1_x64;

        fee_inside0 = pool->fee_growth_global0_x64 - below0 - above0;
        fee_inside1 = pool->fee_growth_global1_x64 - below1 - above1;
    }

    // Calculate fees owed to the position
    BalanceDelta fees_accrued{0, 0};
    if (pos.liquidity > 0) {
        U128 growth0 = fee_inside0 - pos.fee_growth_inside0_last_x64;
        U128 growth1 = fee_inside1 - pos.fee_growth_inside1_last_x64;
        fees_accrued.amount0 = full_math::mul_div(static_cast<I128>(growth0), pos.liquidity, Q64);
        fees_accrued.amount1 = full_math::mul_div(static_cast<I128>(growth1), pos.liquidity, Q64);
    }

    pos.liquidity += liquidity_delta;
    pos.fee_growth_inside0_last_x64 = fee_inside0;
    pos.fee_growth_inside1_last_x64 = fee_inside1;

    // Update active liquidity if the range contains the current tick
    if (tick_current >= params.tick_lower && tick_current < params.tick_upper) {
        pool->liquidity += liquidity_delta;
    }

    // Drop ticks no longer referenced
    if (liquidity_delta < 0) {
        for (int32_t tick : {params.tick_lower, params.tick_upper}) {
            auto it = pool->ticks.find(tick);
            if (it != pool->ticks.end() && it->second.liquidity_gross == 0) {
                pool->ticks.erase(it);
            }
        }
    }

    // Principal token amounts (round up when paying in, down when paying out)
    BalanceDelta principal{0, 0};
    if (liquidity_delta != 0) {
        const bool adding = liquidity_delta > 0;
        const I128 magnitude = abs128(liquidity_delta);
        const I128 sqrt_lower = tick_math::get_sqrt_ratio_at_tick(params.tick_lower);
        const I128 sqrt_upper = tick_math::get_sqrt_ratio_at_tick(params.tick_upper);
        const I128 sqrt_price = pool->slot0.sqrt_price_x96;

        I128 amount0 = 0;
        I128 amount1 = 0;
        if (tick_current < params.tick_lower) {
            amount0 = sqrt_price_math::get_amount0_delta(sqrt_lower, sqrt_upper, magnitude, adding);
        } else if (tick_current < params.tick_upper) {
            amount0 = sqrt_price_math::get_amount0_delta(sqrt_price, sqrt_upper, magnitude, adding);
            amount1 = sqrt_price_math::get_amount1_delta(sqrt_lower, sqrt_price, magnitude, adding);
        } else {
            amount1 = sqrt_price_math::get_amount1_delta(sqrt_lower, sqrt_upper, magnitude, adding);
        }

        principal = adding ? BalanceDelta{amount0, amount1} : -BalanceDelta{amount0, amount1};
    }

    ModifyLiquidityResult result{principal, fees_accrued, principal - fees_accrued};

    account_delta(key.currency0, result.caller_delta.amount0);
    account_delta(key.currency1, result.caller_delta.amount1);

    ++total_liquidity_ops_;

    return result;
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<SwapQuote> PoolManager::quote_exact_input(const PoolKey& key, bool zero_for_one,
                                                        I128 amount_in,
                                                        I128 sqrt_price_limit) const {
    const PoolState* pool = get_pool(key);
    if (!pool) return std::nullopt;

    // Simulate on a copy; live state is untouched
    PoolState scratch = *pool;
    try {
        SwapOutcome outcome = execute_swap(scratch,
                                           SwapParams{zero_for_one, amount_in, sqrt_price_limit});
        return SwapQuote{outcome.amount_consumed, outcome.amount_out,
                         scratch.slot0.sqrt_price_x96};
    } catch (const SlippageError&) {
        return std::nullopt;
    } catch (const ValidationError&) {
        return std::nullopt;
    }
}

std::optional<Slot0> PoolManager::get_slot0(const PoolKey& key) const {
    const PoolState* pool = get_pool(key);
    return pool ? std::optional{pool->slot0} : std::nullopt;
}

std::optional<I128> PoolManager::get_liquidity(const PoolKey& key) const {
    const PoolState* pool = get_pool(key);
    return pool ? std::optional{pool->liquidity} : std::nullopt;
}

std::optional<PositionInfo> PoolManager::get_position(const PoolKey& key,
                                                      const Address& owner,
                                                      int32_t tick_lower,
                                                      int32_t tick_upper,
                                                      uint64_t salt) const {
    const PoolState* pool = get_pool(key);
    if (!pool) return std::nullopt;

    uint64_t pos_key = position_key(owner, tick_lower, tick_upper, salt);
    auto it = pool->positions.find(pos_key);
    return it != pool->positions.end() ? std::optional{it->second} : std::nullopt;
}

bool PoolManager::pool_exists(const PoolKey& key) const {
    return pools_.find(key.id()) != pools_.end();
}

// =============================================================================
// Statistics
// =============================================================================

PoolManager::Stats PoolManager::get_stats() const {
    return Stats{
        static_cast<uint64_t>(pools_.size()),
        total_swaps_,
        total_liquidity_ops_
    };
}

std::function<void()> PoolManager::checkpoint() {
    auto saved_pools = pools_;
    uint64_t saved_swaps = total_swaps_;
    uint64_t saved_ops = total_liquidity_ops_;
    return [this, saved_pools, saved_swaps, saved_ops]() {
        pools_ = saved_pools;
        total_swaps_ = saved_swaps;
        total_liquidity_ops_ = saved_ops;
    };
}

} // namespace liquid
