#ifndef LIQUID_POOL_HPP
#define LIQUID_POOL_HPP

#include <map>
#include <unordered_map>
#include <optional>
#include <vector>
#include <functional>

#include "types.hpp"
#include "chain.hpp"

namespace liquid {

// =============================================================================
// Pool Slot0 State
// =============================================================================

struct Slot0 {
    I128 sqrt_price_x96;    // Current sqrt(price) as Q64.96
    int32_t tick;           // Current tick
    uint32_t lp_fee;        // LP fee (hundredths of bip)
};

// =============================================================================
// Tick Info
// =============================================================================

struct TickInfo {
    I128 liquidity_gross;        // Total liquidity referencing the tick
    I128 liquidity_net;          // Net liquidity change when crossing upwards
    U128 fee_growth_outside0_x64;
    U128 fee_growth_outside1_x64;
};

// =============================================================================
// Position Info
// =============================================================================

struct PositionInfo {
    I128 liquidity;
    U128 fee_growth_inside0_last_x64;
    U128 fee_growth_inside1_last_x64;
};

// =============================================================================
// Pool State (single pool)
// =============================================================================

struct PoolState {
    Slot0 slot0;
    U128 fee_growth_global0_x64;
    U128 fee_growth_global1_x64;
    I128 liquidity;              // Current active liquidity
    std::map<int32_t, TickInfo> ticks;                      // initialized ticks only
    std::unordered_map<uint64_t, PositionInfo> positions;  // position_key -> info
};

// =============================================================================
// Modify Liquidity Result
// =============================================================================

struct ModifyLiquidityResult {
    BalanceDelta principal;      // positive = paid in, negative = paid out
    BalanceDelta fees_accrued;   // non-negative, owed to the position owner
    BalanceDelta caller_delta;   // principal - fees_accrued
};

// =============================================================================
// Unlock Callback (implemented by every locker)
// =============================================================================

class IUnlockCallback {
public:
    virtual ~IUnlockCallback() = default;

    // Invoked by the pool manager from inside unlock(). `sender` is the
    // address of the contract making the call; implementations must treat
    // any other sender as hostile.
    virtual std::vector<uint8_t> unlock_callback(const Address& sender,
                                                 const std::vector<uint8_t>& data) = 0;
};

// =============================================================================
// Quoter (read-only pricing, usable outside the locked region)
// =============================================================================

struct SwapQuote {
    I128 amount_in;          // input actually consumed (including LP fee)
    I128 amount_out;
    I128 sqrt_price_after_x96;
};

class IQuoter {
public:
    virtual ~IQuoter() = default;

    // Simulates an exact-input swap without touching state.
    // Returns nullopt when the pool is missing or the limit is invalid.
    virtual std::optional<SwapQuote> quote_exact_input(const PoolKey& key, bool zero_for_one,
                                                       I128 amount_in,
                                                       I128 sqrt_price_limit = 0) const = 0;
};

// =============================================================================
// PoolManager - v4-style singleton venue with flash accounting
// =============================================================================

class PoolManager : public IQuoter, public Journaled {
public:
    explicit PoolManager(Chain& chain, const Address& self = addresses::POOL_MANAGER);
    ~PoolManager() override;

    // Non-copyable
    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    const Address& address() const { return self_; }

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Initialize a new pool
    // Returns: errors::OK, or an error code (tick is readable via get_slot0)
    int32_t initialize(const PoolKey& key, I128 sqrt_price_x96);

    // Unlock the manager and call back into `locker`. Every currency delta
    // created inside the callback must be settled before this returns.
    std::vector<uint8_t> unlock(IUnlockCallback& locker, const std::vector<uint8_t>& data);

    // Exact-input swap - must be called within unlock()
    // Returns: balance delta, positive = owed to the pool
    BalanceDelta swap(const PoolKey& key, const SwapParams& params);

    // Add/remove liquidity or collect fees (liquidity_delta == 0) - within unlock()
    ModifyLiquidityResult modify_liquidity(const Address& owner, const PoolKey& key,
                                           const ModifyLiquidityParams& params);

    // Pay out of the pool (creates debt) - within unlock()
    void take(const Currency& currency, const Address& to, I128 amount);

    // Pay into the pool from `payer` (clears debt) - within unlock()
    I128 settle(const Currency& currency, const Address& payer, I128 amount);

    bool is_unlocked() const { return unlocked_; }

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<SwapQuote> quote_exact_input(const PoolKey& key, bool zero_for_one,
                                               I128 amount_in,
                                               I128 sqrt_price_limit = 0) const override;

    std::optional<Slot0> get_slot0(const PoolKey& key) const;
    std::optional<I128> get_liquidity(const PoolKey& key) const;
    std::optional<PositionInfo> get_position(const PoolKey& key,
                                              const Address& owner,
                                              int32_t tick_lower,
                                              int32_t tick_upper,
                                              uint64_t salt = 0) const;

    bool pool_exists(const PoolKey& key) const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

    std::function<void()> checkpoint() override;

private:
    struct SwapOutcome {
        I128 amount_consumed;
        I128 amount_out;
        I128 fee_paid;
    };

    Chain& chain_;
    Address self_;

    // Pool storage: pool_id -> state
    std::unordered_map<uint64_t, PoolState> pools_;

    // Flash accounting state
    bool unlocked_{false};
    std::map<Address, I128> currency_deltas_;  // currency -> owed to pool

    // Statistics
    uint64_t total_swaps_{0};
    uint64_t total_liquidity_ops_{0};

    // Internal helpers
    PoolState* get_pool(const PoolKey& key);
    const PoolState* get_pool(const PoolKey& key) const;
    void require_unlocked(const char* op) const;
    void account_delta(const Currency& currency, I128 delta);

    static uint64_t position_key(const Address& owner, int32_t tick_lower,
                                  int32_t tick_upper, uint64_t salt);

    // Runs the swap loop against `pool` (the live state or a copy)
    static SwapOutcome execute_swap(PoolState& pool, const SwapParams& params);
};

} // namespace liquid

#endif // LIQUID_POOL_HPP
