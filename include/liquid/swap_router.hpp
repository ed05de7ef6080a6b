#ifndef LIQUID_SWAP_ROUTER_HPP
#define LIQUID_SWAP_ROUTER_HPP

#include <optional>

#include "pool.hpp"

namespace liquid {

// =============================================================================
// SwapRouter - plain venue access for outside traders and LPs
// (no protocol fees; pays straight from the caller's balance)
// =============================================================================

class SwapRouter : public IUnlockCallback {
public:
    SwapRouter(Chain& chain, PoolManager& manager);

    // Exact-input swap; output goes to `recipient`. Atomic: any failure
    // (price limit, balance) leaves the world unchanged.
    BalanceDelta swap_exact_input(const Address& payer, const PoolKey& key,
                                  bool zero_for_one, I128 amount_in,
                                  I128 sqrt_price_limit, const Address& recipient);

    // Mint a position owned by `provider`, who pays the principal
    BalanceDelta add_liquidity(const Address& provider, const PoolKey& key,
                               int32_t tick_lower, int32_t tick_upper, I128 liquidity);

    std::vector<uint8_t> unlock_callback(const Address& sender,
                                         const std::vector<uint8_t>& data) override;

private:
    struct Request {
        bool is_swap;
        Address payer;
        Address recipient;
        PoolKey key;
        SwapParams swap;
        ModifyLiquidityParams liquidity;
    };

    BalanceDelta run(const Request& request);
    void settle_deltas(const Request& request, const BalanceDelta& delta);

    Chain& chain_;
    PoolManager& manager_;
    std::optional<Request> pending_;
};

} // namespace liquid

#endif // LIQUID_SWAP_ROUTER_HPP
