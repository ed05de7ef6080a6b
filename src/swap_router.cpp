// =============================================================================
// swap_router.cpp - Direct venue access for outside traders and LPs
// =============================================================================

#include "liquid/swap_router.hpp"
#include "liquid/settlement_guard.hpp"
#include "liquid/errors.hpp"

namespace liquid {

SwapRouter::SwapRouter(Chain& chain, PoolManager& manager)
    : chain_(chain), manager_(manager) {}

BalanceDelta SwapRouter::swap_exact_input(const Address& payer, const PoolKey& key,
                                          bool zero_for_one, I128 amount_in,
                                          I128 sqrt_price_limit, const Address& recipient) {
    if (addresses::is_zero(recipient)) {
        throw ValidationError(errors::ZERO_ADDRESS, "SwapRouter: zero recipient");
    }
    Request request{};
    request.is_swap = true;
    request.payer = payer;
    request.recipient = recipient;
    request.key = key;
    request.swap = SwapParams{zero_for_one, amount_in, sqrt_price_limit};
    return run(request);
}

BalanceDelta SwapRouter::add_liquidity(const Address& provider, const PoolKey& key,
                                       int32_t tick_lower, int32_t tick_upper,
                                       I128 liquidity) {
    if (liquidity <= 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "SwapRouter: liquidity must be positive");
    }
    Request request{};
    request.is_swap = false;
    request.payer = provider;
    request.recipient = provider;
    request.key = key;
    request.liquidity = ModifyLiquidityParams{tick_lower, tick_upper, liquidity, 0};
    return run(request);
}

BalanceDelta SwapRouter::run(const Request& request) {
    if (pending_) {
        throw GuardViolation(errors::REENTRANCY, "SwapRouter: request already in flight");
    }

    Chain::Checkpoint checkpoint(chain_);
    pending_ = request;
    std::vector<uint8_t> result;
    try {
        result = manager_.unlock(*this, {});
    } catch (...) {
        pending_.reset();
        throw;
    }
    pending_.reset();
    checkpoint.commit();
    return payload::decode_delta(result);
}

std::vector<uint8_t> SwapRouter::unlock_callback(const Address& sender,
                                                 const std::vector<uint8_t>& data) {
    (void)data;
    if (sender != manager_.address()) {
        throw GuardViolation(errors::UNAUTHORIZED_CALLBACK, "SwapRouter: caller is not the venue");
    }
    if (!pending_) {
        throw GuardViolation(errors::NO_ACTIVE_SETTLEMENT, "SwapRouter: no request in flight");
    }
    const Request request = *pending_;

    BalanceDelta delta{};
    if (request.is_swap) {
        delta = manager_.swap(request.key, request.swap);
    } else {
        delta = manager_.modify_liquidity(request.payer, request.key, request.liquidity).caller_delta;
    }
    settle_deltas(request, delta);
    return payload::encode_delta(delta);
}

void SwapRouter::settle_deltas(const Request& request, const BalanceDelta& delta) {
    // Positive: owed to the pool by the payer; negative: owed to the recipient
    if (delta.amount0 > 0) manager_.settle(request.key.currency0, request.payer, delta.amount0);
    if (delta.amount1 > 0) manager_.settle(request.key.currency1, request.payer, delta.amount1);
    if (delta.amount0 < 0) manager_.take(request.key.currency0, request.recipient, -delta.amount0);
    if (delta.amount1 < 0) manager_.take(request.key.currency1, request.recipient, -delta.amount1);
}

} // namespace liquid
