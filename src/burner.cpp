// =============================================================================
// burner.cpp - Burn fee accumulator
// =============================================================================

#include "liquid/burner.hpp"
#include "liquid/math.hpp"
#include "liquid/errors.hpp"
#include "liquid/log.hpp"

#include <exception>

namespace liquid {

namespace {

void validate_pool(const PoolKey& pool) {
    if (!pool.currency0.is_native() || pool.currency1.is_native()) {
        throw ConfigError("burn pool must pair the native currency with a target token");
    }
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

BurnAccumulator::BurnAccumulator(Chain& chain, PoolManager& manager, const Address& self,
                                 const Address& owner, const PoolKey& pool,
                                 uint32_t max_slippage_bps)
    : chain_(chain),
      manager_(manager),
      self_(self),
      owner_(owner),
      state_{0, true, pool, addresses::BURN_SINK, max_slippage_bps, &manager, false, 0, 0, 0},
      guard_(manager.address()) {
    if (addresses::is_zero(self_) || addresses::is_zero(owner_)) {
        throw ValidationError(errors::ZERO_ADDRESS, "BurnAccumulator: zero address");
    }
    validate_pool(pool);
    if (max_slippage_bps > bps::DENOMINATOR) {
        throw ConfigError("max_slippage_bps above 100%");
    }
    chain_.attach(this);
}

BurnAccumulator::~BurnAccumulator() {
    chain_.detach(this);
}

// =============================================================================
// Deposit
// =============================================================================

bool BurnAccumulator::deposit(const Address& from, I128 amount) {
    bool accepted = false;
    if (!state_.enabled) {
        log::get()->warn("burn accumulator disabled, deposit of {} declined", to_string(amount));
    } else if (amount <= 0) {
        log::get()->warn("burn accumulator: ignoring deposit of {}", to_string(amount));
    } else {
        int32_t rc = chain_.try_transfer(NATIVE, from, self_, amount);
        if (rc == errors::OK) {
            state_.pending += amount;
            state_.total_deposited += amount;
            accepted = true;
        } else {
            log::get()->warn("burn accumulator: pulling {} from {} failed ({})",
                             to_string(amount), addresses::to_hex(from), rc);
        }
    }

    emit(BurnDeposit{from, amount, accepted});

    if (accepted && state_.flush_on_deposit) {
        try_flush(from);
    }
    return accepted;
}

// =============================================================================
// Flush
// =============================================================================

I128 BurnAccumulator::slippage_floor(I128 amount_in) const {
    if (!state_.quoter) return 0;

    auto quote = state_.quoter->quote_exact_input(state_.pool, true, amount_in);
    if (!quote) {
        throw VenueError(errors::POOL_NOT_INITIALIZED, "BurnAccumulator: no quote for burn pool");
    }
    return full_math::mul_div(quote->amount_out,
                              bps::DENOMINATOR - state_.max_slippage_bps,
                              bps::DENOMINATOR);
}

I128 BurnAccumulator::flush(const Address& caller) {
    if (!state_.enabled || state_.pending == 0) {
        log::get()->debug("burn flush skipped (enabled={}, pending={})",
                          state_.enabled, to_string(state_.pending));
        return 0;
    }

    Chain::Checkpoint checkpoint(chain_);

    const I128 amount = state_.pending;
    const I128 min_out = slippage_floor(amount);

    BalanceDelta delta{};
    {
        SettlementGuard::Scope scope(guard_, SettlementContext{SettlementKind::Flush, amount, 0,
                                                                caller, min_out});
        delta = payload::decode_delta(manager_.unlock(*this, scope.payload()));
    }

    const I128 burned = -delta.amount1;
    state_.pending = 0;
    state_.total_converted += amount;
    state_.total_burned += burned;
    emit(BurnFlush{caller, amount, burned, true});
    checkpoint.commit();

    log::get()->info("burn flush: {} wei -> {} target tokens to {}", to_string(amount),
                     to_string(burned), addresses::to_hex(state_.sink));
    return burned;
}

bool BurnAccumulator::try_flush(const Address& caller) {
    const I128 pending = state_.pending;
    try {
        flush(caller);
        return true;
    } catch (const GuardViolation&) {
        throw;
    } catch (const LiquidError& e) {
        log::get()->warn("burn flush of {} failed: {} (code {}), balance stays pending",
                         to_string(pending), e.what(), e.code());
    } catch (const std::exception& e) {
        log::get()->warn("burn flush of {} failed: {}, balance stays pending",
                         to_string(pending), e.what());
    }
    emit(BurnFlush{caller, pending, 0, false});
    return false;
}

// Held until the enclosing operation commits; dropped if it rolls back
void BurnAccumulator::emit(const BurnDeposit& event) {
    chain_.defer([this, event]() {
        if (listener_) listener_->on_burn_deposit(event);
    });
}

void BurnAccumulator::emit(const BurnFlush& event) {
    chain_.defer([this, event]() {
        if (listener_) listener_->on_burn_flush(event);
    });
}

std::vector<uint8_t> BurnAccumulator::unlock_callback(const Address& sender,
                                                      const std::vector<uint8_t>& data) {
    SettlementContext ctx = guard_.consume(sender, data);
    if (ctx.kind != SettlementKind::Flush) {
        throw GuardViolation(errors::PAYLOAD_MISMATCH, "BurnAccumulator: unexpected settlement kind");
    }

    const PoolKey& key = state_.pool;
    BalanceDelta delta = manager_.swap(key, SwapParams{true, ctx.amount, ctx.price_limit});
    if (delta.amount0 != ctx.amount) {
        throw SlippageError(errors::PARTIAL_FILL, "BurnAccumulator: burn pool cannot absorb pending");
    }
    const I128 out = -delta.amount1;
    if (out < ctx.min_out) {
        throw SlippageError(errors::SLIPPAGE_EXCEEDED, "BurnAccumulator: output below slippage floor");
    }

    manager_.settle(key.currency0, self_, ctx.amount);
    manager_.take(key.currency1, state_.sink, out);
    return payload::encode_delta(delta);
}

// =============================================================================
// Owner Configuration
// =============================================================================

void BurnAccumulator::require_owner(const Address& caller, const char* op) const {
    if (caller != owner_) {
        throw Unauthorized(std::string("BurnAccumulator: ") + op + " is owner-only");
    }
}

void BurnAccumulator::set_enabled(const Address& caller, bool enabled) {
    require_owner(caller, "set_enabled");
    state_.enabled = enabled;
    log::get()->info("burn accumulator {}", enabled ? "enabled" : "disabled");
}

void BurnAccumulator::set_pool(const Address& caller, const PoolKey& pool) {
    require_owner(caller, "set_pool");
    validate_pool(pool);
    state_.pool = pool;
}

void BurnAccumulator::set_max_slippage_bps(const Address& caller, uint32_t slippage_bps) {
    require_owner(caller, "set_max_slippage_bps");
    if (slippage_bps > bps::DENOMINATOR) {
        throw ConfigError("max_slippage_bps above 100%");
    }
    state_.max_slippage_bps = slippage_bps;
}

void BurnAccumulator::set_quoter(const Address& caller, const IQuoter* quoter) {
    require_owner(caller, "set_quoter");
    state_.quoter = quoter;
}

void BurnAccumulator::set_flush_on_deposit(const Address& caller, bool flush) {
    require_owner(caller, "set_flush_on_deposit");
    state_.flush_on_deposit = flush;
}

void BurnAccumulator::set_sink(const Address& caller, const Address& sink) {
    require_owner(caller, "set_sink");
    if (addresses::is_zero(sink)) {
        throw ValidationError(errors::ZERO_ADDRESS, "BurnAccumulator: zero sink");
    }
    state_.sink = sink;
}

std::function<void()> BurnAccumulator::checkpoint() {
    State saved = state_;
    return [this, saved]() { state_ = saved; };
}

} // namespace liquid
