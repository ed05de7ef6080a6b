// =============================================================================
// token.cpp - LiquidToken trade engine
// Every public mutating call runs inside one Chain::Checkpoint: it either
// completes or leaves balances, venue and token state untouched.
// =============================================================================

#include "liquid/token.hpp"
#include "liquid/math.hpp"
#include "liquid/errors.hpp"
#include "liquid/log.hpp"

#include <utility>

namespace liquid {

namespace {

I128 effective_price(I128 eth, I128 tokens) {
    if (tokens <= 0 || eth <= 0) return 0;
    return full_math::mul_div(eth, X18_ONE, tokens);
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

LiquidToken::LiquidToken(Chain& chain, PoolManager& manager, const IConfigSource& config,
                         const Address& self, TokenParams params)
    : chain_(chain),
      manager_(manager),
      config_(config),
      self_(self),
      params_(std::move(params)),
      state_{},
      guard_(manager.address()) {
    if (addresses::is_zero(self_)) {
        throw ValidationError(errors::ZERO_ADDRESS, "LiquidToken: zero token address");
    }
    if (params_.total_supply <= 0 ||
        params_.creator_allocation < 0 ||
        params_.creator_allocation >= params_.total_supply) {
        throw ValidationError(errors::ZERO_AMOUNT, "LiquidToken: invalid supply allocation");
    }
    chain_.attach(this);
}

LiquidToken::~LiquidToken() {
    chain_.detach(this);
}

// =============================================================================
// Initialize
// =============================================================================

void LiquidToken::initialize(const Address& creator) {
    if (state_.initialized) {
        throw ValidationError(errors::ALREADY_INITIALIZED, "LiquidToken: already initialized");
    }
    if (addresses::is_zero(creator)) {
        throw ValidationError(errors::ZERO_ADDRESS, "LiquidToken: zero creator");
    }

    Chain::Checkpoint checkpoint(chain_);

    const Currency token = currency();
    const int32_t tick_lower = config_.lp_tick_lower();
    const int32_t tick_upper = config_.lp_tick_upper();

    PoolKey key{NATIVE, token, config_.pool_fee(), config_.tick_spacing(), addresses::ZERO};

    chain_.mint(token, self_, params_.total_supply);
    chain_.transfer(token, self_, creator, params_.creator_allocation);
    const I128 seed = params_.total_supply - params_.creator_allocation;

    // Price starts at the top of the range so the position holds only tokens
    const I128 sqrt_lower = tick_math::get_sqrt_ratio_at_tick(tick_lower);
    const I128 sqrt_upper = tick_math::get_sqrt_ratio_at_tick(tick_upper);
    int32_t rc = manager_.initialize(key, sqrt_upper);
    if (rc != errors::OK) {
        throw VenueError(rc, "LiquidToken: pool initialization failed");
    }

    const I128 liquidity = sqrt_price_math::get_liquidity_for_amount1(sqrt_lower, sqrt_upper, seed);
    if (liquidity <= 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "LiquidToken: seed too small for range");
    }

    state_.initialized = true;
    state_.creator = creator;
    state_.total_supply = params_.total_supply;
    state_.creator_allocation = params_.creator_allocation;
    state_.seed_allocation = seed;
    state_.pool_key = key;
    state_.tick_lower = tick_lower;
    state_.tick_upper = tick_upper;
    state_.seed_liquidity = liquidity;

    settle(SettlementContext{SettlementKind::Seed, liquidity, 0, creator, 0});

    checkpoint.commit();
    log::get()->info("{} ({}) initialized: supply={} creator={} seed={} liquidity={} range=[{}, {}]",
                     params_.name, params_.symbol, to_string(params_.total_supply),
                     addresses::to_hex(creator), to_string(seed), to_string(liquidity),
                     tick_lower, tick_upper);
}

// =============================================================================
// Public Trading Operations
// =============================================================================

I128 LiquidToken::buy(const Address& sender, I128 value, const Address& recipient,
                      const Address& referrer, I128 min_tokens_out, I128 sqrt_price_limit) {
    Chain::Checkpoint checkpoint(chain_);
    TradeSettled record = execute_buy(sender, value, recipient, referrer,
                                      min_tokens_out, sqrt_price_limit);
    emit(record);
    checkpoint.commit();
    return record.tokens;
}

I128 LiquidToken::sell(const Address& sender, I128 token_amount, const Address& recipient,
                       const Address& referrer, I128 min_payout, I128 sqrt_price_limit) {
    Chain::Checkpoint checkpoint(chain_);
    TradeSettled record = execute_sell(sender, token_amount, recipient, referrer,
                                       min_payout, sqrt_price_limit);
    emit(record);
    checkpoint.commit();
    return record.net;
}

HarvestResult LiquidToken::harvest(const Address& sender) {
    Chain::Checkpoint checkpoint(chain_);
    HarvestResult result = execute_harvest(sender);
    emit(result);
    checkpoint.commit();
    return result;
}

TradeAndHarvest LiquidToken::buy_and_harvest(const Address& sender, I128 value,
                                             const Address& recipient, const Address& referrer,
                                             I128 min_tokens_out, I128 sqrt_price_limit) {
    Chain::Checkpoint checkpoint(chain_);
    TradeSettled record = execute_buy(sender, value, recipient, referrer,
                                      min_tokens_out, sqrt_price_limit);
    HarvestResult rewards = execute_harvest(sender);
    emit(record);
    emit(rewards);
    checkpoint.commit();
    return TradeAndHarvest{record.tokens, rewards};
}

TradeAndHarvest LiquidToken::sell_and_harvest(const Address& sender, I128 token_amount,
                                              const Address& recipient, const Address& referrer,
                                              I128 min_payout, I128 sqrt_price_limit) {
    Chain::Checkpoint checkpoint(chain_);
    TradeSettled record = execute_sell(sender, token_amount, recipient, referrer,
                                       min_payout, sqrt_price_limit);
    HarvestResult rewards = execute_harvest(sender);
    emit(record);
    emit(rewards);
    checkpoint.commit();
    return TradeAndHarvest{record.net, rewards};
}

void LiquidToken::burn(const Address& holder, I128 amount) {
    if (amount <= 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "LiquidToken: burn amount must be positive");
    }
    chain_.burn(currency(), holder, amount);
    log::get()->info("{} burned {} from {}", params_.symbol, to_string(amount),
                     addresses::to_hex(holder));
}

// =============================================================================
// Buy
// =============================================================================

TradeSettled LiquidToken::execute_buy(const Address& sender, I128 value, const Address& recipient,
                                      const Address& referrer, I128 min_tokens_out,
                                      I128 sqrt_price_limit) {
    require_initialized();

    // 1. Validate
    if (value <= 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "buy: zero value");
    }
    if (addresses::is_zero(recipient) || addresses::is_zero(sender)) {
        throw ValidationError(errors::ZERO_ADDRESS, "buy: zero address");
    }
    if (value < config_.min_order_size()) {
        throw ValidationError(errors::ORDER_TOO_SMALL, "buy: order below minimum size");
    }

    // 2. Fee first, then the venue; quote_buy uses the same order
    const FeeConfig fees = config_.fee_config();
    const I128 fee = compute_fee(value, fees.total_fee_bps);
    const I128 net = value - fee;
    if (net <= 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "buy: nothing left after fee");
    }

    chain_.transfer(NATIVE, sender, self_, value);
    const I128 price_before = current_sqrt_price();

    // 3-4. Guarded swap; exact fill enforced in the callback
    BalanceDelta delta = settle(SettlementContext{SettlementKind::Buy, net, sqrt_price_limit,
                                                  sender, min_tokens_out});
    const I128 tokens_out = -delta.amount1;
    if (tokens_out < min_tokens_out) {
        throw SlippageError(errors::SLIPPAGE_EXCEEDED, "buy: output below minimum");
    }

    // 5. Fees
    FeeShares shares = split_fee(fee, fees.creator_fee_bps, fees.burn_bps, fees.protocol_bps,
                                 fees.referrer_bps, !addresses::is_zero(referrer));
    FeeDistributor distributor(chain_, NATIVE, self_);
    FeeDistribution paid = distributor.distribute(
        shares, FeeRecipients{state_.creator, referrer, config_.protocol_fee_recipient()},
        config_.burn_accumulator());

    // 6. Deliver
    chain_.transfer(currency(), self_, recipient, tokens_out);

    TradeSettled record{};
    record.side = TradeSide::Buy;
    record.trader = sender;
    record.recipient = recipient;
    record.referrer = referrer;
    record.gross = value;
    record.fee = fee;
    record.net = net;
    record.tokens = tokens_out;
    record.creator_fee = paid.creator_paid;
    record.burn_fee = paid.burn_credited;
    record.protocol_fee = paid.protocol_paid;
    record.referrer_fee = paid.referrer_paid;
    record.burn_credited = paid.burn_credit_ok;
    record.sqrt_price_before_x96 = price_before;
    record.sqrt_price_after_x96 = current_sqrt_price();
    record.effective_price_x18 = effective_price(value, tokens_out);
    return record;
}

// =============================================================================
// Sell
// =============================================================================

TradeSettled LiquidToken::execute_sell(const Address& sender, I128 token_amount,
                                       const Address& recipient, const Address& referrer,
                                       I128 min_payout, I128 sqrt_price_limit) {
    require_initialized();

    if (token_amount <= 0) {
        throw ValidationError(errors::ZERO_AMOUNT, "sell: zero amount");
    }
    if (addresses::is_zero(recipient) || addresses::is_zero(sender)) {
        throw ValidationError(errors::ZERO_ADDRESS, "sell: zero address");
    }

    chain_.transfer(currency(), sender, self_, token_amount);
    const I128 price_before = current_sqrt_price();

    BalanceDelta delta = settle(SettlementContext{SettlementKind::Sell, token_amount,
                                                  sqrt_price_limit, sender, min_payout});
    const I128 proceeds = -delta.amount0;
    if (proceeds <= 0) {
        throw SlippageError(errors::PARTIAL_FILL, "sell: venue returned nothing");
    }
    if (proceeds < config_.min_order_size()) {
        throw ValidationError(errors::ORDER_TOO_SMALL, "sell: proceeds below minimum size");
    }

    // Fee comes off the proceeds; the caller's minimum applies after it
    const FeeConfig fees = config_.fee_config();
    const I128 fee = compute_fee(proceeds, fees.total_fee_bps);
    const I128 payout = proceeds - fee;
    if (payout < min_payout) {
        throw SlippageError(errors::SLIPPAGE_EXCEEDED, "sell: payout below minimum");
    }

    FeeShares shares = split_fee(fee, fees.creator_fee_bps, fees.burn_bps, fees.protocol_bps,
                                 fees.referrer_bps, !addresses::is_zero(referrer));
    FeeDistributor distributor(chain_, NATIVE, self_);
    FeeDistribution paid = distributor.distribute(
        shares, FeeRecipients{state_.creator, referrer, config_.protocol_fee_recipient()},
        config_.burn_accumulator());

    // The seller's payout has no fallback
    chain_.transfer(NATIVE, self_, recipient, payout);

    TradeSettled record{};
    record.side = TradeSide::Sell;
    record.trader = sender;
    record.recipient = recipient;
    record.referrer = referrer;
    record.gross = proceeds;
    record.fee = fee;
    record.net = payout;
    record.tokens = token_amount;
    record.creator_fee = paid.creator_paid;
    record.burn_fee = paid.burn_credited;
    record.protocol_fee = paid.protocol_paid;
    record.referrer_fee = paid.referrer_paid;
    record.burn_credited = paid.burn_credit_ok;
    record.sqrt_price_before_x96 = price_before;
    record.sqrt_price_after_x96 = current_sqrt_price();
    record.effective_price_x18 = effective_price(payout, token_amount);
    return record;
}

// =============================================================================
// Harvest
// =============================================================================

HarvestResult LiquidToken::execute_harvest(const Address& sender) {
    require_initialized();

    BalanceDelta collected = settle(SettlementContext{SettlementKind::Harvest, 0, 0, sender, 0});

    HarvestResult result{};
    result.caller = sender;
    result.eth_collected = collected.amount0;
    result.tokens_collected = collected.amount1;

    const Address protocol = config_.protocol_fee_recipient();
    const FeeRecipients recipients{state_.creator, addresses::ZERO, protocol};

    FeeShares eth_shares = split_fee(collected.amount0, bps::HALF, 0, bps::DENOMINATOR, 0, false);
    FeeDistribution eth_paid = FeeDistributor(chain_, NATIVE, self_)
        .distribute(eth_shares, recipients, nullptr);
    result.creator_eth = eth_paid.creator_paid;
    result.protocol_eth = eth_paid.protocol_paid;

    FeeShares token_shares = split_fee(collected.amount1, bps::HALF, 0, bps::DENOMINATOR, 0, false);
    FeeDistribution token_paid = FeeDistributor(chain_, currency(), self_)
        .distribute(token_shares, recipients, nullptr);
    result.creator_tokens = token_paid.creator_paid;
    result.protocol_tokens = token_paid.protocol_paid;

    return result;
}

// =============================================================================
// Quotes
// =============================================================================

BuyQuote LiquidToken::quote_buy(I128 value) const {
    require_initialized();

    BuyQuote quote{};
    quote.fee_bps = config_.fee_config().total_fee_bps;
    quote.fee = compute_fee(value, quote.fee_bps);
    quote.net = value - quote.fee;
    quote.sqrt_price_after_x96 = current_sqrt_price();
    if (quote.net <= 0) return quote;

    // A buy the venue cannot fill in full fails with PARTIAL_FILL; quote nothing
    auto simulated = manager_.quote_exact_input(state_.pool_key, true, quote.net);
    if (simulated && simulated->amount_in == quote.net) {
        quote.fillable = true;
        quote.tokens_out = simulated->amount_out;
        quote.sqrt_price_after_x96 = simulated->sqrt_price_after_x96;
    }
    return quote;
}

SellQuote LiquidToken::quote_sell(I128 token_amount) const {
    require_initialized();

    SellQuote quote{};
    quote.fee_bps = config_.fee_config().total_fee_bps;
    quote.tokens_in = token_amount;
    quote.sqrt_price_after_x96 = current_sqrt_price();
    if (token_amount <= 0) return quote;

    auto simulated = manager_.quote_exact_input(state_.pool_key, false, token_amount);
    if (simulated && simulated->amount_in == token_amount) {
        quote.fillable = true;
        quote.fee = compute_fee(simulated->amount_out, quote.fee_bps);
        quote.payout = simulated->amount_out - quote.fee;
        quote.sqrt_price_after_x96 = simulated->sqrt_price_after_x96;
    }
    return quote;
}

// =============================================================================
// Venue Settlement
// =============================================================================

BalanceDelta LiquidToken::settle(const SettlementContext& ctx) {
    SettlementGuard::Scope scope(guard_, ctx);
    return payload::decode_delta(manager_.unlock(*this, scope.payload()));
}

std::vector<uint8_t> LiquidToken::unlock_callback(const Address& sender,
                                                  const std::vector<uint8_t>& data) {
    SettlementContext ctx = guard_.consume(sender, data);

    BalanceDelta delta{};
    switch (ctx.kind) {
        case SettlementKind::Buy: delta = on_buy(ctx); break;
        case SettlementKind::Sell: delta = on_sell(ctx); break;
        case SettlementKind::Seed: delta = on_seed(ctx); break;
        case SettlementKind::Harvest: delta = on_harvest(ctx); break;
        default:
            throw GuardViolation(errors::PAYLOAD_MISMATCH,
                                 "LiquidToken: unexpected settlement kind");
    }
    return payload::encode_delta(delta);
}

BalanceDelta LiquidToken::on_buy(const SettlementContext& ctx) {
    const PoolKey& key = state_.pool_key;
    BalanceDelta delta = manager_.swap(key, SwapParams{true, ctx.amount, ctx.price_limit});

    // The venue must consume the whole net amount
    if (delta.amount0 != ctx.amount) {
        log::get()->warn("buy: partial fill {} of {}", to_string(delta.amount0),
                         to_string(ctx.amount));
        throw SlippageError(errors::PARTIAL_FILL, "buy: price limit reached before full fill");
    }

    manager_.settle(key.currency0, self_, delta.amount0);
    manager_.take(key.currency1, self_, -delta.amount1);
    return delta;
}

BalanceDelta LiquidToken::on_sell(const SettlementContext& ctx) {
    const PoolKey& key = state_.pool_key;
    BalanceDelta delta = manager_.swap(key, SwapParams{false, ctx.amount, ctx.price_limit});

    if (delta.amount1 != ctx.amount) {
        log::get()->warn("sell: partial fill {} of {}", to_string(delta.amount1),
                         to_string(ctx.amount));
        throw SlippageError(errors::PARTIAL_FILL, "sell: price limit reached before full fill");
    }

    manager_.settle(key.currency1, self_, delta.amount1);
    manager_.take(key.currency0, self_, -delta.amount0);
    return delta;
}

BalanceDelta LiquidToken::on_seed(const SettlementContext& ctx) {
    const PoolKey& key = state_.pool_key;
    ModifyLiquidityResult result = manager_.modify_liquidity(
        self_, key, ModifyLiquidityParams{state_.tick_lower, state_.tick_upper, ctx.amount, 0});

    if (result.caller_delta.amount0 > 0) {
        manager_.settle(key.currency0, self_, result.caller_delta.amount0);
    }
    if (result.caller_delta.amount1 > 0) {
        manager_.settle(key.currency1, self_, result.caller_delta.amount1);
    }
    return result.caller_delta;
}

BalanceDelta LiquidToken::on_harvest(const SettlementContext& ctx) {
    (void)ctx;
    const PoolKey& key = state_.pool_key;
    ModifyLiquidityResult result = manager_.modify_liquidity(
        self_, key, ModifyLiquidityParams{state_.tick_lower, state_.tick_upper, 0, 0});

    manager_.take(key.currency0, self_, result.fees_accrued.amount0);
    manager_.take(key.currency1, self_, result.fees_accrued.amount1);
    return result.fees_accrued;
}

// =============================================================================
// Accessors
// =============================================================================

I128 LiquidToken::balance_of(const Address& owner) const {
    return chain_.balance_of(owner, currency());
}

I128 LiquidToken::total_supply() const {
    return chain_.total_supply(currency());
}

I128 LiquidToken::current_sqrt_price() const {
    if (!state_.initialized) return 0;
    auto slot0 = manager_.get_slot0(state_.pool_key);
    return slot0 ? slot0->sqrt_price_x96 : 0;
}

void LiquidToken::require_initialized() const {
    if (!state_.initialized) {
        throw ValidationError(errors::NOT_INITIALIZED, "LiquidToken: not initialized");
    }
}

std::function<void()> LiquidToken::checkpoint() {
    TokenState saved = state_;
    return [this, saved]() { state_ = saved; };
}

// =============================================================================
// Events
// =============================================================================

void LiquidToken::emit(const TradeSettled& record) {
    log::get()->info("{} {}: trader={} gross={} fee={} net={} tokens={} "
                     "creator={} burn={} protocol={} referrer={} burn_credited={}",
                     params_.symbol, record.side == TradeSide::Buy ? "buy" : "sell",
                     addresses::to_hex(record.trader), to_string(record.gross),
                     to_string(record.fee), to_string(record.net), to_string(record.tokens),
                     to_string(record.creator_fee), to_string(record.burn_fee),
                     to_string(record.protocol_fee), to_string(record.referrer_fee),
                     record.burn_credited);
    chain_.defer([this, record]() {
        if (listener_) listener_->on_trade_settled(record);
    });
}

void LiquidToken::emit(const HarvestResult& result) {
    log::get()->info("{} harvest: eth={} tokens={} creator_eth={} protocol_eth={}",
                     params_.symbol, to_string(result.eth_collected),
                     to_string(result.tokens_collected), to_string(result.creator_eth),
                     to_string(result.protocol_eth));
    chain_.defer([this, result]() {
        if (listener_) listener_->on_rewards_harvested(result);
    });
}

} // namespace liquid
