#ifndef LIQUID_TOKEN_HPP
#define LIQUID_TOKEN_HPP

#include <string>

#include "types.hpp"
#include "chain.hpp"
#include "pool.hpp"
#include "config.hpp"
#include "fees.hpp"
#include "settlement_guard.hpp"

namespace liquid {

// =============================================================================
// Token State
// =============================================================================

struct TokenParams {
    std::string name;
    std::string symbol;
    I128 total_supply;
    I128 creator_allocation;
};

struct TokenState {
    bool initialized;
    Address creator;
    I128 total_supply;          // minted at initialize
    I128 creator_allocation;
    I128 seed_allocation;       // deposited into the venue position
    PoolKey pool_key;
    int32_t tick_lower;
    int32_t tick_upper;
    I128 seed_liquidity;
};

// =============================================================================
// Settlement Records
// =============================================================================

enum class TradeSide : uint8_t {
    Buy = 0,
    Sell = 1,
};

// Amounts in wei. Buy: gross = value paid, net = value swapped, tokens = out.
// Sell: gross = swap proceeds, net = payout, tokens = in.
struct TradeSettled {
    TradeSide side;
    Address trader;
    Address recipient;
    Address referrer;
    I128 gross;
    I128 fee;
    I128 net;
    I128 tokens;
    I128 creator_fee;
    I128 burn_fee;
    I128 protocol_fee;      // includes redirected shares
    I128 referrer_fee;
    bool burn_credited;
    I128 sqrt_price_before_x96;
    I128 sqrt_price_after_x96;
    I128 effective_price_x18;  // wei per whole token paid/received by the trader
};

struct HarvestResult {
    Address caller;
    I128 eth_collected;
    I128 tokens_collected;
    I128 creator_eth;
    I128 protocol_eth;
    I128 creator_tokens;
    I128 protocol_tokens;
};

struct TradeAndHarvest {
    I128 amount;            // tokens out (buy) or payout (sell)
    HarvestResult rewards;
};

// fillable is false when the pool cannot absorb the whole input; the trade
// would fail and the output fields stay zero.
struct BuyQuote {
    uint32_t fee_bps;
    I128 fee;
    I128 net;
    I128 tokens_out;
    I128 sqrt_price_after_x96;
    bool fillable;
};

struct SellQuote {
    uint32_t fee_bps;
    I128 fee;
    I128 tokens_in;
    I128 payout;
    I128 sqrt_price_after_x96;
    bool fillable;
};

class ILiquidListener {
public:
    virtual ~ILiquidListener() = default;
    virtual void on_trade_settled(const TradeSettled& record) { (void)record; }
    virtual void on_rewards_harvested(const HarvestResult& result) { (void)result; }
};

// =============================================================================
// LiquidToken - trade engine settling against the venue
// =============================================================================

class LiquidToken : public IUnlockCallback, public Journaled {
public:
    LiquidToken(Chain& chain, PoolManager& manager, const IConfigSource& config,
                const Address& self, TokenParams params);
    ~LiquidToken() override;

    LiquidToken(const LiquidToken&) = delete;
    LiquidToken& operator=(const LiquidToken&) = delete;

    // Mint supply, pay the creator allocation and seed the venue position
    // single-sided with the rest. Runs once.
    void initialize(const Address& creator);

    // =========================================================================
    // Trading
    // =========================================================================

    // `sender` pays `value` wei; tokens go to `recipient`
    I128 buy(const Address& sender, I128 value, const Address& recipient,
             const Address& referrer, I128 min_tokens_out, I128 sqrt_price_limit = 0);

    // `sender` sells `token_amount`; the post-fee payout goes to `recipient`
    I128 sell(const Address& sender, I128 token_amount, const Address& recipient,
              const Address& referrer, I128 min_payout, I128 sqrt_price_limit = 0);

    // Collect LP fees accrued on the position, split 50/50 creator/protocol
    HarvestResult harvest(const Address& sender);

    TradeAndHarvest buy_and_harvest(const Address& sender, I128 value, const Address& recipient,
                                    const Address& referrer, I128 min_tokens_out,
                                    I128 sqrt_price_limit = 0);
    TradeAndHarvest sell_and_harvest(const Address& sender, I128 token_amount,
                                     const Address& recipient, const Address& referrer,
                                     I128 min_payout, I128 sqrt_price_limit = 0);

    // Destroy `amount` of the holder's tokens
    void burn(const Address& holder, I128 amount);

    // =========================================================================
    // Quotes (read-only)
    // =========================================================================

    BuyQuote quote_buy(I128 value) const;
    SellQuote quote_sell(I128 token_amount) const;

    // =========================================================================
    // Accessors
    // =========================================================================

    const Address& address() const { return self_; }
    Currency currency() const { return Currency(self_); }
    const std::string& name() const { return params_.name; }
    const std::string& symbol() const { return params_.symbol; }
    const TokenState& token_state() const { return state_; }
    I128 balance_of(const Address& owner) const;
    I128 total_supply() const;
    I128 current_sqrt_price() const;

    void set_listener(ILiquidListener* listener) { listener_ = listener; }

    // Venue entry point
    std::vector<uint8_t> unlock_callback(const Address& sender,
                                         const std::vector<uint8_t>& data) override;

    std::function<void()> checkpoint() override;

private:
    TradeSettled execute_buy(const Address& sender, I128 value, const Address& recipient,
                             const Address& referrer, I128 min_tokens_out, I128 sqrt_price_limit);
    TradeSettled execute_sell(const Address& sender, I128 token_amount, const Address& recipient,
                              const Address& referrer, I128 min_payout, I128 sqrt_price_limit);
    HarvestResult execute_harvest(const Address& sender);

    BalanceDelta settle(const SettlementContext& ctx);

    BalanceDelta on_buy(const SettlementContext& ctx);
    BalanceDelta on_sell(const SettlementContext& ctx);
    BalanceDelta on_seed(const SettlementContext& ctx);
    BalanceDelta on_harvest(const SettlementContext& ctx);

    void require_initialized() const;
    void emit(const TradeSettled& record);
    void emit(const HarvestResult& result);

    Chain& chain_;
    PoolManager& manager_;
    const IConfigSource& config_;
    Address self_;
    TokenParams params_;
    TokenState state_;
    SettlementGuard guard_;
    ILiquidListener* listener_{nullptr};
};

} // namespace liquid

#endif // LIQUID_TOKEN_HPP
