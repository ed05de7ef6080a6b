/**
 * liquid-sim - scripted session against an in-process venue
 *
 * Builds a chain, a pool manager, a burn accumulator with its own burn pool
 * and one Liquid token from a JSON config, then runs buy / sell / outside
 * trade / harvest / flush and prints every settlement record.
 *
 *   liquid-sim [config.json]
 */

#include <liquid/burner.hpp>
#include <liquid/config.hpp>
#include <liquid/errors.hpp>
#include <liquid/log.hpp>
#include <liquid/math.hpp>
#include <liquid/swap_router.hpp>
#include <liquid/token.hpp>

#include <iostream>
#include <string>

using namespace liquid;

namespace {

constexpr I128 ETHER = X18_ONE;

// ============================================
// Session addresses
// ============================================

const Address CREATOR = addresses::from_id(0xc0ffee);
const Address ALICE = addresses::from_id(0xa11ce);
const Address BOB = addresses::from_id(0xb0b);
const Address WHALE = addresses::from_id(0x3a1e);
const Address LP = addresses::from_id(0x1b);
const Address BURNER_OWNER = addresses::from_id(0xad);
const Address BURNER = addresses::from_id(0xb0);
const Address TOKEN = addresses::from_id(0x70c);
const Address TARGET = addresses::from_id(0x7a7e);

std::string eth(I128 wei) {
    return std::to_string(x18::to_double(wei)) + " ETH";
}

// ============================================
// Event printer
// ============================================

class Printer : public ILiquidListener, public IBurnListener {
public:
    void on_trade_settled(const TradeSettled& r) override {
        std::cout << "[trade] " << (r.side == TradeSide::Buy ? "BUY " : "SELL")
                  << " trader=" << addresses::to_hex(r.trader)
                  << " gross=" << eth(r.gross)
                  << " fee=" << eth(r.fee)
                  << " net=" << eth(r.net)
                  << " tokens=" << x18::to_double(r.tokens) << std::endl;
        std::cout << "        creator=" << to_string(r.creator_fee)
                  << " burn=" << to_string(r.burn_fee)
                  << " protocol=" << to_string(r.protocol_fee)
                  << " referrer=" << to_string(r.referrer_fee)
                  << " burn_credited=" << (r.burn_credited ? "yes" : "no")
                  << " price=" << x18::to_double(r.effective_price_x18) << " ETH/token"
                  << std::endl;
    }

    void on_rewards_harvested(const HarvestResult& r) override {
        std::cout << "[harvest] eth=" << eth(r.eth_collected)
                  << " tokens=" << x18::to_double(r.tokens_collected)
                  << " creator_eth=" << to_string(r.creator_eth)
                  << " protocol_eth=" << to_string(r.protocol_eth) << std::endl;
    }

    void on_burn_deposit(const BurnDeposit& e) override {
        std::cout << "[burn] deposit " << to_string(e.amount) << " wei "
                  << (e.success ? "accepted" : "declined") << std::endl;
    }

    void on_burn_flush(const BurnFlush& e) override {
        std::cout << "[burn] flush " << eth(e.amount_in) << " -> "
                  << x18::to_double(e.burned) << " target burned "
                  << (e.success ? "ok" : "FAILED") << std::endl;
    }
};

int run(ConfigStore& config) {
    log::init(config.log_level());

    Chain chain;
    PoolManager manager(chain);
    SwapRouter router(chain, manager);
    Printer printer;

    // Burn pool: native / target at 1:1 with two-sided liquidity
    const Currency target(TARGET);
    PoolKey burn_pool{NATIVE, target, fees::FEE_030, tick_spacings::TICK_SPACING_030,
                      addresses::ZERO};
    int32_t rc = manager.initialize(burn_pool, tick_math::get_sqrt_ratio_at_tick(0));
    if (rc != errors::OK) {
        std::cerr << "burn pool initialization failed: " << rc << std::endl;
        return 1;
    }
    chain.mint(NATIVE, LP, 10000 * ETHER);
    chain.mint(target, LP, 10000 * ETHER);
    router.add_liquidity(LP, burn_pool, -6000, 6000, 1000 * ETHER);

    BurnAccumulator burner(chain, manager, BURNER, BURNER_OWNER, burn_pool,
                           config.burner_max_slippage_bps());
    burner.set_listener(&printer);
    config.set_burn_accumulator(&burner);

    LiquidToken token(chain, manager, config, TOKEN,
                      TokenParams{"Liquid Demo", "LQD", 1000000000 * ETHER, 100000000 * ETHER});
    token.set_listener(&printer);
    token.initialize(CREATOR);

    chain.mint(NATIVE, ALICE, 10 * ETHER);
    chain.mint(NATIVE, WHALE, 50 * ETHER);

    std::cout << std::string(60, '=') << std::endl;
    std::cout << "LIQUID SIMULATION: " << token.name() << " (" << token.symbol() << ")" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    // Quote, then buy with the quoted post-trade price as the limit
    BuyQuote quote = token.quote_buy(ETHER);
    std::cout << "[quote] 1 ETH -> " << x18::to_double(quote.tokens_out) << " tokens (fee "
              << eth(quote.fee) << ")" << std::endl;
    I128 bought = token.buy(ALICE, ETHER, ALICE, BOB, quote.tokens_out, quote.sqrt_price_after_x96);

    // Outside trading generates LP fees on the token position
    router.swap_exact_input(WHALE, token.token_state().pool_key, true, 20 * ETHER, 0, WHALE);

    SellQuote sell_quote = token.quote_sell(bought / 2);
    token.sell(ALICE, bought / 2, ALICE, addresses::ZERO, sell_quote.payout);

    token.harvest(ALICE);

    std::cout << "[burn] pending before flush: " << eth(burner.pending_balance()) << std::endl;
    burner.flush(ALICE);

    std::cout << std::string(60, '-') << std::endl;
    std::cout << "alice:    " << eth(chain.balance_of(ALICE, NATIVE)) << ", "
              << x18::to_double(token.balance_of(ALICE)) << " LQD" << std::endl;
    std::cout << "creator:  " << eth(chain.balance_of(CREATOR, NATIVE)) << std::endl;
    std::cout << "protocol: " << eth(chain.balance_of(config.protocol_fee_recipient(), NATIVE))
              << std::endl;
    std::cout << "referrer: " << eth(chain.balance_of(BOB, NATIVE)) << std::endl;
    std::cout << "sink:     " << x18::to_double(chain.balance_of(burner.sink(), target))
              << " target tokens" << std::endl;

    auto stats = manager.get_stats();
    std::cout << "venue:    " << stats.total_pools << " pools, " << stats.total_swaps
              << " swaps, " << stats.total_liquidity_ops << " liquidity ops" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        ConfigStore config = argc > 1 ? ConfigStore::from_file(argv[1]) : ConfigStore();
        return run(config);
    } catch (const LiquidError& e) {
        std::cerr << "liquid-sim: " << e.what() << " (code " << e.code() << ")" << std::endl;
        return 1;
    }
}
