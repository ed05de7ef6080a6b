// Liquid - shared test world

#ifndef LIQUID_TEST_FIXTURE_HPP
#define LIQUID_TEST_FIXTURE_HPP

#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_tostring.hpp>

#include <liquid/burner.hpp>
#include <liquid/config.hpp>
#include <liquid/errors.hpp>
#include <liquid/math.hpp>
#include <liquid/swap_router.hpp>
#include <liquid/token.hpp>

// Catch has no printer for 128-bit integers
namespace Catch {
template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) { return liquid::to_string(value); }
};
} // namespace Catch

namespace liquid::testing {

constexpr I128 ETHER = X18_ONE;

constexpr Address CREATOR = addresses::from_id(0xc0ffee);
constexpr Address ALICE = addresses::from_id(0xa11ce);
constexpr Address BOB = addresses::from_id(0xb0b);
constexpr Address WHALE = addresses::from_id(0x3a1e);
constexpr Address LP = addresses::from_id(0x1b);
constexpr Address ATTACKER = addresses::from_id(0xbad);
constexpr Address BURNER_OWNER = addresses::from_id(0xad);
constexpr Address BURNER = addresses::from_id(0xb0);
constexpr Address TOKEN = addresses::from_id(0x70c);
constexpr Address TARGET = addresses::from_id(0x7a7e);
constexpr Address PROTOCOL = addresses::from_id(0xfee);

// Records every event delivered by the token and the burner
struct Recorder : ILiquidListener, IBurnListener {
    std::vector<TradeSettled> trades;
    std::vector<HarvestResult> harvests;
    std::vector<BurnDeposit> deposits;
    std::vector<BurnFlush> flushes;
    std::vector<std::string> order;  // delivery sequence across all four

    void on_trade_settled(const TradeSettled& r) override {
        trades.push_back(r);
        order.push_back("trade");
    }
    void on_rewards_harvested(const HarvestResult& r) override {
        harvests.push_back(r);
        order.push_back("harvest");
    }
    void on_burn_deposit(const BurnDeposit& e) override {
        deposits.push_back(e);
        order.push_back("deposit");
    }
    void on_burn_flush(const BurnFlush& e) override {
        flushes.push_back(e);
        order.push_back("flush");
    }
};

// Chain + venue + burn pool + burner + one initialized token.
// 1e9 token supply, 10% to the creator, the rest seeded over [138200, 184200].
struct World {
    Chain chain;
    PoolManager manager{chain};
    SwapRouter router{chain, manager};
    ConfigStore config;
    Recorder recorder;
    PoolKey burn_pool{NATIVE, Currency(TARGET), fees::FEE_030,
                      tick_spacings::TICK_SPACING_030, addresses::ZERO};
    std::unique_ptr<BurnAccumulator> burner;
    std::unique_ptr<LiquidToken> token;

    explicit World(bool init_burn_pool = true) {
        config.set_protocol_fee_recipient(PROTOCOL);

        if (init_burn_pool) {
            int32_t rc = manager.initialize(burn_pool, tick_math::get_sqrt_ratio_at_tick(0));
            if (rc != errors::OK) {
                throw VenueError(rc, "burn pool initialization failed");
            }
            chain.mint(NATIVE, LP, 10000 * ETHER);
            chain.mint(Currency(TARGET), LP, 10000 * ETHER);
            router.add_liquidity(LP, burn_pool, -6000, 6000, 1000 * ETHER);
        }

        burner = std::make_unique<BurnAccumulator>(chain, manager, BURNER, BURNER_OWNER,
                                                   burn_pool, 500);
        burner->set_listener(&recorder);
        config.set_burn_accumulator(burner.get());

        token = std::make_unique<LiquidToken>(
            chain, manager, config, TOKEN,
            TokenParams{"Liquid Test", "LQT", 1000000000 * ETHER, 100000000 * ETHER});
        token->set_listener(&recorder);
        token->initialize(CREATOR);

        chain.mint(NATIVE, ALICE, 100 * ETHER);
        chain.mint(NATIVE, WHALE, 100 * ETHER);
    }

    I128 eth(const Address& who) const { return chain.balance_of(who, NATIVE); }
    I128 tokens(const Address& who) const { return chain.balance_of(who, token->currency()); }
    const PoolKey& token_pool() const { return token->token_state().pool_key; }

    // Fee split with a burn share: 20% burn, 40% protocol, 40% referrer
    void use_burn_split() {
        config.set_fee_config(FeeConfig{100, 5000, 2000, 4000, 4000});
    }
};

} // namespace liquid::testing

#endif // LIQUID_TEST_FIXTURE_HPP
